#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <redlog.hpp>

#include "nbdmap/base/status.hpp"
#include "nbdmap/chain/extent_map.hpp"
#include "nbdmap/replay/block_target.hpp"
#include "nbdmap/runtime/interrupt_monitor.hpp"

namespace nbdmap::replay {

constexpr size_t k_default_replay_chunk = 4 * 1024 * 1024;

struct replay_stats {
  uint64_t entries_written = 0;
  uint64_t entries_zeroed = 0;
  uint64_t entries_skipped = 0;
  uint64_t bytes_written = 0;
  uint64_t bytes_zeroed = 0;
};

// materializes incremental-owned entries onto an attached device, strictly in
// ascending virtual offset order. the engine is the device's only writer; a
// failure aborts the whole replay and is not resumable.
class replay_engine {
public:
  replay_engine(
      block_target& target, source_reader& sources, runtime::interrupt_monitor* interrupts = nullptr,
      size_t chunk_size = k_default_replay_chunk
  );

  result<replay_stats> replay(const chain::resolved_extent_map& map);

private:
  status copy_entry(const chain::resolved_extent_map& map, const chain::resolved_extent& entry);

  block_target& target_;
  source_reader& sources_;
  runtime::interrupt_monitor* interrupts_;
  size_t chunk_size_;
  std::vector<uint8_t> buffer_;
  redlog::logger log_;
};

} // namespace nbdmap::replay
