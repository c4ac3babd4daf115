#pragma once

#include <redlog.hpp>

#include "nbdmap/base/status.hpp"
#include "nbdmap/chain/backup_chain.hpp"
#include "nbdmap/chain/extent_map.hpp"

namespace nbdmap::chain {

// decodes every file of a chain and folds the extents into one partition of
// the virtual disk; higher sequence wins on overlap, zero extents included
class extent_resolver {
public:
  extent_resolver();

  result<resolved_extent_map> resolve(const backup_chain& chain);

private:
  status apply_file(const file_ref& ref, uint32_t index, extent_map_builder& builder, uint64_t disk_size,
                    std::vector<source_file>& sources);

  redlog::logger log_;
};

} // namespace nbdmap::chain
