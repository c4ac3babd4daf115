#include "replay_engine.hpp"

#include <algorithm>

#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::replay {

namespace {

status replay_failure(const chain::resolved_extent& entry, const status& cause) {
  return make_status(
      error_code::replay_error, "replay failed at virtual offset " + util::format_hex(entry.virtual_offset) + ": " +
                                    cause.message
  );
}

} // namespace

replay_engine::replay_engine(
    block_target& target, source_reader& sources, runtime::interrupt_monitor* interrupts, size_t chunk_size
)
    : target_(target), sources_(sources), interrupts_(interrupts), chunk_size_(std::max<size_t>(chunk_size, 512)),
      log_(redlog::get_logger("nbdmap.replay")) {}

status replay_engine::copy_entry(const chain::resolved_extent_map& map, const chain::resolved_extent& entry) {
  const std::string& path = map.source_of(entry).path;
  if (buffer_.size() < chunk_size_) {
    buffer_.resize(chunk_size_);
  }

  uint64_t done = 0;
  while (done < entry.length) {
    if (interrupts_ && interrupts_->interrupted()) {
      return make_status(
          error_code::interrupted, "replay interrupted at virtual offset " + util::format_hex(entry.virtual_offset + done)
      );
    }

    size_t chunk = static_cast<size_t>(std::min<uint64_t>(entry.length - done, chunk_size_));
    std::span<uint8_t> window(buffer_.data(), chunk);

    status read = sources_.read(path, entry.source_offset + done, window);
    if (!read.ok()) {
      return replay_failure(entry, read);
    }
    status wrote = target_.write(entry.virtual_offset + done, std::span<const uint8_t>(window.data(), window.size()));
    if (!wrote.ok()) {
      return replay_failure(entry, wrote);
    }
    done += chunk;
  }
  return ok_status();
}

result<replay_stats> replay_engine::replay(const chain::resolved_extent_map& map) {
  replay_stats stats{};
  log_.inf("replaying incremental extents", redlog::field("entries", map.entries().size()));

  for (const auto& entry : map.entries()) {
    if (interrupts_ && interrupts_->interrupted()) {
      return error_result<replay_stats>(
          error_code::interrupted, "replay interrupted at virtual offset " + util::format_hex(entry.virtual_offset)
      );
    }

    // the full backup is what the device already shows
    if (map.source_of(entry).kind == chain::file_kind::full || entry.kind == stream::extent_kind::stop) {
      ++stats.entries_skipped;
      continue;
    }

    if (entry.kind == stream::extent_kind::zero) {
      status zeroed = target_.write_zeroes(entry.virtual_offset, entry.length);
      if (!zeroed.ok()) {
        return error_result<replay_stats>(replay_failure(entry, zeroed));
      }
      ++stats.entries_zeroed;
      stats.bytes_zeroed += entry.length;
    } else {
      status copied = copy_entry(map, entry);
      if (!copied.ok()) {
        return error_result<replay_stats>(copied);
      }
      ++stats.entries_written;
      stats.bytes_written += entry.length;
    }

    log_.ped(
        "replayed entry", redlog::field("offset", entry.virtual_offset), redlog::field("length", entry.length),
        redlog::field("kind", stream::extent_kind_name(entry.kind)), redlog::field("source", map.source_of(entry).path)
    );
  }

  status flushed = target_.flush();
  if (!flushed.ok()) {
    return error_result<replay_stats>(error_code::replay_error, "flush after replay failed: " + flushed.message);
  }

  log_.inf(
      "replay finished", redlog::field("written", stats.entries_written), redlog::field("zeroed", stats.entries_zeroed),
      redlog::field("skipped", stats.entries_skipped), redlog::field("bytes", stats.bytes_written)
  );
  return ok_result(stats);
}

} // namespace nbdmap::replay
