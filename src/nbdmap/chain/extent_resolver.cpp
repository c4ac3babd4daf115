#include "extent_resolver.hpp"

#include "nbdmap/base/interval.hpp"
#include "nbdmap/base/string_utils.hpp"
#include "nbdmap/stream/stream_reader.hpp"

namespace nbdmap::chain {

extent_resolver::extent_resolver() : log_(redlog::get_logger("nbdmap.chain")) {}

result<resolved_extent_map> extent_resolver::resolve(const backup_chain& chain) {
  if (chain.empty()) {
    return error_result<resolved_extent_map>(error_code::chain_error, "backup chain is empty");
  }

  const file_ref& full = chain.full();
  if (full.kind != file_kind::full) {
    return error_result<resolved_extent_map>(
        error_code::chain_error, "chain must start with a full backup: " + full.path
    );
  }

  // the disk size comes from the full backup only
  stream::stream_reader full_reader(full.path);
  status opened = full_reader.open();
  if (!opened.ok()) {
    return error_result<resolved_extent_map>(opened);
  }
  const uint64_t disk_size = full_reader.metadata().virtual_size;
  full_reader.close();
  if (disk_size == 0) {
    return error_result<resolved_extent_map>(
        error_code::chain_error, "cannot determine disk size from full backup " + full.path
    );
  }

  log_.inf(
      "resolving backup chain", redlog::field("files", chain.size()), redlog::field("disk_size", disk_size),
      redlog::field("full", full.path)
  );

  extent_map_builder builder(disk_size, 0);
  std::vector<source_file> sources;
  sources.reserve(chain.size());

  const auto& files = chain.files();
  for (size_t i = 0; i < files.size(); ++i) {
    status applied = apply_file(files[i], static_cast<uint32_t>(i), builder, disk_size, sources);
    if (!applied.ok()) {
      return error_result<resolved_extent_map>(applied);
    }
  }

  resolved_extent_map map(disk_size, std::move(sources), builder.entries());
  log_.inf("resolved extent map", redlog::field("entries", map.entries().size()));
  return ok_result(std::move(map));
}

status extent_resolver::apply_file(
    const file_ref& ref, uint32_t index, extent_map_builder& builder, uint64_t disk_size,
    std::vector<source_file>& sources
) {
  stream::stream_reader reader(ref.path);
  status opened = reader.open();
  if (!opened.ok()) {
    return opened;
  }

  const auto& metadata = reader.metadata();
  if (ref.kind == file_kind::full && metadata.incremental) {
    return make_status(
        error_code::chain_error, "first chain entry is an incremental backup, expected a full backup: " + ref.path
    );
  }
  if (ref.kind == file_kind::incremental) {
    if (!metadata.incremental) {
      return make_status(error_code::chain_error, "full backup listed after the first chain entry: " + ref.path);
    }
    const auto& previous = sources.back().metadata;
    if (!metadata.parent_checkpoint.empty() && !previous.checkpoint_name.empty() &&
        metadata.parent_checkpoint != previous.checkpoint_name) {
      log_.wrn(
          "incremental does not follow previous checkpoint", redlog::field("path", ref.path),
          redlog::field("parent", metadata.parent_checkpoint), redlog::field("previous", previous.checkpoint_name)
      );
    }
    if (metadata.virtual_size != disk_size) {
      log_.wrn(
          "incremental declares a different disk size", redlog::field("path", ref.path),
          redlog::field("declared", metadata.virtual_size), redlog::field("disk_size", disk_size)
      );
    }
  }
  sources.push_back(source_file{ref, metadata});

  uint64_t applied = 0;
  stream::extent next{};
  while (reader.read_next(next)) {
    if (next.kind == stream::extent_kind::stop) {
      break;
    }

    uint64_t end = util::range_end_saturating(next.offset, next.length);
    if (end > disk_size) {
      return make_status(
          error_code::chain_error, ref.path + ": extent " + util::format_hex(next.offset) + "+" +
                                       util::format_hex(next.length) + " exceeds disk size " +
                                       util::format_hex(disk_size)
      );
    }

    resolved_extent entry{};
    entry.virtual_offset = next.offset;
    entry.length = next.length;
    entry.source = index;
    entry.source_offset = next.kind == stream::extent_kind::data ? next.payload_offset : 0;
    entry.kind = next.kind;
    builder.overlay(entry);
    ++applied;
  }
  if (!reader.error().ok()) {
    return reader.error();
  }

  log_.vrb(
      "applied backup file", redlog::field("path", ref.path), redlog::field("kind", file_kind_name(ref.kind)),
      redlog::field("sequence", ref.sequence), redlog::field("extents", applied),
      redlog::field("partition_size", builder.size())
  );
  return ok_status();
}

} // namespace nbdmap::chain
