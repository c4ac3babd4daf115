#include "inspect.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "nbdmap/base/string_utils.hpp"
#include "nbdmap/blockmap/routing_table.hpp"
#include "nbdmap/chain/backup_chain.hpp"
#include "nbdmap/chain/extent_resolver.hpp"
#include "nbdmap/stream/stream_reader.hpp"

namespace nbdmap_cli::commands {

namespace {

struct extent_totals {
  uint64_t data_extents = 0;
  uint64_t zero_extents = 0;
  uint64_t data_bytes = 0;
  uint64_t zero_bytes = 0;
};

extent_totals count_extents(const std::vector<nbdmap::stream::extent>& extents) {
  extent_totals totals;
  for (const auto& item : extents) {
    if (item.kind == nbdmap::stream::extent_kind::data) {
      ++totals.data_extents;
      totals.data_bytes += item.length;
    } else if (item.kind == nbdmap::stream::extent_kind::zero) {
      ++totals.zero_extents;
      totals.zero_bytes += item.length;
    }
  }
  return totals;
}

std::string format_bytes(uint64_t bytes) {
  std::stringstream ss;
  if (bytes >= 1024ULL * 1024 * 1024) {
    ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0) << " GB";
  } else if (bytes >= 1024 * 1024) {
    ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
  } else if (bytes >= 1024) {
    ss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / 1024.0 << " KB";
  } else {
    ss << bytes << " B";
  }
  return ss.str();
}

nlohmann::json describe_file(
    const nbdmap::chain::file_ref& ref, const nbdmap::stream::stream_metadata& metadata, const extent_totals& totals
) {
  nlohmann::json file;
  file["path"] = ref.path;
  file["sequence"] = ref.sequence;
  file["kind"] = nbdmap::chain::file_kind_name(ref.kind);
  file["virtualSize"] = metadata.virtual_size;
  file["dataSize"] = metadata.data_size;
  file["date"] = metadata.date;
  file["diskName"] = metadata.disk_name;
  file["checkpointName"] = metadata.checkpoint_name;
  file["parentCheckpoint"] = metadata.parent_checkpoint;
  file["incremental"] = metadata.incremental;
  file["streamVersion"] = metadata.stream_version;
  file["dataExtents"] = totals.data_extents;
  file["zeroExtents"] = totals.zero_extents;
  file["dataBytes"] = totals.data_bytes;
  file["zeroBytes"] = totals.zero_bytes;
  return file;
}

} // namespace

int inspect(args::ValueFlag<std::string>& files_flag, args::Flag& json_flag, args::Flag& extents_flag) {
  auto log = redlog::get_logger("nbdmap.cli");

  if (!files_flag) {
    log.err("--file argument required");
    return 1;
  }

  auto chain = nbdmap::chain::backup_chain::from_list(args::get(files_flag));
  if (!chain.ok()) {
    log.err("invalid backup chain", redlog::field("error", chain.status.message));
    std::cerr << "error: " << chain.status.describe() << std::endl;
    return 1;
  }

  nlohmann::json files = nlohmann::json::array();
  std::vector<std::string> text_blocks;
  for (const auto& ref : chain.value.files()) {
    auto decoded = nbdmap::stream::decode_stream(ref.path);
    if (!decoded.ok()) {
      log.err("failed to decode backup", redlog::field("path", ref.path), redlog::field("error", decoded.status.message));
      std::cerr << "error: " << ref.path << ": " << decoded.status.describe() << std::endl;
      return 1;
    }

    extent_totals totals = count_extents(decoded.value.extents);
    const auto& meta = decoded.value.metadata;
    files.push_back(describe_file(ref, meta, totals));

    std::stringstream block;
    block << "├─ " << ref.path << " (" << nbdmap::chain::file_kind_name(ref.kind) << ", #" << ref.sequence << ")\n";
    block << "│  ├─ disk: " << meta.disk_name << ", " << format_bytes(meta.virtual_size) << "\n";
    block << "│  ├─ date: " << meta.date << "\n";
    block << "│  ├─ checkpoint: " << (meta.checkpoint_name.empty() ? "-" : meta.checkpoint_name);
    if (!meta.parent_checkpoint.empty()) {
      block << " (parent " << meta.parent_checkpoint << ")";
    }
    block << "\n";
    block << "│  └─ extents: " << totals.data_extents << " data (" << format_bytes(totals.data_bytes) << "), "
          << totals.zero_extents << " zero (" << format_bytes(totals.zero_bytes) << ")\n";
    text_blocks.push_back(block.str());
  }

  nbdmap::chain::extent_resolver resolver;
  auto resolved = resolver.resolve(chain.value);
  if (!resolved.ok()) {
    log.err("failed to resolve chain", redlog::field("error", resolved.status.message));
    std::cerr << "error: " << resolved.status.describe() << std::endl;
    return 1;
  }
  const auto& map = resolved.value;

  if (json_flag) {
    nlohmann::json report;
    report["diskSize"] = map.disk_size();
    report["files"] = files;
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : map.entries()) {
      if (entry.kind != nbdmap::stream::extent_kind::stop) {
        entries.push_back(nbdmap::blockmap::make_record(map, entry));
      }
    }
    report["entries"] = entries;
    std::cout << report.dump(2) << std::endl;
    return 0;
  }

  std::cout << "backup chain\n";
  for (const auto& block : text_blocks) {
    std::cout << block;
  }
  std::cout << "└─ resolved map: " << map.entries().size() << " entries covering " << format_bytes(map.disk_size())
            << "\n";

  if (extents_flag) {
    for (const auto& entry : map.entries()) {
      const auto& source = map.source_of(entry);
      std::cout << "   " << nbdmap::util::format_hex(entry.virtual_offset) << " +"
                << nbdmap::util::format_hex(entry.length) << " " << nbdmap::stream::extent_kind_name(entry.kind)
                << " <- " << source.path;
      if (entry.kind == nbdmap::stream::extent_kind::data) {
        std::cout << " @" << nbdmap::util::format_hex(entry.source_offset);
      }
      std::cout << "\n";
    }
  }

  return 0;
}

} // namespace nbdmap_cli::commands
