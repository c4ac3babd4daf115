#include "routing_table.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <redlog.hpp>

namespace nbdmap::blockmap {

namespace {
auto log_blockmap = redlog::get_logger("nbdmap.blockmap");

status sync_path(const std::string& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return make_status(error_code::io_error, "cannot reopen " + path + " for sync: " + std::strerror(errno));
  }
  int rc = ::fsync(fd);
  int sync_errno = errno;
  ::close(fd);
  if (rc != 0) {
    return make_status(error_code::io_error, "fsync failed for " + path + ": " + std::strerror(sync_errno));
  }
  return ok_status();
}

} // namespace

nlohmann::json make_record(const chain::resolved_extent_map& map, const chain::resolved_extent& entry) {
  nlohmann::json record;
  record["virtualOffset"] = entry.virtual_offset;
  record["length"] = entry.length;
  record["sourcePath"] = map.source_of(entry).path;
  record["sourceOffset"] = entry.source_offset;
  record["kind"] = stream::extent_kind_name(entry.kind);
  return record;
}

status write_routing_table(const chain::resolved_extent_map& map, std::ostream& out) {
  size_t written = 0;
  out << "[\n";
  for (const auto& entry : map.entries()) {
    if (entry.kind == stream::extent_kind::stop) {
      continue;
    }
    if (written > 0) {
      out << ",\n";
    }
    out << make_record(map, entry).dump();
    ++written;
  }
  out << "\n]\n";
  out.flush();

  if (!out.good()) {
    return make_status(error_code::io_error, "failed to write routing table");
  }

  log_blockmap.dbg("wrote routing table", redlog::field("records", written));
  return ok_status();
}

routing_table_file::~routing_table_file() { remove(); }

result<std::unique_ptr<routing_table_file>> routing_table_file::create(const std::string& directory) {
  std::string pattern = (std::filesystem::path(directory) / "nbdmap-XXXXXX.json").string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  int fd = ::mkstemps(buffer.data(), 5);
  if (fd < 0) {
    return error_result<std::unique_ptr<routing_table_file>>(
        error_code::io_error, "cannot create routing table in " + directory + ": " + std::strerror(errno)
    );
  }
  ::close(fd);

  std::string path(buffer.data());
  log_blockmap.dbg("created routing table file", redlog::field("path", path));
  return ok_result(std::unique_ptr<routing_table_file>(new routing_table_file(std::move(path))));
}

status routing_table_file::write(const chain::resolved_extent_map& map) {
  if (removed_) {
    return make_status(error_code::io_error, "routing table already removed: " + path_);
  }

  {
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
      return make_status(error_code::io_error, "cannot open routing table " + path_);
    }
    status written = write_routing_table(map, out);
    if (!written.ok()) {
      return make_status(error_code::io_error, written.message + ": " + path_);
    }
    out.close();
    if (out.fail()) {
      return make_status(error_code::io_error, "failed to close routing table " + path_);
    }
  }

  status synced = sync_path(path_);
  if (!synced.ok()) {
    return synced;
  }

  log_blockmap.inf(
      "routing table written", redlog::field("path", path_), redlog::field("entries", map.entries().size())
  );
  return ok_status();
}

void routing_table_file::remove() {
  if (removed_) {
    return;
  }
  removed_ = true;

  std::error_code ec;
  if (!std::filesystem::remove(path_, ec) && ec) {
    log_blockmap.wrn("failed to remove routing table", redlog::field("path", path_), redlog::field("error", ec.message()));
    return;
  }
  log_blockmap.dbg("removed routing table", redlog::field("path", path_));
}

bool routing_table_file::exists() const {
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

} // namespace nbdmap::blockmap
