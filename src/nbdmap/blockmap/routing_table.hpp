#pragma once

#include <memory>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "nbdmap/base/status.hpp"
#include "nbdmap/chain/extent_map.hpp"

namespace nbdmap::blockmap {

// one routing-table record as consumed by the export server plugin
nlohmann::json make_record(const chain::resolved_extent_map& map, const chain::resolved_extent& entry);

// writes a json array, one record per line, in ascending virtual offset order.
// stop entries are never emitted.
status write_routing_table(const chain::resolved_extent_map& map, std::ostream& out);

// temporary routing-table file; removed by remove() or on destruction
class routing_table_file {
public:
  ~routing_table_file();

  routing_table_file(const routing_table_file&) = delete;
  routing_table_file& operator=(const routing_table_file&) = delete;

  // creates an empty file named nbdmap-<random>.json inside directory
  static result<std::unique_ptr<routing_table_file>> create(const std::string& directory);

  // serializes the map and syncs it to disk before returning
  status write(const chain::resolved_extent_map& map);

  // idempotent
  void remove();

  const std::string& path() const { return path_; }
  bool exists() const;

private:
  explicit routing_table_file(std::string path) : path_(std::move(path)) {}

  std::string path_;
  bool removed_ = false;
};

} // namespace nbdmap::blockmap
