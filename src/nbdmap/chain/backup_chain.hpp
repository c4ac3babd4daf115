#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "nbdmap/base/status.hpp"

namespace nbdmap::chain {

enum class file_kind : uint8_t { full, incremental };

inline const char* file_kind_name(file_kind kind) { return kind == file_kind::full ? "full" : "incremental"; }

struct file_ref {
  std::string path;
  uint32_t sequence = 0;
  file_kind kind = file_kind::full;
};

// ordered full backup followed by incrementals; immutable once built
class backup_chain {
public:
  backup_chain() = default;

  // first path is the full backup, the rest are incrementals in order
  static result<backup_chain> from_paths(const std::vector<std::string>& paths);

  // comma-separated list as given on the command line
  static result<backup_chain> from_list(const std::string& list);

  static result<backup_chain> from_refs(std::vector<file_ref> refs);

  const std::vector<file_ref>& files() const { return files_; }
  const file_ref& full() const { return files_.front(); }
  size_t size() const { return files_.size(); }
  bool empty() const { return files_.empty(); }
  bool has_incrementals() const { return files_.size() > 1; }

private:
  explicit backup_chain(std::vector<file_ref> files) : files_(std::move(files)) {}

  std::vector<file_ref> files_;
};

} // namespace nbdmap::chain
