#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "nbdmap/chain/backup_chain.hpp"
#include "nbdmap/stream/stream_format.hpp"

namespace nbdmap::chain {

struct source_file {
  file_ref ref;
  stream::stream_metadata metadata;
};

// one partition entry; source indexes resolved_extent_map::sources()
struct resolved_extent {
  uint64_t virtual_offset = 0;
  uint64_t length = 0;
  uint32_t source = 0;
  uint64_t source_offset = 0;
  stream::extent_kind kind = stream::extent_kind::zero;

  uint64_t end() const { return virtual_offset + length; }

  bool operator==(const resolved_extent& other) const = default;
};

// authoritative partition of [0, disk_size); read-only once built
class resolved_extent_map {
public:
  resolved_extent_map() = default;
  resolved_extent_map(uint64_t disk_size, std::vector<source_file> sources, std::vector<resolved_extent> entries)
      : disk_size_(disk_size), sources_(std::move(sources)), entries_(std::move(entries)) {}

  uint64_t disk_size() const { return disk_size_; }
  const std::vector<source_file>& sources() const { return sources_; }
  const std::vector<resolved_extent>& entries() const { return entries_; }
  const file_ref& source_of(const resolved_extent& entry) const { return sources_.at(entry.source).ref; }

  // entry covering offset, nullptr past the end
  const resolved_extent* find(uint64_t offset) const;

private:
  uint64_t disk_size_ = 0;
  std::vector<source_file> sources_;
  std::vector<resolved_extent> entries_;
};

// keeps a partition of [0, disk_size) and lets later extents override earlier ones
class extent_map_builder {
public:
  // the whole range starts out as zero owned by fill_source
  extent_map_builder(uint64_t disk_size, uint32_t fill_source);

  // caller guarantees entry lies inside [0, disk_size) and has non-zero length
  void overlay(const resolved_extent& entry);

  std::vector<resolved_extent> entries() const;
  size_t size() const { return pieces_.size(); }

private:
  void split_at(uint64_t offset);

  uint64_t disk_size_ = 0;
  std::map<uint64_t, resolved_extent> pieces_;
};

// checks sorted, non-overlapping, gap-free coverage of [0, disk_size)
bool check_partition(const resolved_extent_map& map, std::string& error);

} // namespace nbdmap::chain
