#include "extent_map.hpp"

#include <algorithm>

#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::chain {

const resolved_extent* resolved_extent_map::find(uint64_t offset) const {
  auto it = std::upper_bound(entries_.begin(), entries_.end(), offset, [](uint64_t value, const resolved_extent& entry) {
    return value < entry.virtual_offset;
  });
  if (it == entries_.begin()) {
    return nullptr;
  }
  --it;
  if (offset >= it->end()) {
    return nullptr;
  }
  return &*it;
}

extent_map_builder::extent_map_builder(uint64_t disk_size, uint32_t fill_source) : disk_size_(disk_size) {
  if (disk_size_ == 0) {
    return;
  }
  resolved_extent fill{};
  fill.virtual_offset = 0;
  fill.length = disk_size_;
  fill.source = fill_source;
  fill.kind = stream::extent_kind::zero;
  pieces_.emplace(0, fill);
}

void extent_map_builder::split_at(uint64_t offset) {
  if (offset == 0 || offset >= disk_size_) {
    return;
  }

  auto it = pieces_.upper_bound(offset);
  --it;
  if (it->first == offset) {
    return;
  }

  resolved_extent& left = it->second;
  uint64_t delta = offset - left.virtual_offset;

  resolved_extent right = left;
  right.virtual_offset = offset;
  right.length = left.length - delta;
  if (right.kind == stream::extent_kind::data) {
    right.source_offset = left.source_offset + delta;
  }
  left.length = delta;

  pieces_.emplace_hint(std::next(it), offset, right);
}

void extent_map_builder::overlay(const resolved_extent& entry) {
  if (entry.length == 0) {
    return;
  }

  uint64_t end = entry.end();
  split_at(entry.virtual_offset);
  split_at(end);

  auto first = pieces_.lower_bound(entry.virtual_offset);
  auto last = pieces_.lower_bound(end);
  auto hint = pieces_.erase(first, last);
  pieces_.emplace_hint(hint, entry.virtual_offset, entry);
}

std::vector<resolved_extent> extent_map_builder::entries() const {
  std::vector<resolved_extent> out;
  out.reserve(pieces_.size());
  for (const auto& [_, piece] : pieces_) {
    out.push_back(piece);
  }
  return out;
}

bool check_partition(const resolved_extent_map& map, std::string& error) {
  uint64_t expected = 0;
  for (const auto& entry : map.entries()) {
    if (entry.length == 0) {
      error = "empty entry at " + util::format_hex(entry.virtual_offset);
      return false;
    }
    if (entry.virtual_offset != expected) {
      error = entry.virtual_offset > expected ? "gap before " : "overlap at ";
      error += util::format_hex(entry.virtual_offset);
      return false;
    }
    if (entry.source >= map.sources().size()) {
      error = "entry at " + util::format_hex(entry.virtual_offset) + " references unknown source";
      return false;
    }
    expected = entry.end();
  }
  if (expected != map.disk_size()) {
    error = "coverage ends at " + util::format_hex(expected) + ", disk size is " + util::format_hex(map.disk_size());
    return false;
  }
  return true;
}

} // namespace nbdmap::chain
