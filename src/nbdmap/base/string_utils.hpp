#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nbdmap::util {

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

// splits on delimiter, trims each item and drops empty items
inline std::vector<std::string> split_list(std::string_view value, char delimiter = ',') {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(delimiter, start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    std::string item = trim_copy(value.substr(start, end - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    start = end + 1;
  }
  return out;
}

inline std::string format_hex(uint64_t value) {
  static constexpr char k_hex[] = "0123456789abcdef";
  std::string out = "0x";
  bool started = false;
  for (int shift = 60; shift >= 0; shift -= 4) {
    unsigned nibble = static_cast<unsigned>((value >> shift) & 0xfu);
    if (nibble != 0 || started || shift == 0) {
      out.push_back(k_hex[nibble]);
      started = true;
    }
  }
  return out;
}

} // namespace nbdmap::util
