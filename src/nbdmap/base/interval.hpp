#pragma once

#include <cstdint>
#include <limits>

namespace nbdmap::util {

inline bool compute_end(uint64_t start, uint64_t length, uint64_t* end) {
  if (!end) {
    return false;
  }

  uint64_t end_value = start + length;
  if (end_value < start) {
    return false;
  }

  *end = end_value;
  return true;
}

inline uint64_t range_end_saturating(uint64_t start, uint64_t length) {
  uint64_t end = start + length;
  if (end < start) {
    return std::numeric_limits<uint64_t>::max();
  }
  return end;
}

} // namespace nbdmap::util
