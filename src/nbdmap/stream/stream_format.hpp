#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace nbdmap::stream {

// "DATA 0000000000000000 0000000000000000\r\n"
constexpr size_t k_frame_kind_size = 4;
constexpr size_t k_frame_number_digits = 16;
constexpr size_t k_frame_length = k_frame_kind_size + 1 + k_frame_number_digits + 1 + k_frame_number_digits + 2;

constexpr std::array<char, 4> k_kind_meta = {'M', 'E', 'T', 'A'};
constexpr std::array<char, 4> k_kind_data = {'D', 'A', 'T', 'A'};
constexpr std::array<char, 4> k_kind_zero = {'Z', 'E', 'R', 'O'};
constexpr std::array<char, 4> k_kind_stop = {'S', 'T', 'O', 'P'};
constexpr std::array<char, 4> k_kind_comp = {'C', 'O', 'M', 'P'};
constexpr std::array<char, 2> k_frame_term = {'\r', '\n'};

constexpr uint32_t k_min_stream_version = 1;
constexpr uint32_t k_max_stream_version = 2;

enum class frame_kind : uint8_t { meta, data, zero, stop, comp };

enum class extent_kind : uint8_t { data, zero, stop };

struct frame_header {
  frame_kind kind = frame_kind::stop;
  uint64_t start = 0;
  uint64_t length = 0;
};

// offset/length address the virtual disk; payload_offset is the position of
// the first payload byte inside the backup file (data extents only)
struct extent {
  uint64_t offset = 0;
  uint64_t length = 0;
  extent_kind kind = extent_kind::stop;
  uint64_t payload_offset = 0;

  uint64_t end() const { return offset + length; }
};

struct stream_metadata {
  uint64_t virtual_size = 0;
  uint64_t data_size = 0;
  std::string date;
  std::string disk_name;
  std::string checkpoint_name;
  std::string parent_checkpoint;
  bool incremental = false;
  uint32_t stream_version = k_max_stream_version;
  bool compressed = false;
  std::string compression_method;
};

inline const char* extent_kind_name(extent_kind kind) {
  switch (kind) {
  case extent_kind::data:
    return "data";
  case extent_kind::zero:
    return "zero";
  case extent_kind::stop:
    return "stop";
  }
  return "unknown";
}

} // namespace nbdmap::stream
