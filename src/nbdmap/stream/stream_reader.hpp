#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "nbdmap/base/status.hpp"
#include "nbdmap/stream/stream_format.hpp"

namespace nbdmap::stream {

// lazy reader over one sparse stream file; payloads are skipped, not loaded.
// reset() rewinds to the first extent so the same sequence is produced again.
class stream_reader {
public:
  explicit stream_reader(std::string path);

  status open();
  void close();
  status reset();

  // returns false at end of sequence or on error; check error() to tell apart.
  // the stop extent is produced once as the final element.
  bool read_next(extent& out);

  const std::string& path() const { return path_; }
  const stream_metadata& metadata() const { return metadata_; }
  const status& error() const { return error_; }
  bool finished() const { return finished_; }

private:
  status read_header();
  bool read_exact(char* data, size_t size);
  bool fail(std::string message);

  std::string path_;
  std::ifstream stream_;
  stream_metadata metadata_{};
  uint64_t file_size_ = 0;
  uint64_t position_ = 0;
  uint64_t header_end_ = 0;
  uint64_t previous_end_ = 0;
  bool header_read_ = false;
  bool finished_ = false;
  status error_{};
  redlog::logger log_;
};

struct decoded_stream {
  stream_metadata metadata;
  std::vector<extent> extents;
};

// reads the whole extent sequence of one file, stop extent included
result<decoded_stream> decode_stream(const std::string& path);

} // namespace nbdmap::stream
