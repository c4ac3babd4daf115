#include "stream_reader.hpp"

#include <array>
#include <filesystem>
#include <system_error>

#include "nbdmap/base/interval.hpp"
#include "nbdmap/base/string_utils.hpp"
#include "nbdmap/stream/stream_codec.hpp"

namespace nbdmap::stream {

stream_reader::stream_reader(std::string path)
    : path_(std::move(path)), log_(redlog::get_logger("nbdmap.stream")) {}

status stream_reader::open() {
  close();

  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (ec) {
    error_ = make_status(error_code::io_error, "cannot stat " + path_ + ": " + ec.message());
    return error_;
  }
  file_size_ = static_cast<uint64_t>(size);

  stream_.open(path_, std::ios::binary | std::ios::in);
  if (!stream_.is_open()) {
    error_ = make_status(error_code::io_error, "failed to open stream file " + path_);
    return error_;
  }

  return read_header();
}

void stream_reader::close() {
  if (stream_.is_open()) {
    stream_.close();
  }
  stream_.clear();
  metadata_ = {};
  file_size_ = 0;
  position_ = 0;
  header_end_ = 0;
  previous_end_ = 0;
  header_read_ = false;
  finished_ = false;
  error_ = {};
}

status stream_reader::reset() {
  if (!stream_.is_open()) {
    return open();
  }
  if (!header_read_) {
    return error_;
  }

  stream_.clear();
  stream_.seekg(static_cast<std::streamoff>(header_end_), std::ios::beg);
  if (!stream_) {
    error_ = make_status(error_code::io_error, "failed to rewind " + path_);
    return error_;
  }
  position_ = header_end_;
  previous_end_ = 0;
  finished_ = false;
  error_ = {};
  return ok_status();
}

bool stream_reader::read_exact(char* data, size_t size) {
  if (size == 0) {
    return true;
  }
  stream_.read(data, static_cast<std::streamsize>(size));
  if (stream_.gcount() != static_cast<std::streamsize>(size)) {
    return false;
  }
  position_ += size;
  return true;
}

bool stream_reader::fail(std::string message) {
  error_ = make_status(
      error_code::format_error, path_ + " at file offset " + util::format_hex(position_) + ": " + std::move(message)
  );
  log_.err("stream format error", redlog::field("path", path_), redlog::field("error", error_.message));
  return false;
}

status stream_reader::read_header() {
  std::array<char, k_frame_length> raw{};
  if (!read_exact(raw.data(), raw.size())) {
    fail("truncated stream header");
    return error_;
  }

  frame_header header{};
  if (!parse_frame_header(std::string_view(raw.data(), raw.size()), header).ok() || header.kind != frame_kind::meta) {
    fail("file does not start with a META frame");
    return error_;
  }

  if (header.length == 0 || header.length > file_size_ - position_) {
    fail("metadata block length out of range");
    return error_;
  }

  std::string text(static_cast<size_t>(header.length), '\0');
  std::array<char, 2> term{};
  if (!read_exact(text.data(), text.size()) || !read_exact(term.data(), term.size())) {
    fail("truncated metadata block");
    return error_;
  }
  if (term != k_frame_term) {
    fail("metadata block is not terminated");
    return error_;
  }

  status decoded = decode_metadata(text, metadata_);
  if (!decoded.ok()) {
    fail(decoded.message);
    return error_;
  }
  if (metadata_.compressed) {
    fail("compressed streams are not supported");
    return error_;
  }

  header_end_ = position_;
  header_read_ = true;

  log_.dbg(
      "opened stream", redlog::field("path", path_), redlog::field("virtual_size", metadata_.virtual_size),
      redlog::field("incremental", metadata_.incremental), redlog::field("version", metadata_.stream_version)
  );
  return ok_status();
}

bool stream_reader::read_next(extent& out) {
  if (!error_.ok() || finished_) {
    return false;
  }
  if (!header_read_) {
    error_ = make_status(error_code::io_error, "stream not open: " + path_);
    return false;
  }

  uint64_t frame_position = position_;
  std::array<char, k_frame_length> raw{};
  stream_.read(raw.data(), static_cast<std::streamsize>(raw.size()));
  auto got = stream_.gcount();
  if (got == 0) {
    return fail("stream ends without a STOP record");
  }
  if (got != static_cast<std::streamsize>(raw.size())) {
    return fail("truncated frame header");
  }
  position_ += raw.size();

  frame_header header{};
  status parsed = parse_frame_header(std::string_view(raw.data(), raw.size()), header);
  if (!parsed.ok()) {
    position_ = frame_position;
    return fail(parsed.message);
  }

  extent next{};
  next.offset = header.start;
  next.length = header.length;

  switch (header.kind) {
  case frame_kind::stop:
    next.kind = extent_kind::stop;
    finished_ = true;
    out = next;
    log_.ped("stream finished", redlog::field("path", path_), redlog::field("file_offset", frame_position));
    return true;
  case frame_kind::data:
    next.kind = extent_kind::data;
    break;
  case frame_kind::zero:
    next.kind = extent_kind::zero;
    break;
  case frame_kind::meta:
  case frame_kind::comp:
    position_ = frame_position;
    return fail("unexpected frame inside extent sequence");
  }

  if (next.length == 0) {
    position_ = frame_position;
    return fail(std::string(extent_kind_name(next.kind)) + " extent with zero length");
  }

  uint64_t end = 0;
  if (!util::compute_end(next.offset, next.length, &end)) {
    position_ = frame_position;
    return fail("extent range overflows");
  }
  if (next.offset < previous_end_) {
    position_ = frame_position;
    return fail("extent at " + util::format_hex(next.offset) + " overlaps or precedes the previous extent");
  }

  if (next.kind == extent_kind::data) {
    next.payload_offset = position_;
    if (next.length > file_size_ - position_ || file_size_ - position_ - next.length < k_frame_term.size()) {
      return fail("truncated data payload");
    }
    stream_.seekg(static_cast<std::streamoff>(next.length), std::ios::cur);
    if (!stream_) {
      return fail("failed to skip data payload");
    }
    position_ += next.length;

    std::array<char, 2> term{};
    if (!read_exact(term.data(), term.size()) || term != k_frame_term) {
      return fail("data payload is not terminated");
    }
  }

  previous_end_ = end;
  out = next;
  return true;
}

result<decoded_stream> decode_stream(const std::string& path) {
  stream_reader reader(path);
  status opened = reader.open();
  if (!opened.ok()) {
    return error_result<decoded_stream>(opened);
  }

  decoded_stream decoded{};
  decoded.metadata = reader.metadata();
  extent next{};
  while (reader.read_next(next)) {
    decoded.extents.push_back(next);
  }
  if (!reader.error().ok()) {
    return error_result<decoded_stream>(reader.error());
  }
  return ok_result(std::move(decoded));
}

} // namespace nbdmap::stream
