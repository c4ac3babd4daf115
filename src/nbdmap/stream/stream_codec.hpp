#pragma once

#include <string>
#include <string_view>

#include "nbdmap/base/status.hpp"
#include "nbdmap/stream/stream_format.hpp"

namespace nbdmap::stream {

std::string format_frame_header(frame_kind kind, uint64_t start, uint64_t length);

// text must be exactly k_frame_length bytes
status parse_frame_header(std::string_view text, frame_header& out);

std::string encode_metadata(const stream_metadata& metadata);

status decode_metadata(std::string_view text, stream_metadata& out);

} // namespace nbdmap::stream
