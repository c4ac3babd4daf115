#include "stream_codec.hpp"

#include <algorithm>
#include <cstring>
#include <initializer_list>

#include <nlohmann/json.hpp>

namespace nbdmap::stream {

namespace {

const std::array<char, 4>& kind_tag(frame_kind kind) {
  switch (kind) {
  case frame_kind::meta:
    return k_kind_meta;
  case frame_kind::data:
    return k_kind_data;
  case frame_kind::zero:
    return k_kind_zero;
  case frame_kind::comp:
    return k_kind_comp;
  case frame_kind::stop:
    break;
  }
  return k_kind_stop;
}

bool match_tag(std::string_view text, const std::array<char, 4>& tag) {
  return std::memcmp(text.data(), tag.data(), tag.size()) == 0;
}

bool parse_kind(std::string_view text, frame_kind& out) {
  if (match_tag(text, k_kind_data)) {
    out = frame_kind::data;
  } else if (match_tag(text, k_kind_zero)) {
    out = frame_kind::zero;
  } else if (match_tag(text, k_kind_stop)) {
    out = frame_kind::stop;
  } else if (match_tag(text, k_kind_meta)) {
    out = frame_kind::meta;
  } else if (match_tag(text, k_kind_comp)) {
    out = frame_kind::comp;
  } else {
    return false;
  }
  return true;
}

bool parse_hex_field(std::string_view digits, uint64_t& out) {
  uint64_t value = 0;
  for (char ch : digits) {
    unsigned nibble = 0;
    if (ch >= '0' && ch <= '9') {
      nibble = static_cast<unsigned>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      nibble = static_cast<unsigned>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      nibble = static_cast<unsigned>(ch - 'A' + 10);
    } else {
      return false;
    }
    value = (value << 4) | nibble;
  }
  out = value;
  return true;
}

std::string optional_string(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

bool optional_bool(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_boolean()) {
    return false;
  }
  return it->get<bool>();
}

} // namespace

std::string format_frame_header(frame_kind kind, uint64_t start, uint64_t length) {
  static constexpr char k_hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(k_frame_length);

  const auto& tag = kind_tag(kind);
  out.append(tag.data(), tag.size());
  for (uint64_t value : {start, length}) {
    out.push_back(' ');
    for (int shift = 60; shift >= 0; shift -= 4) {
      out.push_back(k_hex[(value >> shift) & 0xfu]);
    }
  }
  out.append(k_frame_term.data(), k_frame_term.size());
  return out;
}

status parse_frame_header(std::string_view text, frame_header& out) {
  if (text.size() != k_frame_length) {
    return make_status(error_code::format_error, "frame header has wrong size");
  }

  const size_t start_pos = k_frame_kind_size + 1;
  const size_t length_pos = start_pos + k_frame_number_digits + 1;
  if (text[k_frame_kind_size] != ' ' || text[length_pos - 1] != ' ' ||
      text.substr(k_frame_length - k_frame_term.size()) != std::string_view(k_frame_term.data(), k_frame_term.size())) {
    return make_status(error_code::format_error, "malformed frame header");
  }

  frame_header header{};
  if (!parse_kind(text.substr(0, k_frame_kind_size), header.kind)) {
    return make_status(
        error_code::format_error, "unknown frame kind '" + std::string(text.substr(0, k_frame_kind_size)) + "'"
    );
  }
  if (!parse_hex_field(text.substr(start_pos, k_frame_number_digits), header.start) ||
      !parse_hex_field(text.substr(length_pos, k_frame_number_digits), header.length)) {
    return make_status(error_code::format_error, "frame header carries non-hex number");
  }

  out = header;
  return ok_status();
}

std::string encode_metadata(const stream_metadata& metadata) {
  nlohmann::json object;
  object["virtual-size"] = metadata.virtual_size;
  object["data-size"] = metadata.data_size;
  object["date"] = metadata.date;
  object["disk-name"] = metadata.disk_name;
  object["checkpoint-name"] = metadata.checkpoint_name;
  if (metadata.parent_checkpoint.empty()) {
    object["parent-checkpoint"] = false;
  } else {
    object["parent-checkpoint"] = metadata.parent_checkpoint;
  }
  object["incremental"] = metadata.incremental;
  object["stream-version"] = metadata.stream_version;
  object["compressed"] = metadata.compressed;
  if (metadata.compression_method.empty()) {
    object["compression-method"] = nullptr;
  } else {
    object["compression-method"] = metadata.compression_method;
  }
  return object.dump(4);
}

status decode_metadata(std::string_view text, stream_metadata& out) {
  nlohmann::json object = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (object.is_discarded() || !object.is_object()) {
    return make_status(error_code::format_error, "metadata block is not a json object");
  }

  auto size_it = object.find("virtual-size");
  if (size_it == object.end() || !size_it->is_number_unsigned()) {
    return make_status(error_code::format_error, "metadata lacks virtual-size");
  }

  stream_metadata metadata{};
  metadata.virtual_size = size_it->get<uint64_t>();

  auto version_it = object.find("stream-version");
  if (version_it == object.end()) {
    metadata.stream_version = k_min_stream_version;
  } else if (version_it->is_number_unsigned()) {
    uint64_t version = version_it->get<uint64_t>();
    if (version < k_min_stream_version || version > k_max_stream_version) {
      return make_status(error_code::format_error, "unsupported stream version " + std::to_string(version));
    }
    metadata.stream_version = static_cast<uint32_t>(version);
  } else {
    return make_status(error_code::format_error, "metadata stream-version is not a number");
  }

  auto data_it = object.find("data-size");
  if (data_it != object.end() && data_it->is_number_unsigned()) {
    metadata.data_size = data_it->get<uint64_t>();
  }

  metadata.date = optional_string(object, "date");
  metadata.disk_name = optional_string(object, "disk-name");
  metadata.checkpoint_name = optional_string(object, "checkpoint-name");
  metadata.parent_checkpoint = optional_string(object, "parent-checkpoint");
  metadata.incremental = optional_bool(object, "incremental");
  metadata.compressed = optional_bool(object, "compressed");
  metadata.compression_method = optional_string(object, "compression-method");

  out = std::move(metadata);
  return ok_status();
}

} // namespace nbdmap::stream
