#include <doctest/doctest.h>

#include <fstream>
#include <vector>

#include "nbdmap/stream/stream_codec.hpp"
#include "nbdmap/stream/stream_reader.hpp"

#include "test_helpers.hpp"

using namespace nbdmap;
using nbdmap::test_helpers::file_cleanup;
using nbdmap::test_helpers::make_metadata;
using nbdmap::test_helpers::stream_builder;

TEST_CASE("stream reader yields extents in file order and ends with stop") {
  stream_builder builder(make_metadata(0x4000, false, "cp.0"));
  builder.data(0, 0x1000, 1).zero(0x1000, 0x2000).data(0x3000, 0x800, 7).stop();
  file_cleanup cleanup{{builder.write("ordered.data")}};

  auto decoded = stream::decode_stream(cleanup.paths[0]);
  REQUIRE(decoded.ok());
  CHECK(decoded.value.metadata.virtual_size == 0x4000);
  CHECK(decoded.value.metadata.checkpoint_name == "cp.0");

  const auto& extents = decoded.value.extents;
  REQUIRE(extents.size() == 4);
  CHECK(extents[0].kind == stream::extent_kind::data);
  CHECK(extents[0].offset == 0);
  CHECK(extents[0].length == 0x1000);
  CHECK(extents[0].payload_offset == builder.payload_offset(0));
  CHECK(extents[1].kind == stream::extent_kind::zero);
  CHECK(extents[1].offset == 0x1000);
  CHECK(extents[2].payload_offset == builder.payload_offset(0x3000));
  CHECK(extents[3].kind == stream::extent_kind::stop);
}

TEST_CASE("stream reader reset produces the same sequence") {
  stream_builder builder(make_metadata(0x2000, false));
  builder.data(0, 0x100, 3).zero(0x100, 0x1f00).stop();
  file_cleanup cleanup{{builder.write("reset.data")}};

  stream::stream_reader reader(cleanup.paths[0]);
  REQUIRE(reader.open().ok());

  std::vector<stream::extent> first;
  stream::extent next{};
  while (reader.read_next(next)) {
    first.push_back(next);
  }
  REQUIRE(reader.error().ok());
  CHECK(reader.finished());

  REQUIRE(reader.reset().ok());
  std::vector<stream::extent> second;
  while (reader.read_next(next)) {
    second.push_back(next);
  }
  REQUIRE(first.size() == second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    CHECK(first[i].offset == second[i].offset);
    CHECK(first[i].length == second[i].length);
    CHECK(first[i].kind == second[i].kind);
    CHECK(first[i].payload_offset == second[i].payload_offset);
  }
}

TEST_CASE("stream without stop is a format error") {
  stream_builder builder(make_metadata(0x1000, false));
  builder.data(0, 0x200, 1);
  file_cleanup cleanup{{builder.write("nostop.data")}};

  auto decoded = stream::decode_stream(cleanup.paths[0]);
  CHECK(decoded.status.code == error_code::format_error);
}

TEST_CASE("truncated payload is a format error") {
  stream_builder builder(make_metadata(0x1000, false));
  builder.raw(stream::format_frame_header(stream::frame_kind::data, 0, 0x400)).raw(std::string(0x100, 'x'));
  file_cleanup cleanup{{builder.write("truncated.data")}};

  auto decoded = stream::decode_stream(cleanup.paths[0]);
  CHECK(decoded.status.code == error_code::format_error);
}

TEST_CASE("unknown frame kind is a format error") {
  stream_builder builder(make_metadata(0x1000, false));
  builder.raw("JUNK 0000000000000000 0000000000000010\r\n").stop();
  file_cleanup cleanup{{builder.write("unknown.data")}};

  auto decoded = stream::decode_stream(cleanup.paths[0]);
  CHECK(decoded.status.code == error_code::format_error);
}

TEST_CASE("meta frame inside the extent sequence is rejected") {
  stream_builder builder(make_metadata(0x1000, false));
  builder.raw(stream::format_frame_header(stream::frame_kind::meta, 0, 2)).raw("{}\r\n").stop();
  file_cleanup cleanup{{builder.write("meta_mid.data")}};

  CHECK(stream::decode_stream(cleanup.paths[0]).status.code == error_code::format_error);
}

TEST_CASE("overlapping or out of order extents are rejected") {
  stream_builder overlap(make_metadata(0x4000, false));
  overlap.data(0, 0x1000, 1).zero(0x800, 0x1000).stop();
  stream_builder backwards(make_metadata(0x4000, false));
  backwards.zero(0x2000, 0x1000).zero(0x0, 0x1000).stop();
  file_cleanup cleanup{{overlap.write("overlap.data"), backwards.write("backwards.data")}};

  CHECK(stream::decode_stream(cleanup.paths[0]).status.code == error_code::format_error);
  CHECK(stream::decode_stream(cleanup.paths[1]).status.code == error_code::format_error);
}

TEST_CASE("zero length extents are rejected") {
  stream_builder builder(make_metadata(0x1000, false));
  builder.zero(0, 0).stop();
  file_cleanup cleanup{{builder.write("empty_extent.data")}};

  CHECK(stream::decode_stream(cleanup.paths[0]).status.code == error_code::format_error);
}

TEST_CASE("file without a leading meta frame is rejected") {
  file_cleanup cleanup{{test_helpers::temp_path("nometa.data").string()}};
  {
    std::ofstream out(cleanup.paths[0], std::ios::binary);
    out << stream::format_frame_header(stream::frame_kind::data, 0, 4) << "abcd\r\n"
        << stream::format_frame_header(stream::frame_kind::stop, 0, 0);
  }

  stream::stream_reader reader(cleanup.paths[0]);
  CHECK(reader.open().code == error_code::format_error);
}

TEST_CASE("compressed streams are rejected") {
  auto meta = make_metadata(0x1000, false);
  meta.compressed = true;
  meta.compression_method = "lz4";
  stream_builder builder(meta);
  builder.stop();
  file_cleanup cleanup{{builder.write("compressed.data")}};

  auto decoded = stream::decode_stream(cleanup.paths[0]);
  CHECK(decoded.status.code == error_code::format_error);
  CHECK(decoded.status.message.find("compressed") != std::string::npos);
}

TEST_CASE("unsupported stream versions are rejected") {
  auto meta = make_metadata(0x1000, false);
  meta.stream_version = 9;
  stream_builder builder(meta);
  builder.stop();
  file_cleanup cleanup{{builder.write("version.data")}};

  CHECK(stream::decode_stream(cleanup.paths[0]).status.code == error_code::format_error);
}

TEST_CASE("missing files are io errors") {
  auto decoded = stream::decode_stream(test_helpers::temp_path("does_not_exist.data").string());
  CHECK(decoded.status.code == error_code::io_error);
}
