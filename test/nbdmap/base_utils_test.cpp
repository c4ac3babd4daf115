#include <doctest/doctest.h>

#include <cstdint>

#include "nbdmap/base/interval.hpp"
#include "nbdmap/base/status.hpp"
#include "nbdmap/base/string_utils.hpp"

TEST_CASE("interval helpers compute end safely") {
  uint64_t end = 0;
  CHECK(nbdmap::util::compute_end(0x1000, 0x200, &end));
  CHECK(end == 0x1200);
  CHECK(nbdmap::util::compute_end(UINT64_MAX, 1, &end) == false);
  CHECK(nbdmap::util::range_end_saturating(UINT64_MAX - 1, 4) == UINT64_MAX);
}

TEST_CASE("string helpers split and format") {
  auto items = nbdmap::util::split_list(" a.data, b.data ,,c.data ");
  REQUIRE(items.size() == 3);
  CHECK(items[0] == "a.data");
  CHECK(items[1] == "b.data");
  CHECK(items[2] == "c.data");

  CHECK(nbdmap::util::format_hex(0) == "0x0");
  CHECK(nbdmap::util::format_hex(0x28) == "0x28");
  CHECK(nbdmap::util::trim_copy("\t value ") == "value");
}

TEST_CASE("status describes failures") {
  CHECK(nbdmap::ok_status().ok());
  CHECK(nbdmap::ok_status().describe() == "ok");

  auto failure = nbdmap::make_status(nbdmap::error_code::chain_error, "missing full backup");
  CHECK_FALSE(failure.ok());
  CHECK(failure.describe() == "chain error: missing full backup");

  auto failed = nbdmap::error_result<int>(failure);
  CHECK_FALSE(failed.ok());
  CHECK(failed.value == 0);
}
