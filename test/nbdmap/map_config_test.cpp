#include <doctest/doctest.h>

#include <cstdlib>

#include "nbdmap/base/env_config.hpp"
#include "nbdmap/pipeline/map_config.hpp"

using namespace nbdmap;

namespace {

pipeline::map_config valid_config() {
  pipeline::map_config config;
  config.files = "/backups/sda.full.data";
  config.temp_directory = "/tmp";
  return config;
}

} // namespace

TEST_CASE("map config defaults match the command line defaults") {
  pipeline::map_config config;
  CHECK(config.device == "/dev/nbd0");
  CHECK(config.export_name == "sda");
  CHECK(config.listen_address == "127.0.0.1");
  CHECK(config.listen_port == 10809);
  CHECK(config.threads == 1);
  CHECK(config.block_size == 4096);
  CHECK_FALSE(config.read_only);
  CHECK(config.attach_retries == 10);
  CHECK(config.attach_backoff_ms == 1000);
}

TEST_CASE("map config validation accepts a plain full backup") {
  std::string error;
  CHECK(valid_config().validate(error));
  CHECK(error.empty());
}

TEST_CASE("map config validation rejects bad values") {
  std::string error;

  auto config = valid_config();
  config.files = " , ";
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.listen_port = 70000;
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.threads = 0;
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.block_size = 3000;
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.block_size = 256;
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.attach_retries = 0;
  CHECK_FALSE(config.validate(error));

  config = valid_config();
  config.export_name.clear();
  CHECK_FALSE(config.validate(error));
  CHECK_FALSE(error.empty());
}

TEST_CASE("read-only is refused for incremental chains") {
  std::string error;
  auto config = valid_config();
  config.read_only = true;
  CHECK(config.validate(error));

  config.files = "/backups/sda.full.data,/backups/sda.inc.1.data";
  CHECK_FALSE(config.validate(error));
  CHECK(error.find("read-only") != std::string::npos);
}

TEST_CASE("map config picks up environment overrides") {
  ::setenv("NBDMAP_NBDKIT", "/opt/nbdkit/bin/nbdkit", 1);
  ::setenv("NBDMAP_ATTACH_RETRIES", "4", 1);
  ::setenv("NBDMAP_ATTACH_BACKOFF_MS", "not-a-number", 1);
  ::setenv("NBDMAP_TMPDIR", "/var/tmp", 1);

  auto config = pipeline::map_config::from_environment();
  CHECK(config.nbdkit == "/opt/nbdkit/bin/nbdkit");
  CHECK(config.attach_retries == 4);
  CHECK(config.attach_backoff_ms == 1000);
  CHECK(config.temp_directory == "/var/tmp");
  CHECK(config.qemu_nbd == "qemu-nbd");

  ::unsetenv("NBDMAP_NBDKIT");
  ::unsetenv("NBDMAP_ATTACH_RETRIES");
  ::unsetenv("NBDMAP_ATTACH_BACKOFF_MS");
  ::unsetenv("NBDMAP_TMPDIR");

  auto defaults = pipeline::map_config::from_environment();
  CHECK(defaults.nbdkit == "nbdkit");
  CHECK_FALSE(defaults.temp_directory.empty());
}

TEST_CASE("env config reads trimmed values") {
  ::setenv("NBDMAP_TEST_PATH", "  /opt/bin/qemu-nbd ", 1);
  ::setenv("NBDMAP_TEST_COUNT", " 12 ", 1);

  util::env_config loader("NBDMAP");
  CHECK(loader.build_env_name("TEST_PATH") == "NBDMAP_TEST_PATH");
  CHECK(loader.get<std::string>("TEST_PATH", "") == "/opt/bin/qemu-nbd");
  CHECK(loader.get<uint32_t>("TEST_COUNT", 1) == 12);
  CHECK(loader.get<std::string>("TEST_MISSING", "fallback") == "fallback");

  ::unsetenv("NBDMAP_TEST_PATH");
  ::unsetenv("NBDMAP_TEST_COUNT");
}

TEST_CASE("env config rejects numbers that do not fit 32 bits") {
  util::env_config loader("NBDMAP");

  ::setenv("NBDMAP_TEST_COUNT", "-1", 1);
  CHECK(loader.get<uint32_t>("TEST_COUNT", 10) == 10);

  ::setenv("NBDMAP_TEST_COUNT", "4294967296", 1);
  CHECK(loader.get<uint32_t>("TEST_COUNT", 10) == 10);

  ::setenv("NBDMAP_TEST_COUNT", "99999999999999999999999", 1);
  CHECK(loader.get<uint32_t>("TEST_COUNT", 10) == 10);

  ::setenv("NBDMAP_TEST_COUNT", "12abc", 1);
  CHECK(loader.get<uint32_t>("TEST_COUNT", 10) == 10);

  ::setenv("NBDMAP_TEST_COUNT", "4294967295", 1);
  CHECK(loader.get<uint32_t>("TEST_COUNT", 10) == 4294967295u);

  ::unsetenv("NBDMAP_TEST_COUNT");
}

TEST_CASE("negative attach retries fall back to the default") {
  ::setenv("NBDMAP_ATTACH_RETRIES", "-1", 1);
  auto config = pipeline::map_config::from_environment();
  CHECK(config.attach_retries == 10);
  ::unsetenv("NBDMAP_ATTACH_RETRIES");
}
