#include "map_config.hpp"

#include <filesystem>
#include <system_error>

#include "nbdmap/base/env_config.hpp"
#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::pipeline {

namespace {

constexpr uint32_t k_min_block_size = 512;
constexpr uint32_t k_max_block_size = 32 * 1024 * 1024;

bool is_power_of_two(uint32_t value) { return value != 0 && (value & (value - 1)) == 0; }

std::string default_temp_directory() {
  std::error_code ec;
  auto path = std::filesystem::temp_directory_path(ec);
  return ec ? std::string("/tmp") : path.string();
}

} // namespace

map_config map_config::from_environment() {
  util::env_config loader("NBDMAP");
  map_config config;
  config.nbdkit = loader.get<std::string>("NBDKIT", config.nbdkit);
  config.plugin = loader.get<std::string>("PLUGIN", config.plugin);
  config.qemu_nbd = loader.get<std::string>("QEMU_NBD", config.qemu_nbd);
  config.attach_retries = loader.get<uint32_t>("ATTACH_RETRIES", config.attach_retries);
  config.attach_backoff_ms = loader.get<uint32_t>("ATTACH_BACKOFF_MS", config.attach_backoff_ms);
  config.temp_directory = loader.get<std::string>("TMPDIR", default_temp_directory());
  return config;
}

bool map_config::validate(std::string& error) const {
  error.clear();

  if (util::split_list(files).empty()) {
    error = "at least one backup file is required";
    return false;
  }
  if (device.empty()) {
    error = "target device is required";
    return false;
  }
  if (export_name.empty()) {
    error = "export name must not be empty";
    return false;
  }
  if (listen_address.empty()) {
    error = "listen address must not be empty";
    return false;
  }
  if (listen_port == 0 || listen_port > 65535) {
    error = "listen port must be between 1 and 65535";
    return false;
  }
  if (threads == 0) {
    error = "thread count must be at least 1";
    return false;
  }
  if (!is_power_of_two(block_size) || block_size < k_min_block_size || block_size > k_max_block_size) {
    error = "block size must be a power of two between 512 and 32M";
    return false;
  }
  if (attach_retries == 0) {
    error = "NBDMAP_ATTACH_RETRIES must be at least 1";
    return false;
  }
  if (read_only && util::split_list(files).size() > 1) {
    error = "read-only mapping is not possible with incremental backups";
    return false;
  }
  if (temp_directory.empty()) {
    error = "temporary directory is not set";
    return false;
  }
  return true;
}

} // namespace nbdmap::pipeline
