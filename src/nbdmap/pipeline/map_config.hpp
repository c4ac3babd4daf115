#pragma once

#include <cstdint>
#include <string>

namespace nbdmap::pipeline {

struct map_config {
  // comma-separated chain, full backup first
  std::string files;
  std::string device = "/dev/nbd0";
  std::string export_name = "sda";
  std::string listen_address = "127.0.0.1";
  uint32_t listen_port = 10809;
  uint32_t threads = 1;
  uint32_t block_size = 4096;
  bool read_only = false;

  std::string nbdkit = "nbdkit";
  std::string plugin = "/usr/share/nbdmap/nbdkit-plugin.py";
  std::string qemu_nbd = "qemu-nbd";
  uint32_t attach_retries = 10;
  uint32_t attach_backoff_ms = 1000;
  std::string temp_directory;

  // defaults with NBDMAP_* environment overrides applied
  static map_config from_environment();
  bool validate(std::string& error) const;
};

} // namespace nbdmap::pipeline
