#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "nbdmap/base/status.hpp"
#include "nbdmap/process/subprocess.hpp"

namespace nbdmap::process {

struct export_settings {
  std::string executable = "nbdkit";
  std::string plugin;
  std::string routing_table;
  std::string listen_address = "127.0.0.1";
  uint16_t port = 10809;
  std::string export_name = "sda";
  uint32_t threads = 1;
  uint32_t block_size = 4096;
  bool read_only = false;
  // overlay writes instead of passing them to the backup files
  bool copy_on_write = false;
};

// network block export server run as a separate process
class export_service {
public:
  virtual ~export_service() = default;

  virtual status start() = 0;
  virtual bool running() = 0;
  // idempotent
  virtual void stop() = 0;
};

std::vector<std::string> build_nbdkit_command(const export_settings& settings);

class nbdkit_service final : public export_service {
public:
  explicit nbdkit_service(export_settings settings);
  ~nbdkit_service() override;

  status start() override;
  bool running() override;
  void stop() override;

  const export_settings& settings() const { return settings_; }

private:
  export_settings settings_;
  std::unique_ptr<child_process> child_;
  redlog::logger log_;
};

} // namespace nbdmap::process
