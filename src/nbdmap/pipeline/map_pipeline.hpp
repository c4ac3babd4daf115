#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <redlog.hpp>

#include "nbdmap/attach/attach_controller.hpp"
#include "nbdmap/attach/attach_transport.hpp"
#include "nbdmap/base/status.hpp"
#include "nbdmap/pipeline/map_config.hpp"
#include "nbdmap/process/export_service.hpp"
#include "nbdmap/replay/block_target.hpp"
#include "nbdmap/replay/replay_engine.hpp"
#include "nbdmap/runtime/interrupt_monitor.hpp"

namespace nbdmap::pipeline {

// how often the export server is health-checked while serving
constexpr std::chrono::milliseconds k_serve_health_interval{1000};

using export_factory = std::function<std::unique_ptr<process::export_service>(const process::export_settings&)>;
using device_opener = std::function<result<std::unique_ptr<replay::block_target>>(const std::string& device)>;

// external collaborators of the pipeline
struct pipeline_ports {
  export_factory make_export;
  attach::attach_transport* transport = nullptr;
  device_opener open_device;
  replay::source_reader* sources = nullptr;
  runtime::interrupt_monitor* interrupts = nullptr;
};

// production ports: nbdkit, qemu-nbd, the device node and the signal handler
pipeline_ports make_system_ports(
    attach::attach_transport& transport, replay::source_reader& sources, runtime::interrupt_monitor& interrupts
);

// decode -> resolve -> export -> attach -> replay -> serve. run() blocks while
// serving and returns when interrupted, when the export server dies or on the
// first fatal error; every acquired resource is released before it returns.
class map_pipeline {
public:
  map_pipeline(map_config config, pipeline_ports ports);

  status run();

  const std::optional<attach::attach_session>& session() const { return session_; }
  const std::optional<replay::replay_stats>& replay_result() const { return replay_stats_; }
  const std::string& routing_table_path() const { return routing_table_path_; }

private:
  map_config config_;
  pipeline_ports ports_;
  std::optional<attach::attach_session> session_;
  std::optional<replay::replay_stats> replay_stats_;
  std::string routing_table_path_;
  redlog::logger log_;
};

} // namespace nbdmap::pipeline
