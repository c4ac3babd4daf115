#include "map.hpp"

#include <iostream>

#include <redlog.hpp>

#include "nbdmap/attach/attach_transport.hpp"
#include "nbdmap/pipeline/map_config.hpp"
#include "nbdmap/pipeline/map_pipeline.hpp"
#include "nbdmap/replay/block_target.hpp"
#include "nbdmap/runtime/interrupt_monitor.hpp"
#include "nbdmap/runtime/signal_handler.hpp"

namespace nbdmap_cli::commands {

int map(
    args::ValueFlag<std::string>& files_flag, args::ValueFlag<std::string>& device_flag,
    args::ValueFlag<std::string>& export_flag, args::ValueFlag<std::string>& listen_address_flag,
    args::ValueFlag<uint32_t>& listen_port_flag, args::ValueFlag<uint32_t>& threads_flag,
    args::ValueFlag<uint32_t>& block_size_flag, args::Flag& read_only_flag
) {
  auto log = redlog::get_logger("nbdmap.cli");

  if (!files_flag) {
    log.err("--file argument required");
    return 1;
  }

  auto config = nbdmap::pipeline::map_config::from_environment();
  config.files = args::get(files_flag);
  if (device_flag) {
    config.device = args::get(device_flag);
  }
  if (export_flag) {
    config.export_name = args::get(export_flag);
  }
  if (listen_address_flag) {
    config.listen_address = args::get(listen_address_flag);
  }
  if (listen_port_flag) {
    config.listen_port = args::get(listen_port_flag);
  }
  if (threads_flag) {
    config.threads = args::get(threads_flag);
  }
  if (block_size_flag) {
    config.block_size = args::get(block_size_flag);
  }
  config.read_only = args::get(read_only_flag);

  nbdmap::runtime::signal_handler::config signal_config;
  signal_config.context_name = "nbdmap";
  signal_config.log_signals = true;
  nbdmap::runtime::signal_handler::guard signals(signal_config);
  if (!signals.is_initialized()) {
    log.err("failed to install signal handlers");
    return 1;
  }

  nbdmap::attach::qemu_nbd_transport transport(config.qemu_nbd);
  nbdmap::replay::file_source_reader sources;
  nbdmap::runtime::signal_interrupt_monitor interrupts;

  auto ports = nbdmap::pipeline::make_system_ports(transport, sources, interrupts);
  nbdmap::pipeline::map_pipeline pipeline(config, ports);

  nbdmap::status outcome = pipeline.run();
  if (outcome.code == nbdmap::error_code::interrupted) {
    log.inf("mapping stopped", redlog::field("device", config.device));
    return 1;
  }

  log.err("mapping failed", redlog::field("error", outcome.describe()));
  std::cerr << "error: " << outcome.describe() << std::endl;
  return 1;
}

} // namespace nbdmap_cli::commands
