#include "map_pipeline.hpp"

#include "nbdmap/blockmap/routing_table.hpp"
#include "nbdmap/chain/backup_chain.hpp"
#include "nbdmap/chain/extent_resolver.hpp"
#include "nbdmap/runtime/teardown.hpp"

namespace nbdmap::pipeline {

namespace {

status with_stage(const char* stage, const status& failure) {
  return make_status(failure.code, std::string(stage) + ": " + failure.message);
}

} // namespace

pipeline_ports make_system_ports(
    attach::attach_transport& transport, replay::source_reader& sources, runtime::interrupt_monitor& interrupts
) {
  pipeline_ports ports{};
  ports.make_export = [](const process::export_settings& settings) -> std::unique_ptr<process::export_service> {
    return std::make_unique<process::nbdkit_service>(settings);
  };
  ports.transport = &transport;
  ports.open_device = [](const std::string& device) -> result<std::unique_ptr<replay::block_target>> {
    auto opened = replay::device_target::open(device);
    if (!opened.ok()) {
      return error_result<std::unique_ptr<replay::block_target>>(opened.status);
    }
    return ok_result<std::unique_ptr<replay::block_target>>(std::move(opened.value));
  };
  ports.sources = &sources;
  ports.interrupts = &interrupts;
  return ports;
}

map_pipeline::map_pipeline(map_config config, pipeline_ports ports)
    : config_(std::move(config)), ports_(std::move(ports)), log_(redlog::get_logger("nbdmap.pipeline")) {}

status map_pipeline::run() {
  if (!ports_.make_export || !ports_.transport || !ports_.open_device || !ports_.sources || !ports_.interrupts) {
    return make_status(error_code::precondition_error, "pipeline ports are incomplete");
  }
  auto& interrupts = *ports_.interrupts;

  // everything up to resolution runs before any process exists
  std::string config_error;
  if (!config_.validate(config_error)) {
    return make_status(error_code::precondition_error, config_error);
  }

  auto chain = chain::backup_chain::from_list(config_.files);
  if (!chain.ok()) {
    return with_stage("chain", chain.status);
  }
  if (config_.read_only && chain.value.has_incrementals()) {
    return make_status(
        error_code::precondition_error, "read-only mapping is not possible with incremental backups"
    );
  }

  chain::extent_resolver resolver;
  auto resolved = resolver.resolve(chain.value);
  if (!resolved.ok()) {
    return with_stage("resolve", resolved.status);
  }
  const chain::resolved_extent_map& map = resolved.value;

  if (interrupts.interrupted()) {
    return make_status(error_code::interrupted, "interrupted before the export server started");
  }

  // owners are declared before the sequence so release actions never outlive them
  std::unique_ptr<blockmap::routing_table_file> routing_table;
  std::unique_ptr<process::export_service> server;
  runtime::teardown_sequence teardown;

  auto table = blockmap::routing_table_file::create(config_.temp_directory);
  if (!table.ok()) {
    return with_stage("routing table", table.status);
  }
  routing_table = std::move(table.value);
  routing_table_path_ = routing_table->path();
  blockmap::routing_table_file& table_file = *routing_table;
  teardown.add("routing table", runtime::k_teardown_remove_routing_table, [&table_file]() { table_file.remove(); });

  status written = table_file.write(map);
  if (!written.ok()) {
    return with_stage("routing table", written);
  }

  process::export_settings settings{};
  settings.executable = config_.nbdkit;
  settings.plugin = config_.plugin;
  settings.routing_table = table_file.path();
  settings.listen_address = config_.listen_address;
  settings.port = static_cast<uint16_t>(config_.listen_port);
  settings.export_name = config_.export_name;
  settings.threads = config_.threads;
  settings.block_size = config_.block_size;
  settings.read_only = config_.read_only;
  settings.copy_on_write = chain.value.has_incrementals();

  server = ports_.make_export(settings);
  if (!server) {
    return make_status(error_code::process_error, "no export server available");
  }
  process::export_service& export_server = *server;
  teardown.add("export server", runtime::k_teardown_stop_export, [&export_server]() { export_server.stop(); });

  status started = export_server.start();
  if (!started.ok()) {
    return with_stage("export server", started);
  }

  attach::endpoint target{};
  target.host = config_.listen_address;
  target.port = settings.port;
  target.export_name = config_.export_name;

  attach::attach_options options{};
  options.max_attempts = config_.attach_retries;
  options.backoff = std::chrono::milliseconds(config_.attach_backoff_ms);
  options.read_only = config_.read_only;
  options.chain_length = chain.value.size();

  attach::attach_controller controller(*ports_.transport, export_server, interrupts);
  session_ = controller.attach(target, config_.device, options);
  if (session_->status != attach::attach_status::connected) {
    return with_stage("attach", session_->failure);
  }

  attach::attach_transport& transport = *ports_.transport;
  const std::string device = config_.device;
  teardown.add("device attachment", runtime::k_teardown_detach_device, [this, &transport, device]() {
    status detached = transport.disconnect(device);
    if (!detached.ok()) {
      log_.wrn("device detach failed", redlog::field("device", device), redlog::field("error", detached.message));
    }
  });

  if (chain.value.has_incrementals()) {
    auto opened = ports_.open_device(config_.device);
    if (!opened.ok()) {
      return with_stage("replay", opened.status);
    }
    replay::replay_engine engine(*opened.value, *ports_.sources, &interrupts);
    auto replayed = engine.replay(map);
    if (!replayed.ok()) {
      return with_stage("replay", replayed.status);
    }
    replay_stats_ = replayed.value;
  }

  log_.inf(
      "device ready", redlog::field("device", config_.device), redlog::field("export", target.uri()),
      redlog::field("files", chain.value.size()), redlog::field("read_only", config_.read_only)
  );

  // serve until interrupted; a dead export server ends the mapping
  while (interrupts.sleep_for(k_serve_health_interval)) {
    if (!export_server.running()) {
      log_.err("export server exited while serving", redlog::field("device", config_.device));
      return make_status(error_code::process_error, "export server exited while the device was attached");
    }
  }

  log_.inf("interrupted, shutting down");
  teardown.run();
  return make_status(error_code::interrupted, "mapping stopped by interruption");
}

} // namespace nbdmap::pipeline
