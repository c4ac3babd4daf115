#include "export_service.hpp"

namespace nbdmap::process {

std::vector<std::string> build_nbdkit_command(const export_settings& settings) {
  std::vector<std::string> argv = {
      settings.executable,
      "--foreground",
      "--exit-with-parent",
      "--ipaddr",
      settings.listen_address,
      "--port",
      std::to_string(settings.port),
      "--exportname",
      settings.export_name,
      "--threads",
      std::to_string(settings.threads),
  };
  if (settings.read_only) {
    argv.push_back("--readonly");
  }
  argv.push_back("--filter=blocksize");
  if (settings.copy_on_write) {
    argv.push_back("--filter=cow");
  }
  argv.push_back("python");
  argv.push_back(settings.plugin);
  argv.push_back("blockmap=" + settings.routing_table);
  argv.push_back("maxlen=" + std::to_string(settings.block_size));
  return argv;
}

nbdkit_service::nbdkit_service(export_settings settings)
    : settings_(std::move(settings)), log_(redlog::get_logger("nbdmap.export")) {}

nbdkit_service::~nbdkit_service() { stop(); }

status nbdkit_service::start() {
  if (child_ && child_->running()) {
    return ok_status();
  }

  auto argv = build_nbdkit_command(settings_);
  log_.inf(
      "starting export server", redlog::field("address", settings_.listen_address),
      redlog::field("port", settings_.port), redlog::field("export", settings_.export_name),
      redlog::field("threads", settings_.threads), redlog::field("read_only", settings_.read_only)
  );
  log_.dbg("export server command", redlog::field("command", join_command(argv)));

  auto spawned = child_process::spawn(argv);
  if (!spawned.ok()) {
    return make_status(error_code::process_error, "export server: " + spawned.status.message);
  }
  child_ = std::move(spawned.value);
  return ok_status();
}

bool nbdkit_service::running() {
  if (!child_) {
    return false;
  }
  bool alive = child_->running();
  if (!alive) {
    log_.trc("export server not running", redlog::field("status", child_->exit_status().describe()));
  }
  return alive;
}

void nbdkit_service::stop() {
  if (!child_) {
    return;
  }
  if (child_->running()) {
    log_.inf("stopping export server", redlog::field("pid", child_->pid()));
  }
  child_->terminate();
  child_.reset();
}

} // namespace nbdmap::process
