#include "attach_transport.hpp"

#include <redlog.hpp>

namespace nbdmap::attach {

namespace {
auto log_transport = redlog::get_logger("nbdmap.attach");
} // namespace

qemu_nbd_transport::qemu_nbd_transport(std::string executable) : executable_(std::move(executable)) {}

std::vector<std::string> qemu_nbd_transport::connect_command(const attach_request& request) const {
  std::vector<std::string> argv = {executable_, "-c", request.device};
  if (request.read_only) {
    argv.push_back("--read-only");
  }
  argv.push_back("--format=raw");
  argv.push_back(request.endpoint.uri());
  return argv;
}

result<process::outcome> qemu_nbd_transport::connect(const attach_request& request) {
  return process::run_command(connect_command(request));
}

status qemu_nbd_transport::disconnect(const std::string& device) {
  auto ran = process::run_command({executable_, "-d", device});
  if (!ran.ok()) {
    return ran.status;
  }
  if (!ran.value.success()) {
    return make_status(error_code::process_error, "failed to detach " + device + ": " + ran.value.describe());
  }
  log_transport.inf("device detached", redlog::field("device", device));
  return ok_status();
}

} // namespace nbdmap::attach
