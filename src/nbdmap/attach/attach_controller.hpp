#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "nbdmap/attach/attach_transport.hpp"
#include "nbdmap/attach/endpoint.hpp"
#include "nbdmap/base/status.hpp"
#include "nbdmap/process/export_service.hpp"
#include "nbdmap/runtime/interrupt_monitor.hpp"

namespace nbdmap::attach {

enum class attach_status { pending, connected, failed };

const char* attach_status_name(attach_status status);

struct attach_session {
  std::string device;
  std::string endpoint;
  uint32_t attempts = 0;
  // attempts beyond the first
  uint32_t retries_used = 0;
  attach_status status = attach_status::pending;
  nbdmap::status failure{};
};

struct attach_options {
  uint32_t max_attempts = 10;
  std::chrono::milliseconds backoff{1000};
  bool read_only = false;
  size_t chain_length = 1;
};

enum class failure_class { not_ready, fatal };

// the helper only reports readiness through its error text; a refused
// connection means the export server is not listening yet
failure_class classify_attach_failure(std::string_view helper_stderr);

class attach_controller {
public:
  attach_controller(attach_transport& transport, process::export_service& server, runtime::interrupt_monitor& interrupts);

  // drives pending -> connected | failed. the export server is stopped on
  // every failure.
  attach_session attach(const endpoint& target, const std::string& device, const attach_options& options);

private:
  attach_session fail(attach_session session, error_code code, std::string message);

  attach_transport& transport_;
  process::export_service& server_;
  runtime::interrupt_monitor& interrupts_;
  redlog::logger log_;
};

} // namespace nbdmap::attach
