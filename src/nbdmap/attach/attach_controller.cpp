#include "attach_controller.hpp"

namespace nbdmap::attach {

namespace {
constexpr std::string_view k_connection_refused = "Connection refused";
} // namespace

const char* attach_status_name(attach_status status) {
  switch (status) {
  case attach_status::pending:
    return "pending";
  case attach_status::connected:
    return "connected";
  case attach_status::failed:
    return "failed";
  }
  return "unknown";
}

failure_class classify_attach_failure(std::string_view helper_stderr) {
  return helper_stderr.find(k_connection_refused) != std::string_view::npos ? failure_class::not_ready
                                                                           : failure_class::fatal;
}

attach_controller::attach_controller(
    attach_transport& transport, process::export_service& server, runtime::interrupt_monitor& interrupts
)
    : transport_(transport), server_(server), interrupts_(interrupts), log_(redlog::get_logger("nbdmap.attach")) {}

attach_session attach_controller::fail(attach_session session, error_code code, std::string message) {
  session.status = attach_status::failed;
  session.failure = make_status(code, std::move(message));
  log_.err(
      "device attach failed", redlog::field("device", session.device), redlog::field("endpoint", session.endpoint),
      redlog::field("attempts", session.attempts), redlog::field("error", session.failure.describe())
  );
  server_.stop();
  return session;
}

attach_session attach_controller::attach(
    const endpoint& target, const std::string& device, const attach_options& options
) {
  attach_session session{};
  session.device = device;
  session.endpoint = target.address();

  if (options.read_only && options.chain_length > 1) {
    return fail(
        std::move(session), error_code::precondition_error,
        "read-only attach cannot be combined with incremental backups, replay needs write access"
    );
  }
  if (options.max_attempts == 0) {
    return fail(std::move(session), error_code::precondition_error, "attach attempt bound must be at least 1");
  }

  attach_request request{};
  request.device = device;
  request.endpoint = target;
  request.read_only = options.read_only;

  log_.inf(
      "attaching device", redlog::field("device", device), redlog::field("uri", target.uri()),
      redlog::field("read_only", options.read_only)
  );

  while (session.status == attach_status::pending) {
    if (interrupts_.interrupted()) {
      return fail(std::move(session), error_code::interrupted, "interrupted while attaching " + device);
    }
    if (!server_.running()) {
      return fail(std::move(session), error_code::process_error, "export server exited before the device attached");
    }

    ++session.attempts;
    auto connected = transport_.connect(request);
    if (!connected.ok()) {
      return fail(std::move(session), error_code::process_error, connected.status.message);
    }

    const auto& outcome = connected.value;
    if (outcome.success()) {
      session.status = attach_status::connected;
      break;
    }

    if (classify_attach_failure(outcome.stderr_text) == failure_class::fatal) {
      return fail(std::move(session), error_code::process_error, "attach helper failed: " + outcome.describe());
    }

    if (session.attempts >= options.max_attempts) {
      return fail(
          std::move(session), error_code::process_error,
          "export not reachable after " + std::to_string(session.attempts) + " attempts: " + outcome.describe()
      );
    }

    log_.vrb(
        "export not ready, retrying", redlog::field("attempt", session.attempts),
        redlog::field("max_attempts", options.max_attempts), redlog::field("backoff_ms", options.backoff.count())
    );
    ++session.retries_used;
    if (!interrupts_.sleep_for(options.backoff)) {
      return fail(std::move(session), error_code::interrupted, "interrupted while waiting for the export server");
    }
  }

  log_.inf(
      "device attached", redlog::field("device", device), redlog::field("endpoint", session.endpoint),
      redlog::field("attempts", session.attempts)
  );
  return session;
}

} // namespace nbdmap::attach
