#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace nbdmap {

// error codes shared by every stage of the mapping pipeline
enum class error_code {
  ok,
  format_error,
  chain_error,
  precondition_error,
  process_error,
  replay_error,
  io_error,
  interrupted
};

inline std::string_view error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::format_error:
    return "format error";
  case error_code::chain_error:
    return "chain error";
  case error_code::precondition_error:
    return "precondition error";
  case error_code::process_error:
    return "process error";
  case error_code::replay_error:
    return "replay error";
  case error_code::io_error:
    return "io error";
  case error_code::interrupted:
    return "interrupted";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }

  std::string describe() const {
    if (ok()) {
      return "ok";
    }
    return std::string(error_code_name(code)) + ": " + message;
  }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  nbdmap::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status failure) { return result<T>{T{}, std::move(failure)}; }

} // namespace nbdmap
