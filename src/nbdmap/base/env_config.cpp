#include "env_config.hpp"

#include <cstdlib>
#include <exception>
#include <limits>
#include <stdexcept>

#include <redlog.hpp>

#include "nbdmap/base/string_utils.hpp"

namespace nbdmap::util {

namespace {
auto log_env = redlog::get_logger("nbdmap.config");
} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? trim_copy(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  try {
    // stoull accepts a sign and wraps negatives
    if (value.front() == '-' || value.front() == '+') {
      throw std::invalid_argument("signed value");
    }
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
      throw std::out_of_range("value exceeds 32 bits");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception& e) {
    log_env.wrn(
        "failed to parse environment value, using default", redlog::field("name", build_env_name(name)),
        redlog::field("value", value), redlog::field("error", e.what())
    );
    return default_value;
  }
}

} // namespace nbdmap::util
