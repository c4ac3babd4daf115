#pragma once

#include <cstdint>
#include <string>

namespace nbdmap::util {

// reads PREFIX_NAME environment variables with typed defaults
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> uint32_t env_config::get<uint32_t>(const std::string& name, uint32_t default_value) const;

} // namespace nbdmap::util
