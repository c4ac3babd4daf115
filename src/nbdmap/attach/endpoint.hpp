#pragma once

#include <cstdint>
#include <string>

namespace nbdmap::attach {

struct endpoint {
  std::string host = "127.0.0.1";
  uint16_t port = 10809;
  std::string export_name;

  // host:port, ipv6 literals bracketed
  std::string address() const {
    if (host.find(':') != std::string::npos) {
      return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
  }

  std::string uri() const { return "nbd://" + address() + "/" + export_name; }
};

} // namespace nbdmap::attach
