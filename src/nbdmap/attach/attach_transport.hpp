#pragma once

#include <string>
#include <vector>

#include "nbdmap/attach/endpoint.hpp"
#include "nbdmap/base/status.hpp"
#include "nbdmap/process/subprocess.hpp"

namespace nbdmap::attach {

struct attach_request {
  std::string device;
  attach::endpoint endpoint;
  bool read_only = false;
};

// connects a local block device node to a network export. a process_error
// status means the helper could not run at all; a helper that ran and failed
// returns ok with a non-zero outcome.
class attach_transport {
public:
  virtual ~attach_transport() = default;

  virtual result<process::outcome> connect(const attach_request& request) = 0;
  virtual status disconnect(const std::string& device) = 0;
};

class qemu_nbd_transport final : public attach_transport {
public:
  explicit qemu_nbd_transport(std::string executable = "qemu-nbd");

  result<process::outcome> connect(const attach_request& request) override;
  status disconnect(const std::string& device) override;

  std::vector<std::string> connect_command(const attach_request& request) const;

private:
  std::string executable_;
};

} // namespace nbdmap::attach
