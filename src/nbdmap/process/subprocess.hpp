#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

#include "nbdmap/base/status.hpp"

namespace nbdmap::process {

struct outcome {
  int exit_code = -1;
  int signal = 0;
  std::string stderr_text;

  bool success() const { return signal == 0 && exit_code == 0; }
  std::string describe() const;
};

// runs argv to completion (PATH lookup), capturing stderr
result<outcome> run_command(const std::vector<std::string>& argv);

std::string join_command(const std::vector<std::string>& argv);

// long-running child; terminated on destruction if still alive
class child_process {
public:
  ~child_process();

  child_process(const child_process&) = delete;
  child_process& operator=(const child_process&) = delete;

  static result<std::unique_ptr<child_process>> spawn(const std::vector<std::string>& argv);

  pid_t pid() const { return pid_; }

  // reaps the child if it exited; false once it is gone
  bool running();

  // SIGTERM, wait up to grace, then SIGKILL; idempotent
  void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(3000));

  // exit status once the child has been reaped
  const outcome& exit_status() const { return exit_status_; }

private:
  explicit child_process(pid_t pid) : pid_(pid) {}

  void record_status(int raw_status);

  pid_t pid_ = -1;
  bool reaped_ = false;
  outcome exit_status_{};
};

} // namespace nbdmap::process
