#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <redlog.hpp>

namespace nbdmap::process {

namespace {

auto log_process = redlog::get_logger("nbdmap.process");

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    out.push_back(const_cast<char*>(arg.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// exec in the child; reports errno through the close-on-exec pipe on failure
[[noreturn]] void exec_child(std::vector<char*>& argv, int error_fd) {
  ::execvp(argv[0], argv.data());
  int exec_errno = errno;
  ssize_t ignored = ::write(error_fd, &exec_errno, sizeof(exec_errno));
  (void) ignored;
  ::_exit(127);
}

// reads the exec error pipe; 0 means exec succeeded
int read_exec_error(int error_fd) {
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(error_fd, &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  return got == static_cast<ssize_t>(sizeof(exec_errno)) ? exec_errno : 0;
}

} // namespace

std::string outcome::describe() const {
  std::string text;
  if (signal != 0) {
    text = "terminated by signal " + std::to_string(signal);
  } else {
    text = "exit code " + std::to_string(exit_code);
  }
  if (!stderr_text.empty()) {
    text += ": " + stderr_text;
  }
  return text;
}

std::string join_command(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

result<outcome> run_command(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    return error_result<outcome>(error_code::process_error, "empty command line");
  }

  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    int pipe_errno = errno;
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return error_result<outcome>(error_code::process_error, std::string("pipe failed: ") + std::strerror(pipe_errno));
  }

  auto args = make_argv(argv);
  log_process.trc("running command", redlog::field("command", join_command(argv)));

  pid_t pid = ::fork();
  if (pid == 0) {
    ::dup2(err_pipe[1], STDERR_FILENO);
    exec_child(args, exec_pipe[1]);
  }

  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  if (pid < 0) {
    int fork_errno = errno;
    close_fd(err_pipe[0]);
    close_fd(exec_pipe[0]);
    return error_result<outcome>(error_code::process_error, std::string("fork failed: ") + std::strerror(fork_errno));
  }

  int exec_errno = read_exec_error(exec_pipe[0]);
  close_fd(exec_pipe[0]);

  outcome out{};
  std::array<char, 4096> buffer{};
  while (true) {
    ssize_t got = ::read(err_pipe[0], buffer.data(), buffer.size());
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    out.stderr_text.append(buffer.data(), static_cast<size_t>(got));
  }
  close_fd(err_pipe[0]);

  int raw_status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &raw_status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited < 0) {
    return error_result<outcome>(
        error_code::process_error, "waitpid failed for " + argv[0] + ": " + std::strerror(errno)
    );
  }

  if (exec_errno != 0) {
    return error_result<outcome>(
        error_code::process_error, "failed to execute " + argv[0] + ": " + std::strerror(exec_errno)
    );
  }

  if (WIFSIGNALED(raw_status)) {
    out.signal = WTERMSIG(raw_status);
  } else if (WIFEXITED(raw_status)) {
    out.exit_code = WEXITSTATUS(raw_status);
  }

  while (!out.stderr_text.empty() && (out.stderr_text.back() == '\n' || out.stderr_text.back() == '\r')) {
    out.stderr_text.pop_back();
  }

  log_process.dbg(
      "command finished", redlog::field("command", argv[0]), redlog::field("exit_code", out.exit_code),
      redlog::field("signal", out.signal)
  );
  return ok_result(std::move(out));
}

child_process::~child_process() { terminate(); }

result<std::unique_ptr<child_process>> child_process::spawn(const std::vector<std::string>& argv) {
  if (argv.empty()) {
    return error_result<std::unique_ptr<child_process>>(error_code::process_error, "empty command line");
  }

  int exec_pipe[2] = {-1, -1};
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    return error_result<std::unique_ptr<child_process>>(
        error_code::process_error, std::string("pipe failed: ") + std::strerror(errno)
    );
  }

  auto args = make_argv(argv);
  log_process.dbg("spawning process", redlog::field("command", join_command(argv)));

  pid_t pid = ::fork();
  if (pid == 0) {
    // children must not inherit the parent's interrupt handling
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    exec_child(args, exec_pipe[1]);
  }
  close_fd(exec_pipe[1]);

  if (pid < 0) {
    int fork_errno = errno;
    close_fd(exec_pipe[0]);
    return error_result<std::unique_ptr<child_process>>(
        error_code::process_error, std::string("fork failed: ") + std::strerror(fork_errno)
    );
  }

  int exec_errno = read_exec_error(exec_pipe[0]);
  close_fd(exec_pipe[0]);

  std::unique_ptr<child_process> child(new child_process(pid));
  if (exec_errno != 0) {
    child->terminate(std::chrono::milliseconds(0));
    return error_result<std::unique_ptr<child_process>>(
        error_code::process_error, "failed to execute " + argv[0] + ": " + std::strerror(exec_errno)
    );
  }

  log_process.inf("process started", redlog::field("command", argv[0]), redlog::field("pid", pid));
  return ok_result(std::move(child));
}

void child_process::record_status(int raw_status) {
  reaped_ = true;
  if (WIFSIGNALED(raw_status)) {
    exit_status_.signal = WTERMSIG(raw_status);
  } else if (WIFEXITED(raw_status)) {
    exit_status_.exit_code = WEXITSTATUS(raw_status);
  }
}

bool child_process::running() {
  if (reaped_ || pid_ <= 0) {
    return false;
  }

  int raw_status = 0;
  pid_t waited = ::waitpid(pid_, &raw_status, WNOHANG);
  if (waited == 0) {
    return true;
  }
  if (waited == pid_) {
    record_status(raw_status);
    log_process.dbg("process exited", redlog::field("pid", pid_), redlog::field("status", exit_status_.describe()));
  } else {
    // already reaped elsewhere or not our child anymore
    reaped_ = true;
  }
  return false;
}

void child_process::terminate(std::chrono::milliseconds grace) {
  if (!running()) {
    return;
  }

  log_process.dbg("terminating process", redlog::field("pid", pid_));
  ::kill(pid_, SIGTERM);

  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!running()) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  if (!running()) {
    return;
  }

  log_process.wrn("process ignored SIGTERM, killing", redlog::field("pid", pid_));
  ::kill(pid_, SIGKILL);
  int raw_status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid_, &raw_status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited == pid_) {
    record_status(raw_status);
  } else {
    reaped_ = true;
  }
}

} // namespace nbdmap::process
