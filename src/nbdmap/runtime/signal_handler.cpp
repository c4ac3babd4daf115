#include "signal_handler.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <redlog.hpp>

namespace nbdmap::runtime::signal_handler {

namespace {

// global state, touched from signal context only through atomics and write()
std::atomic<bool> g_initialized{false};
std::atomic<bool> g_interrupted{false};
std::atomic<int> g_wake_read{-1};
std::atomic<int> g_wake_write{-1};
std::atomic<bool> g_log_signals{false};
redlog::logger g_log("nbdmap.signal_handler");

void signal_write(const char* message) {
  ssize_t ignored = ::write(STDERR_FILENO, message, std::strlen(message));
  (void) ignored;
}

void wake_waiters() {
  int fd = g_wake_write.load();
  if (fd >= 0) {
    const char byte = 1;
    ssize_t ignored = ::write(fd, &byte, 1);
    (void) ignored;
  }
}

void unix_handler(int signum) {
  int saved_errno = errno;
  if (g_log_signals.load()) {
    signal_write(signum == SIGTERM ? "received sigterm signal\n" : "received sigint signal\n");
  }
  g_interrupted.store(true);
  wake_waiters();
  errno = saved_errno;
}

void close_pipe() {
  int read_fd = g_wake_read.exchange(-1);
  int write_fd = g_wake_write.exchange(-1);
  if (read_fd >= 0) {
    ::close(read_fd);
  }
  if (write_fd >= 0) {
    ::close(write_fd);
  }
}

} // anonymous namespace

bool initialize(const config& cfg) {
  if (g_initialized.exchange(true)) {
    return true; // already initialized
  }

  g_log = redlog::logger("nbdmap.signal_handler." + cfg.context_name);
  g_log_signals.store(cfg.log_signals);
  g_interrupted.store(false);

  g_log.dbg("initializing signal handler system", redlog::field("context", cfg.context_name));

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
    g_log.err("failed to create wakeup pipe", redlog::field("error", std::strerror(errno)));
    g_initialized = false;
    return false;
  }
  g_wake_read.store(fds[0]);
  g_wake_write.store(fds[1]);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = unix_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  for (int signum : {SIGINT, SIGTERM}) {
    if (sigaction(signum, &sa, nullptr) != 0) {
      g_log.err(
          "failed to install signal handler", redlog::field("signal", signum),
          redlog::field("error", std::strerror(errno))
      );
      signal(SIGINT, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      close_pipe();
      g_initialized = false;
      return false;
    }
  }

  return true;
}

void shutdown() {
  if (!g_initialized.exchange(false)) {
    return; // not initialized
  }

  g_log.dbg("shutting down signal handler system");

  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  close_pipe();
}

bool interrupted() { return g_interrupted.load(); }

bool wait_for_interrupt(std::chrono::milliseconds timeout) {
  if (g_interrupted.load()) {
    return true;
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  int fd = g_wake_read.load();
  if (fd < 0) {
    // handler not installed; plain timed wait
    while (!g_interrupted.load()) {
      if (timeout.count() >= 0 && std::chrono::steady_clock::now() >= deadline) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return g_interrupted.load();
  }

  while (!g_interrupted.load()) {
    int wait_ms = -1;
    if (timeout.count() >= 0) {
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, wait_ms);
    if (rc < 0 && errno != EINTR) {
      g_log.err("poll on wakeup pipe failed", redlog::field("error", std::strerror(errno)));
      break;
    }
    if (rc > 0) {
      char drain[16];
      while (::read(fd, drain, sizeof(drain)) > 0) {
      }
    }
  }

  return g_interrupted.load();
}

// raii guard implementation
guard::guard(const config& cfg) : initialized_(initialize(cfg)) {}

guard::~guard() {
  if (initialized_) {
    shutdown();
  }
}

bool guard::is_initialized() const { return initialized_; }

} // namespace nbdmap::runtime::signal_handler
