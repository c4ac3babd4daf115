#pragma once

#include <chrono>
#include <string>

namespace nbdmap::runtime::signal_handler {

/**
 * @brief configuration for signal handling behavior
 */
struct config {
  std::string context_name = "nbdmap"; ///< context name for logging
  bool log_signals = false;            ///< log signal reception for debugging
};

/**
 * @brief install SIGINT/SIGTERM handlers and the wakeup pipe
 * @param cfg configuration for signal handling behavior
 * @return true if initialization succeeded
 *
 * the handler itself only records the signal and wakes waiters; all cleanup
 * runs on the control thread.
 */
bool initialize(const config& cfg = {});

/**
 * @brief restore default dispositions and close the wakeup pipe
 */
void shutdown();

/**
 * @brief true once an interruption signal was received
 */
bool interrupted();

/**
 * @brief block until interrupted or the timeout elapses
 * @param timeout negative waits forever
 * @return true if interrupted
 */
bool wait_for_interrupt(std::chrono::milliseconds timeout);

/**
 * @brief raii helper for signal handling setup/cleanup
 */
class guard {
public:
  explicit guard(const config& cfg = {});
  ~guard();

  guard(const guard&) = delete;
  guard& operator=(const guard&) = delete;
  guard(guard&&) = delete;
  guard& operator=(guard&&) = delete;

  bool is_initialized() const;

private:
  bool initialized_;
};

} // namespace nbdmap::runtime::signal_handler
