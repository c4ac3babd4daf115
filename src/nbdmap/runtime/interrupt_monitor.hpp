#pragma once

#include <chrono>

namespace nbdmap::runtime {

// cancellation seen by blocking steps of the pipeline
class interrupt_monitor {
public:
  virtual ~interrupt_monitor() = default;

  virtual bool interrupted() const = 0;

  // returns false when woken early by an interruption
  virtual bool sleep_for(std::chrono::milliseconds duration) = 0;
};

// backed by the process signal handler
class signal_interrupt_monitor final : public interrupt_monitor {
public:
  bool interrupted() const override;
  bool sleep_for(std::chrono::milliseconds duration) override;
};

} // namespace nbdmap::runtime
