#include "interrupt_monitor.hpp"

#include "nbdmap/runtime/signal_handler.hpp"

namespace nbdmap::runtime {

bool signal_interrupt_monitor::interrupted() const { return signal_handler::interrupted(); }

bool signal_interrupt_monitor::sleep_for(std::chrono::milliseconds duration) {
  return !signal_handler::wait_for_interrupt(duration);
}

} // namespace nbdmap::runtime
