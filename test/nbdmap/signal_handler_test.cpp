#include <doctest/doctest.h>

#include <chrono>
#include <csignal>
#include <thread>

#include <signal.h>
#include <unistd.h>

#include "nbdmap/runtime/interrupt_monitor.hpp"
#include "nbdmap/runtime/signal_handler.hpp"

using namespace nbdmap;
using namespace std::chrono_literals;

namespace {

void raise_later(int signum, std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
  ::kill(::getpid(), signum);
}

} // namespace

TEST_CASE("sigint wakes a monitor sleeping through attach backoff") {
  runtime::signal_handler::guard signals;
  REQUIRE(signals.is_initialized());

  runtime::signal_interrupt_monitor monitor;
  CHECK_FALSE(monitor.interrupted());

  auto started = std::chrono::steady_clock::now();
  std::thread raiser(raise_later, SIGINT, 150ms);
  bool completed = monitor.sleep_for(5000ms);
  auto elapsed = std::chrono::steady_clock::now() - started;
  raiser.join();

  CHECK_FALSE(completed);
  CHECK(monitor.interrupted());
  CHECK(elapsed < 4000ms);
}

TEST_CASE("sigterm wakes a monitor waiting without a deadline") {
  runtime::signal_handler::guard signals;
  REQUIRE(signals.is_initialized());
  CHECK_FALSE(runtime::signal_handler::interrupted());

  std::thread raiser(raise_later, SIGTERM, 100ms);
  bool interrupted = runtime::signal_handler::wait_for_interrupt(-1ms);
  raiser.join();

  CHECK(interrupted);
  CHECK(runtime::signal_handler::interrupted());
}

TEST_CASE("sleep after an interruption returns at once") {
  runtime::signal_handler::guard signals;
  REQUIRE(signals.is_initialized());

  runtime::signal_interrupt_monitor monitor;
  ::raise(SIGINT);
  CHECK(monitor.interrupted());

  auto started = std::chrono::steady_clock::now();
  CHECK_FALSE(monitor.sleep_for(5000ms));
  CHECK(std::chrono::steady_clock::now() - started < 1000ms);
}

TEST_CASE("uninterrupted sleep runs to its deadline") {
  runtime::signal_handler::guard signals;
  REQUIRE(signals.is_initialized());

  runtime::signal_interrupt_monitor monitor;
  auto started = std::chrono::steady_clock::now();
  CHECK(monitor.sleep_for(50ms));
  CHECK(std::chrono::steady_clock::now() - started >= 40ms);
  CHECK_FALSE(monitor.interrupted());
}

TEST_CASE("a new guard starts uninterrupted") {
  {
    runtime::signal_handler::guard signals;
    REQUIRE(signals.is_initialized());
    ::raise(SIGINT);
    CHECK(runtime::signal_handler::interrupted());
  }

  runtime::signal_handler::guard signals;
  REQUIRE(signals.is_initialized());
  CHECK_FALSE(runtime::signal_handler::interrupted());
}
