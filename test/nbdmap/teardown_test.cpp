#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "nbdmap/runtime/teardown.hpp"

using namespace nbdmap;

TEST_CASE("teardown releases by priority then newest first") {
  std::vector<std::string> order;
  runtime::teardown_sequence teardown;
  teardown.add("routing table", runtime::k_teardown_remove_routing_table, [&]() { order.push_back("table"); });
  teardown.add("export server", runtime::k_teardown_stop_export, [&]() { order.push_back("export"); });
  teardown.add("first extra", 5, [&]() { order.push_back("extra1"); });
  teardown.add("second extra", 5, [&]() { order.push_back("extra2"); });
  teardown.add("device", runtime::k_teardown_detach_device, [&]() { order.push_back("device"); });
  CHECK(teardown.pending() == 5);

  teardown.run();
  CHECK(teardown.done());
  CHECK(teardown.pending() == 0);
  CHECK(order == std::vector<std::string>{"device", "export", "table", "extra2", "extra1"});
}

TEST_CASE("teardown runs only once") {
  int calls = 0;
  {
    runtime::teardown_sequence teardown;
    teardown.add("counter", 1, [&]() { ++calls; });
    teardown.run();
    teardown.run();
  }
  CHECK(calls == 1);
}

TEST_CASE("teardown runs pending actions on destruction") {
  int calls = 0;
  {
    runtime::teardown_sequence teardown;
    teardown.add("counter", 1, [&]() { ++calls; });
  }
  CHECK(calls == 1);
}

TEST_CASE("teardown continues after a failing action") {
  std::vector<std::string> order;
  runtime::teardown_sequence teardown;
  teardown.add("last", 1, [&]() { order.push_back("last"); });
  teardown.add("throws", 2, []() { throw std::runtime_error("release failed"); });
  teardown.run();
  CHECK(order == std::vector<std::string>{"last"});
}

TEST_CASE("teardown continues after a non-standard exception") {
  std::vector<std::string> order;
  {
    runtime::teardown_sequence teardown;
    teardown.add("routing table", runtime::k_teardown_remove_routing_table, [&]() { order.push_back("table"); });
    teardown.add("export server", runtime::k_teardown_stop_export, []() { throw 42; });
    teardown.add("device", runtime::k_teardown_detach_device, [&]() { order.push_back("device"); });
  }
  CHECK(order == std::vector<std::string>{"device", "table"});
}

TEST_CASE("actions added after teardown are released immediately") {
  int calls = 0;
  runtime::teardown_sequence teardown;
  teardown.run();
  teardown.add("late", 1, [&]() { ++calls; });
  CHECK(calls == 1);
  CHECK(teardown.pending() == 0);
}
