#pragma once

#include <functional>
#include <string>
#include <vector>

#include <redlog.hpp>

namespace nbdmap::runtime {

// release actions for resources acquired along the pipeline. run() executes
// them once, highest priority first and newest first within a priority; the
// destructor runs whatever is still pending.
class teardown_sequence {
public:
  using action = std::function<void()>;

  teardown_sequence();
  ~teardown_sequence();

  teardown_sequence(const teardown_sequence&) = delete;
  teardown_sequence& operator=(const teardown_sequence&) = delete;

  void add(std::string name, int priority, action release);

  void run();

  bool done() const { return done_; }
  size_t pending() const { return entries_.size(); }

private:
  struct entry {
    std::string name;
    int priority = 0;
    size_t order = 0;
    action release;
  };

  std::vector<entry> entries_;
  size_t next_order_ = 0;
  bool done_ = false;
  redlog::logger log_;
};

// priorities used by the mapping pipeline
constexpr int k_teardown_detach_device = 30;
constexpr int k_teardown_stop_export = 20;
constexpr int k_teardown_remove_routing_table = 10;

} // namespace nbdmap::runtime
