#include "teardown.hpp"

#include <algorithm>
#include <exception>

namespace nbdmap::runtime {

teardown_sequence::teardown_sequence() : log_(redlog::get_logger("nbdmap.runtime")) {}

teardown_sequence::~teardown_sequence() { run(); }

void teardown_sequence::add(std::string name, int priority, action release) {
  if (done_) {
    // sequence already ran; release immediately so nothing leaks
    log_.wrn("teardown already ran, releasing immediately", redlog::field("resource", name));
    if (release) {
      release();
    }
    return;
  }
  log_.dbg("registered release action", redlog::field("resource", name), redlog::field("priority", priority));
  entries_.push_back(entry{std::move(name), priority, next_order_++, std::move(release)});
}

void teardown_sequence::run() {
  if (done_) {
    return;
  }
  done_ = true;

  std::vector<entry> entries;
  entries.swap(entries_);
  std::sort(entries.begin(), entries.end(), [](const entry& a, const entry& b) {
    if (a.priority != b.priority) {
      return a.priority > b.priority;
    }
    return a.order > b.order;
  });

  for (auto& current : entries) {
    log_.vrb("releasing", redlog::field("resource", current.name));
    try {
      if (current.release) {
        current.release();
      }
    } catch (const std::exception& e) {
      log_.err("release action failed", redlog::field("resource", current.name), redlog::field("error", e.what()));
    } catch (...) {
      // remaining actions still run
      log_.err("release action failed", redlog::field("resource", current.name), redlog::field("error", "unknown exception"));
    }
  }
}

} // namespace nbdmap::runtime
