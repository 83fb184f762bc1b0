#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace lull {

// Operator settings. timeout is the quiet period a value must survive before
// its action runs; zero defers the action to the next scheduling opportunity.
struct debounce_config {
  std::chrono::milliseconds timeout{0};

  void validate() const {
    if (timeout < std::chrono::milliseconds::zero()) {
      throw std::invalid_argument("debounce timeout must be non-negative, got " +
                                  std::to_string(timeout.count()) + "ms");
    }
  }
};

} // namespace lull
