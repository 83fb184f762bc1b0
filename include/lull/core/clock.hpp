#pragma once
#include <chrono>
#include <functional>

#include <lull/core/subscription.hpp>

namespace lull {

// Source of time and of cancellable delays.
// schedule_after never runs fn inside the call itself, even for a zero delay:
// the callback waits for the next scheduling opportunity.
// Resetting the returned subscription withdraws fn if it has not started yet.
class clock {
public:
  using duration = std::chrono::milliseconds;

  virtual ~clock() = default;

  // time elapsed since the clock's epoch
  virtual duration now() const = 0;

  [[nodiscard]] virtual subscription schedule_after(duration d, std::function<void()> fn) = 0;
};

} // namespace lull
