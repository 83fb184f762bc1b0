#pragma once
#include <chrono>
#include <memory>

#include <lull/core/clock.hpp>
#include <lull/core/observable.hpp>
#include <lull/core/subscription.hpp>

namespace lull {

// Single-shot effect: after d, emit unit{} and complete.
// Unsubscribing before d withdraws the timer, so nothing is emitted.
// IMPORTANT: clk must outlive the subscription.
inline effect delay(std::chrono::milliseconds d, clock& clk) {
  return effect::create([d, &clk](auto on_next, auto, auto on_done){
    return clk.schedule_after(d, [on_next, on_done]{
      on_next(unit{});
      on_done();
    });
  });
}

} // namespace lull
