#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <lull/core/clock.hpp>
#include <lull/core/logger.hpp>

namespace lull {

// Deterministic clock: time moves only when the owner advances it.
// Due callbacks run on the advancing thread, ordered by deadline and then by
// scheduling order. Work scheduled from a callback runs in the same advance
// call if its deadline is not past the target.
class virtual_clock final : public clock {
public:
  virtual_clock() : st_(std::make_shared<state>()) {}

  duration now() const override {
    std::lock_guard<std::mutex> lock(st_->m);
    return st_->now;
  }

  [[nodiscard]] subscription schedule_after(duration d, std::function<void()> fn) override {
    if (d < duration::zero()) d = duration::zero();

    key k;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      k = key{st_->now + d, st_->seq++};
      st_->queue.emplace(k, std::move(fn));
    }

    std::weak_ptr<state> weak = st_;
    return subscription([weak, k]{
      if (auto st = weak.lock()) {
        std::lock_guard<std::mutex> lock(st->m);
        st->queue.erase(k);
      }
    });
  }

  std::size_t advance_by(duration d) {
    if (d < duration::zero()) throw std::invalid_argument("virtual_clock: negative advance");
    return advance_to(now() + d);
  }

  // Runs everything due up to t, then leaves now() at t (or where it was, if later).
  std::size_t advance_to(duration t) {
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (st_->advancing) throw std::logic_error("virtual_clock: re-entrant advance");
      st_->advancing = true;
    }

    std::size_t ran = 0;
    for (;;) {
      std::function<void()> fn;
      {
        std::lock_guard<std::mutex> lock(st_->m);
        auto it = st_->queue.begin();
        if (it == st_->queue.end() || it->first.due > t) {
          if (t > st_->now) st_->now = t;
          st_->advancing = false;
          break;
        }
        if (it->first.due > st_->now) st_->now = it->first.due;
        fn = std::move(it->second);
        st_->queue.erase(it);
      }

      try {
        fn();
      } catch (...) {
        std::lock_guard<std::mutex> lock(st_->m);
        st_->advancing = false;
        throw;
      }
      ++ran;
    }

    if (ran > 0) LULL_LOG_DEBUG("virtual_clock ran {} callbacks, now={}ms", ran, now().count());
    return ran;
  }

  // Runs whatever is due at the current instant, zero-delay work included.
  std::size_t run_ready() { return advance_to(now()); }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(st_->m);
    return st_->queue.size();
  }

private:
  struct key {
    duration due{};
    std::uint64_t seq{};
    bool operator<(const key& o) const noexcept {
      return due < o.due || (due == o.due && seq < o.seq);
    }
  };

  struct state {
    mutable std::mutex m;
    duration now{0};
    std::uint64_t seq{0};
    bool advancing{false};
    std::map<key, std::function<void()>> queue;
  };

  std::shared_ptr<state> st_;
};

} // namespace lull
