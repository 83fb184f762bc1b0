#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include <lull/core/subscription.hpp>

namespace lull {

// Raised at a suspension point when the surrounding work was cancelled.
// Not a failure: it only unwinds the cancelled work.
class operation_cancelled : public std::runtime_error {
public:
  operation_cancelled() : std::runtime_error("operation cancelled") {}
};

namespace detail {

struct cancel_state {
  std::mutex m;
  std::atomic<bool> requested{false};
  std::uint64_t next_id{0};
  std::vector<std::pair<std::uint64_t, std::function<void()>>> callbacks;
};

} // namespace detail

// Read side, handed to the work that should stop.
// A default-constructed token is never cancelled.
class cancellation_token {
public:
  cancellation_token() noexcept = default;

  bool can_be_cancelled() const noexcept { return static_cast<bool>(st_); }

  bool cancellation_requested() const noexcept {
    return st_ && st_->requested.load(std::memory_order_acquire);
  }

  void throw_if_cancellation_requested() const {
    if (cancellation_requested()) throw operation_cancelled{};
  }

  // Runs fn once on cancellation (right away if already cancelled).
  // Resetting the returned subscription unregisters fn.
  [[nodiscard]] subscription on_cancel(std::function<void()> fn) const {
    if (!st_ || !fn) return subscription{};

    std::uint64_t id = 0;
    bool registered = false;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (!st_->requested.load(std::memory_order_acquire)) {
        id = st_->next_id++;
        st_->callbacks.emplace_back(id, std::move(fn));
        registered = true;
      }
    }
    if (!registered) {
      fn();
      return subscription{};
    }

    std::weak_ptr<detail::cancel_state> weak = st_;
    return subscription([weak, id]{
      auto st = weak.lock();
      if (!st) return;
      std::lock_guard<std::mutex> lock(st->m);
      for (auto it = st->callbacks.begin(); it != st->callbacks.end(); ++it) {
        if (it->first == id) { st->callbacks.erase(it); break; }
      }
    });
  }

private:
  friend class cancellation_source;
  explicit cancellation_token(std::shared_ptr<detail::cancel_state> st) noexcept : st_(std::move(st)) {}

  std::shared_ptr<detail::cancel_state> st_;
};

// Write side, kept by the owner of the work.
class cancellation_source {
public:
  cancellation_source() : st_(std::make_shared<detail::cancel_state>()) {}

  cancellation_token token() const noexcept { return cancellation_token{st_}; }

  bool cancellation_requested() const noexcept {
    return st_->requested.load(std::memory_order_acquire);
  }

  // Returns true only for the call that actually cancelled.
  // Callbacks run on the calling thread, outside the lock.
  bool request_cancel() {
    std::vector<std::pair<std::uint64_t, std::function<void()>>> local;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (st_->requested.exchange(true, std::memory_order_acq_rel)) return false;
      local.swap(st_->callbacks);
    }
    for (auto& cb : local) cb.second();
    return true;
  }

private:
  std::shared_ptr<detail::cancel_state> st_;
};

} // namespace lull
