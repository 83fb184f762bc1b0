#pragma once
#include <exception>
#include <functional>
#include <utility>

#include <lull/core/logger.hpp>

namespace lull {

// RAII handle over a cancel operation (a timer, an upstream source, a running task).
// - One owner: copying is prohibited.
// - Moving transfers the cancel right and leaves the source empty.
// - The destructor cancels.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn) noexcept : cancel_(std::move(fn)) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept : cancel_(std::exchange(other.cancel_, nullptr)) {}

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
  }

  ~subscription() { reset(); }

  // Cancels once; repeated calls are no-op.
  // A throwing cancel function cannot escape a destructor, so the error is logged instead.
  void reset() noexcept {
    auto fn = std::exchange(cancel_, nullptr);
    if (!fn) return;
    try {
      fn();
    } catch (const std::exception& e) {
      LULL_LOG_WARNING("cancel function threw during reset: {}", e.what());
    } catch (...) {
      LULL_LOG_WARNING("cancel function threw a non-standard exception during reset");
    }
  }

  // Forget the cancel function without calling it: responsibility moved elsewhere.
  void release() noexcept { cancel_ = nullptr; }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

private:
  cancel_fn cancel_{};
};

} // namespace lull
