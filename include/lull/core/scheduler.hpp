#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace lull {

// Where deferred work runs. Timer callbacks of a timer_thread are posted here.
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Runs the work immediately on the posting thread
struct inline_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

// FIFO queue drained explicitly by its owner (e.g. a UI loop).
// Work posted while draining runs in the same drain() call.
class strand final : public executor {
public:
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  std::size_t drain() {
    std::size_t n = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front());
        q_.pop();
      }
      f();
      ++n;
    }
    return n;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.size();
  }

private:
  mutable std::mutex m_;
  std::queue<std::function<void()>> q_;
};

} // namespace lull
