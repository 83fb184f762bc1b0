#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include <lull/core/logger.hpp>
#include <lull/core/scheduler.hpp>

namespace lull {

// Fixed set of worker threads sharing one queue.
// Work still queued at destruction is run before the workers exit.
class thread_pool final : public executor {
public:
  explicit thread_pool(std::size_t threads = std::thread::hardware_concurrency()) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
      workers_.emplace_back([this]{ run(); });
    }
    LULL_LOG_DEBUG("thread_pool started with {} workers", threads);
  }

  ~thread_pool() override {
    {
      std::lock_guard<std::mutex> lock(m_);
      stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) if (t.joinable()) t.join();
  }

  void post(std::function<void()> f) override {
    {
      std::lock_guard<std::mutex> lock(m_);
      q_.push(std::move(f));
    }
    cv_.notify_one();
  }

  // Blocks until the queue is empty and no worker is running a task
  void wait_idle() {
    std::unique_lock<std::mutex> lock(m_);
    idle_cv_.wait(lock, [&]{ return q_.empty() && busy_ == 0; });
  }

  std::size_t size() const noexcept { return workers_.size(); }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;

private:
  void run() {
    for (;;) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [&]{ return stop_ || !q_.empty(); });
        if (stop_ && q_.empty()) return;
        task = std::move(q_.front());
        q_.pop();
        ++busy_;
      }
      // a throwing task must not take the worker down with it
      try {
        task();
      } catch (const std::exception& e) {
        LULL_LOG_ERROR("thread_pool task threw: {}", e.what());
      } catch (...) {
        LULL_LOG_ERROR("thread_pool task threw a non-standard exception");
      }
      {
        std::lock_guard<std::mutex> lock(m_);
        --busy_;
        if (q_.empty() && busy_ == 0) idle_cv_.notify_all();
      }
    }
  }

  std::mutex m_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<std::function<void()>> q_;
  std::vector<std::thread> workers_;
  std::size_t busy_{0};
  bool stop_{false};
};

} // namespace lull
