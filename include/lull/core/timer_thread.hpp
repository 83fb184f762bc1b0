#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <lull/core/clock.hpp>
#include <lull/core/logger.hpp>
#include <lull/core/scheduler.hpp>

namespace lull {

// Real-time clock backed by one helper thread.
// The thread sleeps until the earliest deadline and posts due callbacks to ex;
// it never runs them itself. A callback withdrawn after it was posted is skipped.
// IMPORTANT: ex must outlive the timer_thread.
class timer_thread final : public clock {
public:
  explicit timer_thread(executor& ex)
  : ex_(&ex), epoch_(std::chrono::steady_clock::now()), st_(std::make_shared<state>()) {
    worker_ = std::thread([this]{ run(); });
  }

  ~timer_thread() override {
    {
      std::lock_guard<std::mutex> lock(st_->m);
      st_->stop = true;
    }
    st_->cv.notify_all();
    if (worker_.joinable()) worker_.join();
  }

  duration now() const override {
    return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() - epoch_);
  }

  [[nodiscard]] subscription schedule_after(duration d, std::function<void()> fn) override {
    if (d < duration::zero()) d = duration::zero();

    auto alive = std::make_shared<std::atomic<bool>>(true);
    key k;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      k = key{std::chrono::steady_clock::now() + d, st_->seq++};
      st_->queue.emplace(k, entry{std::move(fn), alive});
    }
    st_->cv.notify_all();

    std::weak_ptr<state> weak = st_;
    return subscription([weak, k, alive]{
      alive->store(false, std::memory_order_release);
      if (auto st = weak.lock()) {
        std::lock_guard<std::mutex> lock(st->m);
        st->queue.erase(k);
      }
    });
  }

  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(st_->m);
    return st_->queue.size();
  }

  timer_thread(const timer_thread&) = delete;
  timer_thread& operator=(const timer_thread&) = delete;

private:
  struct key {
    std::chrono::steady_clock::time_point due{};
    std::uint64_t seq{};
    bool operator<(const key& o) const noexcept {
      return due < o.due || (due == o.due && seq < o.seq);
    }
  };

  struct entry {
    std::function<void()> fn;
    std::shared_ptr<std::atomic<bool>> alive;
  };

  struct state {
    mutable std::mutex m;
    std::condition_variable cv;
    std::map<key, entry> queue;
    std::uint64_t seq{0};
    bool stop{false};
  };

  void run() {
    std::unique_lock<std::mutex> lock(st_->m);
    while (!st_->stop) {
      if (st_->queue.empty()) {
        st_->cv.wait(lock, [&]{ return st_->stop || !st_->queue.empty(); });
        continue;
      }

      auto it = st_->queue.begin();
      const auto due = it->first.due;
      if (std::chrono::steady_clock::now() < due) {
        st_->cv.wait_until(lock, due);
        continue; // something earlier may have been scheduled or withdrawn
      }

      entry e = std::move(it->second);
      st_->queue.erase(it);

      lock.unlock();
      ex_->post([fn = std::move(e.fn), alive = std::move(e.alive)]{
        if (alive->load(std::memory_order_acquire)) fn();
      });
      lock.lock();
    }

    if (!st_->queue.empty()) {
      LULL_LOG_DEBUG("timer_thread stopped with {} callbacks dropped", st_->queue.size());
    }
  }

  executor* ex_;
  std::chrono::steady_clock::time_point epoch_;
  std::shared_ptr<state> st_;
  std::thread worker_;
};

} // namespace lull
