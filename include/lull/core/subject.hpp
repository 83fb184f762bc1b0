#pragma once
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <vector>

#include <lull/core/observable.hpp>
#include <lull/core/subscription.hpp>

namespace lull {

// Hot source: values pushed with on_next() fan out to the current subscribers.
// Thread-safe. After on_error/on_completed the subject is terminated and late
// subscribers receive the terminal signal immediately.
template <class T>
class subject {
public:
  using OnNext = typename observable<T>::OnNext;
  using OnErr  = typename observable<T>::OnErr;
  using OnDone = typename observable<T>::OnDone;

  subject() : st_(std::make_shared<state>()) {}

  subject(const subject&) = delete;
  subject& operator=(const subject&) = delete;

  observable<T> as_observable() const {
    std::weak_ptr<state> weak = st_;
    return observable<T>::create([weak](OnNext on_next, OnErr on_err, OnDone on_done) {
      auto st = weak.lock();
      if (!st) { on_done(); return subscription{}; }

      std::size_t id = 0;
      {
        std::unique_lock<std::mutex> lock(st->m);
        if (st->completed) { lock.unlock(); on_done(); return subscription{}; }
        if (st->error)     { auto e = st->error; lock.unlock(); on_err(e); return subscription{}; }
        id = st->next_id++;
        st->slots.push_back({id, std::move(on_next), std::move(on_err), std::move(on_done)});
      }

      return subscription([weak, id]{
        auto st = weak.lock();
        if (!st) return;
        std::lock_guard<std::mutex> lock(st->m);
        for (auto it = st->slots.begin(); it != st->slots.end(); ++it) {
          if (it->id == id) { st->slots.erase(it); break; }
        }
      });
    });
  }

  void on_next(const T& v) {
    std::vector<OnNext> local;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (st_->completed || st_->error) return;
      local.reserve(st_->slots.size());
      for (auto& s : st_->slots) local.push_back(s.on_next);
    }
    for (auto& f : local) f(v);
  }

  void on_error(std::exception_ptr e) {
    std::vector<OnErr> local;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (st_->completed || st_->error) return;
      st_->error = e;
      local.reserve(st_->slots.size());
      for (auto& s : st_->slots) local.push_back(s.on_err);
      st_->slots.clear();
    }
    for (auto& f : local) f(e);
  }

  void on_completed() {
    std::vector<OnDone> local;
    {
      std::lock_guard<std::mutex> lock(st_->m);
      if (st_->completed || st_->error) return;
      st_->completed = true;
      local.reserve(st_->slots.size());
      for (auto& s : st_->slots) local.push_back(s.on_done);
      st_->slots.clear();
    }
    for (auto& f : local) f();
  }

  std::size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(st_->m);
    return st_->slots.size();
  }

private:
  struct slot {
    std::size_t id;
    OnNext on_next;
    OnErr  on_err;
    OnDone on_done;
  };

  struct state {
    mutable std::mutex m;
    std::vector<slot> slots;
    std::size_t next_id{0};
    bool completed{false};
    std::exception_ptr error;
  };

  std::shared_ptr<state> st_;
};

// Cold source: emits every value synchronously on subscribe, then completes
template <class T>
inline observable<T> from_values(std::vector<T> values) {
  return observable<T>::create([values = std::move(values)](auto on_next, auto, auto on_done){
    for (const auto& v : values) on_next(v);
    on_done();
    return subscription{};
  });
}

} // namespace lull
