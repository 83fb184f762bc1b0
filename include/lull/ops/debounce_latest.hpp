#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <lull/core/cancellation.hpp>
#include <lull/core/clock.hpp>
#include <lull/core/config.hpp>
#include <lull/core/logger.hpp>
#include <lull/core/observable.hpp>
#include <lull/core/pending_task.hpp>
#include <lull/core/subscription.hpp>

namespace lull {

namespace detail {

template <class Action, class T>
inline constexpr bool takes_token_v =
  std::is_invocable_v<Action&, const T&, const cancellation_token&>;

template <class Action, class T, class = void>
struct action_result { using type = void; };

template <class Action, class T>
struct action_result<Action, T, std::enable_if_t<std::is_invocable_v<Action&, const T&>>> {
  using type = std::decay_t<std::invoke_result_t<Action&, const T&>>;
};

template <class Action, class T>
inline constexpr bool returns_effect_v =
  !takes_token_v<Action, T> && is_observable_v<typename action_result<Action, T>::type>;

// Shared state of one subscription to a debounce_latest pipeline.
//
// current_ is the single task eligible to run the action. unwinding_ is a
// superseded task whose action has not returned yet; while it is set no other
// action may start, and a current task whose delay elapses waits with due().
// Both are only touched under m_. User code (action, downstream signals,
// subscription resets, token callbacks) always runs outside m_.
template <class T, class Action>
class debounce_latest_state
  : public std::enable_shared_from_this<debounce_latest_state<T, Action>> {
public:
  using task_ptr = std::shared_ptr<pending_task<T>>;
  using OnNext = typename observable<T>::OnNext;
  using OnErr  = typename observable<T>::OnErr;
  using OnDone = typename observable<T>::OnDone;

  debounce_latest_state(debounce_config cfg, clock& clk, Action action,
                        OnNext on_next, OnErr on_err, OnDone on_done)
  : cfg_(cfg), clk_(&clk), action_(std::move(action)),
    on_next_(std::move(on_next)), on_err_(std::move(on_err)), on_done_(std::move(on_done)) {}

  void accept(const T& v) {
    std::optional<retired> prev;
    std::uint64_t id = 0;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (closed_) return;

      if (current_) {
        prev.emplace(retire_locked(current_));
        current_.reset();
      }

      auto task = std::make_shared<pending_task<T>>(next_id_++, v);
      id = task->id();
      std::weak_ptr<debounce_latest_state> weak = this->shared_from_this();
      task->attach_timer(clk_->schedule_after(cfg_.timeout, [weak, task]{
        if (auto self = weak.lock()) self->on_delay_elapsed(task);
      }));
      current_ = std::move(task);
    }

    if (prev) {
      LULL_LOG_DEBUG("task #{} superseded by #{}", prev->task->id(), id);
      finish_retired(*prev);
    }
    LULL_LOG_DEBUG("task #{} scheduled in {}ms", id, cfg_.timeout.count());
  }

  void source_completed() {
    bool emit_done = false;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (closed_) return;
      closed_ = true;
      source_done_ = true;
      emit_done = try_finish_locked();
    }
    LULL_LOG_DEBUG("source completed");
    if (emit_done) on_done_();
  }

  void source_failed(std::exception_ptr e) {
    std::vector<retired> cancelled;
    subscription up;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (closed_) return;
      close_locked(cancelled);
      up = std::move(upstream_);
    }
    LULL_LOG_ERROR("source failed: {}", describe(e));
    up.reset();
    for (auto& r : cancelled) finish_retired(r);
    on_err_(e);
  }

  // Enclosing scope cancelled (subscription reset or scope token fired).
  // Nothing is emitted downstream after this.
  void teardown() {
    std::vector<retired> cancelled;
    subscription up;
    subscription scope;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (torn_down_) return;
      torn_down_ = true;
      close_locked(cancelled);
      up = std::move(upstream_);
      scope = std::move(scope_hook_);
    }
    LULL_LOG_DEBUG("pipeline cancelled, {} task(s) cancelled", cancelled.size());
    up.reset();
    scope.reset();
    for (auto& r : cancelled) finish_retired(r);
  }

  void attach_upstream(subscription s) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!torn_down_ && !closed_) {
        upstream_ = std::move(s);
        return;
      }
    }
    s.reset();
  }

  void attach_scope(subscription s) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!torn_down_) {
        scope_hook_ = std::move(s);
        return;
      }
    }
    s.reset();
  }

  bool torn_down() const {
    std::lock_guard<std::mutex> lock(m_);
    return torn_down_;
  }

private:
  // A task taken out of service under the lock; its handles are released after unlocking
  struct retired {
    task_ptr task;
    subscription timer;
    subscription effect;
  };

  retired retire_locked(const task_ptr& task) {
    task->request_cancel();
    retired r{task, task->take_timer(), task->take_effect()};
    // still inside a non-suspending action: it must return before the next one starts
    if (task->state() == task_state::running && !r.effect) unwinding_ = task;
    return r;
  }

  void finish_retired(retired& r) {
    r.timer.reset();
    r.task->signal_cancel();
    if (r.effect) {
      // the effect is torn down at its suspension point: the task is over
      r.effect.reset();
      settle(r.task, task_cancelled{});
    }
  }

  // Stop accepting values and cancel whatever is in flight
  void close_locked(std::vector<retired>& out) {
    closed_ = true;
    finished_ = true;
    if (unwinding_) {
      out.push_back(retired{unwinding_, subscription{}, subscription{}});
    }
    if (current_) {
      out.push_back(retire_locked(current_));
      current_.reset();
    }
  }

  bool try_finish_locked() {
    if (finished_ || !source_done_ || current_ || unwinding_) return false;
    finished_ = true;
    return true;
  }

  void on_delay_elapsed(const task_ptr& task) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (task != current_ || task->state() != task_state::scheduled) return;
      task->take_timer().release();
      if (unwinding_) {
        task->mark_due();
        return;
      }
      if (!task->start()) return;
    }
    run_action(task);
  }

  // The request flag is set under m_ by whoever supersedes the task; the token
  // itself flips only later, outside the lock, so it cannot be checked here.
  bool cancel_requested(const task_ptr& task) const {
    std::lock_guard<std::mutex> lock(m_);
    return task->cancel_requested();
  }

  void run_action(const task_ptr& task) {
    LULL_LOG_DEBUG("task #{} starting", task->id());
    if (cancel_requested(task)) {
      settle(task, task_cancelled{});
      return;
    }

    if constexpr (returns_effect_v<Action, T>) {
      using effect_type = typename action_result<Action, T>::type;
      std::weak_ptr<debounce_latest_state> weak = this->shared_from_this();
      subscription s;
      try {
        effect_type eff = action_(task->value());
        s = eff.subscribe(
          [](const auto&){},
          [weak, task](std::exception_ptr e){
            if (auto self = weak.lock()) self->settle(task, outcome_of(e));
          },
          [weak, task]{
            if (auto self = weak.lock()) self->settle(task, task_completed{});
          });
      } catch (...) {
        settle(task, outcome_of(std::current_exception()));
        return;
      }

      bool drop = false;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (task->terminal() || task->cancel_requested()) drop = true;
        else task->attach_effect(std::move(s));
      }
      if (drop) {
        s.reset();
        settle(task, task_cancelled{});
      }
    } else {
      static_assert(takes_token_v<Action, T> || std::is_invocable_v<Action&, const T&>,
                    "debounce_latest action must be callable as action(v) or action(v, token)");
      static_assert(takes_token_v<Action, T> ||
                    std::is_void_v<typename action_result<Action, T>::type>,
                    "debounce_latest action must return void or an observable effect");

      std::exception_ptr error;
      try {
        if constexpr (takes_token_v<Action, T>) {
          action_(task->value(), task->token());
        } else {
          action_(task->value());
        }
      } catch (...) {
        error = std::current_exception();
      }
      settle(task, error ? outcome_of(error) : task_outcome{task_completed{}});
    }
  }

  // Moves a running task to its terminal state and reacts to the outcome.
  // Idempotent: only the first call for a task has any effect.
  void settle(const task_ptr& task, task_outcome outcome) {
    std::vector<retired> cancelled;
    subscription up;
    subscription leftover_timer;
    subscription leftover_effect;
    task_ptr next;
    bool emit_next = false;
    bool emit_done = false;
    std::exception_ptr failure;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!task->finish(std::move(outcome))) return;
      leftover_timer = task->take_timer();
      leftover_effect = task->take_effect();

      if (task == current_) current_.reset();
      const bool was_unwinding = task == unwinding_;
      if (was_unwinding) unwinding_.reset();

      const auto& out = *task->outcome();
      if (auto* f = std::get_if<task_failed>(&out); f && !finished_) {
        failure = f->error;
        close_locked(cancelled);
        up = std::move(upstream_);
      } else {
        emit_next = !finished_ && task->state() == task_state::completed;
        // the superseded action returned: the waiting one may start now
        if (was_unwinding && current_ && current_->due() && current_->start()) next = current_;
        emit_done = try_finish_locked();
      }
    }

    leftover_timer.reset();
    leftover_effect.reset();

    if (failure) {
      LULL_LOG_ERROR("action for task #{} failed: {}", task->id(), describe(failure));
      up.reset();
      for (auto& r : cancelled) finish_retired(r);
      on_err_(failure);
      return;
    }

    LULL_LOG_DEBUG("task #{} {}", task->id(), to_string(task->state()));
    if (emit_next) on_next_(task->value());
    if (next) run_action(next);
    if (emit_done) on_done_();
  }

  debounce_config cfg_;
  clock* clk_;
  Action action_;
  OnNext on_next_;
  OnErr on_err_;
  OnDone on_done_;

  mutable std::mutex m_;
  task_ptr current_;
  task_ptr unwinding_;
  std::uint64_t next_id_{1};
  bool closed_{false};      // no more values accepted
  bool source_done_{false};
  bool finished_{false};    // no more downstream signals
  bool torn_down_{false};
  subscription upstream_;
  subscription scope_hook_;
};

} // namespace detail

// debounce_latest: for every value, cancel the task of the previous value (still
// waiting or already running) and schedule action(value) after timeout on clk.
// Only the latest value's action may run, and never two actions at once.
//
// The resulting observable emits a value once its action completed without being
// cancelled, on_error once if the source or an action fails (the pipeline stops),
// and on_completed after the source completed and the last task settled.
// A subscriber that passes no on_error still gets the failure logged at error
// level, whatever the configured level.
// Resetting the subscription, or cancelling the scope token, cancels everything
// silently. The action is either
//   void(const T&)                             runs to completion
//   void(const T&, const cancellation_token&)  may poll the token, or throw operation_cancelled
//   effect(const T&)                           async, cancelled by unsubscribing
// IMPORTANT: clk must outlive the subscription.
template <class Action>
struct op_debounce_latest {
  debounce_config cfg;
  clock* clk;
  cancellation_token scope;
  Action action;

  template <class T>
  observable<T> operator()(const observable<T>& src) const {
    return observable<T>::create(
      [src, cfg = cfg, clk = clk, scope = scope, action = action]
      (auto on_next, auto on_err, auto on_done)
    {
      using state_t = detail::debounce_latest_state<T, Action>;
      auto st = std::make_shared<state_t>(cfg, *clk, action,
                                          std::move(on_next), std::move(on_err), std::move(on_done));

      std::weak_ptr<state_t> weak = st;
      st->attach_scope(scope.on_cancel([weak]{
        if (auto s = weak.lock()) s->teardown();
      }));
      if (st->torn_down()) return subscription{};

      st->attach_upstream(src.subscribe(
        [st](const T& v){ st->accept(v); },
        [st](std::exception_ptr e){ st->source_failed(e); },
        [st]{ st->source_completed(); }
      ));

      return subscription([st]{ st->teardown(); });
    });
  }
};

template <class Action>
inline auto debounce_latest(debounce_config cfg, clock& clk, cancellation_token scope, Action action) {
  cfg.validate();
  return op_debounce_latest<Action>{cfg, &clk, std::move(scope), std::move(action)};
}

template <class Action>
inline auto debounce_latest(std::chrono::milliseconds timeout, clock& clk,
                            cancellation_token scope, Action action) {
  return debounce_latest(debounce_config{timeout}, clk, std::move(scope), std::move(action));
}

template <class Action>
inline auto debounce_latest(std::chrono::milliseconds timeout, clock& clk, Action action) {
  return debounce_latest(debounce_config{timeout}, clk, cancellation_token{}, std::move(action));
}

} // namespace lull
