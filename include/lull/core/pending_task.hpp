#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <utility>
#include <variant>

#include <lull/core/cancellation.hpp>
#include <lull/core/subscription.hpp>

namespace lull {

// scheduled -> running -> completed
// scheduled | running -> cancelled
// completed and cancelled are terminal.
enum class task_state { scheduled, running, completed, cancelled };

constexpr const char* to_string(task_state s) noexcept {
  switch (s) {
    case task_state::scheduled: return "scheduled";
    case task_state::running:   return "running";
    case task_state::completed: return "completed";
    case task_state::cancelled: return "cancelled";
  }
  return "unknown";
}

// How a task ended
struct task_completed {};
struct task_cancelled {};
struct task_failed { std::exception_ptr error; };

using task_outcome = std::variant<task_completed, task_cancelled, task_failed>;

// operation_cancelled is a cancellation, anything else a failure
inline task_outcome outcome_of(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const operation_cancelled&) {
    return task_cancelled{};
  } catch (...) {
    return task_failed{std::current_exception()};
  }
}

inline bool is_failure(const task_outcome& o) noexcept {
  return std::holds_alternative<task_failed>(o);
}

// One unit of deferred work for one accepted value: a delay, then the action.
// Owns the timer of the delay, the running effect (if the action is asynchronous)
// and the cancellation source the action observes.
// Not synchronized: the owner serializes every call.
template <class T>
class pending_task {
public:
  pending_task(std::uint64_t id, T value) : id_(id), value_(std::move(value)) {}

  pending_task(const pending_task&) = delete;
  pending_task& operator=(const pending_task&) = delete;

  std::uint64_t id() const noexcept { return id_; }
  const T& value() const noexcept { return value_; }
  task_state state() const noexcept { return state_; }
  cancellation_token token() const noexcept { return cancel_.token(); }
  bool cancel_requested() const noexcept { return cancel_requested_; }
  const std::optional<task_outcome>& outcome() const noexcept { return outcome_; }

  bool terminal() const noexcept {
    return state_ == task_state::completed || state_ == task_state::cancelled;
  }

  // The delay elapsed but the action cannot start yet (a previous action is still unwinding)
  void mark_due() noexcept { due_ = true; }
  bool due() const noexcept { return due_; }

  void attach_timer(subscription s) { timer_ = std::move(s); }
  void attach_effect(subscription s) { effect_ = std::move(s); }

  // Handles are released to the caller so that they are reset outside its lock
  subscription take_timer() noexcept { return std::move(timer_); }
  subscription take_effect() noexcept { return std::move(effect_); }

  // scheduled -> running
  bool start() noexcept {
    if (state_ != task_state::scheduled || cancel_requested()) return false;
    state_ = task_state::running;
    return true;
  }

  // A scheduled task is cancelled on the spot; a running one keeps running
  // until its action unwinds and finish() is called.
  // Returns true when the task became terminal here.
  // The token seen by the action flips only on signal_cancel().
  bool request_cancel() noexcept {
    if (terminal() || cancel_requested_) return false;
    cancel_requested_ = true;
    if (state_ == task_state::scheduled) {
      state_ = task_state::cancelled;
      outcome_ = task_cancelled{};
      return true;
    }
    return false;
  }

  // Fires the token and its callbacks. Safe from any thread; call it outside
  // the owner's lock since the callbacks are user code.
  void signal_cancel() { cancel_.request_cancel(); }

  // running -> completed | cancelled. A normal return after a cancellation
  // request still counts as cancelled: its result must not be observed.
  bool finish(task_outcome o) {
    if (state_ != task_state::running) return false;
    if (std::holds_alternative<task_completed>(o) && cancel_requested()) o = task_cancelled{};
    state_ = (cancel_requested() || std::holds_alternative<task_cancelled>(o))
               ? task_state::cancelled
               : task_state::completed;
    outcome_ = std::move(o);
    return true;
  }

private:
  std::uint64_t id_;
  T value_;
  task_state state_{task_state::scheduled};
  bool due_{false};
  bool cancel_requested_{false};
  cancellation_source cancel_;
  subscription timer_;
  subscription effect_;
  std::optional<task_outcome> outcome_;
};

} // namespace lull
