#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <lull/lull.hpp>

using namespace lull;
using namespace std::chrono_literals;

// Polls pred until it holds or the deadline passes
template <class Pred>
static bool wait_for(Pred pred, std::chrono::milliseconds limit = 3000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

// Real time on a pool: a quick burst runs only its last value
static void burst_on_thread_pool() {
  thread_pool pool{2};
  timer_thread timers{pool};
  subject<int> src;

  std::mutex m;
  std::vector<int> got;

  auto sub = (src.as_observable()
    | debounce_latest(100ms, timers, [](int){})
  ).subscribe([&](int v){
    std::lock_guard<std::mutex> lock(m);
    got.push_back(v);
  });

  for (int i = 1; i <= 3; ++i) {
    src.on_next(i);
    std::this_thread::sleep_for(5ms);
  }

  assert(wait_for([&]{ std::lock_guard<std::mutex> lock(m); return !got.empty(); }));
  std::this_thread::sleep_for(200ms);
  {
    std::lock_guard<std::mutex> lock(m);
    assert((got == std::vector<int>{3}));
  }
  sub.reset();
  pool.wait_idle();
}

// A value arriving while a non-polling action runs on another thread waits
// for that action to return: two actions never overlap
static void actions_never_overlap() {
  thread_pool pool{2};
  timer_thread timers{pool};
  subject<int> src;

  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  std::atomic<int> started{0};
  std::mutex m;
  std::vector<int> ran;
  std::vector<int> got;

  auto sub = (src.as_observable()
    | debounce_latest(20ms, timers, [&](int v){
        const int now_active = ++active;
        int seen = max_active.load();
        while (now_active > seen && !max_active.compare_exchange_weak(seen, now_active)) {}
        ++started;
        if (v == 1) std::this_thread::sleep_for(200ms);
        {
          std::lock_guard<std::mutex> lock(m);
          ran.push_back(v);
        }
        --active;
      })
  ).subscribe([&](int v){
    std::lock_guard<std::mutex> lock(m);
    got.push_back(v);
  });

  src.on_next(1);
  assert(wait_for([&]{ return started.load() == 1; }));
  src.on_next(2);   // delay of 2 elapses while 1 is still sleeping

  assert(wait_for([&]{ std::lock_guard<std::mutex> lock(m); return ran.size() == 2; }));
  assert(max_active.load() == 1 && "A superseded action must return before the next starts");
  {
    std::lock_guard<std::mutex> lock(m);
    assert((ran == std::vector<int>{1, 2}));
    assert((got == std::vector<int>{2}) && "The superseded result is dropped");
  }
  sub.reset();
  pool.wait_idle();
}

// A polling action on a pool thread stops when a newer value arrives
static void polling_action_stops_early() {
  thread_pool pool{2};
  timer_thread timers{pool};
  subject<int> src;

  std::atomic<bool> first_started{false};
  std::atomic<bool> first_cancelled{false};
  std::atomic<int> completed{0};

  auto sub = (src.as_observable()
    | debounce_latest(10ms, timers, [&](int v, const cancellation_token& token){
        if (v == 1) {
          first_started = true;
          for (int i = 0; i < 500; ++i) {
            if (token.cancellation_requested()) {
              first_cancelled = true;
              throw operation_cancelled{};
            }
            std::this_thread::sleep_for(2ms);
          }
        }
        ++completed;
      })
  ).subscribe({});

  src.on_next(1);
  assert(wait_for([&]{ return first_started.load(); }));
  src.on_next(2);

  assert(wait_for([&]{ return completed.load() == 1; }));
  assert(first_cancelled.load());
  sub.reset();
  pool.wait_idle();
}

// A value accepted on another thread after a task started, but before its
// action was called, keeps that action from running even though the task's
// token has not been signalled yet
static void supersede_between_start_and_call() {
  virtual_clock clk;
  subject<int> src;
  std::mutex m;
  std::vector<int> executed;

  std::atomic<bool> superseded{false};
  std::atomic<bool> release{false};
  std::thread other;

  set_log_function([&](const log_context& ctx){
    if (ctx.message == "task #1 starting") {
      other = std::thread([&]{ src.on_next(2); });
      wait_for([&]{ return superseded.load(); });
    } else if (ctx.message == "task #1 superseded by #2") {
      superseded = true;
      // the token of #1 flips only once this returns
      wait_for([&]{ return release.load(); });
    }
  });
  set_log_level(log_level::debug);

  auto sub = (src.as_observable()
    | debounce_latest(10ms, clk, [&](int v){
        std::lock_guard<std::mutex> lock(m);
        executed.push_back(v);
      })
  ).subscribe({});

  src.on_next(1);
  clk.advance_by(10ms);
  release = true;
  other.join();
  set_log_level(log_level::off);
  set_log_function(nullptr);

  {
    std::lock_guard<std::mutex> lock(m);
    assert(superseded.load());
    assert(executed.empty() && "A task cancelled before its call must not run the action");
  }

  clk.advance_by(10ms);
  std::lock_guard<std::mutex> lock(m);
  assert((executed == std::vector<int>{2}));
}

// Timer callbacks can be marshalled onto a strand drained by its owner
static void timers_onto_strand() {
  strand loop;
  timer_thread timers{loop};
  subject<int> src;
  std::vector<int> got;

  auto sub = (src.as_observable() | debounce_latest(30ms, timers, [](int){}))
    .subscribe([&](int v){ got.push_back(v); });

  src.on_next(1);
  src.on_next(2);
  assert(wait_for([&]{ return loop.size() > 0; }));
  loop.drain();
  assert((got == std::vector<int>{2}) && "Everything ran on the draining thread");
}

int main() {
  burst_on_thread_pool();
  actions_never_overlap();
  polling_action_stops_early();
  supersede_between_start_and_call();
  timers_onto_strand();

  std::cout << "[debounce_latest_threading_tests] OK\n";
  return 0;
}
