#include <lull/lull.hpp>
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

using namespace lull;
using namespace std::chrono_literals;

// --- Source class: emulates user input -----------------------------
class SearchBox {
public:
  void type(std::string s) { text_.on_next(s); }
  void close() { text_.on_completed(); }
  observable<std::string> stream() const { return text_.as_observable(); }

private:
  subject<std::string> text_;
};

// --- Service: only the last query is searched, a stale search is abandoned ---
class SearchService {
public:
  SearchService(observable<std::string> input, lull::clock& clk)
  : sub_((input
      | debounce_latest(200ms, clk, [](const std::string& q, const cancellation_token& token){
          for (int step = 0; step < 5; ++step) {   // network simulation
            token.throw_if_cancellation_requested();
            std::this_thread::sleep_for(50ms);
          }
          std::cout << "[SearchService] results for '" << q << "'\n";
        })
    ).subscribe(
      [](const std::string& q){ std::cout << "[SearchService] done: " << q << "\n"; },
      [](std::exception_ptr){ std::cout << "[SearchService] search failed\n"; },
      []{ std::cout << "[SearchService] input closed\n"; }))
  {}

private:
  subscription sub_;
};

int main() {
  set_log_level(log_level_from_env());

  thread_pool io{2};
  timer_thread timers{io};

  SearchBox box;
  SearchService service(box.stream(), timers);

  // "noisy" input
  box.type("q");      std::this_thread::sleep_for(50ms);
  box.type("qu");     std::this_thread::sleep_for(50ms);
  box.type("que");    std::this_thread::sleep_for(50ms);
  box.type("query");

  std::this_thread::sleep_for(300ms);   // search for "query" is running

  box.type("react");  std::this_thread::sleep_for(80ms);
  box.type("reactive");
  box.close();

  std::this_thread::sleep_for(800ms);
  io.wait_idle();
  return 0;
}
