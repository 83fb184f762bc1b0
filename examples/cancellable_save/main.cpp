#include <lull/lull.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace lull;
using namespace std::chrono_literals;

// Autosave for an editor: every edit restarts the quiet period, a save in
// progress is abandoned when the document changes again, and closing the
// editor cancels everything through its scope.
int main() {
  set_log_level(log_level_from_env("LULL_LOG_LEVEL", log_level::info));

  strand ui;
  timer_thread timers{ui};
  subject<std::string> edits;
  cancellation_source editor_scope;

  auto sub = (edits.as_observable()
    | debounce_latest(100ms, timers, editor_scope.token(), [&](const std::string& text){
        std::cout << "saving '" << text << "'...\n";
        return delay(150ms, timers) | map([text](unit){
          std::cout << "saved '" << text << "'\n";
          return unit{};
        });
      })
  ).subscribe([](const std::string& text){ std::cout << "autosave done: " << text << "\n"; });

  auto pump = [&](std::chrono::milliseconds d){
    const auto until = std::chrono::steady_clock::now() + d;
    while (std::chrono::steady_clock::now() < until) {
      ui.drain();
      std::this_thread::sleep_for(5ms);
    }
  };

  edits.on_next("H");
  edits.on_next("He");
  edits.on_next("Hello");
  pump(180ms);                 // save of "Hello" in progress
  edits.on_next("Hello, world");
  pump(400ms);                 // "Hello" abandoned, "Hello, world" saved

  edits.on_next("Hello, world!");
  pump(50ms);
  editor_scope.request_cancel(); // editor closed before the quiet period ended
  pump(300ms);

  std::cout << "editor closed\n";
  return 0;
}
