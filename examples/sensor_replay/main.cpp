#include <lull/lull.hpp>
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

using namespace lull;
using namespace std::chrono_literals;

// Replays a recorded burst of sensor readings on a virtual clock:
// the calibration runs once per quiet period, with the latest reading.
int main() {
  set_log_level(log_level_from_env());

  virtual_clock clk;
  subject<double> readings;

  auto sub = (readings.as_observable()
    | debounce_latest(debounce_config{250ms}, clk, cancellation_token{}, [&](double v){
        std::cout << "[t=" << clk.now().count() << "ms] calibrate with " << v << "\n";
      })
  ).subscribe({}, {}, []{ std::cout << "replay finished\n"; });

  const std::vector<std::pair<std::chrono::milliseconds, double>> recording{
    {0ms, 20.1}, {40ms, 20.4}, {90ms, 20.9},   // burst
    {600ms, 21.5},                             // alone
    {1200ms, 19.8}, {1300ms, 19.7},            // burst
  };

  for (const auto& [at, value] : recording) {
    clk.advance_to(at);
    readings.on_next(value);
  }
  readings.on_completed();
  clk.advance_by(1s);
  return 0;
}
