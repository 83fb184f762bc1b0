#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <lull/lull.hpp>

using namespace lull;
using namespace std::chrono_literals;

int main() {
  // callbacks run in deadline order, equal deadlines in scheduling order,
  // and now() reads the deadline of the running callback
  {
    virtual_clock clk;
    std::vector<int> order;
    std::vector<long long> at;
    auto a = clk.schedule_after(30ms, [&]{ order.push_back(3); at.push_back(clk.now().count()); });
    auto b = clk.schedule_after(10ms, [&]{ order.push_back(1); at.push_back(clk.now().count()); });
    auto c = clk.schedule_after(10ms, [&]{ order.push_back(2); at.push_back(clk.now().count()); });

    assert(clk.pending() == 3);
    assert(clk.advance_by(100ms) == 3);
    assert((order == std::vector<int>{1, 2, 3}));
    assert((at == std::vector<long long>{10, 10, 30}));
    assert(clk.now() == 100ms);
  }

  // nothing runs before its deadline, and a withdrawn callback never runs
  {
    virtual_clock clk;
    int fired = 0;
    auto keep = clk.schedule_after(50ms, [&]{ ++fired; });
    auto drop = clk.schedule_after(20ms, [&]{ fired += 100; });

    clk.advance_by(49ms);
    assert(fired == 0);
    drop.reset();
    clk.advance_by(1ms);
    assert(fired == 1);
    assert(clk.pending() == 0);
  }

  // zero and negative delays wait for the next advance
  {
    virtual_clock clk;
    int fired = 0;
    auto a = clk.schedule_after(0ms, [&]{ ++fired; });
    auto b = clk.schedule_after(-5ms, [&]{ ++fired; });
    assert(fired == 0);
    assert(clk.run_ready() == 2);
    assert(fired == 2);
    assert(clk.now() == 0ms);
  }

  // work scheduled from a callback runs within the same advance if it is due
  {
    virtual_clock clk;
    std::vector<long long> at;
    subscription inner;
    auto outer = clk.schedule_after(10ms, [&]{
      inner = clk.schedule_after(10ms, [&]{ at.push_back(clk.now().count()); });
    });
    clk.advance_by(25ms);
    assert((at == std::vector<long long>{20}));
  }

  // advancing from inside a callback is a usage error
  {
    virtual_clock clk;
    bool rejected = false;
    auto s = clk.schedule_after(1ms, [&]{
      try {
        clk.advance_by(1ms);
      } catch (const std::logic_error&) {
        rejected = true;
      }
    });
    clk.advance_by(1ms);
    assert(rejected);
  }

  // negative advance is rejected
  {
    virtual_clock clk;
    bool thrown = false;
    try {
      clk.advance_by(-1ms);
    } catch (const std::invalid_argument&) {
      thrown = true;
    }
    assert(thrown);
  }

  // a throwing callback propagates and leaves the clock usable
  {
    virtual_clock clk;
    int fired = 0;
    auto a = clk.schedule_after(1ms, []{ throw std::runtime_error("cb"); });
    auto b = clk.schedule_after(2ms, [&]{ ++fired; });

    bool thrown = false;
    try {
      clk.advance_by(5ms);
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown);
    clk.advance_by(5ms);
    assert(fired == 1);
  }

  std::cout << "[virtual_clock_tests] OK\n";
  return 0;
}
