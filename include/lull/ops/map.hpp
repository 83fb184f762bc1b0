#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <lull/core/observable.hpp>

namespace lull {

// Transforms each value with f. An exception thrown by f ends the
// sequence with on_error; later upstream signals are ignored.
template <class F>
struct op_map {
  F f;

  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    return observable<U>::create([src, f = f](auto on_next, auto on_err, auto on_done){
      auto failed = std::make_shared<std::atomic<bool>>(false);
      return src.subscribe(
        [f, on_next, on_err, failed](const T& v){
          if (failed->load()) return;
          std::optional<U> out;
          try {
            out.emplace(f(v));
          } catch (...) {
            if (!failed->exchange(true)) on_err(std::current_exception());
            return;
          }
          on_next(*out);
        },
        [on_err, failed](std::exception_ptr e){ if (!failed->exchange(true)) on_err(e); },
        [on_done, failed]{ if (!failed->load()) on_done(); }
      );
    });
  }
};

template <class F> inline auto map(F f) { return op_map<F>{ std::move(f) }; }

} // namespace lull
