#pragma once
#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include <lull/core/subscription.hpp>

namespace lull {

namespace detail {

inline std::string describe(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace detail

// Value-less payload of effects (observable<unit>)
struct unit {
  friend constexpr bool operator==(unit, unit) noexcept { return true; }
};

// Push-based sequence of T: on_next* then at most one of on_error / on_completed.
// Resetting the subscription returned by subscribe() stops delivery.
// A missing on_error handler is replaced by one that logs the error.
template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnErr  = std::function<void(std::exception_ptr)>;
  using OnDone = std::function<void()>;
  using impl_fn = std::function<subscription(OnNext, OnErr, OnDone)>;

  static observable create(impl_fn impl) {
    return observable(std::move(impl));
  }

  subscription subscribe(OnNext on_next,
                         OnErr  on_err  = {},
                         OnDone on_done = {}) const {
    if (!on_next) on_next = [](const T&){};
    if (!on_err)  on_err  = [](std::exception_ptr e){
      get_logger().log_unhandled("unhandled error: " + detail::describe(e), __FILE__, __LINE__);
    };
    if (!on_done) on_done = []{};
    return impl_(std::move(on_next), std::move(on_err), std::move(on_done));
  }

private:
  explicit observable(impl_fn impl) : impl_(std::move(impl)) {}

  impl_fn impl_;
};

// Effect returned by asynchronous actions
using effect = observable<unit>;

template <class>
struct is_observable : std::false_type {};

template <class T>
struct is_observable<observable<T>> : std::true_type {};

template <class T>
inline constexpr bool is_observable_v = is_observable<T>::value;

// source | op  ==  op(source)
template <class T, class Op>
auto operator|(const observable<T>& src, Op&& op) -> decltype(std::forward<Op>(op)(src)) {
  return std::forward<Op>(op)(src);
}

} // namespace lull
