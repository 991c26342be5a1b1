#ifndef NOTIFY_WATCH_HPP
#define NOTIFY_WATCH_HPP

#include <chrono>
#include <concepts>
#include <exception>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "notify/concepts.hpp"
#include "notify/var.hpp"
#include "select.hpp"

namespace notify {

// =============================================================================
// Watch Helpers - Blocking loops over var::get()
// =============================================================================
//
// Each helper reads the var, compares, and parks on the returned signal raced
// against the token (and a deadline where there is one). They never miss a
// change: the signal they wait on belongs to the exact value they compared.

enum class wait_status { satisfied, timed_out, cancelled };

template <typename T> struct wait_result {
  wait_status status;
  T value;        // the new value, or the one passed in if not satisfied
  signal changed; // fires when value is superseded

  explicit operator bool() const { return status == wait_status::satisfied; }
};

// A change callback threw. The callback's exception is nested inside.
class change_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename T> struct loop_result {
  T last;                   // last value the callback accepted
  std::exception_ptr error; // change_error, or null if the token stopped us

  explicit operator bool() const { return error == nullptr; }

  void rethrow_if_failed() const {
    if (error)
      std::rethrow_exception(error);
  }
};

namespace detail {

template <typename T>
concept Printable = requires(std::ostream &os, const T &v) { os << v; };

template <typename T>
std::string describe_change(const T &old_value, const T &new_value) {
  if constexpr (Printable<T>) {
    std::ostringstream out;
    out << "changed [" << old_value << " -> " << new_value << "]";
    return out.str();
  } else {
    return "changed";
  }
}

// Must be called from inside a catch block.
template <typename T>
std::exception_ptr nest_change_error(const T &old_value, const T &new_value) {
  try {
    std::throw_with_nested(change_error(describe_change(old_value, new_value)));
  } catch (...) {
    return std::current_exception();
  }
}

template <typename T, typename L>
wait_result<T> wait_for_change(const cancellation_token &token,
                               const T &current, const var<T, L> &source,
                               std::optional<std::chrono::steady_clock::time_point> deadline) {
  while (true) {
    auto [next, changed] = source.get();
    if (!(next == current))
      return {wait_status::satisfied, std::move(next), std::move(changed)};
    if (token.is_cancelled())
      return {wait_status::cancelled, current, std::move(changed)};

    std::vector<signal> watch{changed, token.cancelled()};
    std::optional<std::size_t> fired;
    if (deadline) {
      fired = wait_any_until(watch, *deadline);
    } else {
      fired = wait_any(watch);
    }
    if (!fired)
      return {wait_status::timed_out, current, std::move(changed)};
    // Loop on either outcome: a change may have set an equal value, and
    // cancellation is reported after one more look at the var.
  }
}

} // namespace detail

// Waits until source holds something other than current.
template <std::equality_comparable T, typename L>
wait_result<T> wait_for_change(const cancellation_token &token,
                               const T &current, const var<T, L> &source) {
  return detail::wait_for_change(token, current, source, std::nullopt);
}

// As wait_for_change(), but gives up with timed_out once timeout elapses.
template <std::equality_comparable T, typename L, typename Rep, typename Period>
wait_result<T> wait_for_change_for(const cancellation_token &token,
                                   const T &current, const var<T, L> &source,
                                   std::chrono::duration<Rep, Period> timeout) {
  return detail::wait_for_change(
      token, current, source,
      std::chrono::steady_clock::now() +
          std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout));
}

// Waits until source holds expected. Mostly useful in tests.
template <std::equality_comparable T, typename L>
wait_status wait_for_value(const cancellation_token &token, const T &expected,
                           const var<T, L> &source) {
  while (true) {
    auto [found, changed] = source.get();
    if (found == expected)
      return wait_status::satisfied;
    if (token.is_cancelled())
      return wait_status::cancelled;
    wait_any({changed, token.cancelled()});
  }
}

// Calls fn(token, old, new) each time source moves to a different value,
// until the token is cancelled or fn throws. fn is never called once the
// token is cancelled, even if the var changed in the meantime.
template <std::equality_comparable T, typename L, typename Func>
  requires ChangeCallback<Func, T>
loop_result<T> do_when_changed(const cancellation_token &token, T start,
                               const var<T, L> &source, Func fn) {
  T last = std::move(start);
  while (true) {
    auto next = wait_for_change(token, last, source);
    // A var that keeps moving must not outlive the token
    if (next.status == wait_status::cancelled || token.is_cancelled())
      return {std::move(last), nullptr};
    try {
      std::invoke(fn, token, std::as_const(last), std::as_const(next.value));
    } catch (...) {
      auto error = detail::nest_change_error(last, next.value);
      return {std::move(last), std::move(error)};
    }
    last = std::move(next.value);
  }
}

// As do_when_changed(), but also calls fn(token, last, last) whenever period
// passes without a change.
template <std::equality_comparable T, typename L, typename Rep, typename Period,
          typename Func>
  requires ChangeCallback<Func, T>
loop_result<T> do_when_changed_or_interval(const cancellation_token &token,
                                           T start, const var<T, L> &source,
                                           std::chrono::duration<Rep, Period> period,
                                           Func fn) {
  T last = std::move(start);
  while (true) {
    auto next = wait_for_change_for(token, last, source, period);
    if (next.status == wait_status::cancelled || token.is_cancelled())
      return {std::move(last), nullptr};
    try {
      std::invoke(fn, token, std::as_const(last), std::as_const(next.value));
    } catch (...) {
      auto error = detail::nest_change_error(last, next.value);
      return {std::move(last), std::move(error)};
    }
    last = std::move(next.value);
  }
}

} // namespace notify

#endif // NOTIFY_WATCH_HPP
