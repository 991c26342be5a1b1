#ifndef NOTIFY_SELECT_HPP
#define NOTIFY_SELECT_HPP

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "notify/continuation_handoff.hpp"
#include "notify/crtp_base.hpp"
#include "notify/signal.hpp"

namespace notify {

// =============================================================================
// Dynamic Wait-Any over One-Shot Signals
// =============================================================================
//
// The set of signals is only known at runtime, so instead of a fixed-arity
// wait every watched signal gets a callback. All callbacks race on one gate;
// the first to claim it records its index and wakes the waiter, later ones
// are no-ops. Subscriptions are removed as soon as the wait ends, so a
// long-lived signal (a cancellation token) does not collect stale callbacks.

namespace detail {

struct select_state {
  static constexpr std::size_t none = std::numeric_limits<std::size_t>::max();

  std::atomic<std::size_t> winner{none};
  signal_source done;           // wakes blocking waiters
  continuation_handoff handoff; // wakes a suspended coroutine

  bool claim(std::size_t index) {
    std::size_t expected = none;
    return winner.compare_exchange_strong(expected, index,
                                          std::memory_order_acq_rel);
  }

  std::optional<std::size_t> result() const {
    std::size_t w = winner.load(std::memory_order_acquire);
    if (w == none)
      return std::nullopt;
    return w;
  }
};

inline std::optional<std::size_t>
first_fired(const std::vector<signal> &signals) {
  for (std::size_t i = 0; i < signals.size(); ++i) {
    if (signals[i].is_fired())
      return i;
  }
  return std::nullopt;
}

inline bool any_observable(const std::vector<signal> &signals) {
  for (const auto &s : signals) {
    if (s)
      return true;
  }
  return false;
}

// RAII set of callback registrations
class subscription_set {
public:
  subscription_set() = default;
  subscription_set(const subscription_set &) = delete;
  subscription_set &operator=(const subscription_set &) = delete;
  subscription_set(subscription_set &&) = default;
  subscription_set &operator=(subscription_set &&) = delete;

  ~subscription_set() { clear(); }

  void add(const signal &sig, std::function<void()> cb) {
    if (!sig)
      return; // empty handles never fire
    signal::callback_id id = sig.on_fire(std::move(cb));
    if (id != 0)
      subs_.emplace_back(sig, id);
  }

  void clear() {
    for (auto &[sig, id] : subs_)
      sig.remove_callback(id);
    subs_.clear();
  }

private:
  std::vector<std::pair<signal, signal::callback_id>> subs_;
};

} // namespace detail

// =============================================================================
// Blocking wait_any
// =============================================================================

// Returns the index of a fired signal, or nothing once the deadline passes.
template <typename Clock, typename Duration>
std::optional<std::size_t>
wait_any_until(const std::vector<signal> &signals,
               std::chrono::time_point<Clock, Duration> deadline) {
  if (auto index = detail::first_fired(signals))
    return index;

  auto state = std::make_shared<detail::select_state>();
  detail::subscription_set subs;
  for (std::size_t i = 0; i < signals.size(); ++i) {
    subs.add(signals[i], [state, i] {
      if (state->claim(i))
        state->done.fire();
    });
    if (state->done.is_fired())
      break;
  }

  state->done.get_signal().wait_until(deadline);
  return state->result();
}

template <typename Rep, typename Period>
std::optional<std::size_t>
wait_any_for(const std::vector<signal> &signals,
             std::chrono::duration<Rep, Period> timeout) {
  return wait_any_until(signals, std::chrono::steady_clock::now() + timeout);
}

// Blocks until one of the signals fires. Throws std::invalid_argument when
// none of them can ever fire.
inline std::size_t wait_any(const std::vector<signal> &signals) {
  if (auto index = detail::first_fired(signals))
    return *index;
  if (!detail::any_observable(signals))
    throw std::invalid_argument("wait_any: no signal to wait on");

  auto state = std::make_shared<detail::select_state>();
  detail::subscription_set subs;
  for (std::size_t i = 0; i < signals.size(); ++i) {
    subs.add(signals[i], [state, i] {
      if (state->claim(i))
        state->done.fire();
    });
    if (state->done.is_fired())
      break;
  }

  state->done.get_signal().wait();
  return *state->result();
}

// =============================================================================
// Select Awaiter - co_await select(signals)
// =============================================================================
//
// Resolves to the index of the first signal seen fired. The winning callback
// and the suspending coroutine meet in a continuation_handoff, so the
// coroutine is resumed exactly once whichever side gets there first.

class select_awaiter : public awaitable_base<select_awaiter, std::size_t> {
public:
  explicit select_awaiter(std::vector<signal> signals)
      : signals_(std::move(signals)),
        state_(std::make_shared<detail::select_state>()) {
    if (!detail::first_fired(signals_) && !detail::any_observable(signals_))
      throw std::invalid_argument("select: no signal to wait on");
  }

  bool ready_impl() {
    ready_index_ = detail::first_fired(signals_);
    return ready_index_.has_value();
  }

  bool suspend_impl(std::coroutine_handle<> h) {
    for (std::size_t i = 0; i < signals_.size(); ++i) {
      subs_.add(signals_[i], [state = state_, i] {
        if (state->claim(i) && state->handoff.set_ready())
          schedule_coro_handle(state->handoff.get_continuation());
      });
      if (state_->handoff.is_ready())
        break;
    }
    return !state_->handoff.park(h);
  }

  std::size_t resume_impl() {
    subs_.clear();
    if (ready_index_)
      return *ready_index_;
    return *state_->result();
  }

private:
  std::vector<signal> signals_;
  std::shared_ptr<detail::select_state> state_;
  detail::subscription_set subs_;
  std::optional<std::size_t> ready_index_;
};

inline select_awaiter select(std::vector<signal> signals) {
  return select_awaiter{std::move(signals)};
}

} // namespace notify

#endif // NOTIFY_SELECT_HPP
