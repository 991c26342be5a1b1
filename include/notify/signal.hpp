#ifndef NOTIFY_SIGNAL_HPP
#define NOTIFY_SIGNAL_HPP

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "continuation_handoff.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

namespace notify {

// =============================================================================
// Signal State - One-shot flag shared by a source and its observers
// =============================================================================
//
// Transitions from unfired to fired exactly once. Blocking waiters park on the
// condition variable; everything else (coroutines, select, fan-in) subscribes
// a callback. Callbacks run once, on the firing thread, outside the lock, and
// must not throw.

class signal_state : public sync_primitive_base<signal_state, mutex_lock_policy> {
  using base_type = sync_primitive_base<signal_state, mutex_lock_policy>;

public:
  using callback_id = std::size_t;

  signal_state() = default;
  explicit signal_state(bool fired) : fired_(fired) {}

  bool is_fired() const noexcept {
    return fired_.load(std::memory_order_acquire);
  }

  // Returns true only for the call that performed the transition.
  bool fire();

  void wait() const;

  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    typename base_type::lock_type lock(this->mutex_);
    return this->wait_for_condition_for(
        lock, [this] { return is_fired(); }, timeout);
  }

  template <typename Clock, typename Duration>
  bool wait_until(std::chrono::time_point<Clock, Duration> deadline) const {
    typename base_type::lock_type lock(this->mutex_);
    return this->wait_for_condition_until(
        lock, [this] { return is_fired(); }, deadline);
  }

  // If already fired, runs cb on the calling thread and returns 0.
  callback_id on_fire(std::function<void()> cb);

  void remove_callback(callback_id id);

  std::size_t callback_count() const;

private:
  std::atomic<bool> fired_{false};
  std::vector<std::pair<callback_id, std::function<void()>>> callbacks_;
  callback_id next_id_{1};
};

class signal_awaiter;

// =============================================================================
// Signal - Copyable observer handle
// =============================================================================

class signal {
public:
  using callback_id = signal_state::callback_id;

  // An empty handle; never fires.
  signal() = default;

  static signal already_fired() {
    return signal{std::make_shared<signal_state>(true)};
  }

  bool is_fired() const { return state_ && state_->is_fired(); }

  // Blocks until fired. Throws std::invalid_argument on an empty handle.
  void wait() const;

  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
    return state_ ? state_->wait_for(timeout) : false;
  }

  template <typename Clock, typename Duration>
  bool wait_until(std::chrono::time_point<Clock, Duration> deadline) const {
    return state_ ? state_->wait_until(deadline) : false;
  }

  callback_id on_fire(std::function<void()> cb) const;

  void remove_callback(callback_id id) const {
    if (state_ && id != 0)
      state_->remove_callback(id);
  }

  signal_awaiter operator co_await() const;

  explicit operator bool() const { return state_ != nullptr; }

  std::shared_ptr<signal_state> state() const { return state_; }

  friend bool operator==(const signal &, const signal &) = default;

private:
  friend class signal_source;
  explicit signal(std::shared_ptr<signal_state> state)
      : state_(std::move(state)) {}

  std::shared_ptr<signal_state> state_;
};

// =============================================================================
// Signal Source - Owns a state and fires it
// =============================================================================

class signal_source {
public:
  signal_source() : state_(std::make_shared<signal_state>()) {}

  bool fire() const { return state_->fire(); }

  bool is_fired() const { return state_->is_fired(); }

  signal get_signal() const { return signal{state_}; }

private:
  std::shared_ptr<signal_state> state_;
};

// =============================================================================
// Signal Awaiter - co_await on a single signal
// =============================================================================
//
// Resumes on the worker pool once the signal fires, or never suspends when it
// already has.

class signal_awaiter : public awaitable_base<signal_awaiter, void> {
public:
  explicit signal_awaiter(signal sig)
      : signal_(std::move(sig)),
        handoff_(std::make_shared<continuation_handoff>()) {}

  bool ready_impl() const { return signal_.is_fired(); }

  bool suspend_impl(std::coroutine_handle<> h) {
    signal_.on_fire([handoff = handoff_] {
      if (handoff->set_ready())
        schedule_coro_handle(handoff->get_continuation());
    });
    return !handoff_->park(h);
  }

  void resume_impl() {}

private:
  signal signal_;
  std::shared_ptr<continuation_handoff> handoff_;
};

inline signal_awaiter signal::operator co_await() const {
  return signal_awaiter{*this};
}

} // namespace notify

#endif // NOTIFY_SIGNAL_HPP
