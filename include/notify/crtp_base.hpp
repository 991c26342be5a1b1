#ifndef NOTIFY_CRTP_BASE_HPP
#define NOTIFY_CRTP_BASE_HPP

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <mutex>

#include "concepts.hpp"
#include "policies.hpp"

namespace notify {

// Forward declaration for scheduler integration
void schedule_coro_handle(std::coroutine_handle<> handle);

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  mutable std::condition_variable_any cv_;

  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) const {
    cv_.wait(lock, pred);
  }

  template <typename Predicate, typename Rep, typename Period>
  bool wait_for_condition_for(lock_type &lock, Predicate pred,
                              std::chrono::duration<Rep, Period> timeout) const {
    return cv_.wait_for(lock, timeout, pred);
  }

  template <typename Predicate, typename Clock, typename Duration>
  bool wait_for_condition_until(
      lock_type &lock, Predicate pred,
      std::chrono::time_point<Clock, Duration> deadline) const {
    return cv_.wait_until(lock, deadline, pred);
  }

  void notify_all() const { cv_.notify_all(); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================
//
// Derived class must implement:
// - bool ready_impl()
// - void or bool suspend_impl(std::coroutine_handle<> h)
//   (bool: false resumes the awaiting coroutine immediately)
// - T resume_impl()

template <typename Derived, typename T> class awaitable_base {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() noexcept { return derived().ready_impl(); }

  decltype(auto) await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }
  const Derived &derived() const { return static_cast<const Derived &>(*this); }

public:
  bool await_ready() noexcept { return derived().ready_impl(); }

  decltype(auto) await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  void await_resume() { derived().resume_impl(); }
};

} // namespace notify

#endif // NOTIFY_CRTP_BASE_HPP
