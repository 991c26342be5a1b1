#ifndef NOTIFY_VAR_HPP
#define NOTIFY_VAR_HPP

#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"
#include "signal.hpp"

namespace notify {

// =============================================================================
// Untyped Var - What an aggregation sees of a var
// =============================================================================
//
// Handles returned by aggregation::choose() are shared_ptr<untyped_var>; the
// caller narrows them back with std::dynamic_pointer_cast<var<T>>.

class untyped_var {
public:
  virtual ~untyped_var() = default;

  // The signal of the generation current at the time of the call.
  virtual signal changed() const = 0;

protected:
  untyped_var() = default;
  untyped_var(const untyped_var &) = delete;
  untyped_var &operator=(const untyped_var &) = delete;
};

// =============================================================================
// Snapshot / Update Result
// =============================================================================

// A value together with the signal that fires once that value is replaced.
template <typename T> struct snapshot {
  T value;
  signal changed;
};

template <typename T> struct update_result {
  T new_value;
  T old_value;
  std::exception_ptr error; // set when the transform threw; var unchanged

  explicit operator bool() const { return error == nullptr; }

  void rethrow_if_failed() const {
    if (error)
      std::rethrow_exception(error);
  }
};

// =============================================================================
// Var - Value plus a one-shot change signal per generation
// =============================================================================
//
// The current (value, signal) pair lives in one immutable generation object
// published through an atomic shared_ptr, so get() can never pair a value
// with another generation's signal and never waits on a writer. Writers
// serialize on the policy's mutex, swap in a fresh generation and then fire
// the old one's signal outside the lock.

template <VarValue T, LockPolicy WriterLock = mutex_lock_policy>
class var : public untyped_var {
  struct generation {
    explicit generation(T v) : value(std::move(v)) {}

    const T value;
    signal_source changed;
  };

public:
  using value_type = T;
  using lock_policy = WriterLock;

  var()
    requires std::default_initializable<T>
      : var(T{}) {}

  explicit var(T initial)
      : current_(std::make_shared<generation>(std::move(initial))) {}

  snapshot<T> get() const {
    auto gen = current_.load(std::memory_order_acquire);
    return {gen->value, gen->changed.get_signal()};
  }

  signal changed() const override {
    return current_.load(std::memory_order_acquire)->changed.get_signal();
  }

  // Replaces the value unconditionally; an equal value still starts a new
  // generation and fires the old signal.
  void set(T value) {
    auto next = std::make_shared<generation>(std::move(value));
    std::shared_ptr<generation> prev;
    {
      typename WriterLock::lock_type lock(mutex_);
      prev = current_.exchange(std::move(next), std::memory_order_acq_rel);
    }
    prev->changed.fire();
  }

  // Applies fn to the current value under the writer lock. If fn throws, the
  // var is left as it was, nothing fires, and the exception is returned with
  // the current value as both old and new.
  template <typename Func>
    requires ValueTransform<Func, T>
  update_result<T> update(Func &&fn) {
    std::shared_ptr<generation> prev;
    std::shared_ptr<generation> next;
    {
      typename WriterLock::lock_type lock(mutex_);
      prev = current_.load(std::memory_order_acquire);
      try {
        next = std::make_shared<generation>(
            std::invoke(std::forward<Func>(fn), prev->value));
      } catch (...) {
        return {prev->value, prev->value, std::current_exception()};
      }
      current_.store(next, std::memory_order_release);
    }
    prev->changed.fire();
    return {next->value, prev->value, nullptr};
  }

private:
  std::atomic<std::shared_ptr<generation>> current_;
  typename WriterLock::mutex_type mutex_;
};

// Vars are shared between producers, readers and aggregations; this is the
// usual way to create one.
template <VarValue T> std::shared_ptr<var<T>> var_of(T initial) {
  return std::make_shared<var<T>>(std::move(initial));
}

} // namespace notify

#endif // NOTIFY_VAR_HPP
