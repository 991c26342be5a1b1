#ifndef NOTIFY_CONCEPTS_HPP
#define NOTIFY_CONCEPTS_HPP

#include <concepts>
#include <type_traits>

namespace notify {

class cancellation_token;

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = requires {
  typename P::mutex_type;
  typename P::lock_type;
} && Lockable<typename P::mutex_type>;

// =============================================================================
// Var Concepts
// =============================================================================

// Anything storable in a var: copied out on every get().
template <typename T>
concept VarValue = std::copy_constructible<T>;

// update() transforms take the current value and produce the next one. They
// report failure by throwing.
template <typename F, typename T>
concept ValueTransform = std::invocable<F &, const T &> &&
                         std::convertible_to<std::invoke_result_t<F &, const T &>, T>;

// Callbacks driven by do_when_changed(): fn(token, old, new).
template <typename F, typename T>
concept ChangeCallback =
    std::invocable<F &, const cancellation_token &, const T &, const T &>;

} // namespace notify

#endif // NOTIFY_CONCEPTS_HPP
