#ifndef NOTIFY_POLICIES_HPP
#define NOTIFY_POLICIES_HPP

#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace notify {

// =============================================================================
// Lock Policies
// =============================================================================
//
// A policy names the mutex a primitive serializes its writers on. Readers of
// a var never take it; the aggregation registry always uses the shared one.

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct shared_mutex_lock_policy {
  using mutex_type = std::shared_mutex;
  using lock_type = std::unique_lock<std::shared_mutex>;
  using shared_lock_type = std::shared_lock<std::shared_mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin on a plain load until the holder clears the flag
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// Only for cheap transforms: update() runs the caller's function while the
// writer lock is held.
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

} // namespace notify

#endif // NOTIFY_POLICIES_HPP
