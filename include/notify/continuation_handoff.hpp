#ifndef NOTIFY_CONTINUATION_HANDOFF_HPP
#define NOTIFY_CONTINUATION_HANDOFF_HPP

#include <atomic>
#include <coroutine>
#include <cstdint>

namespace notify {

// A lock-free, one-shot rendezvous between a signal firing on some thread and
// a coroutine that is still in the middle of suspending on it. Whichever side
// arrives second owns the resumption.
//
// State encoding (single atomic):
//   Bit 0: READY flag (a watched signal has fired)
//   Bits 1+: continuation address (naturally aligned, so bit 0 is always 0)
//
//   0x0          = Initial
//   addr         = Coroutine parked, nothing fired yet
//   0x1          = Fired before the coroutine finished suspending
//   addr | 0x1   = Resolved
//
// Usage:
//   // Firing side (exactly once):
//   if (handoff.set_ready())
//     schedule_coro_handle(handoff.get_continuation());
//
//   // Suspending side, from a bool await_suspend:
//   return !handoff.park(h);   // true = stay suspended
class continuation_handoff {
public:
  static constexpr std::uintptr_t READY_FLAG = 1;
  static constexpr std::uintptr_t ADDR_MASK = ~std::uintptr_t(1);

  continuation_handoff() = default;
  continuation_handoff(const continuation_handoff &) = delete;
  continuation_handoff &operator=(const continuation_handoff &) = delete;

  // Returns true if the caller must resume the parked continuation.
  bool set_ready() noexcept {
    std::uintptr_t old_val = state_.load(std::memory_order_acquire);
    while (true) {
      if (old_val & READY_FLAG)
        return false;
      if (state_.compare_exchange_weak(old_val, old_val | READY_FLAG,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return (old_val & ADDR_MASK) != 0;
      }
    }
  }

  // Returns true if the firing side already arrived; the caller then keeps
  // running instead of suspending.
  bool park(std::coroutine_handle<> h) noexcept {
    const auto addr = reinterpret_cast<std::uintptr_t>(h.address());
    std::uintptr_t old_val = state_.load(std::memory_order_acquire);
    while (true) {
      if (state_.compare_exchange_weak(old_val, (old_val & READY_FLAG) | addr,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        return (old_val & READY_FLAG) != 0;
      }
    }
  }

  std::coroutine_handle<> get_continuation() const noexcept {
    std::uintptr_t val = state_.load(std::memory_order_acquire);
    void *addr = reinterpret_cast<void *>(val & ADDR_MASK);
    return addr ? std::coroutine_handle<>::from_address(addr)
                : std::noop_coroutine();
  }

  bool is_ready() const noexcept {
    return (state_.load(std::memory_order_acquire) & READY_FLAG) != 0;
  }

private:
  std::atomic<std::uintptr_t> state_{0};
};

} // namespace notify

#endif // NOTIFY_CONTINUATION_HANDOFF_HPP
