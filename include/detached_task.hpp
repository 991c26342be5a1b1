#ifndef NOTIFY_DETACHED_TASK_HPP
#define NOTIFY_DETACHED_TASK_HPP

#include <coroutine>
#include <cstddef>

#include "allocator.hpp"

namespace notify {

// =============================================================================
// Detached Task - Fire-and-forget coroutine
// =============================================================================
//
// Runs eagerly on the calling thread up to its first suspension, is resumed
// by whichever worker the scheduler hands it to, and frees its own frame when
// it finishes. Nobody can observe its result, so an escaping exception is
// logged and terminates the process.

class detached_task {
public:
  struct promise_type {
    detached_task get_return_object() noexcept { return {}; }

    std::suspend_never initial_suspend() noexcept { return {}; }

    std::suspend_never final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    [[noreturn]] void unhandled_exception() noexcept;

    static void *operator new(std::size_t size) { return allocate_frame(size); }

    static void operator delete(void *p, std::size_t size) noexcept {
      deallocate_frame(p, size);
    }
  };
};

} // namespace notify

#endif // NOTIFY_DETACHED_TASK_HPP
