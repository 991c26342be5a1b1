#ifndef NOTIFY_TASK_SCHEDULER_HPP
#define NOTIFY_TASK_SCHEDULER_HPP

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <thread>
#include <vector>

#include "ts_queue.hpp"

namespace notify {

/*
  Runs coroutines that were parked on a signal once that signal fires. The
  firing thread only enqueues the handle, so set() and cancel() never run
  a waiter's continuation themselves. A fixed set of workers (one per
  hardware thread) drains a single shared queue.
*/

class task_scheduler {
public:
  explicit task_scheduler(std::size_t worker_count = default_worker_count());
  ~task_scheduler();

  task_scheduler(const task_scheduler &) = delete;
  task_scheduler &operator=(const task_scheduler &) = delete;

  // Queue a suspended coroutine for resumption on a worker. After shutdown
  // has begun the handle is resumed inline instead.
  void schedule_coro_handle(std::coroutine_handle<> handle);

  // Stop accepting work, let the workers drain the queue, join them.
  void shutdown();

  bool is_shutting_down() const noexcept {
    return shutting_down_.load(std::memory_order_acquire);
  }

  std::size_t worker_count() const noexcept { return workers_.size(); }

  static std::size_t default_worker_count();

private:
  void run_worker(std::size_t worker_id);

  ts_queue<std::coroutine_handle<>> queue_;
  std::vector<std::thread> workers_;
  std::atomic<bool> shutting_down_{false};
};

// Process-wide scheduler, created on first use.
task_scheduler &global_scheduler();

} // namespace notify

#endif // NOTIFY_TASK_SCHEDULER_HPP
