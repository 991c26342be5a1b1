#include "task_scheduler.hpp"
#include "allocator.hpp"

#include <cstdio>
#include <exception>

namespace notify {

std::size_t task_scheduler::default_worker_count() {
  std::size_t processor_count = std::thread::hardware_concurrency();
  return processor_count > 0 ? processor_count : 1;
}

task_scheduler::task_scheduler(std::size_t worker_count) {
  init_allocator();

  if (worker_count == 0)
    worker_count = 1;
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i)
    workers_.emplace_back([this, i] { run_worker(i); });
}

task_scheduler::~task_scheduler() { shutdown(); }

void task_scheduler::schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done())
    return;

  if (shutting_down_.load(std::memory_order_acquire) || !queue_.push(handle)) {
    // Run inline during shutdown
    handle.resume();
  }
}

void task_scheduler::shutdown() {
  if (shutting_down_.exchange(true, std::memory_order_acq_rel))
    return; // already shut down

  queue_.close();
  for (auto &worker : workers_) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
      continue;
    }
    if (worker.joinable())
      worker.join();
  }
}

void task_scheduler::run_worker(std::size_t worker_id) {
  while (auto handle = queue_.pop()) {
    try {
      handle->resume();
    } catch (const std::exception &e) {
      std::fprintf(stderr, "[task_scheduler] worker %zu: coroutine threw: %s\n",
                   worker_id, e.what());
      throw;
    }
  }
}

task_scheduler &global_scheduler() {
  static task_scheduler scheduler;
  return scheduler;
}

void schedule_coro_handle(std::coroutine_handle<> handle) {
  global_scheduler().schedule_coro_handle(handle);
}

} // namespace notify
