#ifndef NOTIFY_ALLOCATOR_HPP
#define NOTIFY_ALLOCATOR_HPP

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace notify {

// std::pmr adaptor over mimalloc. Instances are interchangeable.
class mi_memory_resource : public std::pmr::memory_resource {
  void *do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void *p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource &other) const noexcept override;
};

// Installs mimalloc as the global default PMR resource. Called once from the
// task_scheduler constructor, before any worker starts.
void init_allocator();

// Global mimalloc-backed PMR resource (singleton). The aggregation registry
// and background waiter frames allocate from it.
std::pmr::memory_resource *mi_resource() noexcept;

// Coroutine frame storage, routed through mi_resource().
void *allocate_frame(std::size_t size);
void deallocate_frame(void *p, std::size_t size) noexcept;

} // namespace notify

#endif // NOTIFY_ALLOCATOR_HPP
