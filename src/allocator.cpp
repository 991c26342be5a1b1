#include "allocator.hpp"

#include <mutex>
#include <new>

namespace notify {

namespace {

// One resource for the whole process. The aggregation registries and the
// updated() waiter frames all come from here, so it must outlive every
// aggregation, including ones with static storage.
mi_memory_resource &registry_resource() noexcept {
  static mi_memory_resource resource;
  return resource;
}

std::once_flag default_resource_once;

} // namespace

// --- mi_memory_resource ---

void *mi_memory_resource::do_allocate(std::size_t bytes, std::size_t alignment) {
  if (void *p = mi_malloc_aligned(bytes, alignment))
    return p;
  throw std::bad_alloc();
}

void mi_memory_resource::do_deallocate(void *p, std::size_t /*bytes*/,
                                       std::size_t alignment) {
  mi_free_aligned(p, alignment);
}

bool mi_memory_resource::do_is_equal(
    const std::pmr::memory_resource &other) const noexcept {
  // Any two mimalloc resources can free each other's blocks
  return dynamic_cast<const mi_memory_resource *>(&other) != nullptr;
}

std::pmr::memory_resource *mi_resource() noexcept {
  return &registry_resource();
}

void init_allocator() {
  std::call_once(default_resource_once, [] {
    std::pmr::set_default_resource(&registry_resource());
  });
}

// --- updated() waiter frames ---

void *allocate_frame(std::size_t size) {
  return registry_resource().allocate(size, alignof(std::max_align_t));
}

void deallocate_frame(void *p, std::size_t size) noexcept {
  registry_resource().deallocate(p, size, alignof(std::max_align_t));
}

} // namespace notify
