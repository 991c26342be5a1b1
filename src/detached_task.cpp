#include "detached_task.hpp"

#include <cstdio>
#include <exception>

namespace notify {

void detached_task::promise_type::unhandled_exception() noexcept {
  try {
    throw;
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[detached_task] unhandled exception: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[detached_task] unhandled non-standard exception\n");
  }
  std::terminate();
}

} // namespace notify
