#include "notify/aggregation.hpp"

#include <utility>
#include <vector>

#include "allocator.hpp"
#include "detached_task.hpp"
#include "select.hpp"

namespace notify {

namespace {

// The single background waiter behind one updated() call. It parks on every
// watched signal at once, resolves done on the first to fire, drops its other
// subscriptions and finishes.
detached_task fire_when_any(std::vector<signal> watch, signal_source done) {
  co_await select(std::move(watch));
  done.fire();
}

} // namespace

aggregation::aggregation() : armed_(mi_resource()) {}

std::shared_ptr<untyped_var> aggregation::choose() {
  typename lock_policy::lock_type lock(mutex_);
  for (auto it = armed_.begin(); it != armed_.end(); ++it) {
    if (it->second.is_fired()) {
      auto found = it->first;
      armed_.erase(it);
      return found;
    }
  }
  return nullptr;
}

std::size_t aggregation::size() const {
  typename lock_policy::shared_lock_type lock(mutex_);
  return armed_.size();
}

signal aggregation::updated(const cancellation_token &cancel) const {
  std::vector<signal> watch;
  {
    typename lock_policy::shared_lock_type lock(mutex_);
    watch.reserve(armed_.size() + 1);
    for (const auto &[v, changed] : armed_) {
      if (changed.is_fired())
        return signal::already_fired();
      watch.push_back(changed);
    }
  }

  if (signal cancelled = cancel.cancelled()) {
    if (cancelled.is_fired())
      return signal::already_fired();
    watch.push_back(std::move(cancelled));
  }

  // Nothing could ever resolve it
  if (watch.empty())
    return signal_source{}.get_signal();

  signal_source done;
  fire_when_any(std::move(watch), done);
  return done.get_signal();
}

} // namespace notify
