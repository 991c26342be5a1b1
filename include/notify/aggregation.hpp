#ifndef NOTIFY_AGGREGATION_HPP
#define NOTIFY_AGGREGATION_HPP

#include <cstddef>
#include <memory>
#include <memory_resource>
#include <shared_mutex>
#include <unordered_map>

#include "../cancellation.hpp"
#include "policies.hpp"
#include "signal.hpp"
#include "var.hpp"

namespace notify {

// =============================================================================
// Aggregation - Wait for a change on any of a dynamic set of vars
// =============================================================================
//
// Vars of any value type are armed with aggregate(), which captures the
// signal of the generation seen at that moment. updated() returns one signal
// covering every armed var (and a cancellation token); choose() hands back a
// single var whose captured signal has fired and disarms it. A var stays out
// of the set until it is aggregated again.
//
//   auto agg = aggregation{};
//   int seen = agg.aggregate(counter);
//   while (!agg.empty()) {
//     agg.updated(token).wait();
//     if (auto v = agg.choose()) { ... }
//   }

class aggregation {
  using lock_policy = shared_mutex_lock_policy;

public:
  aggregation();

  aggregation(const aggregation &) = delete;
  aggregation &operator=(const aggregation &) = delete;

  // Arms v and returns the value it was armed at. Aggregating a var that is
  // still armed keeps the captured signal and returns the var's current
  // value.
  template <typename T, typename L>
  T aggregate(const std::shared_ptr<var<T, L>> &v) {
    typename lock_policy::lock_type lock(mutex_);
    std::shared_ptr<untyped_var> key = v;
    if (armed_.contains(key))
      return v->get().value;

    auto snap = v->get();
    armed_.emplace(std::move(key), std::move(snap.changed));
    return std::move(snap.value);
  }

  // Removes and returns one armed var whose signal has fired, or nullptr
  // when none has. Which one is picked among several is unspecified.
  std::shared_ptr<untyped_var> choose();

  std::size_t size() const;

  bool empty() const { return size() == 0; }

  // Fires once any var armed right now changes, or cancel is cancelled.
  // Vars aggregated afterwards are not covered; call updated() again after
  // draining with choose(). Returns an already-fired signal without starting
  // anything when a change or the cancellation is already visible.
  //
  // The background waiter lives until one of its signals fires, so pass a
  // token that will be cancelled when the caller stops listening. A
  // default-constructed token never cancels.
  signal updated(const cancellation_token &cancel) const;

private:
  mutable typename lock_policy::mutex_type mutex_;
  std::pmr::unordered_map<std::shared_ptr<untyped_var>, signal> armed_;
};

} // namespace notify

#endif // NOTIFY_AGGREGATION_HPP
