#ifndef NOTIFY_TS_QUEUE_HPP
#define NOTIFY_TS_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

#include "notify/crtp_base.hpp"
#include "notify/policies.hpp"

namespace notify {

// =============================================================================
// Thread-Safe Queue - Unbounded MPMC queue with close
// =============================================================================
//
// Feeds the worker pool. Once closed, push() is refused and pop() keeps
// returning queued items until the queue is empty, then returns nothing.

template <typename T, typename LockPolicy = mutex_lock_policy>
class ts_queue : public sync_primitive_base<ts_queue<T, LockPolicy>, LockPolicy> {
  using base_type = sync_primitive_base<ts_queue<T, LockPolicy>, LockPolicy>;

  std::deque<T> buffer_;
  bool closed_{false};

public:
  using value_type = T;

  ts_queue() = default;

  // Returns false if the queue is closed.
  bool push(T value) {
    {
      typename base_type::lock_type lock(this->mutex_);
      if (closed_)
        return false;
      buffer_.push_back(std::move(value));
    }
    this->cv_.notify_one();
    return true;
  }

  // Blocks until an item is available or the queue is closed and drained.
  std::optional<T> pop() {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock,
                             [this] { return !buffer_.empty() || closed_; });
    if (buffer_.empty())
      return std::nullopt;
    T value = std::move(buffer_.front());
    buffer_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    typename base_type::lock_type lock(this->mutex_);
    if (buffer_.empty())
      return std::nullopt;
    T value = std::move(buffer_.front());
    buffer_.pop_front();
    return value;
  }

  void close() {
    {
      typename base_type::lock_type lock(this->mutex_);
      closed_ = true;
    }
    this->notify_all();
  }

  bool is_closed() const {
    typename base_type::lock_type lock(this->mutex_);
    return closed_;
  }

  std::size_t size() const {
    typename base_type::lock_type lock(this->mutex_);
    return buffer_.size();
  }
};

} // namespace notify

#endif // NOTIFY_TS_QUEUE_HPP
