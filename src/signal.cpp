#include "notify/signal.hpp"

#include <stdexcept>

namespace notify {

bool signal_state::fire() {
  std::vector<std::pair<callback_id, std::function<void()>>> cbs;
  {
    typename base_type::lock_type lock(this->mutex_);
    if (fired_.load(std::memory_order_relaxed))
      return false;
    fired_.store(true, std::memory_order_release);
    cbs.swap(callbacks_);
  }
  this->notify_all();

  for (auto &entry : cbs)
    entry.second();
  return true;
}

void signal_state::wait() const {
  typename base_type::lock_type lock(this->mutex_);
  this->wait_for_condition(lock, [this] { return is_fired(); });
}

signal_state::callback_id signal_state::on_fire(std::function<void()> cb) {
  {
    typename base_type::lock_type lock(this->mutex_);
    if (!fired_.load(std::memory_order_relaxed)) {
      callback_id id = next_id_++;
      callbacks_.emplace_back(id, std::move(cb));
      return id;
    }
  }
  cb();
  return 0;
}

void signal_state::remove_callback(callback_id id) {
  typename base_type::lock_type lock(this->mutex_);
  for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
    if (it->first == id) {
      callbacks_.erase(it);
      return;
    }
  }
}

std::size_t signal_state::callback_count() const {
  typename base_type::lock_type lock(this->mutex_);
  return callbacks_.size();
}

void signal::wait() const {
  if (!state_)
    throw std::invalid_argument("wait on an empty signal");
  state_->wait();
}

signal::callback_id signal::on_fire(std::function<void()> cb) const {
  if (!state_)
    throw std::invalid_argument("on_fire on an empty signal");
  return state_->on_fire(std::move(cb));
}

} // namespace notify
