#ifndef NOTIFY_CANCELLATION_HPP
#define NOTIFY_CANCELLATION_HPP

#include <exception>
#include <memory>

#include "notify/signal.hpp"

namespace notify {

// Exception thrown when a cancelled operation is detected
struct cancelled_exception : std::exception {
  const char *what() const noexcept override { return "operation cancelled"; }
};

// Copyable handle observing the source's one-shot signal
class cancellation_token {
public:
  // A token with no source; never cancelled.
  cancellation_token() = default;

  bool is_cancelled() const { return signal_.is_fired(); }

  void throw_if_cancelled() const {
    if (is_cancelled())
      throw cancelled_exception{};
  }

  // Fires once, when the source is cancelled. Empty for a default token.
  // co_await token.cancelled() suspends until cancellation.
  notify::signal cancelled() const { return signal_; }

  explicit operator bool() const { return static_cast<bool>(signal_); }

private:
  friend class cancellation_source;
  explicit cancellation_token(notify::signal sig) : signal_(std::move(sig)) {}

  notify::signal signal_;
};

// Owns the cancellation signal, creates tokens, triggers cancellation
class cancellation_source {
public:
  cancellation_source() = default;

  cancellation_token token() const {
    return cancellation_token{source_.get_signal()};
  }

  // Idempotent; every outstanding wait on a token resolves.
  void cancel() { source_.fire(); }

  bool is_cancelled() const { return source_.is_fired(); }

private:
  signal_source source_;
};

} // namespace notify

#endif // NOTIFY_CANCELLATION_HPP
