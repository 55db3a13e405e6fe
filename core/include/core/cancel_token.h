#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace spine::core {

/// Thread-safe cancellation token, one per job.
///
/// Single writer (whoever calls request_cancel()) / multi reader (uploader,
/// stream client and resolver poll is_canceled() or block in sleep_for()).
/// The flag is an atomic<bool>; the mutex only guards callbacks and wakeups.
///
/// Usage in a retry loop:
///   if (!token->sleep_for(backoff)) {
///       return canceled_error();
///   }
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation. Thread-safe, idempotent.
  void request_cancel() noexcept;

  /// Check if cancellation has been requested.
  [[nodiscard]] bool is_canceled() const noexcept;

  /// Block for up to `duration`, waking early on cancellation.
  /// Returns true if the full duration elapsed, false if canceled.
  bool sleep_for(std::chrono::milliseconds duration);

  /// Register a callback to be invoked when cancellation is requested.
  /// Callbacks are invoked synchronously from request_cancel().
  using Callback = std::function<void()>;
  void on_cancel(Callback cb);

  /// Create a shared CancelToken.
  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  std::mutex mutex_;
  std::condition_variable wake_;
  std::vector<Callback> callbacks_;
};

/// Sleep that honours an optional token. Returns false when canceled.
using SleepFn = std::function<bool(std::chrono::milliseconds,
                                   const std::shared_ptr<CancelToken> &)>;

/// Default SleepFn: CancelToken::sleep_for, or a plain sleep without a token.
SleepFn default_sleep();

} // namespace spine::core
