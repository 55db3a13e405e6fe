#include "core/cancel_token.h"

#include <thread>

namespace spine::core {

void CancelToken::request_cancel() noexcept {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }

  std::vector<Callback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(callbacks_);
  }
  wake_.notify_all();

  // First cancellation: invoke callbacks outside the lock
  for (auto &cb : callbacks) {
    if (cb) {
      cb();
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

bool CancelToken::sleep_for(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !wake_.wait_for(lock, duration, [this] { return is_canceled(); });
}

void CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_canceled()) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  // Already canceled, invoke immediately
  if (cb) {
    cb();
  }
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

SleepFn default_sleep() {
  return [](std::chrono::milliseconds duration,
            const std::shared_ptr<CancelToken> &token) {
    if (token) {
      return token->sleep_for(duration);
    }
    std::this_thread::sleep_for(duration);
    return true;
  };
}

} // namespace spine::core
