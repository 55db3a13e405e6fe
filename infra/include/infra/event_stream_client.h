#pragma once

#include "core/backoff.h"
#include "core/job_ports.h"
#include "core/logger.h"
#include "infra/http_client.h"
#include "infra/sse_parser.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>

namespace spine::infra {

/// Stream reconnect / liveness policy.
struct StreamPolicy {
  // 3 x the server's 30 s ping interval.
  std::chrono::milliseconds idle_timeout{90000};
  int max_reconnect_attempts = 5; // consecutive failed connections
  spine::core::BackoffPolicy backoff{std::chrono::milliseconds(1000), 2.0,
                                     std::chrono::milliseconds(30000), 0.2};
  std::chrono::milliseconds max_session_duration{5 * 60 * 1000};
  std::chrono::seconds token_ttl{2 * 60 * 60};
  std::chrono::milliseconds connect_timeout{10000};
  bool forward_pings = false;
};

/// EventStreamClient: follows one job's `text/event-stream`.
///
/// Reconnects with Last-Event-ID after disconnects, clean EOF without a
/// terminal event, idle timeouts and 429/5xx connect responses. Every
/// subscribe() call starts from a fresh RetryState; one instance serves one
/// job at a time.
class EventStreamClient final : public spine::core::IJobEventStream {
public:
  using NowFn = std::function<std::chrono::steady_clock::time_point()>;

  EventStreamClient(std::shared_ptr<IHttpClient> http, StreamPolicy policy = {},
                    std::shared_ptr<spine::core::ILogger> logger = nullptr,
                    spine::core::SleepFn sleep = spine::core::default_sleep(),
                    NowFn now = nullptr,
                    std::uint32_t seed = std::random_device{}());

  spine::core::Result<void, spine::core::ClientError>
  subscribe(const spine::core::remote::JobHandle &handle, EventCallback on_event,
            std::shared_ptr<spine::core::CancelToken> cancel_token) override;

  /// Replay position reached by the most recent subscribe().
  [[nodiscard]] const std::optional<std::string> &last_event_id() const {
    return state_.last_event_id;
  }

  /// Connections opened by the most recent subscribe().
  [[nodiscard]] int connection_count() const { return state_.attempt_count; }

private:
  struct RetryState {
    int attempt_count = 0; // connections opened this session
    int consecutive_failures = 0;
    std::optional<std::string> last_event_id;
    std::chrono::milliseconds next_backoff{0};
    std::optional<std::chrono::milliseconds> server_retry_hint;
  };

  std::shared_ptr<IHttpClient> http_;
  StreamPolicy policy_;
  std::shared_ptr<spine::core::ILogger> logger_;
  spine::core::SleepFn sleep_;
  NowFn now_;
  std::mt19937 rng_;
  RetryState state_;

  HttpRequest build_request(const spine::core::remote::JobHandle &handle,
                            std::chrono::milliseconds remaining) const;

  enum class RecordOutcome {
    Skipped,   // no payload, failed to decode, or an unknown label
    Delivered, // a known event (or ping) reached the stream
    Terminal,
  };

  RecordOutcome handle_record(const SseRecord &record,
                              const EventCallback &on_event,
                              const std::string &trace_id);

  void update_last_event_id(const std::string &id, const std::string &trace_id);
};

} // namespace spine::infra
