#include "infra/event_stream_client.h"

#include "core/ids.h"
#include "infra/error_translator.h"
#include "infra/event_codec.h"

#include <algorithm>
#include <charconv>

namespace spine::infra {

using spine::core::ClientError;
using spine::core::ErrorKind;
using spine::core::StreamEvent;
using spine::core::remote::JobHandle;
using SubscribeResult = spine::core::Result<void, ClientError>;

namespace {

constexpr const char *kComponent = "event_stream";

std::optional<std::uint64_t> numeric_id(const std::string &id) {
  if (id.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), value);
  if (ec != std::errc() || ptr != id.data() + id.size()) {
    return std::nullopt;
  }
  return value;
}

ClientError stream_error(std::string code, std::string user_message,
                         std::string internal_message, bool retryable) {
  return ClientError(ErrorKind::Transport, std::move(code), retryable,
                     std::move(user_message), std::move(internal_message));
}

ClientError session_timeout(std::chrono::milliseconds cap) {
  return stream_error("STREAM_SESSION_TIMEOUT",
                      "Scan took too long. Please try again.",
                      "Stream session exceeded " + std::to_string(cap.count()) +
                          " ms",
                      false);
}

} // namespace

EventStreamClient::EventStreamClient(std::shared_ptr<IHttpClient> http,
                                     StreamPolicy policy,
                                     std::shared_ptr<spine::core::ILogger> logger,
                                     spine::core::SleepFn sleep, NowFn now,
                                     std::uint32_t seed)
    : http_(std::move(http)), policy_(std::move(policy)),
      logger_(std::move(logger)),
      sleep_(sleep ? std::move(sleep) : spine::core::default_sleep()),
      now_(now ? std::move(now)
               : NowFn([] { return std::chrono::steady_clock::now(); })),
      rng_(seed) {}

HttpRequest EventStreamClient::build_request(const JobHandle &handle,
                                             std::chrono::milliseconds remaining) const {
  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = handle.stream_endpoint;
  request.headers["Accept"] = "text/event-stream";
  request.headers["Cache-Control"] = "no-cache";
  if (!handle.auth_token.empty()) {
    request.headers["Authorization"] = "Bearer " + handle.auth_token;
  }
  if (!handle.device_id.empty()) {
    request.headers["X-Device-ID"] = handle.device_id;
  }
  // Only reconnects resume; the first connection never carries an id.
  if (state_.attempt_count > 0 && state_.last_event_id) {
    request.headers["Last-Event-ID"] = *state_.last_event_id;
  }
  request.trace_id = handle.job_id;
  request.request_id = spine::core::generate_id("sse");
  request.connect_timeout = policy_.connect_timeout;
  request.idle_timeout = policy_.idle_timeout;
  // The session cap doubles as the transfer timeout.
  request.timeout = std::max(remaining, std::chrono::milliseconds(1));
  return request;
}

void EventStreamClient::update_last_event_id(const std::string &id,
                                             const std::string &trace_id) {
  if (state_.last_event_id) {
    const auto current = numeric_id(*state_.last_event_id);
    const auto incoming = numeric_id(id);
    if (current && incoming && *incoming < *current) {
      if (logger_) {
        logger_->debug(trace_id, kComponent, "event_id_regression",
                       "ignoring id=" + id + " last=" + *state_.last_event_id);
      }
      return;
    }
  }
  state_.last_event_id = id;
}

EventStreamClient::RecordOutcome
EventStreamClient::handle_record(const SseRecord &record,
                                 const EventCallback &on_event,
                                 const std::string &trace_id) {
  // Replay position first, so a record that fails to decode is not replayed.
  if (record.id) {
    update_last_event_id(*record.id, trace_id);
  }
  if (record.retry_ms) {
    state_.server_retry_hint =
        std::chrono::milliseconds(static_cast<long long>(*record.retry_ms));
  }
  if (!record.has_payload()) {
    return RecordOutcome::Skipped;
  }

  const std::string label = record.label();
  auto decoded = decode_stream_event(label, record.data);
  if (decoded.is_err()) {
    if (logger_) {
      logger_->warn(trace_id, kComponent, "decode_failed",
                    "label=" + decoded.error().label +
                        " reason=" + decoded.error().reason);
    }
    if (label != "error") {
      return RecordOutcome::Skipped;
    }
    // The server has ended the job; reconnecting would only replay silence.
    decoded = spine::core::Result<StreamEvent, spine::core::DecodeFailure>::Ok(
        StreamEvent{recover_error_event(record.data), std::nullopt});
  }

  StreamEvent event = std::move(decoded).value();
  event.id = record.id;

  if (event.is<spine::core::IgnoredUnknownEvent>()) {
    if (logger_) {
      logger_->debug(trace_id, kComponent, "unknown_event", "label=" + label);
    }
    return RecordOutcome::Skipped;
  }
  if (event.is<spine::core::PingEvent>()) {
    if (policy_.forward_pings && on_event) {
      on_event(event);
    }
    return RecordOutcome::Delivered;
  }

  if (on_event) {
    on_event(event);
  }
  return spine::core::is_terminal(event) ? RecordOutcome::Terminal
                                         : RecordOutcome::Delivered;
}

SubscribeResult EventStreamClient::subscribe(
    const JobHandle &handle, EventCallback on_event,
    std::shared_ptr<spine::core::CancelToken> cancel_token) {
  state_ = RetryState{};
  const std::string &trace_id = handle.job_id;

  if (!http_) {
    return SubscribeResult::Err(
        ClientError::Internal("EventStreamClient has null HTTP client"));
  }

  const auto deadline = now_() + policy_.max_session_duration;
  SseParser parser;

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return SubscribeResult::Err(ClientError::Canceled("Stream canceled"));
    }
    if (handle.is_expired(JobHandle::Clock::now(), policy_.token_ttl)) {
      return SubscribeResult::Err(stream_error(
          "AUTH_TOKEN_EXPIRED", "Scan session expired.",
          "Job token older than " + std::to_string(policy_.token_ttl.count()) +
              " s; not reconnecting",
          false));
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - now_());
    if (remaining.count() <= 0) {
      return SubscribeResult::Err(session_timeout(policy_.max_session_duration));
    }

    const HttpRequest request = build_request(handle, remaining);
    if (logger_) {
      logger_->info(trace_id, kComponent,
                    state_.attempt_count == 0 ? "connect" : "reconnect",
                    "attempt=" + std::to_string(state_.attempt_count + 1) +
                        " last_event_id=" + state_.last_event_id.value_or("-"));
    }
    ++state_.attempt_count;

    parser.reset();
    bool productive = false;
    bool terminal_seen = false;
    auto on_chunk = [&](std::string_view chunk) -> bool {
      for (const auto &record : parser.feed(chunk)) {
        const RecordOutcome outcome = handle_record(record, on_event, trace_id);
        if (outcome == RecordOutcome::Terminal) {
          terminal_seen = true;
          return false;
        }
        if (outcome == RecordOutcome::Delivered) {
          productive = true;
        }
      }
      return now_() < deadline;
    };

    auto result = http_->stream(request, on_chunk, cancel_token);
    if (terminal_seen) {
      if (logger_) {
        logger_->info(trace_id, kComponent, "stream_finished",
                      "connections=" + std::to_string(state_.attempt_count));
      }
      return SubscribeResult::Ok();
    }

    ClientError failure;
    if (result.is_err()) {
      failure = std::move(result).error();
      if (failure.kind == ErrorKind::Canceled) {
        return SubscribeResult::Err(std::move(failure));
      }
    } else {
      const HttpResponse &response = result.value();
      if (!response.is_success()) {
        failure = translate_http_error(response.status_code, response.body,
                                       response.header("Retry-After"));
        const bool reconnectable =
            response.status_code == 429 || response.status_code >= 500;
        if (!reconnectable) {
          if (logger_) {
            logger_->error(trace_id, kComponent, "connect_rejected",
                           spine::core::describe(failure));
          }
          return SubscribeResult::Err(std::move(failure));
        }
      } else {
        failure = stream_error("STREAM_CLOSED", "Connection lost.",
                               "Stream ended without a terminal event", true);
      }
    }

    if (now_() >= deadline) {
      return SubscribeResult::Err(session_timeout(policy_.max_session_duration));
    }

    // Only known events prove the endpoint healthy; unknown labels and
    // undecodable records leave the failure budget alone.
    if (productive) {
      state_.consecutive_failures = 0;
    }
    ++state_.consecutive_failures;
    if (state_.consecutive_failures > policy_.max_reconnect_attempts) {
      auto exhausted = stream_error(
          "STREAM_RECONNECT_EXHAUSTED", "Lost connection to the scan service.",
          "Gave up after " + std::to_string(state_.consecutive_failures) +
              " consecutive failures; last: " + spine::core::describe(failure),
          false);
      exhausted.http_status = failure.http_status;
      exhausted.details["retry_count"] =
          std::to_string(state_.consecutive_failures - 1);
      exhausted.details["last_error_code"] = failure.code;
      if (state_.last_event_id) {
        exhausted.details["last_event_id"] = *state_.last_event_id;
      }
      if (logger_) {
        logger_->error(trace_id, kComponent, "reconnect_exhausted",
                       exhausted.internal_message);
      }
      return SubscribeResult::Err(std::move(exhausted));
    }

    auto delay = policy_.backoff.delay(state_.consecutive_failures - 1, rng_);
    if (failure.http_status == 429 && failure.retry_after) {
      delay = *failure.retry_after;
    }
    if (state_.server_retry_hint) {
      delay = std::max(delay, *state_.server_retry_hint);
    }
    state_.next_backoff = delay;

    if (logger_) {
      logger_->warn(trace_id, kComponent, "reconnect_scheduled",
                    spine::core::describe(failure) +
                        " delay_ms=" + std::to_string(delay.count()) +
                        " failures=" +
                        std::to_string(state_.consecutive_failures));
    }
    if (!sleep_(delay, cancel_token)) {
      return SubscribeResult::Err(
          ClientError::Canceled("Stream canceled during reconnect backoff"));
    }
  }
}

} // namespace spine::infra
