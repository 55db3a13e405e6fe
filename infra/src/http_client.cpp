#include "infra/http_client.h"

#include <algorithm>
#include <cctype>
#include <thread>

namespace spine::infra {

using spine::core::ClientError;
using spine::core::ErrorKind;

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

ClientError canceled_error(const HttpRequest &request, int retry_count,
                           const std::string &internal_message) {
  auto err = make_transport_error(HttpErrorCode::CANCELED, "Request canceled.",
                                  internal_message, false);
  err.details["retry_count"] = std::to_string(retry_count);
  err.details["request_id"] = request.request_id;
  return err;
}

} // namespace

const char *to_string(HttpMethod method) {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  }
  return "GET";
}

const char *to_string(HttpErrorCode code) {
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
    return "NETWORK_ERROR";
  case HttpErrorCode::TIMEOUT:
    return "TIMEOUT";
  case HttpErrorCode::CANCELED:
    return "CANCELED";
  case HttpErrorCode::UNKNOWN:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

std::optional<std::string> HttpResponse::header(const std::string &name) const {
  const std::string wanted = to_lower(name);
  for (const auto &[key, value] : headers) {
    if (to_lower(key) == wanted) {
      return value;
    }
  }
  return std::nullopt;
}

ClientError make_transport_error(HttpErrorCode code,
                                 const std::string &user_message,
                                 const std::string &internal_message,
                                 bool retryable) {
  const ErrorKind kind =
      code == HttpErrorCode::CANCELED ? ErrorKind::Canceled : ErrorKind::Transport;
  ClientError error(kind, to_string(code), retryable, user_message,
                    internal_message);
  error.details["http_error_code"] = std::to_string(static_cast<int>(code));
  return error;
}

RetryableHttpClient::RetryableHttpClient(
    std::shared_ptr<IHttpClient> inner,
    RetryPolicy policy,
    std::shared_ptr<spine::core::ILogger> logger)
    : inner_(std::move(inner)), policy_(std::move(policy)),
      logger_(std::move(logger)) {}

IHttpClient::Result RetryableHttpClient::execute(
    const HttpRequest &request,
    std::shared_ptr<spine::core::CancelToken> cancel_token
) {
  int retry_count = 0;
  auto backoff = policy_.initial_backoff;

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return Result::Err(canceled_error(
          request, retry_count, "Cancellation requested before HTTP call"));
    }

    if (!inner_) {
      auto err = make_transport_error(HttpErrorCode::UNKNOWN, "Request failed.",
                                      "RetryableHttpClient has null inner client",
                                      false);
      err.details["retry_count"] = std::to_string(retry_count);
      err.details["request_id"] = request.request_id;
      return Result::Err(std::move(err));
    }

    auto result = inner_->execute(request, cancel_token);
    if (result.is_ok()) {
      return result;
    }

    auto error = std::move(result).error();
    const bool should_retry = policy_.should_retry(error);
    const bool has_attempts_left = retry_count < policy_.max_retries;

    error.details["retry_count"] = std::to_string(retry_count);
    if (!request.request_id.empty()) {
      error.details["request_id"] = request.request_id;
    }
    if (!should_retry || !has_attempts_left) {
      return Result::Err(std::move(error));
    }

    if (logger_) {
      logger_->warn(
          request.trace_id, "http_client", "retry_scheduled",
          "request_id=" + request.request_id +
              " retry_count=" + std::to_string(retry_count + 1) +
              " max_retries=" + std::to_string(policy_.max_retries) +
              " backoff_ms=" + std::to_string(backoff.count()));
    }

    auto sleep_until = std::chrono::steady_clock::now() + backoff;
    while (std::chrono::steady_clock::now() < sleep_until) {
      if (cancel_token && cancel_token->is_canceled()) {
        return Result::Err(canceled_error(
            request, retry_count, "Cancellation requested during retry backoff"));
      }
      std::this_thread::sleep_for(policy_.sleep_slice);
    }

    auto next_backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
        backoff * policy_.backoff_multiplier);
    backoff = std::min(next_backoff, policy_.max_backoff);
    retry_count++;
  }
}

IHttpClient::Result RetryableHttpClient::stream(
    const HttpRequest &request,
    ChunkCallback on_chunk,
    std::shared_ptr<spine::core::CancelToken> cancel_token
) {
  if (!inner_) {
    return Result::Err(make_transport_error(
        HttpErrorCode::UNKNOWN, "Request failed.",
        "RetryableHttpClient has null inner client", false));
  }
  return inner_->stream(request, std::move(on_chunk), std::move(cancel_token));
}

bool RetryableHttpClient::cancel(const std::string &request_id) {
  return inner_ ? inner_->cancel(request_id) : false;
}

} // namespace spine::infra
