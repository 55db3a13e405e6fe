#include "infra/error_translator.h"

#include "infra/problem_details_codec.h"

#include <algorithm>
#include <charconv>

namespace spine::infra {

using spine::core::ClientError;
using spine::core::ErrorKind;

namespace {

constexpr size_t kBodyExcerpt = 200;

std::string excerpt(std::string_view body) {
  if (body.size() <= kBodyExcerpt) {
    return std::string(body);
  }
  return std::string(body.substr(0, kBodyExcerpt)) + "...";
}

std::string raw_user_message(int status) {
  if (status == 429) {
    return "Too many requests. Please slow down.";
  }
  if (status >= 500) {
    return "Server error occurred. Please try again later.";
  }
  return "Request rejected by the server.";
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_retry_after_header(const std::string &value) {
  const auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return std::nullopt;
  }
  const auto end = value.find_last_not_of(" \t");
  const char *first = value.data() + begin;
  const char *last = value.data() + end + 1;

  long long seconds = 0;
  auto [ptr, ec] = std::from_chars(first, last, seconds);
  if (ptr != last) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range && *first != '-') {
    return kMaxRetryAfter;
  }
  if (ec != std::errc() || seconds < 0) {
    return std::nullopt;
  }
  if (seconds > kMaxRetryAfter.count() / 1000) {
    return kMaxRetryAfter;
  }
  return std::chrono::milliseconds(seconds * 1000);
}

ClientError translate_http_error(int status, std::string_view body,
                                 const std::optional<std::string> &retry_after_header) {
  std::optional<std::chrono::milliseconds> header_delay;
  if (retry_after_header) {
    header_delay = parse_retry_after_header(*retry_after_header);
  }

  auto decoded = decode_problem_details(body);
  if (decoded.is_ok()) {
    auto pd = std::move(decoded).value();
    ClientError error(ErrorKind::StructuredApi, pd.code, pd.retryable,
                      pd.detail.empty() ? pd.title : pd.detail,
                      "HTTP " + std::to_string(status) + " " + pd.code + ": " +
                          pd.title,
                      status);
    if (pd.retry_after_ms) {
      error.retry_after = std::min(std::chrono::milliseconds(*pd.retry_after_ms),
                                   kMaxRetryAfter);
    } else if (header_delay) {
      error.retry_after = header_delay;
    }
    if (pd.instance) {
      error.details["instance"] = *pd.instance;
    }
    error.details["http_status"] = std::to_string(status);
    error.problem = std::move(pd);
    return error;
  }

  if (status >= 200 && status < 300) {
    auto error = ClientError::Malformed("HTTP " + std::to_string(status) +
                                            " body not understood: " +
                                            decoded.error(),
                                        status);
    error.details["http_status"] = std::to_string(status);
    return error;
  }

  const bool retryable = status == 429 || status >= 500;
  ClientError error(ErrorKind::RawHttp, "HTTP_" + std::to_string(status),
                    retryable, raw_user_message(status),
                    "HTTP " + std::to_string(status) + " response: " +
                        excerpt(body),
                    status);
  if (retryable) {
    error.retry_after = header_delay;
  }
  error.details["http_status"] = std::to_string(status);
  return error;
}

} // namespace spine::infra
