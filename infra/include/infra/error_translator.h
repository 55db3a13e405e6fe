#pragma once

#include "core/client_error.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace spine::infra {

/// Longest server-requested delay honoured; larger values are clamped.
inline constexpr std::chrono::milliseconds kMaxRetryAfter{300000};

/// Parse a Retry-After header holding integral seconds, clamped to
/// kMaxRetryAfter. HTTP-date values and anything else yield std::nullopt.
std::optional<std::chrono::milliseconds>
parse_retry_after_header(const std::string &value);

/// HTTP status + body (+ Retry-After) -> ClientError.
///
///   ProblemDetails body -> StructuredApi (retryable / retryAfterMs from the
///                          body; the header only fills a missing delay.
///                          Either delay is clamped to kMaxRetryAfter)
///   otherwise, 2xx      -> MalformedResponse
///   otherwise           -> RawHttp (retryable for 429 and 5xx)
///
/// The error carries details["http_status"].
spine::core::ClientError
translate_http_error(int status, std::string_view body,
                     const std::optional<std::string> &retry_after_header = std::nullopt);

} // namespace spine::infra
