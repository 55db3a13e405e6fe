#pragma once

#include "core/remote/dto.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace spine::core {

/// Error kinds. Lets callers branch on the failure class without string
/// parsing.
enum class ErrorKind {
  Transport,         // connectivity, timeout, reconnect budget exhausted
  StructuredApi,     // parsed ProblemDetails body
  MalformedResponse, // schema violation in an otherwise successful exchange
  RawHttp,           // non-2xx with a body that is not ProblemDetails
  StreamTerminal,    // `error` event delivered by the job's own stream
  Canceled,          // caller canceled the job's task
  Internal           // invariant violation inside the client
};

/// Structured error for every client operation.
struct ClientError {
  ErrorKind kind = ErrorKind::Internal;
  int http_status = 0;  // 0 when no HTTP response was received
  std::string code;     // machine-readable, e.g. "RATE_LIMIT_EXCEEDED"
  bool retryable = false;
  std::optional<std::chrono::milliseconds> retry_after;
  std::string user_message;     // safe to show in UI
  std::string internal_message; // technical details for logging
  std::optional<remote::ProblemDetails> problem;
  std::map<std::string, std::string> details; // e.g. "retry_count": "3"

  ClientError() = default;

  ClientError(ErrorKind k, std::string c, bool retry, std::string user_msg,
              std::string internal_msg, int status = 0)
      : kind(k), http_status(status), code(std::move(c)), retryable(retry),
        user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)) {}

  static ClientError Canceled(std::string msg = "Operation canceled") {
    return {ErrorKind::Canceled, "CANCELED", false, "Scan canceled.",
            std::move(msg)};
  }
  static ClientError Internal(std::string msg) {
    return {ErrorKind::Internal, "INTERNAL", false, "Unexpected client error.",
            std::move(msg)};
  }
  static ClientError Malformed(std::string msg, int status = 0) {
    return {ErrorKind::MalformedResponse, "MALFORMED_RESPONSE", false,
            "Invalid server response.", std::move(msg), status};
  }
};

/// Convert ErrorKind to string for logging.
const char *to_string(ErrorKind kind);

/// One-line summary "<kind> <code> http=<status>: <internal_message>".
std::string describe(const ClientError &error);

} // namespace spine::core
