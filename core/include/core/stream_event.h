#pragma once

#include "core/remote/dto.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace spine::core {

// ---- Event payloads ----

struct ProgressEvent {
  std::string message;
};

struct ResultItemEvent {
  remote::BookResult book;
};

/// Terminal success. Either field may be absent (legacy servers send neither).
struct CompletedEvent {
  std::optional<std::string> results_endpoint;
  std::optional<std::vector<remote::BookResult>> inline_items;

  [[nodiscard]] bool has_inline_items() const {
    return inline_items.has_value() && !inline_items->empty();
  }
};

/// Terminal failure reported by the job itself.
struct ErrorEvent {
  std::string message;
  std::optional<std::string> code;
  std::optional<bool> retryable;
  std::optional<std::string> job_id;
};

struct CanceledEvent {};

struct PingEvent {};

/// Informational: enrichment fell back to a secondary source.
struct EnrichmentDegradedEvent {
  std::optional<std::string> job_id;
  std::optional<std::string> isbn;
  std::optional<std::string> title;
  std::optional<std::string> reason;
  std::optional<std::string> fallback_source;
  std::optional<std::string> timestamp;
};

/// A label this client does not know. Never an error.
struct IgnoredUnknownEvent {
  std::string label;
};

using StreamEventPayload =
    std::variant<ProgressEvent, ResultItemEvent, CompletedEvent, ErrorEvent,
                 CanceledEvent, PingEvent, EnrichmentDegradedEvent,
                 IgnoredUnknownEvent>;

/// One decoded SSE record plus the id it arrived with.
struct StreamEvent {
  StreamEventPayload payload;
  std::optional<std::string> id;

  template <typename T> [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(payload);
  }
  template <typename T> [[nodiscard]] const T *get_if() const {
    return std::get_if<T>(&payload);
  }
};

/// completed / error / canceled end the job's stream.
bool is_terminal(const StreamEvent &event);

/// Variant name for logging ("progress", "resultItem", ...).
const char *kind_name(const StreamEvent &event);

/// Failure to decode a known label's required fields.
struct DecodeFailure {
  std::string label;
  std::string reason;
};

} // namespace spine::core
