#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace spine::core::remote {

/// Server-side enrichment outcome attached to a recognized book.
enum class EnrichmentStatus {
  Success,
  Pending,
  Degraded,
  NotFound,
  Failed
};

const char *to_string(EnrichmentStatus status);

/// Parses the wire spelling ("success", "not_found", ...). Unknown values
/// yield std::nullopt so newer server states never break decoding.
std::optional<EnrichmentStatus> parse_enrichment_status(const std::string &s);

/// One recognized book. Built once from wire data, then treated as a value.
struct BookResult {
  std::string title;
  std::string author;
  std::optional<std::string> isbn;
  std::optional<std::string> cover_url;
  std::optional<std::string> publisher;
  std::optional<std::string> published_date;
  std::optional<int> page_count;
  std::optional<std::string> format;
  std::optional<double> confidence; // [0, 1]
  std::optional<EnrichmentStatus> enrichment_status;

  bool operator==(const BookResult &other) const;
  bool operator!=(const BookResult &other) const { return !(*this == other); }
};

/// RFC 9457 style error envelope returned on every non-2xx response.
struct ProblemDetails {
  bool success = false;
  std::string type;
  std::string title;
  int status = 0;
  std::string detail;
  std::string code;
  bool retryable = false;
  std::optional<long long> retry_after_ms;
  std::optional<std::string> instance;
  std::optional<std::map<std::string, std::string>> metadata;
};

/// Everything needed to follow one accepted scan job.
/// Created by the uploader, owned by exactly one coordinator.
struct JobHandle {
  using Clock = std::chrono::system_clock;

  std::string job_id;
  std::string stream_endpoint; // absolute URL
  std::string auth_token;
  std::optional<std::string> status_endpoint;
  std::string device_id;
  Clock::time_point created_at = Clock::now();

  /// True once the auth token's validity window has elapsed.
  [[nodiscard]] bool is_expired(Clock::time_point now,
                                std::chrono::seconds ttl) const {
    return now - created_at >= ttl;
  }
};

/// Payload of `GET resultsEndpoint?format=lite`.
struct ResultsPage {
  std::string job_id;
  std::string status;
  std::vector<BookResult> results;
};

} // namespace spine::core::remote
