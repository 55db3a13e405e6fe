#include "core/remote/dto.h"

namespace spine::core::remote {

const char *to_string(EnrichmentStatus status) {
  switch (status) {
  case EnrichmentStatus::Success:
    return "success";
  case EnrichmentStatus::Pending:
    return "pending";
  case EnrichmentStatus::Degraded:
    return "degraded";
  case EnrichmentStatus::NotFound:
    return "not_found";
  case EnrichmentStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::optional<EnrichmentStatus> parse_enrichment_status(const std::string &s) {
  if (s == "success") {
    return EnrichmentStatus::Success;
  }
  if (s == "pending") {
    return EnrichmentStatus::Pending;
  }
  if (s == "degraded") {
    return EnrichmentStatus::Degraded;
  }
  if (s == "not_found" || s == "notFound") {
    return EnrichmentStatus::NotFound;
  }
  if (s == "failed") {
    return EnrichmentStatus::Failed;
  }
  return std::nullopt;
}

bool BookResult::operator==(const BookResult &other) const {
  return title == other.title && author == other.author &&
         isbn == other.isbn && cover_url == other.cover_url &&
         publisher == other.publisher &&
         published_date == other.published_date &&
         page_count == other.page_count && format == other.format &&
         confidence == other.confidence &&
         enrichment_status == other.enrichment_status;
}

} // namespace spine::core::remote
