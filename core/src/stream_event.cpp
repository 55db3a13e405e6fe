#include "core/stream_event.h"

namespace spine::core {

namespace {

struct KindNameVisitor {
  const char *operator()(const ProgressEvent &) const { return "progress"; }
  const char *operator()(const ResultItemEvent &) const { return "resultItem"; }
  const char *operator()(const CompletedEvent &) const { return "completed"; }
  const char *operator()(const ErrorEvent &) const { return "error"; }
  const char *operator()(const CanceledEvent &) const { return "canceled"; }
  const char *operator()(const PingEvent &) const { return "ping"; }
  const char *operator()(const EnrichmentDegradedEvent &) const {
    return "enrichmentDegraded";
  }
  const char *operator()(const IgnoredUnknownEvent &) const {
    return "ignoredUnknown";
  }
};

} // namespace

bool is_terminal(const StreamEvent &event) {
  return event.is<CompletedEvent>() || event.is<ErrorEvent>() ||
         event.is<CanceledEvent>();
}

const char *kind_name(const StreamEvent &event) {
  return std::visit(KindNameVisitor{}, event.payload);
}

} // namespace spine::core
