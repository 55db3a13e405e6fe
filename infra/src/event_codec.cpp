#include "infra/event_codec.h"

#include "infra/json_util.h"

#include <algorithm>
#include <optional>

namespace spine::infra {

using spine::core::DecodeFailure;
using spine::core::StreamEvent;
using spine::core::remote::BookResult;
using EventResult = spine::core::Result<StreamEvent, DecodeFailure>;
using BookDecodeResult = spine::core::Result<BookResult, std::string>;

namespace {

EventResult failure(const std::string &label, std::string reason) {
  return EventResult::Err(DecodeFailure{label, std::move(reason)});
}

EventResult event(spine::core::StreamEventPayload payload) {
  return EventResult::Ok(StreamEvent{std::move(payload), std::nullopt});
}

/// Parsed JSON object, or std::nullopt for empty / non-JSON / non-object data.
std::optional<Json::Value> parse_object(std::string_view data) {
  auto root = json::parse(data);
  if (!root || !root->isObject()) {
    return std::nullopt;
  }
  return root;
}

EventResult decode_progress(const std::string &label, std::string_view data) {
  auto obj = parse_object(data);
  if (!obj) {
    return failure(label, "data is not a JSON object");
  }
  auto message = json::get_string(*obj, "message");
  if (!message) {
    return failure(label, "missing string field 'message'");
  }
  return event(spine::core::ProgressEvent{std::move(*message)});
}

EventResult decode_result(const std::string &label, std::string_view data) {
  auto obj = parse_object(data);
  if (!obj) {
    return failure(label, "data is not a JSON object");
  }
  auto book = decode_book_result(*obj);
  if (book.is_err()) {
    return failure(label, book.error());
  }
  return event(spine::core::ResultItemEvent{std::move(book).value()});
}

// Legacy servers send `complete` with no body or a non-JSON body.
EventResult decode_completed(std::string_view data) {
  spine::core::CompletedEvent completed;
  auto obj = parse_object(data);
  if (!obj) {
    return event(std::move(completed));
  }

  completed.results_endpoint = json::get_string(*obj, "resultsUrl");

  const Json::Value &books = (*obj)["books"];
  if (books.isArray()) {
    std::vector<BookResult> items;
    items.reserve(books.size());
    bool all_valid = true;
    for (const auto &entry : books) {
      auto book = decode_book_result(entry);
      if (book.is_err()) {
        all_valid = false;
        break;
      }
      items.push_back(std::move(book).value());
    }
    // A partially valid list is dropped so the resolver fetches the full set.
    if (all_valid) {
      completed.inline_items = std::move(items);
    }
  }
  return event(std::move(completed));
}

EventResult decode_error(const std::string &label, std::string_view data) {
  auto obj = parse_object(data);
  if (!obj) {
    return failure(label, "data is not a JSON object");
  }
  auto message = json::get_string(*obj, "message");
  if (!message) {
    return failure(label, "missing string field 'message'");
  }
  spine::core::ErrorEvent error;
  error.message = std::move(*message);
  error.code = json::get_string(*obj, "code");
  error.retryable = json::get_bool(*obj, "retryable");
  error.job_id = json::get_string(*obj, "jobId");
  return event(std::move(error));
}

EventResult decode_enrichment_degraded(std::string_view data) {
  spine::core::EnrichmentDegradedEvent degraded;
  auto obj = parse_object(data);
  if (obj) {
    degraded.job_id = json::get_string(*obj, "jobId");
    degraded.isbn = json::get_string(*obj, "isbn");
    degraded.title = json::get_string(*obj, "title");
    degraded.reason = json::get_string(*obj, "reason");
    degraded.fallback_source = json::get_string(*obj, "fallbackSource");
    degraded.timestamp = json::get_string(*obj, "timestamp");
  }
  return event(std::move(degraded));
}

} // namespace

BookDecodeResult decode_book_result(const Json::Value &obj) {
  if (!obj.isObject()) {
    return BookDecodeResult::Err("book is not a JSON object");
  }
  auto title = json::get_string(obj, "title");
  if (!title) {
    return BookDecodeResult::Err("missing string field 'title'");
  }
  auto author = json::get_string(obj, "author");
  if (!author) {
    return BookDecodeResult::Err("missing string field 'author'");
  }

  BookResult book;
  book.title = std::move(*title);
  book.author = std::move(*author);
  book.isbn = json::get_string(obj, "isbn");
  book.cover_url = json::get_string(obj, "coverUrl");
  book.publisher = json::get_string(obj, "publisher");
  book.published_date = json::get_string(obj, "publishedDate");
  book.page_count = json::get_int(obj, "pageCount");
  book.format = json::get_string(obj, "format");
  if (auto confidence = json::get_double(obj, "confidence")) {
    book.confidence = std::clamp(*confidence, 0.0, 1.0);
  }
  if (auto status = json::get_string(obj, "enrichmentStatus")) {
    book.enrichment_status =
        spine::core::remote::parse_enrichment_status(*status);
  }
  return BookDecodeResult::Ok(std::move(book));
}

spine::core::ErrorEvent recover_error_event(std::string_view data) {
  spine::core::ErrorEvent error;
  error.message = "Unknown error";
  auto obj = parse_object(data);
  if (!obj) {
    error.retryable = false;
    return error;
  }
  if (auto message = json::get_string(*obj, "message")) {
    error.message = std::move(*message);
  }
  error.code = json::get_string(*obj, "code");
  error.retryable = json::get_bool(*obj, "retryable");
  error.job_id = json::get_string(*obj, "jobId");
  return error;
}

EventResult decode_stream_event(const std::string &label, std::string_view data) {
  if (label == "progress") {
    return decode_progress(label, data);
  }
  if (label == "result") {
    return decode_result(label, data);
  }
  if (label == "complete" || label == "completed") {
    return decode_completed(data);
  }
  if (label == "error") {
    return decode_error(label, data);
  }
  if (label == "canceled") {
    return event(spine::core::CanceledEvent{});
  }
  if (label == "ping") {
    return event(spine::core::PingEvent{});
  }
  if (label == "enrichment_degraded") {
    return decode_enrichment_degraded(data);
  }
  return event(spine::core::IgnoredUnknownEvent{label});
}

} // namespace spine::infra
