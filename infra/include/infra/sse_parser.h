#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spine::infra {

/// One framed `text/event-stream` record.
///
///   id: <event-id>        (optional, used for Last-Event-ID)
///   event: <label>        (optional, defaults to "message")
///   data: <payload>       (repeatable, joined with '\n')
///   retry: <ms>           (optional reconnection hint)
///   <blank line>          (ends the record)
struct SseRecord {
  std::optional<std::string> id;
  std::optional<std::string> event;
  std::string data;
  bool has_data = false;
  std::optional<std::uint64_t> retry_ms;

  [[nodiscard]] std::string label() const { return event.value_or("message"); }

  /// False for records that only carry id/retry bookkeeping.
  [[nodiscard]] bool has_payload() const { return event.has_value() || has_data; }
};

/// Incremental SSE framing parser.
///
/// Bytes may arrive in arbitrary chunks; partial lines are buffered until the
/// next feed(). Accepts "\n", "\r\n" and "\r" line endings (also when a
/// "\r\n" pair is split across chunks) and skips ':' comment lines.
///
/// Usage:
///   SseParser parser;
///   for (auto &chunk : incoming) {
///     for (auto &record : parser.feed(chunk)) {
///       handle(record);
///     }
///   }
class SseParser {
public:
  [[nodiscard]] std::vector<SseRecord> feed(std::string_view chunk);

  /// Drop buffered partial state (call before reading a new connection).
  void reset();

  /// True while an unterminated line or record is buffered.
  [[nodiscard]] bool has_partial() const;

private:
  std::string line_;
  bool skip_lf_ = false;
  bool at_stream_start_ = true;

  std::optional<std::string> id_;
  std::optional<std::string> event_;
  std::string data_;
  bool data_seen_ = false;
  std::optional<std::uint64_t> retry_;

  void finish_line(std::vector<SseRecord> &out);
  void process_field(std::string_view field, std::string_view value);
  void dispatch(std::vector<SseRecord> &out);
};

} // namespace spine::infra
