#include "infra/sse_parser.h"

#include <charconv>

namespace spine::infra {

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
} // namespace

std::vector<SseRecord> SseParser::feed(std::string_view chunk) {
  std::vector<SseRecord> out;
  for (char c : chunk) {
    if (skip_lf_) {
      skip_lf_ = false;
      if (c == '\n') {
        continue;
      }
    }
    if (c == '\r') {
      skip_lf_ = true;
      finish_line(out);
      continue;
    }
    if (c == '\n') {
      finish_line(out);
      continue;
    }
    line_.push_back(c);
  }
  return out;
}

void SseParser::reset() {
  line_.clear();
  skip_lf_ = false;
  at_stream_start_ = true;
  id_.reset();
  event_.reset();
  data_.clear();
  data_seen_ = false;
  retry_.reset();
}

bool SseParser::has_partial() const {
  return !line_.empty() || id_.has_value() || event_.has_value() ||
         data_seen_ || retry_.has_value();
}

void SseParser::finish_line(std::vector<SseRecord> &out) {
  std::string_view line(line_);
  if (at_stream_start_) {
    at_stream_start_ = false;
    if (line.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
      line.remove_prefix(kUtf8Bom.size());
    }
  }

  if (line.empty()) {
    dispatch(out);
  } else if (line.front() != ':') {
    const auto colon = line.find(':');
    std::string_view field = line.substr(0, colon);
    std::string_view value;
    if (colon != std::string_view::npos) {
      value = line.substr(colon + 1);
      if (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
    }
    process_field(field, value);
  }
  line_.clear();
}

void SseParser::process_field(std::string_view field, std::string_view value) {
  if (field == "event") {
    event_ = std::string(value);
  } else if (field == "data") {
    if (data_seen_) {
      data_.push_back('\n');
    }
    data_.append(value);
    data_seen_ = true;
  } else if (field == "id") {
    // Ids containing NUL are ignored.
    if (value.find('\0') == std::string_view::npos) {
      id_ = std::string(value);
    }
  } else if (field == "retry") {
    std::uint64_t parsed = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (!value.empty() && ec == std::errc() &&
        ptr == value.data() + value.size()) {
      retry_ = parsed;
    }
  }
  // Unknown fields are ignored.
}

void SseParser::dispatch(std::vector<SseRecord> &out) {
  if (!id_ && !event_ && !data_seen_ && !retry_) {
    return;
  }
  SseRecord record;
  record.id = std::move(id_);
  record.event = std::move(event_);
  record.data = std::move(data_);
  record.has_data = data_seen_;
  record.retry_ms = retry_;
  out.push_back(std::move(record));

  id_.reset();
  event_.reset();
  data_.clear();
  data_seen_ = false;
  retry_.reset();
}

} // namespace spine::infra
