#include "core/client_error.h"

namespace spine::core {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Transport:
    return "Transport";
  case ErrorKind::StructuredApi:
    return "StructuredApi";
  case ErrorKind::MalformedResponse:
    return "MalformedResponse";
  case ErrorKind::RawHttp:
    return "RawHttp";
  case ErrorKind::StreamTerminal:
    return "StreamTerminal";
  case ErrorKind::Canceled:
    return "Canceled";
  case ErrorKind::Internal:
    return "Internal";
  }
  return "Unknown";
}

std::string describe(const ClientError &error) {
  std::string out = to_string(error.kind);
  if (!error.code.empty()) {
    out += " " + error.code;
  }
  if (error.http_status != 0) {
    out += " http=" + std::to_string(error.http_status);
  }
  out += ": " + (error.internal_message.empty() ? error.user_message
                                                 : error.internal_message);
  return out;
}

} // namespace spine::core
