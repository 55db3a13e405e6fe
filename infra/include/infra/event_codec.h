#pragma once

#include "core/remote/dto.h"
#include "core/result.h"
#include "core/stream_event.h"

#include <json/value.h>

#include <string>
#include <string_view>

namespace spine::infra {

/// Decode one SSE record into a typed StreamEvent (id is left unset).
///
/// Labels: progress, result, complete/completed, error, canceled, ping,
/// enrichment_degraded. Any other label decodes to IgnoredUnknownEvent.
/// DecodeFailure only for a known label whose required fields are missing or
/// malformed.
spine::core::Result<spine::core::StreamEvent, spine::core::DecodeFailure>
decode_stream_event(const std::string &label, std::string_view data);

/// Best-effort ErrorEvent for an `error` record that failed to decode. The
/// server has ended the job either way; the message falls back to
/// "Unknown error" and whatever optional fields parse are kept.
spine::core::ErrorEvent recover_error_event(std::string_view data);

/// BookResult from its wire object. Requires string `title` and `author`;
/// optional fields of the wrong type are treated as absent and confidence is
/// clamped to [0, 1].
spine::core::Result<spine::core::remote::BookResult, std::string>
decode_book_result(const Json::Value &obj);

} // namespace spine::infra
