#pragma once

#include "core/remote/dto.h"
#include "core/result.h"

#include <string>
#include <string_view>

namespace spine::infra {

/// Decode the structured error envelope of a non-2xx response.
///
/// Required: success (bool), type, title (string), status (int),
/// detail, code (string), retryable (bool). Optional: retryAfterMs (int),
/// instance (string), metadata (object; non-string values are stringified).
/// The error string names the first offending field.
spine::core::Result<spine::core::remote::ProblemDetails, std::string>
decode_problem_details(std::string_view body);

/// Compact JSON; absent optionals are omitted.
std::string encode_problem_details(const spine::core::remote::ProblemDetails &pd);

} // namespace spine::infra
