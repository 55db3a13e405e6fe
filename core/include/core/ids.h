#pragma once

#include <string>

namespace spine::core {

/// Random v4-style UUID string. Thread-safe (thread_local generator).
std::string generate_uuid();

/// "<prefix>-<uuid>", used for job keys, request ids and multipart
/// boundaries.
std::string generate_id(const std::string &prefix);

} // namespace spine::core
