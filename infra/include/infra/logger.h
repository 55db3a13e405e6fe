#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace spine::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// `level` uses spdlog names ("trace", "debug", "info", "warn", "err", ...);
/// unknown names fall back to "info".
std::unique_ptr<spine::core::ILogger>
create_console_logger(const std::string &level = "info");

} // namespace spine::infra
