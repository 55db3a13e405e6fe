#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

namespace spine::infra {

namespace {

constexpr const char *kLoggerName = "spine";

/// Lookup and registration happen under one lock; spdlog rejects a second
/// registration of the same name.
std::shared_ptr<spdlog::logger> shared_backend() {
  static std::mutex mutex;
  std::lock_guard<std::mutex> lock(mutex);
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
  }
  return logger;
}

/// ConsoleLogger: spdlog-based structured logger.
/// All instances share the "spine" logger; the newest level applies.
class ConsoleLogger : public spine::core::ILogger {
public:
  explicit ConsoleLogger(const std::string &level) : logger_(shared_backend()) {
    logger_->set_level(parse_level(level));
  }

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;

  static spdlog::level::level_enum parse_level(const std::string &level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"; only honour an explicit "off".
    if (parsed == spdlog::level::off && level != "off") {
      return spdlog::level::info;
    }
    return parsed;
  }
};

} // namespace

/// Factory function
std::unique_ptr<spine::core::ILogger>
create_console_logger(const std::string &level) {
  return std::make_unique<ConsoleLogger>(level);
}

} // namespace spine::infra
