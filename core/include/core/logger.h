#pragma once

#include <string>

namespace spine::core {

/// Logger interface used by the coordinator and every client component.
/// Concrete implementations live in infra; a null logger is always allowed.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace spine::core
