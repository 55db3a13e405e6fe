#include "infra/config.h"

#include <charconv>
#include <cstdlib>
#include <optional>

namespace spine::infra {

namespace {

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value && value[0] != '\0') {
    return value;
  }
  return nullptr;
}

/// Integer in [min_value, max_value]; anything else is reported and ignored.
std::optional<long long> read_int(const char *name, long long min_value,
                                  long long max_value,
                                  std::vector<std::string> &warnings) {
  const char *raw = non_empty_env(name);
  if (!raw) {
    return std::nullopt;
  }
  const std::string value(raw);
  long long parsed = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    warnings.push_back(std::string(name) + "='" + value +
                       "' is not an integer; using default");
    return std::nullopt;
  }
  if (parsed < min_value || parsed > max_value) {
    warnings.push_back(std::string(name) + "=" + value + " out of range [" +
                       std::to_string(min_value) + ", " +
                       std::to_string(max_value) + "]; using default");
    return std::nullopt;
  }
  return parsed;
}

} // namespace

ScanClientConfig ScanClientConfig::from_environment() {
  ScanClientConfig config;

  if (const char *api_base = non_empty_env("SPINE_API_BASE_URL")) {
    config.api_base_url = api_base;
    while (!config.api_base_url.empty() && config.api_base_url.back() == '/') {
      config.api_base_url.pop_back();
    }
  }
  if (const char *device_id = non_empty_env("SPINE_DEVICE_ID")) {
    config.device_id = device_id;
  }
  if (const char *level = non_empty_env("SPINE_LOG_LEVEL")) {
    config.log_level = level;
  }

  auto &warnings = config.warnings;
  if (auto v = read_int("SPINE_MAX_SERVER_RETRIES", 0, 10, warnings)) {
    config.max_server_retries = static_cast<int>(*v);
  }
  if (auto v = read_int("SPINE_STREAM_IDLE_TIMEOUT_MS", 1000, 3600000, warnings)) {
    config.stream_idle_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = read_int("SPINE_MAX_RECONNECTS", 0, 100, warnings)) {
    config.max_reconnect_attempts = static_cast<int>(*v);
  }
  if (auto v = read_int("SPINE_MAX_CONCURRENT_STREAMS", 1, 64, warnings)) {
    config.max_concurrent_streams = static_cast<int>(*v);
  }
  if (auto v = read_int("SPINE_REQUEST_TIMEOUT_MS", 100, 600000, warnings)) {
    config.request_timeout = std::chrono::milliseconds(*v);
  }
  if (const char *pings = non_empty_env("SPINE_FORWARD_PINGS")) {
    const std::string value(pings);
    config.forward_pings = value == "1" || value == "true" || value == "yes";
  }

  return config;
}

} // namespace spine::infra
