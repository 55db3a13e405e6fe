#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <string_view>

namespace spine::infra::json {

/// Strict parse (no comments, no trailing content). std::nullopt on failure;
/// the reader's message goes to `error` when provided.
std::optional<Json::Value> parse(std::string_view text,
                                 std::string *error = nullptr);

/// Compact single-line serialization.
std::string write_compact(const Json::Value &value);

// Typed member access. Absent, null and wrongly typed members all yield
// std::nullopt; callers decide which of those is an error.
std::optional<std::string> get_string(const Json::Value &obj, const char *key);
std::optional<bool> get_bool(const Json::Value &obj, const char *key);
std::optional<int> get_int(const Json::Value &obj, const char *key);
std::optional<long long> get_int64(const Json::Value &obj, const char *key);
std::optional<double> get_double(const Json::Value &obj, const char *key);

/// True when `key` exists and is not null.
bool has(const Json::Value &obj, const char *key);

/// Scalar as text: strings verbatim, everything else as compact JSON.
std::string stringify(const Json::Value &value);

} // namespace spine::infra::json
