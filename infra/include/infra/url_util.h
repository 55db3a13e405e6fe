#pragma once

#include <string>

namespace spine::infra {

/// True for "http://..." and "https://..." URLs.
bool is_absolute_url(const std::string &url);

/// Resolve `endpoint` against `base_url`. Absolute endpoints are returned
/// unchanged; "/path" and "path" are appended to the base with one '/'.
std::string join_url(const std::string &base_url, const std::string &endpoint);

/// Append "key=value" using '?' or '&' as appropriate.
std::string append_query(const std::string &url, const std::string &param);

} // namespace spine::infra
