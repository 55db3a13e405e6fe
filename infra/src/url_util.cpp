#include "infra/url_util.h"

namespace spine::infra {

bool is_absolute_url(const std::string &url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::string join_url(const std::string &base_url, const std::string &endpoint) {
  if (is_absolute_url(endpoint)) {
    return endpoint;
  }
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (endpoint.empty()) {
    return base;
  }
  if (endpoint.front() == '/') {
    return base + endpoint;
  }
  return base + "/" + endpoint;
}

std::string append_query(const std::string &url, const std::string &param) {
  const auto fragment = url.find('#');
  std::string head = url.substr(0, fragment);
  const std::string tail =
      fragment == std::string::npos ? std::string() : url.substr(fragment);
  head += head.find('?') == std::string::npos ? '?' : '&';
  head += param;
  return head + tail;
}

} // namespace spine::infra
