#include "infra/job_cleaner.h"

#include "core/ids.h"
#include "infra/error_translator.h"
#include "infra/url_util.h"

namespace spine::infra {

using spine::core::ClientError;
using CleanupResult = spine::core::Result<void, ClientError>;

JobCleaner::JobCleaner(std::shared_ptr<IHttpClient> http, std::string base_url,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<spine::core::ILogger> logger)
    : http_(std::move(http)), base_url_(std::move(base_url)), timeout_(timeout),
      logger_(std::move(logger)) {}

std::string JobCleaner::cleanup_url(const std::string &job_id) const {
  return join_url(base_url_, "/v3/jobs/scans/" + job_id + "/cleanup");
}

CleanupResult JobCleaner::cleanup(
    const spine::core::remote::JobHandle &handle,
    std::shared_ptr<spine::core::CancelToken> cancel_token) {
  if (!http_) {
    return CleanupResult::Err(
        ClientError::Internal("JobCleaner has null HTTP client"));
  }
  if (handle.job_id.empty()) {
    return CleanupResult::Err(ClientError::Internal("job_id is empty"));
  }

  HttpRequest request;
  request.method = HttpMethod::DELETE;
  request.url = cleanup_url(handle.job_id);
  if (!handle.auth_token.empty()) {
    request.headers["Authorization"] = "Bearer " + handle.auth_token;
  }
  if (!handle.device_id.empty()) {
    request.headers["X-Device-ID"] = handle.device_id;
  }
  request.trace_id = handle.job_id;
  request.request_id = spine::core::generate_id("cleanup");
  request.timeout = timeout_;

  auto result = http_->execute(request, std::move(cancel_token));
  if (result.is_err()) {
    return CleanupResult::Err(std::move(result).error());
  }

  const int status = result.value().status_code;
  if (status >= 200 && status < 300) {
    return CleanupResult::Ok();
  }
  if (status == 404) {
    if (logger_) {
      logger_->debug(handle.job_id, "cleaner", "already_cleaned",
                     "cleanup returned 404");
    }
    return CleanupResult::Ok();
  }
  return CleanupResult::Err(translate_http_error(
      status, result.value().body, result.value().header("Retry-After")));
}

} // namespace spine::infra
