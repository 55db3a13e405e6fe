#pragma once

#include "core/backoff.h"
#include "core/job_ports.h"
#include "core/logger.h"
#include "infra/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace spine::infra {

/// Upload retry policy.
///   429           -> one deferred retry at the server's delay (default 2 s)
///   5xx/transport -> `max_server_retries` retries with exponential backoff
///   other 4xx     -> surfaced immediately
struct UploadPolicy {
  int max_server_retries = 3;
  int max_rate_limit_retries = 1;
  spine::core::BackoffPolicy backoff{};
  std::chrono::milliseconds rate_limit_default_delay{2000};
  std::chrono::milliseconds timeout{60000};
};

/// JobUploader: `POST {base}/v3/jobs/scans` as multipart/form-data.
///
/// Owns its retry loop so callers only see the final outcome. The HTTP client
/// must not retry on its own (uploads are not idempotent).
class JobUploader final : public spine::core::IJobUploader {
public:
  JobUploader(std::shared_ptr<IHttpClient> http, std::string base_url,
              UploadPolicy policy = {},
              std::shared_ptr<spine::core::ILogger> logger = nullptr,
              spine::core::SleepFn sleep = spine::core::default_sleep());

  spine::core::Result<spine::core::remote::JobHandle, spine::core::ClientError>
  submit(const std::string &image_bytes, const std::string &device_id,
         std::shared_ptr<spine::core::CancelToken> cancel_token) override;

  [[nodiscard]] std::string upload_url() const;

private:
  std::shared_ptr<IHttpClient> http_;
  std::string base_url_;
  UploadPolicy policy_;
  std::shared_ptr<spine::core::ILogger> logger_;
  spine::core::SleepFn sleep_;

  HttpRequest build_request(const std::string &image_bytes,
                            const std::string &device_id,
                            const std::string &trace_id) const;

  spine::core::Result<spine::core::remote::JobHandle, spine::core::ClientError>
  parse_accepted(const HttpResponse &response,
                 const std::string &device_id) const;
};

} // namespace spine::infra
