#pragma once

#include "core/job_ports.h"
#include "core/logger.h"
#include "infra/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace spine::infra {

/// JobCleaner: `DELETE {base}/v3/jobs/scans/{jobId}/cleanup`.
/// 2xx (200/204 in practice) means cleaned, 404 means already cleaned;
/// both are Ok.
class JobCleaner final : public spine::core::IJobCleaner {
public:
  JobCleaner(std::shared_ptr<IHttpClient> http, std::string base_url,
             std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
             std::shared_ptr<spine::core::ILogger> logger = nullptr);

  spine::core::Result<void, spine::core::ClientError>
  cleanup(const spine::core::remote::JobHandle &handle,
          std::shared_ptr<spine::core::CancelToken> cancel_token) override;

  [[nodiscard]] std::string cleanup_url(const std::string &job_id) const;

private:
  std::shared_ptr<IHttpClient> http_;
  std::string base_url_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<spine::core::ILogger> logger_;
};

} // namespace spine::infra
