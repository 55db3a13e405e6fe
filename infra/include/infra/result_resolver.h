#pragma once

#include "core/job_ports.h"
#include "core/logger.h"
#include "infra/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace spine::infra {

/// ResultResolver: `GET {resultsEndpoint}?format=lite`.
///
/// Pure read. Wrap the HTTP client in RetryableHttpClient for transport
/// retries. An empty endpoint falls back to `{base}/v3/jobs/results/{jobId}`.
class ResultResolver final : public spine::core::IResultResolver {
public:
  ResultResolver(std::shared_ptr<IHttpClient> http, std::string base_url,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
                 std::shared_ptr<spine::core::ILogger> logger = nullptr);

  spine::core::Result<std::vector<spine::core::remote::BookResult>,
                      spine::core::ClientError>
  resolve(const spine::core::remote::JobHandle &handle,
          const std::string &results_endpoint,
          std::shared_ptr<spine::core::CancelToken> cancel_token) override;

  /// Absolute URL that resolve() will request.
  [[nodiscard]] std::string
  results_url(const spine::core::remote::JobHandle &handle,
              const std::string &results_endpoint) const;

private:
  std::shared_ptr<IHttpClient> http_;
  std::string base_url_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<spine::core::ILogger> logger_;
};

/// Decode the `{success, data:{jobId, status, results:[...]}}` envelope.
spine::core::Result<spine::core::remote::ResultsPage, spine::core::ClientError>
decode_results_page(int status, const std::string &body);

} // namespace spine::infra
