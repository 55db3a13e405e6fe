#include "infra/scan_client.h"

#include "infra/curl_http_client.h"
#include "infra/job_cleaner.h"
#include "infra/result_resolver.h"

namespace spine::infra {

ScanClient::ScanClient(ScanClientConfig config,
                       std::shared_ptr<spine::core::ILogger> logger,
                       HttpFactory http_factory, spine::core::SleepFn sleep)
    : config_(std::move(config)), logger_(std::move(logger)),
      http_factory_(std::move(http_factory)),
      sleep_(sleep ? std::move(sleep) : spine::core::default_sleep()) {
  if (!http_factory_) {
    http_factory_ = [] { return std::make_shared<CurlHttpClient>(); };
  }
}

UploadPolicy ScanClient::upload_policy() const {
  UploadPolicy policy;
  policy.max_server_retries = config_.max_server_retries;
  policy.backoff.initial = config_.upload_initial_backoff;
  policy.rate_limit_default_delay = config_.rate_limit_default_delay;
  policy.timeout = config_.upload_timeout;
  return policy;
}

StreamPolicy ScanClient::stream_policy() const {
  StreamPolicy policy;
  policy.idle_timeout = config_.stream_idle_timeout;
  policy.max_reconnect_attempts = config_.max_reconnect_attempts;
  policy.backoff.initial = config_.reconnect_initial_backoff;
  policy.backoff.max = config_.reconnect_max_backoff;
  policy.backoff.jitter = config_.reconnect_jitter;
  policy.max_session_duration = config_.max_session_duration;
  policy.token_ttl = config_.token_ttl;
  policy.forward_pings = config_.forward_pings;
  return policy;
}

RetryPolicy ScanClient::transport_retry_policy() const {
  RetryPolicy policy;
  policy.max_retries = config_.max_transport_retries;
  return policy;
}

spine::core::JobPorts ScanClient::make_ports() const {
  std::shared_ptr<IHttpClient> http = http_factory_();
  auto retrying =
      std::make_shared<RetryableHttpClient>(http, transport_retry_policy(), logger_);

  spine::core::JobPorts ports;
  ports.uploader = std::make_shared<JobUploader>(http, config_.api_base_url,
                                                 upload_policy(), logger_, sleep_);
  ports.event_stream =
      std::make_unique<EventStreamClient>(http, stream_policy(), logger_, sleep_);
  ports.resolver = std::make_shared<ResultResolver>(
      retrying, config_.api_base_url, config_.request_timeout, logger_);
  ports.cleaner = std::make_shared<JobCleaner>(
      retrying, config_.api_base_url, config_.request_timeout, logger_);
  return ports;
}

std::unique_ptr<spine::core::JobLifecycleCoordinator>
ScanClient::make_coordinator(const std::string &job_key) const {
  return std::make_unique<spine::core::JobLifecycleCoordinator>(make_ports(),
                                                                logger_, job_key);
}

spine::core::JobOutcome
ScanClient::scan(const std::string &image_bytes, const std::string &device_id,
                 spine::core::JobLifecycleCoordinator::EventCallback on_event,
                 std::shared_ptr<spine::core::CancelToken> cancel_token) const {
  auto coordinator = make_coordinator();
  return coordinator->run(image_bytes, device_id, std::move(on_event),
                          std::move(cancel_token));
}

std::unique_ptr<spine::core::JobRunner> ScanClient::make_runner() const {
  spine::core::JobRunnerConfig runner_config;
  runner_config.max_concurrent_jobs = config_.max_concurrent_streams;
  return std::make_unique<spine::core::JobRunner>(
      [this](const std::string &job_key) { return make_coordinator(job_key); },
      runner_config, logger_);
}

} // namespace spine::infra
