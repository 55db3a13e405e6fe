#pragma once

#include "core/job_coordinator.h"
#include "core/job_runner.h"
#include "core/logger.h"
#include "infra/config.h"
#include "infra/event_stream_client.h"
#include "infra/http_client.h"
#include "infra/job_uploader.h"

#include <functional>
#include <memory>
#include <string>

namespace spine::infra {

/// ScanClient: wires transport, codecs and coordinators from a config.
///
/// Every job gets its own HTTP client (and so its own curl handle), uploader,
/// event stream, resolver and cleaner. Nothing mutable is shared between jobs
/// except the logger.
class ScanClient {
public:
  using HttpFactory = std::function<std::shared_ptr<IHttpClient>()>;

  /// `http_factory` defaults to a fresh CurlHttpClient per job.
  ScanClient(ScanClientConfig config, std::shared_ptr<spine::core::ILogger> logger,
             HttpFactory http_factory = nullptr,
             spine::core::SleepFn sleep = spine::core::default_sleep());

  [[nodiscard]] spine::core::JobPorts make_ports() const;

  [[nodiscard]] std::unique_ptr<spine::core::JobLifecycleCoordinator>
  make_coordinator(const std::string &job_key = {}) const;

  /// Run one job on the calling thread.
  spine::core::JobOutcome
  scan(const std::string &image_bytes, const std::string &device_id,
       spine::core::JobLifecycleCoordinator::EventCallback on_event,
       std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr) const;

  /// Runner bounded by `max_concurrent_streams`. Must not outlive this client.
  [[nodiscard]] std::unique_ptr<spine::core::JobRunner> make_runner() const;

  [[nodiscard]] const ScanClientConfig &config() const { return config_; }

  [[nodiscard]] UploadPolicy upload_policy() const;
  [[nodiscard]] StreamPolicy stream_policy() const;
  [[nodiscard]] RetryPolicy transport_retry_policy() const;

private:
  ScanClientConfig config_;
  std::shared_ptr<spine::core::ILogger> logger_;
  HttpFactory http_factory_;
  spine::core::SleepFn sleep_;
};

} // namespace spine::infra
