#pragma once

#include "core/cancel_token.h"
#include "core/client_error.h"
#include "core/remote/dto.h"
#include "core/result.h"
#include "core/stream_event.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spine::core {

/// Uploads one image and returns the accepted job's handle.
/// Implementations own the retry policy; callers only see the final outcome.
class IJobUploader {
public:
  virtual ~IJobUploader() = default;

  virtual Result<remote::JobHandle, ClientError>
  submit(const std::string &image_bytes, const std::string &device_id,
         std::shared_ptr<CancelToken> cancel_token) = 0;
};

/// Follows a job's event stream until a terminal event.
class IJobEventStream {
public:
  virtual ~IJobEventStream() = default;

  using EventCallback = std::function<void(const StreamEvent &)>;

  /// Blocks, delivering events in arrival order. Returns Ok right after the
  /// terminal event was delivered, Err when the stream cannot be recovered.
  virtual Result<void, ClientError>
  subscribe(const remote::JobHandle &handle, EventCallback on_event,
            std::shared_ptr<CancelToken> cancel_token) = 0;
};

/// Fetches results by reference when `completed` carried no inline items.
class IResultResolver {
public:
  virtual ~IResultResolver() = default;

  virtual Result<std::vector<remote::BookResult>, ClientError>
  resolve(const remote::JobHandle &handle, const std::string &results_endpoint,
          std::shared_ptr<CancelToken> cancel_token) = 0;
};

/// Releases server-side job resources. Must be idempotent.
class IJobCleaner {
public:
  virtual ~IJobCleaner() = default;

  virtual Result<void, ClientError>
  cleanup(const remote::JobHandle &handle,
          std::shared_ptr<CancelToken> cancel_token) = 0;
};

/// Collaborators of one coordinator. The event stream is owned exclusively;
/// uploader, resolver and cleaner hold no per-job state and may be shared.
struct JobPorts {
  std::shared_ptr<IJobUploader> uploader;
  std::unique_ptr<IJobEventStream> event_stream;
  std::shared_ptr<IResultResolver> resolver;
  std::shared_ptr<IJobCleaner> cleaner;
};

} // namespace spine::core
