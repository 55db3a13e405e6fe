#pragma once

#include "core/cancel_token.h"
#include "core/client_error.h"
#include "core/job_ports.h"
#include "core/job_state.h"
#include "core/logger.h"
#include "core/remote/dto.h"
#include "core/result.h"
#include "core/stream_event.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spine::core {

/// Final report of one job, returned by JobLifecycleCoordinator::run().
struct JobOutcome {
  std::string job_key;
  std::optional<std::string> job_id;
  JobState state = JobState::Created;
  std::vector<remote::BookResult> results;
  std::optional<ClientError> error;

  /// The caller's token fired; the job was left as-is on the server.
  bool canceled_by_caller = false;

  bool cleanup_attempted = false;
  std::optional<ClientError> cleanup_error;
};

/// JobLifecycleCoordinator: drives one scan job end to end.
///
///   Created → Uploading → Streaming → [Resolving] → Completed | Failed | Canceled
///
/// Responsibilities:
///   1. Upload through IJobUploader and keep the resulting JobHandle
///   2. Follow the event stream, forwarding non-terminal events to the caller
///   3. Resolve results by reference when `completed` has no inline items, then
///      hand the caller a `completed` event with the items inlined
///   4. Issue exactly one best-effort cleanup when a terminal state is reached
///
/// One instance per job. It owns its event stream and therefore its retry
/// state; nothing mutable is shared with other coordinators.
class JobLifecycleCoordinator {
public:
  using EventCallback = IJobEventStream::EventCallback;

  JobLifecycleCoordinator(JobPorts ports, std::shared_ptr<ILogger> logger,
                          std::string job_key = {});

  JobLifecycleCoordinator(const JobLifecycleCoordinator &) = delete;
  JobLifecycleCoordinator &operator=(const JobLifecycleCoordinator &) = delete;

  /// Run the job to a terminal state (or until the caller cancels).
  /// May be called once.
  JobOutcome run(const std::string &image_bytes, const std::string &device_id,
                 EventCallback on_event,
                 std::shared_ptr<CancelToken> cancel_token = nullptr);

  /// Explicit cleanup, e.g. after the caller canceled and decided to discard
  /// the server-side job. Works for jobs that were never streamed.
  Result<void, ClientError>
  cleanup(std::shared_ptr<CancelToken> cancel_token = nullptr);

  [[nodiscard]] JobState state() const { return machine_.state; }
  [[nodiscard]] const std::string &job_key() const { return machine_.job_key; }
  [[nodiscard]] const std::optional<remote::JobHandle> &handle() const {
    return handle_;
  }

private:
  JobPorts ports_;
  std::shared_ptr<ILogger> logger_;
  JobStateMachine machine_;
  std::optional<remote::JobHandle> handle_;

  void stream_job(JobOutcome &outcome, const EventCallback &on_event,
                  const std::shared_ptr<CancelToken> &cancel_token);
  void finish_completed(JobOutcome &outcome, StreamEvent terminal,
                        const EventCallback &on_event,
                        const std::shared_ptr<CancelToken> &cancel_token);
  void fail(JobOutcome &outcome, ClientError error);
  void enter(JobState next);
  void cleanup_after_terminal(JobOutcome &outcome,
                              const std::shared_ptr<CancelToken> &cancel_token);
  std::string trace_id() const;
};

} // namespace spine::core
