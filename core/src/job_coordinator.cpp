#include "core/job_coordinator.h"
#include "core/ids.h"

#include <utility>

namespace spine::core {

namespace {

constexpr const char *kComponent = "coordinator";

ClientError make_stream_terminal_error(const ErrorEvent &event) {
  ClientError error(ErrorKind::StreamTerminal, event.code.value_or("JOB_FAILED"),
                    event.retryable.value_or(false), event.message,
                    "Job reported error: " + event.message);
  if (event.job_id) {
    error.details["job_id"] = *event.job_id;
  }
  return error;
}

} // namespace

JobLifecycleCoordinator::JobLifecycleCoordinator(JobPorts ports,
                                                 std::shared_ptr<ILogger> logger,
                                                 std::string job_key)
    : ports_(std::move(ports)), logger_(std::move(logger)) {
  machine_.job_key = job_key.empty() ? generate_id("scan") : std::move(job_key);
}

std::string JobLifecycleCoordinator::trace_id() const {
  return handle_ ? handle_->job_id : machine_.job_key;
}

void JobLifecycleCoordinator::enter(JobState next) {
  const JobState previous = machine_.state;
  auto moved = machine_.transition_to(next);
  if (moved.is_err()) {
    if (logger_) {
      logger_->error(trace_id(), kComponent, "illegal_transition",
                     moved.error().internal_message);
    }
    return;
  }
  if (logger_) {
    logger_->debug(trace_id(), kComponent, "state_change",
                   std::string(to_string(previous)) + " -> " + to_string(next));
  }
}

void JobLifecycleCoordinator::fail(JobOutcome &outcome, ClientError error) {
  if (logger_) {
    logger_->error(trace_id(), kComponent, "job_failed", describe(error));
  }
  outcome.error = std::move(error);
  enter(JobState::Failed);
}

JobOutcome JobLifecycleCoordinator::run(const std::string &image_bytes,
                                        const std::string &device_id,
                                        EventCallback on_event,
                                        std::shared_ptr<CancelToken> cancel_token) {
  JobOutcome outcome;
  outcome.job_key = machine_.job_key;

  if (machine_.state != JobState::Created) {
    outcome.state = machine_.state;
    outcome.job_id = handle_ ? std::optional<std::string>(handle_->job_id)
                             : std::nullopt;
    outcome.error = ClientError::Internal("run() called twice for job_key=" +
                                          machine_.job_key);
    return outcome;
  }
  if (!ports_.uploader || !ports_.event_stream || !ports_.resolver) {
    outcome.error = ClientError::Internal("Coordinator ports are incomplete");
    return outcome;
  }

  enter(JobState::Uploading);
  if (logger_) {
    logger_->info(trace_id(), kComponent, "upload_start",
                  "bytes=" + std::to_string(image_bytes.size()) +
                      " device_id=" + device_id);
  }

  auto uploaded = ports_.uploader->submit(image_bytes, device_id, cancel_token);
  if (uploaded.is_err()) {
    ClientError error = std::move(uploaded).error();
    if (error.kind == ErrorKind::Canceled) {
      outcome.canceled_by_caller = true;
      outcome.error = std::move(error);
      outcome.state = machine_.state;
      return outcome;
    }
    fail(outcome, std::move(error));
    // No server-side job exists, so there is nothing to clean up.
    outcome.state = machine_.state;
    return outcome;
  }

  handle_ = std::move(uploaded).value();
  outcome.job_id = handle_->job_id;
  if (logger_) {
    logger_->info(trace_id(), kComponent, "upload_accepted",
                  "job_key=" + machine_.job_key +
                      " stream=" + handle_->stream_endpoint);
  }

  enter(JobState::Streaming);
  stream_job(outcome, on_event, cancel_token);

  if (is_terminal(machine_.state)) {
    cleanup_after_terminal(outcome, cancel_token);
  }

  outcome.state = machine_.state;
  if (logger_) {
    logger_->info(trace_id(), kComponent, "job_finished",
                  std::string("state=") + to_string(outcome.state) +
                      " results=" + std::to_string(outcome.results.size()) +
                      (outcome.canceled_by_caller ? " canceled_by_caller" : ""));
  }
  return outcome;
}

void JobLifecycleCoordinator::stream_job(
    JobOutcome &outcome, const EventCallback &on_event,
    const std::shared_ptr<CancelToken> &cancel_token) {
  std::optional<StreamEvent> terminal;
  auto forward = [&terminal, &on_event](const StreamEvent &event) {
    if (is_terminal(event)) {
      terminal = event;
      return;
    }
    if (on_event) {
      on_event(event);
    }
  };

  auto streamed =
      ports_.event_stream->subscribe(*handle_, forward, cancel_token);
  if (streamed.is_err()) {
    ClientError error = std::move(streamed).error();
    if (error.kind == ErrorKind::Canceled) {
      if (logger_) {
        logger_->info(trace_id(), kComponent, "stream_canceled",
                      "caller canceled; server job left untouched");
      }
      outcome.canceled_by_caller = true;
      outcome.error = std::move(error);
      return;
    }
    fail(outcome, std::move(error));
    return;
  }

  if (!terminal) {
    fail(outcome,
         ClientError::Internal("Event stream returned without a terminal event"));
    return;
  }

  if (terminal->is<CompletedEvent>()) {
    finish_completed(outcome, std::move(*terminal), on_event, cancel_token);
    return;
  }

  if (on_event) {
    on_event(*terminal);
  }

  if (const auto *error_event = terminal->get_if<ErrorEvent>()) {
    fail(outcome, make_stream_terminal_error(*error_event));
    return;
  }

  if (logger_) {
    logger_->warn(trace_id(), kComponent, "job_canceled",
                  "server reported the job as canceled");
  }
  enter(JobState::Canceled);
}

void JobLifecycleCoordinator::finish_completed(
    JobOutcome &outcome, StreamEvent terminal, const EventCallback &on_event,
    const std::shared_ptr<CancelToken> &cancel_token) {
  auto &completed = std::get<CompletedEvent>(terminal.payload);

  if (completed.has_inline_items()) {
    outcome.results = *completed.inline_items;
    enter(JobState::Completed);
    if (on_event) {
      on_event(terminal);
    }
    return;
  }

  enter(JobState::Resolving);
  const std::string endpoint = completed.results_endpoint.value_or("");
  if (logger_) {
    logger_->info(trace_id(), kComponent, "resolve_start",
                  "endpoint=" + (endpoint.empty() ? "<default>" : endpoint));
  }

  auto resolved = ports_.resolver->resolve(*handle_, endpoint, cancel_token);
  if (resolved.is_err()) {
    ClientError error = std::move(resolved).error();
    if (error.kind == ErrorKind::Canceled) {
      outcome.canceled_by_caller = true;
      outcome.error = std::move(error);
      return;
    }
    fail(outcome, std::move(error));
    return;
  }

  outcome.results = std::move(resolved).value();
  completed.inline_items = outcome.results;
  enter(JobState::Completed);
  if (on_event) {
    on_event(terminal);
  }
}

void JobLifecycleCoordinator::cleanup_after_terminal(
    JobOutcome &outcome, const std::shared_ptr<CancelToken> &cancel_token) {
  if (!handle_) {
    return;
  }
  outcome.cleanup_attempted = true;
  auto cleaned = cleanup(cancel_token);
  if (cleaned.is_err()) {
    // Recorded, never propagated: the terminal state stands.
    outcome.cleanup_error = cleaned.error();
  }
}

Result<void, ClientError>
JobLifecycleCoordinator::cleanup(std::shared_ptr<CancelToken> cancel_token) {
  if (!handle_) {
    return Result<void, ClientError>::Err(
        ClientError::Internal("No accepted job to clean up"));
  }
  if (!ports_.cleaner) {
    return Result<void, ClientError>::Err(
        ClientError::Internal("Coordinator has no cleaner"));
  }

  auto cleaned = ports_.cleaner->cleanup(*handle_, std::move(cancel_token));
  if (logger_) {
    if (cleaned.is_ok()) {
      logger_->info(trace_id(), kComponent, "cleanup_done",
                    "job_id=" + handle_->job_id);
    } else {
      logger_->warn(trace_id(), kComponent, "cleanup_failed",
                    describe(cleaned.error()));
    }
  }
  return cleaned;
}

} // namespace spine::core
