#pragma once

#include "core/client_error.h"
#include "core/result.h"

#include <chrono>
#include <optional>
#include <string>

namespace spine::core {

// ---- Job State Enum ----

enum class JobState {
  Created,   // Coordinator constructed, nothing sent
  Uploading, // Multipart upload in flight (including retries)
  Streaming, // Event stream open or reconnecting
  Resolving, // Fetching results by reference after `completed`
  Completed, // Results available (terminal)
  Failed,    // Upload, stream or fetch failed (terminal)
  Canceled   // Server reported the job canceled (terminal)
};

/// Convert JobState to string for logging.
const char *to_string(JobState state);

/// Completed, Failed and Canceled admit no further transitions.
bool is_terminal(JobState state);

// ---- Job State Machine ----

/// Lifecycle of one scan job. Owned by exactly one coordinator.
struct JobStateMachine {
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  std::string job_key; // client-side id, stable before the server job exists
  JobState state = JobState::Created;
  TimePoint created_at = Clock::now();
  std::optional<TimePoint> streaming_at;
  std::optional<TimePoint> finished_at;

  /// Attempt a state transition. Returns Err if the transition is illegal.
  /// Legal transitions:
  ///   Created   → Uploading
  ///   Uploading → Streaming, Failed
  ///   Streaming → Resolving, Completed, Failed, Canceled
  ///   Resolving → Completed, Failed
  Result<void, ClientError> transition_to(JobState new_state);
};

} // namespace spine::core
