#include "core/job_state.h"

namespace spine::core {

const char *to_string(JobState state) {
  switch (state) {
  case JobState::Created:
    return "Created";
  case JobState::Uploading:
    return "Uploading";
  case JobState::Streaming:
    return "Streaming";
  case JobState::Resolving:
    return "Resolving";
  case JobState::Completed:
    return "Completed";
  case JobState::Failed:
    return "Failed";
  case JobState::Canceled:
    return "Canceled";
  }
  return "Unknown";
}

bool is_terminal(JobState state) {
  switch (state) {
  case JobState::Completed:
  case JobState::Failed:
  case JobState::Canceled:
    return true;
  default:
    return false;
  }
}

Result<void, ClientError> JobStateMachine::transition_to(JobState new_state) {
  bool legal = false;

  switch (state) {
  case JobState::Created:
    legal = (new_state == JobState::Uploading);
    break;
  case JobState::Uploading:
    legal = (new_state == JobState::Streaming || new_state == JobState::Failed);
    break;
  case JobState::Streaming:
    legal = (new_state == JobState::Resolving ||
             new_state == JobState::Completed ||
             new_state == JobState::Failed || new_state == JobState::Canceled);
    break;
  case JobState::Resolving:
    legal = (new_state == JobState::Completed || new_state == JobState::Failed);
    break;
  case JobState::Completed:
  case JobState::Failed:
  case JobState::Canceled:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, ClientError>::Err(ClientError::Internal(
        std::string("Illegal job transition: ") + to_string(state) + " -> " +
        to_string(new_state) + " (job_key=" + job_key + ")"));
  }

  state = new_state;

  if (new_state == JobState::Streaming) {
    streaming_at = Clock::now();
  }
  if (is_terminal(new_state)) {
    finished_at = Clock::now();
  }

  return Result<void, ClientError>::Ok();
}

} // namespace spine::core
