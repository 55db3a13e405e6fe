#include <gtest/gtest.h>

#include "core/job_state.h"

using namespace spine::core;

namespace {

JobStateMachine machine_in(JobState state) {
  JobStateMachine m;
  m.job_key = "scan-test";
  m.state = state;
  return m;
}

} // namespace

// ============================================================
// Test: Legal state transitions
// ============================================================

TEST(JobStateMachine, CreatedToUploading) {
  JobStateMachine m;
  m.job_key = "scan-001";
  ASSERT_EQ(m.state, JobState::Created);

  auto result = m.transition_to(JobState::Uploading);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(m.state, JobState::Uploading);
  ASSERT_FALSE(m.streaming_at.has_value());
}

TEST(JobStateMachine, UploadingToStreaming) {
  auto m = machine_in(JobState::Uploading);

  auto result = m.transition_to(JobState::Streaming);
  ASSERT_TRUE(result.is_ok());
  ASSERT_EQ(m.state, JobState::Streaming);
  ASSERT_TRUE(m.streaming_at.has_value());
}

TEST(JobStateMachine, UploadingToFailed) {
  auto m = machine_in(JobState::Uploading);

  auto result = m.transition_to(JobState::Failed);
  ASSERT_TRUE(result.is_ok());
  ASSERT_TRUE(m.finished_at.has_value());
}

TEST(JobStateMachine, StreamingToEveryExit) {
  for (auto next : {JobState::Resolving, JobState::Completed, JobState::Failed,
                    JobState::Canceled}) {
    auto m = machine_in(JobState::Streaming);
    auto result = m.transition_to(next);
    EXPECT_TRUE(result.is_ok()) << to_string(next);
    EXPECT_EQ(m.state, next);
  }
}

TEST(JobStateMachine, ResolvingToCompletedOrFailed) {
  auto completed = machine_in(JobState::Resolving);
  ASSERT_TRUE(completed.transition_to(JobState::Completed).is_ok());
  ASSERT_TRUE(completed.finished_at.has_value());

  auto failed = machine_in(JobState::Resolving);
  ASSERT_TRUE(failed.transition_to(JobState::Failed).is_ok());
}

TEST(JobStateMachine, FullHappyPath) {
  JobStateMachine m;
  m.job_key = "scan-002";
  ASSERT_TRUE(m.transition_to(JobState::Uploading).is_ok());
  ASSERT_TRUE(m.transition_to(JobState::Streaming).is_ok());
  ASSERT_TRUE(m.transition_to(JobState::Resolving).is_ok());
  ASSERT_TRUE(m.transition_to(JobState::Completed).is_ok());
  ASSERT_TRUE(is_terminal(m.state));
}

// ============================================================
// Test: Illegal state transitions
// ============================================================

TEST(JobStateMachine, CreatedCannotSkipUpload) {
  auto m = machine_in(JobState::Created);

  auto result = m.transition_to(JobState::Streaming);
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::Internal);
  EXPECT_NE(result.error().internal_message.find("scan-test"), std::string::npos);
  EXPECT_EQ(m.state, JobState::Created);
}

TEST(JobStateMachine, UploadingCannotComplete) {
  auto m = machine_in(JobState::Uploading);
  ASSERT_TRUE(m.transition_to(JobState::Completed).is_err());
  ASSERT_TRUE(m.transition_to(JobState::Canceled).is_err());
  ASSERT_EQ(m.state, JobState::Uploading);
}

TEST(JobStateMachine, ResolvingCannotBeCanceledByServer) {
  auto m = machine_in(JobState::Resolving);
  ASSERT_TRUE(m.transition_to(JobState::Canceled).is_err());
  ASSERT_TRUE(m.transition_to(JobState::Streaming).is_err());
}

TEST(JobStateMachine, TerminalStatesAreFinal) {
  for (auto terminal :
       {JobState::Completed, JobState::Failed, JobState::Canceled}) {
    for (auto next : {JobState::Created, JobState::Uploading, JobState::Streaming,
                      JobState::Resolving, JobState::Completed, JobState::Failed,
                      JobState::Canceled}) {
      auto m = machine_in(terminal);
      EXPECT_TRUE(m.transition_to(next).is_err())
          << to_string(terminal) << " -> " << to_string(next);
      EXPECT_EQ(m.state, terminal);
    }
  }
}

TEST(JobStateMachine, TerminalClassification) {
  EXPECT_FALSE(is_terminal(JobState::Created));
  EXPECT_FALSE(is_terminal(JobState::Uploading));
  EXPECT_FALSE(is_terminal(JobState::Streaming));
  EXPECT_FALSE(is_terminal(JobState::Resolving));
  EXPECT_TRUE(is_terminal(JobState::Completed));
  EXPECT_TRUE(is_terminal(JobState::Failed));
  EXPECT_TRUE(is_terminal(JobState::Canceled));
}
