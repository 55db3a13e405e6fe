#include <gtest/gtest.h>

#include "infra/job_cleaner.h"
#include "support/mock_http_client.h"

using namespace spine::infra;
using namespace spine::core;
using namespace spine::test;
using namespace std::chrono_literals;

namespace {

remote::JobHandle make_handle() {
  remote::JobHandle handle;
  handle.job_id = "job-9";
  handle.auth_token = "tok-9";
  handle.device_id = "device-9";
  return handle;
}

class JobCleanerTest : public ::testing::Test {
protected:
  std::shared_ptr<MockHttpClient> http_ = std::make_shared<MockHttpClient>();
  std::shared_ptr<RecordingLogger> logger_ = std::make_shared<RecordingLogger>();
  JobCleaner cleaner_{http_, "https://api.example.test/", 5s, logger_};
};

} // namespace

TEST_F(JobCleanerTest, SendsDeleteToCleanupPath) {
  http_->push_response(204, "");

  auto result = cleaner_.cleanup(make_handle(), nullptr);

  ASSERT_TRUE(result.is_ok());
  auto requests = http_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, HttpMethod::DELETE);
  EXPECT_EQ(requests[0].url, "https://api.example.test/v3/jobs/scans/job-9/cleanup");
  EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer tok-9");
  EXPECT_EQ(requests[0].headers.at("X-Device-ID"), "device-9");
  EXPECT_EQ(requests[0].timeout, 5s);
}

TEST_F(JobCleanerTest, OkStatusIsSuccess) {
  http_->push_response(200, R"({"success":true})");
  EXPECT_TRUE(cleaner_.cleanup(make_handle(), nullptr).is_ok());
}

TEST_F(JobCleanerTest, NotFoundMeansAlreadyCleaned) {
  http_->push_response(404, "");

  auto result = cleaner_.cleanup(make_handle(), nullptr);

  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(logger_->count("already_cleaned"), 1u);
}

TEST_F(JobCleanerTest, ServerErrorIsReported) {
  http_->push_response(500, "boom");

  auto result = cleaner_.cleanup(make_handle(), nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::RawHttp);
  EXPECT_EQ(result.error().http_status, 500);
}

TEST_F(JobCleanerTest, TransportErrorIsReported) {
  http_->push_error(network_error());

  auto result = cleaner_.cleanup(make_handle(), nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::Transport);
}

TEST_F(JobCleanerTest, RepeatedCleanupIsIdempotent) {
  http_->push_response(204, "");
  http_->push_response(404, "");

  EXPECT_TRUE(cleaner_.cleanup(make_handle(), nullptr).is_ok());
  EXPECT_TRUE(cleaner_.cleanup(make_handle(), nullptr).is_ok());
  EXPECT_EQ(http_->call_count(), 2u);
}

TEST_F(JobCleanerTest, EmptyJobIdIsRejected) {
  auto handle = make_handle();
  handle.job_id.clear();

  auto result = cleaner_.cleanup(handle, nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::Internal);
  EXPECT_EQ(http_->call_count(), 0u);
}
