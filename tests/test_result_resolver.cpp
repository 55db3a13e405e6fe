#include <gtest/gtest.h>

#include "infra/result_resolver.h"
#include "infra/url_util.h"
#include "support/mock_http_client.h"

using namespace spine::infra;
using namespace spine::core;
using namespace spine::test;
using namespace std::chrono_literals;

namespace {

remote::JobHandle make_handle() {
  remote::JobHandle handle;
  handle.job_id = "job-5";
  handle.stream_endpoint = "https://api.example.test/v3/jobs/scans/job-5/stream";
  handle.auth_token = "tok-5";
  handle.device_id = "device-5";
  return handle;
}

const char *kResults = R"({
  "success": true,
  "data": {
    "jobId": "job-5",
    "status": "completed",
    "results": [
      {"title": "Dune", "author": "Frank Herbert", "isbn": "9780441013593"},
      {"title": "Emma", "author": "Jane Austen", "confidence": 0.8}
    ]
  }
})";

class ResultResolverTest : public ::testing::Test {
protected:
  std::shared_ptr<MockHttpClient> http_ = std::make_shared<MockHttpClient>();
  ResultResolver resolver_{http_, "https://api.example.test", 15s, nullptr};
};

} // namespace

// ============================================================
// Test: URL helpers
// ============================================================

TEST(UrlUtil, JoinUrl) {
  EXPECT_EQ(join_url("https://a.test/", "/v3/x"), "https://a.test/v3/x");
  EXPECT_EQ(join_url("https://a.test", "v3/x"), "https://a.test/v3/x");
  EXPECT_EQ(join_url("https://a.test", "https://b.test/y"), "https://b.test/y");
  EXPECT_EQ(join_url("https://a.test//", ""), "https://a.test");
}

TEST(UrlUtil, AppendQuery) {
  EXPECT_EQ(append_query("https://a.test/r", "format=lite"), "https://a.test/r?format=lite");
  EXPECT_EQ(append_query("https://a.test/r?page=2", "format=lite"),
            "https://a.test/r?page=2&format=lite");
  EXPECT_EQ(append_query("https://a.test/r#top", "format=lite"),
            "https://a.test/r?format=lite#top");
}

// ============================================================
// Test: Fetching by reference
// ============================================================

TEST_F(ResultResolverTest, FetchesResultsByReference) {
  http_->push_response(200, kResults);

  auto result = resolver_.resolve(make_handle(), "/v3/jobs/results/job-5", nullptr);

  ASSERT_TRUE(result.is_ok()) << describe(result.error());
  ASSERT_EQ(result.value().size(), 2u);
  EXPECT_EQ(result.value()[0].title, "Dune");
  EXPECT_EQ(*result.value()[0].isbn, "9780441013593");
  EXPECT_DOUBLE_EQ(*result.value()[1].confidence, 0.8);

  auto requests = http_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, HttpMethod::GET);
  EXPECT_EQ(requests[0].url, "https://api.example.test/v3/jobs/results/job-5?format=lite");
  EXPECT_EQ(requests[0].headers.at("Authorization"), "Bearer tok-5");
  EXPECT_EQ(requests[0].headers.at("X-Device-ID"), "device-5");
  EXPECT_EQ(requests[0].timeout, 15s);
}

TEST_F(ResultResolverTest, ExistingQueryUsesAmpersand) {
  EXPECT_EQ(resolver_.results_url(make_handle(), "https://cdn.example.test/r/job-5?sig=abc"),
            "https://cdn.example.test/r/job-5?sig=abc&format=lite");
}

TEST_F(ResultResolverTest, EmptyEndpointFallsBackToJobPath) {
  EXPECT_EQ(resolver_.results_url(make_handle(), ""),
            "https://api.example.test/v3/jobs/results/job-5?format=lite");
}

TEST_F(ResultResolverTest, EmptyResultListIsValid) {
  http_->push_response(200, R"({"success":true,"data":{"jobId":"job-5","results":[]}})");

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_ok());
  EXPECT_TRUE(result.value().empty());
}

TEST_F(ResultResolverTest, MissingResultsArrayIsMalformed) {
  http_->push_response(200, R"({"success":true,"data":{"jobId":"job-5"}})");

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::MalformedResponse);
}

TEST_F(ResultResolverTest, InvalidBookIsMalformedWithIndex) {
  http_->push_response(200, R"({"success":true,"data":{"results":[)"
                            R"({"title":"A","author":"X"},{"author":"Y"}]}})");

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::MalformedResponse);
  EXPECT_NE(result.error().internal_message.find("results[1]"), std::string::npos);
}

TEST_F(ResultResolverTest, NotJsonIsMalformed) {
  http_->push_response(200, "<html></html>");

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::MalformedResponse);
}

TEST_F(ResultResolverTest, HttpErrorIsTranslated) {
  http_->push_response(404, R"({"success":false,"type":"about:blank",)"
                            R"("title":"Not found","status":404,)"
                            R"("detail":"Results expired","code":"RESULTS_EXPIRED",)"
                            R"("retryable":false})");

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::StructuredApi);
  EXPECT_EQ(result.error().code, "RESULTS_EXPIRED");
  EXPECT_EQ(result.error().http_status, 404);
}

TEST_F(ResultResolverTest, TransportErrorIsForwarded) {
  http_->push_error(network_error());

  auto result = resolver_.resolve(make_handle(), "/r", nullptr);

  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().kind, ErrorKind::Transport);
}

TEST(ResultsPage, DecodesEnvelope) {
  auto page = decode_results_page(200, kResults);

  ASSERT_TRUE(page.is_ok());
  EXPECT_EQ(page.value().job_id, "job-5");
  EXPECT_EQ(page.value().status, "completed");
  EXPECT_EQ(page.value().results.size(), 2u);
}

TEST(ResultsPage, SuccessFalseIsMalformed) {
  auto page = decode_results_page(200, R"({"success":false,"data":{"results":[]}})");

  ASSERT_TRUE(page.is_err());
  EXPECT_EQ(page.error().kind, ErrorKind::MalformedResponse);
}
