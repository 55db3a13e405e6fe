#include "infra/result_resolver.h"

#include "core/ids.h"
#include "infra/error_translator.h"
#include "infra/event_codec.h"
#include "infra/json_util.h"
#include "infra/url_util.h"

namespace spine::infra {

using spine::core::ClientError;
using spine::core::remote::BookResult;
using spine::core::remote::JobHandle;
using spine::core::remote::ResultsPage;
using PageResult = spine::core::Result<ResultsPage, ClientError>;
using ResolveResult = spine::core::Result<std::vector<BookResult>, ClientError>;

namespace {
constexpr const char *kComponent = "result_resolver";
} // namespace

PageResult decode_results_page(int status, const std::string &body) {
  std::string parse_error;
  auto root = json::parse(body, &parse_error);
  if (!root || !root->isObject()) {
    return PageResult::Err(ClientError::Malformed(
        "Results body is not a JSON object: " + parse_error, status));
  }
  if (json::get_bool(*root, "success") != std::optional<bool>(true)) {
    return PageResult::Err(
        ClientError::Malformed("Results success flag is not true", status));
  }

  const Json::Value &data = (*root)["data"];
  if (!data.isObject()) {
    return PageResult::Err(
        ClientError::Malformed("Results body lacks data object", status));
  }
  const Json::Value &results = data["results"];
  if (!results.isArray()) {
    return PageResult::Err(
        ClientError::Malformed("Results body lacks data.results array", status));
  }

  ResultsPage page;
  page.job_id = json::get_string(data, "jobId").value_or("");
  page.status = json::get_string(data, "status").value_or("");
  page.results.reserve(results.size());
  for (Json::ArrayIndex i = 0; i < results.size(); ++i) {
    auto book = decode_book_result(results[i]);
    if (book.is_err()) {
      return PageResult::Err(ClientError::Malformed(
          "results[" + std::to_string(i) + "]: " + book.error(), status));
    }
    page.results.push_back(std::move(book).value());
  }
  return PageResult::Ok(std::move(page));
}

ResultResolver::ResultResolver(std::shared_ptr<IHttpClient> http,
                               std::string base_url,
                               std::chrono::milliseconds timeout,
                               std::shared_ptr<spine::core::ILogger> logger)
    : http_(std::move(http)), base_url_(std::move(base_url)), timeout_(timeout),
      logger_(std::move(logger)) {}

std::string ResultResolver::results_url(const JobHandle &handle,
                                        const std::string &results_endpoint) const {
  const std::string endpoint =
      results_endpoint.empty() ? "/v3/jobs/results/" + handle.job_id
                               : results_endpoint;
  return append_query(join_url(base_url_, endpoint), "format=lite");
}

ResolveResult ResultResolver::resolve(
    const JobHandle &handle, const std::string &results_endpoint,
    std::shared_ptr<spine::core::CancelToken> cancel_token) {
  if (!http_) {
    return ResolveResult::Err(
        ClientError::Internal("ResultResolver has null HTTP client"));
  }

  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = results_url(handle, results_endpoint);
  request.headers["Accept"] = "application/json";
  if (!handle.device_id.empty()) {
    request.headers["X-Device-ID"] = handle.device_id;
  }
  if (!handle.auth_token.empty()) {
    request.headers["Authorization"] = "Bearer " + handle.auth_token;
  }
  request.trace_id = handle.job_id;
  request.request_id = spine::core::generate_id("results");
  request.timeout = timeout_;

  auto result = http_->get(request, std::move(cancel_token));
  if (result.is_err()) {
    return result.forward_error<std::vector<BookResult>>();
  }

  const HttpResponse &response = result.value();
  if (!response.is_success()) {
    auto error = translate_http_error(response.status_code, response.body,
                                      response.header("Retry-After"));
    if (logger_) {
      logger_->error(handle.job_id, kComponent, "fetch_failed",
                     spine::core::describe(error));
    }
    return ResolveResult::Err(std::move(error));
  }

  auto page = decode_results_page(response.status_code, response.body);
  if (page.is_err()) {
    return page.forward_error<std::vector<BookResult>>();
  }
  if (logger_) {
    logger_->info(handle.job_id, kComponent, "results_fetched",
                  "count=" + std::to_string(page.value().results.size()) +
                      " status=" + page.value().status);
  }
  return ResolveResult::Ok(std::move(page).value().results);
}

} // namespace spine::infra
