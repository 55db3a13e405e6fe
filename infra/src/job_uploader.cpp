#include "infra/job_uploader.h"

#include "core/ids.h"
#include "infra/error_translator.h"
#include "infra/json_util.h"
#include "infra/url_util.h"

#include <random>

namespace spine::infra {

using spine::core::ClientError;
using spine::core::ErrorKind;
using spine::core::remote::JobHandle;
using UploadResult = spine::core::Result<JobHandle, ClientError>;

namespace {

constexpr const char *kComponent = "uploader";
constexpr const char *kUploadPath = "/v3/jobs/scans";

bool is_server_side_failure(const ClientError &error) {
  if (error.kind == ErrorKind::Transport) {
    return error.retryable;
  }
  return error.http_status >= 500;
}

} // namespace

JobUploader::JobUploader(std::shared_ptr<IHttpClient> http, std::string base_url,
                         UploadPolicy policy,
                         std::shared_ptr<spine::core::ILogger> logger,
                         spine::core::SleepFn sleep)
    : http_(std::move(http)), base_url_(std::move(base_url)),
      policy_(std::move(policy)), logger_(std::move(logger)),
      sleep_(sleep ? std::move(sleep) : spine::core::default_sleep()) {}

std::string JobUploader::upload_url() const {
  return join_url(base_url_, kUploadPath);
}

HttpRequest JobUploader::build_request(const std::string &image_bytes,
                                       const std::string &device_id,
                                       const std::string &trace_id) const {
  const std::string boundary = "spine-" + spine::core::generate_uuid();

  std::string body;
  body.reserve(image_bytes.size() + 512);
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"deviceId\"\r\n\r\n";
  body += device_id + "\r\n";
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"photos[]\"; "
          "filename=\"spine.jpg\"\r\n";
  body += "Content-Type: image/jpeg\r\n\r\n";
  body += image_bytes;
  body += "\r\n--" + boundary + "--\r\n";

  HttpRequest request;
  request.method = HttpMethod::POST;
  request.url = upload_url();
  request.headers["Content-Type"] =
      "multipart/form-data; boundary=" + boundary;
  request.headers["Accept"] = "application/json";
  request.headers["X-Device-ID"] = device_id;
  request.body = std::move(body);
  request.trace_id = trace_id;
  request.timeout = policy_.timeout;
  return request;
}

UploadResult JobUploader::parse_accepted(const HttpResponse &response,
                                         const std::string &device_id) const {
  std::string parse_error;
  auto root = json::parse(response.body, &parse_error);
  if (!root || !root->isObject()) {
    return UploadResult::Err(ClientError::Malformed(
        "Upload response is not a JSON object: " + parse_error,
        response.status_code));
  }
  if (json::get_bool(*root, "success") != std::optional<bool>(true)) {
    return UploadResult::Err(ClientError::Malformed(
        "Upload response success flag is not true", response.status_code));
  }

  const Json::Value &data = (*root)["data"];
  auto job_id = json::get_string(data, "jobId");
  if (!job_id || job_id->empty()) {
    return UploadResult::Err(ClientError::Malformed(
        "Upload response lacks data.jobId", response.status_code));
  }
  auto stream_endpoint = json::get_string(data, "streamEndpoint");
  if (!stream_endpoint) {
    stream_endpoint = json::get_string(data, "sseUrl");
  }
  if (!stream_endpoint || stream_endpoint->empty()) {
    return UploadResult::Err(ClientError::Malformed(
        "Upload response lacks data.streamEndpoint", response.status_code));
  }

  JobHandle handle;
  handle.job_id = std::move(*job_id);
  handle.stream_endpoint = join_url(base_url_, *stream_endpoint);
  handle.auth_token = json::get_string(data, "authToken").value_or("");
  auto status_endpoint = json::get_string(data, "statusEndpoint");
  if (!status_endpoint) {
    status_endpoint = json::get_string(data, "statusUrl");
  }
  if (status_endpoint) {
    handle.status_endpoint = join_url(base_url_, *status_endpoint);
  }
  handle.device_id = device_id;
  handle.created_at = JobHandle::Clock::now();
  return UploadResult::Ok(std::move(handle));
}

UploadResult JobUploader::submit(
    const std::string &image_bytes, const std::string &device_id,
    std::shared_ptr<spine::core::CancelToken> cancel_token) {
  if (!http_) {
    return UploadResult::Err(
        ClientError::Internal("JobUploader has null HTTP client"));
  }

  const std::string trace_id = spine::core::generate_id("upload");
  const HttpRequest request = build_request(image_bytes, device_id, trace_id);

  // Retry state is local to this call.
  std::mt19937 rng{std::random_device{}()};
  int server_retries = 0;
  int rate_limit_retries = 0;

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return UploadResult::Err(
          ClientError::Canceled("Upload canceled before request"));
    }

    ClientError error;
    auto result = http_->post(request, cancel_token);
    if (result.is_err()) {
      error = std::move(result).error();
      if (error.kind == ErrorKind::Canceled) {
        return UploadResult::Err(std::move(error));
      }
    } else {
      const HttpResponse &response = result.value();
      if (response.is_success()) {
        auto accepted = parse_accepted(response, device_id);
        if (accepted.is_ok() && logger_) {
          logger_->info(trace_id, kComponent, "upload_accepted",
                        "job_id=" + accepted.value().job_id + " status=" +
                            std::to_string(response.status_code));
        }
        return accepted;
      }
      error = translate_http_error(response.status_code, response.body,
                                   response.header("Retry-After"));
    }

    error.details["retry_count"] =
        std::to_string(server_retries + rate_limit_retries);

    std::chrono::milliseconds delay{0};
    if (error.http_status == 429) {
      if (rate_limit_retries >= policy_.max_rate_limit_retries) {
        return UploadResult::Err(std::move(error));
      }
      delay = error.retry_after.value_or(policy_.rate_limit_default_delay);
      ++rate_limit_retries;
    } else if (is_server_side_failure(error)) {
      if (server_retries >= policy_.max_server_retries) {
        if (logger_) {
          logger_->error(trace_id, kComponent, "upload_exhausted",
                         spine::core::describe(error));
        }
        return UploadResult::Err(std::move(error));
      }
      delay = policy_.backoff.delay(server_retries, rng);
      ++server_retries;
    } else {
      return UploadResult::Err(std::move(error));
    }

    if (logger_) {
      logger_->warn(trace_id, kComponent, "retry_scheduled",
                    spine::core::describe(error) +
                        " delay_ms=" + std::to_string(delay.count()));
    }
    if (!sleep_(delay, cancel_token)) {
      return UploadResult::Err(
          ClientError::Canceled("Upload canceled during retry backoff"));
    }
  }
}

} // namespace spine::infra
