#include "infra/problem_details_codec.h"

#include "infra/json_util.h"

namespace spine::infra {

using spine::core::remote::ProblemDetails;
using DecodeResult = spine::core::Result<ProblemDetails, std::string>;

namespace {

DecodeResult missing(const char *field, const char *expected) {
  return DecodeResult::Err(std::string("field '") + field + "' missing or not " +
                           expected);
}

} // namespace

DecodeResult decode_problem_details(std::string_view body) {
  std::string parse_error;
  auto root = json::parse(body, &parse_error);
  if (!root) {
    return DecodeResult::Err("body is not JSON: " + parse_error);
  }
  if (!root->isObject()) {
    return DecodeResult::Err("body is not a JSON object");
  }

  ProblemDetails pd;
  auto success = json::get_bool(*root, "success");
  if (!success) {
    return missing("success", "a bool");
  }
  auto type = json::get_string(*root, "type");
  if (!type) {
    return missing("type", "a string");
  }
  auto title = json::get_string(*root, "title");
  if (!title) {
    return missing("title", "a string");
  }
  auto status = json::get_int(*root, "status");
  if (!status) {
    return missing("status", "an integer");
  }
  auto detail = json::get_string(*root, "detail");
  if (!detail) {
    return missing("detail", "a string");
  }
  auto code = json::get_string(*root, "code");
  if (!code) {
    return missing("code", "a string");
  }
  auto retryable = json::get_bool(*root, "retryable");
  if (!retryable) {
    return missing("retryable", "a bool");
  }

  pd.success = *success;
  pd.type = std::move(*type);
  pd.title = std::move(*title);
  pd.status = *status;
  pd.detail = std::move(*detail);
  pd.code = std::move(*code);
  pd.retryable = *retryable;

  // Optional fields: wrong types are treated as absent.
  if (auto retry_after = json::get_int64(*root, "retryAfterMs")) {
    if (*retry_after >= 0) {
      pd.retry_after_ms = *retry_after;
    }
  }
  pd.instance = json::get_string(*root, "instance");

  const Json::Value &metadata = (*root)["metadata"];
  if (metadata.isObject()) {
    std::map<std::string, std::string> values;
    for (const auto &key : metadata.getMemberNames()) {
      values[key] = json::stringify(metadata[key]);
    }
    pd.metadata = std::move(values);
  }

  return DecodeResult::Ok(std::move(pd));
}

std::string encode_problem_details(const ProblemDetails &pd) {
  Json::Value root(Json::objectValue);
  root["success"] = pd.success;
  root["type"] = pd.type;
  root["title"] = pd.title;
  root["status"] = pd.status;
  root["detail"] = pd.detail;
  root["code"] = pd.code;
  root["retryable"] = pd.retryable;
  if (pd.retry_after_ms) {
    root["retryAfterMs"] = Json::Int64(*pd.retry_after_ms);
  }
  if (pd.instance) {
    root["instance"] = *pd.instance;
  }
  if (pd.metadata) {
    Json::Value metadata(Json::objectValue);
    for (const auto &[key, value] : *pd.metadata) {
      metadata[key] = value;
    }
    root["metadata"] = metadata;
  }
  return json::write_compact(root);
}

} // namespace spine::infra
