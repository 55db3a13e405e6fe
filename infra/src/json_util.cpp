#include "infra/json_util.h"

#include <memory>

namespace spine::infra::json {

namespace {

const Json::Value *member(const Json::Value &obj, const char *key) {
  if (!obj.isObject()) {
    return nullptr;
  }
  const Json::Value *found = obj.find(key, key + std::char_traits<char>::length(key));
  if (!found || found->isNull()) {
    return nullptr;
  }
  return found;
}

} // namespace

std::optional<Json::Value> parse(std::string_view text, std::string *error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["failIfExtra"] = true;
  builder["rejectDupKeys"] = false;

  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    if (error) {
      *error = errs;
    }
    return std::nullopt;
  }
  return root;
}

std::string write_compact(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

bool has(const Json::Value &obj, const char *key) {
  return member(obj, key) != nullptr;
}

std::optional<std::string> get_string(const Json::Value &obj, const char *key) {
  const auto *v = member(obj, key);
  if (!v || !v->isString()) {
    return std::nullopt;
  }
  return v->asString();
}

std::optional<bool> get_bool(const Json::Value &obj, const char *key) {
  const auto *v = member(obj, key);
  if (!v || !v->isBool()) {
    return std::nullopt;
  }
  return v->asBool();
}

std::optional<int> get_int(const Json::Value &obj, const char *key) {
  const auto *v = member(obj, key);
  if (!v || !v->isInt()) {
    return std::nullopt;
  }
  return v->asInt();
}

std::optional<long long> get_int64(const Json::Value &obj, const char *key) {
  const auto *v = member(obj, key);
  if (!v || !v->isInt64()) {
    return std::nullopt;
  }
  return static_cast<long long>(v->asInt64());
}

std::optional<double> get_double(const Json::Value &obj, const char *key) {
  const auto *v = member(obj, key);
  if (!v || !v->isNumeric()) {
    return std::nullopt;
  }
  return v->asDouble();
}

std::string stringify(const Json::Value &value) {
  if (value.isString()) {
    return value.asString();
  }
  return write_compact(value);
}

} // namespace spine::infra::json
