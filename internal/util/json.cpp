#include "internal/util/json.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <google/protobuf/util/json_util.h>

namespace jobclaim::util {

google::protobuf::Value ParseJson(const std::string& text) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(text, &value);
  if (!status.ok()) {
    throw std::invalid_argument("invalid JSON: " + std::string(status.message()));
  }
  return value;
}

google::protobuf::Struct ParseJsonObject(const std::string& text) {
  auto value = ParseJson(text);
  if (!value.has_struct_value()) {
    throw std::invalid_argument("JSON value is not an object");
  }
  return value.struct_value();
}

std::string ToJson(const google::protobuf::Value& value) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    throw std::runtime_error("JSON encode failed: " + std::string(status.message()));
  }
  return out;
}

std::string ToJson(const google::protobuf::Struct& object) {
  google::protobuf::Value value;
  *value.mutable_struct_value() = object;
  return ToJson(value);
}

namespace {

std::string QuoteKey(const std::string& key) {
  google::protobuf::Value value;
  value.set_string_value(key);
  return ToJson(value);
}

void AppendCanonical(const google::protobuf::Value& value, std::string& out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStructValue: {
      const auto&                     fields = value.struct_value().fields();
      std::vector<const std::string*> keys;
      keys.reserve(fields.size());
      for (const auto& [key, _] : fields) keys.push_back(&key);
      std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

      out += '{';
      bool first = true;
      for (const auto* key : keys) {
        if (!first) out += ',';
        first = false;
        out += QuoteKey(*key);
        out += ':';
        AppendCanonical(fields.at(*key), out);
      }
      out += '}';
      break;
    }
    case google::protobuf::Value::kListValue: {
      out += '[';
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out += ',';
        first = false;
        AppendCanonical(item, out);
      }
      out += ']';
      break;
    }
    default:
      out += ToJson(value);
      break;
  }
}

} // namespace

std::string CanonicalJson(const google::protobuf::Value& value) {
  std::string out;
  AppendCanonical(value, out);
  return out;
}

std::string CanonicalJson(const std::string& text) {
  return CanonicalJson(ParseJson(text));
}

} // namespace jobclaim::util
