#pragma once

#include <string>

#include <google/protobuf/struct.pb.h>

namespace jobclaim::util {

/*
  JSON helpers on top of protobuf's JSON mapping of google.protobuf.Value.

  Parse* throw std::invalid_argument on malformed input.
*/

google::protobuf::Value  ParseJson(const std::string& text);
google::protobuf::Struct ParseJsonObject(const std::string& text);

std::string ToJson(const google::protobuf::Value& value);
std::string ToJson(const google::protobuf::Struct& object);

// Compact JSON with object keys sorted, stable across producers.
std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const std::string& text);

} // namespace jobclaim::util
