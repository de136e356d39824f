#include "internal/queue/envelope.hpp"

#include <google/protobuf/util/json_util.h>

#include <regex>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobclaim::queue {

namespace {

bool IsUuid(const std::string& value) {
  static const std::regex kUuid("^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
  return std::regex_match(value, kUuid);
}

bool IsRfc3339(const std::string& value) {
  static const std::regex kRfc3339(R"(^\d{4}-\d{2}-\d{2}[Tt ]\d{2}:\d{2}:\d{2}(\.\d+)?([Zz]|[+-]\d{2}:\d{2})$)");
  return std::regex_match(value, kRfc3339);
}

} // namespace

std::vector<std::string> ValidateEnvelope(const jobclaim::v1::JobEnvelope& envelope) {
  std::vector<std::string> errors;

  if (envelope.job_id().empty()) {
    errors.emplace_back("job_id: required");
  } else if (!IsUuid(envelope.job_id())) {
    errors.emplace_back("job_id: must be a UUID");
  }
  if (!envelope.trace_id().empty() && !IsUuid(envelope.trace_id())) {
    errors.emplace_back("trace_id: must be a UUID");
  }
  if (envelope.org_id().empty()) {
    errors.emplace_back("org_id: required");
  }
  if (envelope.idempotency_key().empty()) {
    errors.emplace_back("idempotency_key: required");
  } else if (envelope.idempotency_key().size() > kMaxIdempotencyKeyLength) {
    errors.emplace_back("idempotency_key: longer than " + std::to_string(kMaxIdempotencyKeyLength) + " characters");
  }
  if (envelope.entity_type().empty()) {
    errors.emplace_back("entity_type: required");
  }
  if (envelope.entity_id().empty()) {
    errors.emplace_back("entity_id: required");
  }
  if (envelope.attempt() < 1) {
    errors.emplace_back("attempt: must be >= 1");
  }
  if (envelope.created_at().empty()) {
    errors.emplace_back("created_at: required");
  } else if (!IsRfc3339(envelope.created_at())) {
    errors.emplace_back("created_at: must be an RFC3339 timestamp");
  }
  if (!envelope.has_payload()) {
    errors.emplace_back("payload: required");
  }

  return errors;
}

std::string EnvelopeToJson(const jobclaim::v1::JobEnvelope& envelope) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(envelope, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("envelope encode failed: " + std::string(status.message()));
  }
  return json;
}

std::string EncodeEnvelope(const jobclaim::v1::JobEnvelope& envelope) {
  auto errors = ValidateEnvelope(envelope);
  if (!errors.empty()) {
    throw util::InvalidEnvelope("invalid envelope: " + errors.front(), std::move(errors));
  }
  return EnvelopeToJson(envelope);
}

jobclaim::v1::JobEnvelope DecodeEnvelope(const std::string& json) {
  jobclaim::v1::JobEnvelope envelope;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &envelope, options);
  if (!status.ok()) {
    std::string error = "malformed: " + std::string(status.message());
    throw util::InvalidEnvelope("invalid envelope: " + error, {error});
  }

  auto errors = ValidateEnvelope(envelope);
  if (!errors.empty()) {
    throw util::InvalidEnvelope("invalid envelope: " + errors.front(), std::move(errors));
  }
  return envelope;
}

jobclaim::v1::JobEnvelope NewEnvelope(const std::string& org_id, const std::string& entity_type, const std::string& entity_id,
                                      const std::string& idempotency_key, const google::protobuf::Struct& payload) {
  jobclaim::v1::JobEnvelope envelope;
  envelope.set_job_id(util::NewUuidString());
  envelope.set_trace_id(util::NewUuidString());
  envelope.set_org_id(org_id);
  envelope.set_idempotency_key(idempotency_key);
  envelope.set_entity_type(entity_type);
  envelope.set_entity_id(entity_id);
  envelope.set_attempt(1);
  envelope.set_created_at(util::ToRfc3339(util::Now()));
  *envelope.mutable_payload() = payload;
  return envelope;
}

} // namespace jobclaim::queue
