#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "jobclaim/v1/envelope.pb.h"

namespace jobclaim::queue {

constexpr std::size_t kMaxIdempotencyKeyLength = 512;

/*
  JobEnvelope codec.

  Envelopes travel as JSON text using the proto field names
  (job_id, trace_id, ...). Decoding rejects unknown fields.
*/

// Structural checks. Empty result means valid.
std::vector<std::string> ValidateEnvelope(const jobclaim::v1::JobEnvelope& envelope);

// JSON text without validation, for quarantining a rejected envelope.
// Throws std::runtime_error when protobuf cannot print it.
std::string EnvelopeToJson(const jobclaim::v1::JobEnvelope& envelope);

// Throws util::InvalidEnvelope when the envelope does not validate.
std::string EncodeEnvelope(const jobclaim::v1::JobEnvelope& envelope);

// Throws util::InvalidEnvelope on malformed JSON or failed validation.
jobclaim::v1::JobEnvelope DecodeEnvelope(const std::string& json);

// Fresh envelope: random job_id and trace_id, attempt 1, created_at now.
jobclaim::v1::JobEnvelope NewEnvelope(const std::string& org_id, const std::string& entity_type, const std::string& entity_id,
                                      const std::string& idempotency_key, const google::protobuf::Struct& payload);

} // namespace jobclaim::queue
