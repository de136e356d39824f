#pragma once

#include <cstdint>
#include <string>

namespace jobclaim::db::model {

struct DeadLetterRecord {
  std::string id; // UUID
  std::string original_queue;
  int64_t     original_job_id = 0;
  std::string idempotency_key;
  std::string original_payload; // JSON text, replayed verbatim
  std::string error_message;
  uint32_t    attempt_count = 0;
  std::string worker_id;

  uint64_t first_attempt_at_ms = 0;
  uint64_t moved_at_ms         = 0;
};

} // namespace jobclaim::db::model
