#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobclaim::db::model {

enum class JobStatus { Processing, Completed, Failed };

inline const char* ToString(JobStatus status) {
  switch (status) {
    case JobStatus::Processing:
      return "processing";
    case JobStatus::Completed:
      return "completed";
    case JobStatus::Failed:
      return "failed";
  }
  return "processing";
}

inline std::optional<JobStatus> ParseJobStatus(std::string_view value) {
  if (value == "processing") return JobStatus::Processing;
  if (value == "completed") return JobStatus::Completed;
  if (value == "failed") return JobStatus::Failed;
  return std::nullopt;
}

/*
  Idempotency registry row. One row per idempotency_key.

  job_id is the msg_id of the message that holds (or last held) the claim.
  Failed rows are retried by incrementing attempts, never by deleting.
*/
struct ProcessedJobRecord {
  std::string idempotency_key;
  int64_t     job_id = 0;
  std::string queue_name;
  std::string worker_id;

  JobStatus status   = JobStatus::Processing;
  uint32_t  attempts = 0;

  std::string result; // JSON text, set on completion
  std::string last_error;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// Outcome of the registry's single insert-or-detect statement.
struct ProcessedJobClaim {
  enum class Kind { Inserted, Reclaimed, AlreadyExists };

  Kind               kind = Kind::Inserted;
  ProcessedJobRecord record; // row after the claim, or the blocking row
};

struct QueueJobStatsRecord {
  std::string queue_name;
  uint64_t    processing = 0;
  uint64_t    completed  = 0;
  uint64_t    failed     = 0;
};

} // namespace jobclaim::db::model
