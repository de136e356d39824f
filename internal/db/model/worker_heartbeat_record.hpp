#pragma once

#include <cstdint>
#include <string>

namespace jobclaim::db::model {

// Liveness row, one per worker instance. status: starting|healthy|draining|stopped
struct WorkerHeartbeatRecord {
  std::string worker_id;
  std::string queue_name;
  std::string hostname;
  int64_t     pid = 0;
  std::string status;

  uint64_t jobs_processed = 0;
  uint64_t jobs_failed    = 0;
  uint64_t jobs_skipped   = 0;
  uint64_t jobs_invalid   = 0;

  uint64_t last_seen_at_ms = 0;
};

} // namespace jobclaim::db::model
