#pragma once

#include <cstdint>
#include <string>

namespace jobclaim::db::model {

/*
  Queued message row.

  Owned by MessageStore. A message is leased while
  visibility_deadline_ms is in the future; read_count counts leases.
*/
struct MessageRecord {
  std::string queue_name;
  int64_t     msg_id = 0; // assigned on enqueue, monotonic per store
  std::string payload;    // JSON text

  uint64_t enqueued_at_ms         = 0;
  uint32_t read_count             = 0;
  uint64_t visibility_deadline_ms = 0;
};

struct QueueMetricsRecord {
  std::string queue_name;
  uint64_t    total         = 0;
  uint64_t    in_flight     = 0;
  uint64_t    readable      = 0;
  uint64_t    oldest_age_ms = 0;
};

} // namespace jobclaim::db::model
