#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace jobclaim::dlq {

struct ReplayResult {
  std::string dead_letter_id;
  bool        success    = false;
  int64_t     new_msg_id = 0;
  std::string original_queue;
  std::string error;
};

/*
  Dead-letter store and operator replay.

  Entries are written only by the worker loop (and by the producer
  boundary for envelopes that fail validation). Listing never mutates.
  Replay moves the payload back onto its original queue, gives the
  idempotency key a fresh retry budget and drops the entry, atomically.
*/
class DeadLetterQueue {
 public:
  explicit DeadLetterQueue(std::shared_ptr<db::Repository> repository);

  // Fills id and moved_at_ms when empty. Returns the entry id.
  std::string Record(db::model::DeadLetterRecord entry);

  // Same, inside a caller-owned transaction.
  std::string Record(db::Transaction& tx, db::model::DeadLetterRecord& entry);

  std::vector<db::model::DeadLetterRecord> List(const std::optional<std::string>& queue = std::nullopt, uint32_t limit = 100);

  std::optional<db::model::DeadLetterRecord> Get(const std::string& id);

  // Unknown id -> success=false.
  ReplayResult Replay(const std::string& id);

  // Oldest first. dry_run reports what would be replayed without mutating.
  std::vector<ReplayResult> ReplayAll(const std::optional<std::string>& queue, uint32_t limit, bool dry_run);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace jobclaim::dlq
