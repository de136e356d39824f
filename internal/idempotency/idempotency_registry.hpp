#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace jobclaim::idempotency {

enum class ClaimKind { Inserted, Reclaimed, AlreadyExists };

struct ClaimOutcome {
  ClaimKind             kind = ClaimKind::Inserted;
  db::model::JobStatus  existing_status = db::model::JobStatus::Processing;
  uint32_t              attempts        = 0;
  int64_t               holder_job_id   = 0;

  bool Claimed() const {
    return kind != ClaimKind::AlreadyExists;
  }
};

const char* ToString(ClaimKind kind);

/*
  Keyed record of job execution state.

  Claim() is a single insert-or-detect statement: a key can be held by
  one message at a time. A failed row, or a processing row whose holder is
  the same message (its lease expired mid-process), may be re-claimed;
  every successful claim increments attempts.
*/
class IdempotencyRegistry {
 public:
  explicit IdempotencyRegistry(std::shared_ptr<db::Repository> repository);

  ClaimOutcome Claim(const std::string& key, int64_t job_id, const std::string& queue, const std::string& worker_id);

  void Complete(const std::string& key, const std::string& result_json);
  void Complete(db::Transaction& tx, const std::string& key, const std::string& result_json);

  void Fail(const std::string& key, const std::string& error);
  void Fail(db::Transaction& tx, const std::string& key, const std::string& error);

  std::optional<db::model::ProcessedJobRecord> Get(const std::string& key);

  bool IsCompleted(const std::string& key);

  // attempts := 0; a non-completed key becomes re-claimable.
  void ResetAttempts(const std::string& key);

  std::vector<db::model::QueueJobStatsRecord> Stats();

 private:
  std::shared_ptr<db::Repository> repository_;
};

// "<queue>:hash:<hex digest of canonical payload JSON>"
std::string PayloadHashKey(const std::string& queue, const std::string& payload_json, const std::string& algorithm = "sha256");

} // namespace jobclaim::idempotency
