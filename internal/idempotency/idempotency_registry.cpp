#include "internal/idempotency/idempotency_registry.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace jobclaim::idempotency {

const char* ToString(ClaimKind kind) {
  switch (kind) {
    case ClaimKind::Inserted:
      return "inserted";
    case ClaimKind::Reclaimed:
      return "reclaimed";
    case ClaimKind::AlreadyExists:
      return "already_exists";
  }
  return "already_exists";
}

IdempotencyRegistry::IdempotencyRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

ClaimOutcome IdempotencyRegistry::Claim(const std::string& key, int64_t job_id, const std::string& queue, const std::string& worker_id) {
  const auto                now = util::NowMillis();
  db::model::ProcessedJobRecord candidate;
  candidate.idempotency_key = key;
  candidate.job_id          = job_id;
  candidate.queue_name      = queue;
  candidate.worker_id       = worker_id;
  candidate.created_at_ms   = now;
  candidate.updated_at_ms   = now;

  auto tx    = repository_->Begin();
  auto claim = repository_->ClaimProcessedJob(*tx, candidate);
  tx->Commit();

  ClaimOutcome outcome;
  switch (claim.kind) {
    case db::model::ProcessedJobClaim::Kind::Inserted:
      outcome.kind = ClaimKind::Inserted;
      break;
    case db::model::ProcessedJobClaim::Kind::Reclaimed:
      outcome.kind = ClaimKind::Reclaimed;
      break;
    case db::model::ProcessedJobClaim::Kind::AlreadyExists:
      outcome.kind = ClaimKind::AlreadyExists;
      break;
  }
  outcome.existing_status = claim.record.status;
  outcome.attempts        = claim.record.attempts;
  outcome.holder_job_id   = claim.record.job_id;
  return outcome;
}

void IdempotencyRegistry::Complete(const std::string& key, const std::string& result_json) {
  auto tx = repository_->Begin();
  Complete(*tx, key, result_json);
  tx->Commit();
}

void IdempotencyRegistry::Complete(db::Transaction& tx, const std::string& key, const std::string& result_json) {
  db::ThrowIfDbError(repository_->CompleteProcessedJob(tx, key, result_json, util::NowMillis()), "complete job " + key);
}

void IdempotencyRegistry::Fail(const std::string& key, const std::string& error) {
  auto tx = repository_->Begin();
  Fail(*tx, key, error);
  tx->Commit();
}

void IdempotencyRegistry::Fail(db::Transaction& tx, const std::string& key, const std::string& error) {
  db::ThrowIfDbError(repository_->FailProcessedJob(tx, key, error, util::NowMillis()), "fail job " + key);
}

std::optional<db::model::ProcessedJobRecord> IdempotencyRegistry::Get(const std::string& key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetProcessedJob(*tx, key);
  tx->Commit();
  return record;
}

bool IdempotencyRegistry::IsCompleted(const std::string& key) {
  auto record = Get(key);
  return record && record->status == db::model::JobStatus::Completed;
}

void IdempotencyRegistry::ResetAttempts(const std::string& key) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->ResetProcessedJobAttempts(*tx, key, util::NowMillis()), "reset attempts " + key);
  tx->Commit();
}

std::vector<db::model::QueueJobStatsRecord> IdempotencyRegistry::Stats() {
  auto tx    = repository_->Begin();
  auto stats = repository_->GetProcessedJobStats(*tx);
  tx->Commit();
  return stats;
}

std::string PayloadHashKey(const std::string& queue, const std::string& payload_json, const std::string& algorithm) {
  return queue + ":hash:" + util::HexDigest(algorithm, util::CanonicalJson(payload_json));
}

} // namespace jobclaim::idempotency
