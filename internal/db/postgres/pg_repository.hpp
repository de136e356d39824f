#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace jobclaim::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result EnqueueMessage(Transaction&, model::MessageRecord&) override;
  std::vector<model::MessageRecord> LeaseMessages(Transaction&, const std::string& queue, uint32_t limit, uint64_t now_ms,
                                                  uint64_t visibility_deadline_ms) override;
  Result DeleteMessage(Transaction&, const std::string& queue, int64_t msg_id) override;
  Result SetMessageVisibility(Transaction&, const std::string& queue, int64_t msg_id, uint64_t visibility_deadline_ms) override;
  model::QueueMetricsRecord GetQueueMetrics(Transaction&, const std::string& queue, uint64_t now_ms) override;
  std::vector<std::string> ListQueues(Transaction&) override;

  model::ProcessedJobClaim ClaimProcessedJob(Transaction&, const model::ProcessedJobRecord&) override;
  std::optional<model::ProcessedJobRecord> GetProcessedJob(Transaction&, const std::string&) override;
  Result CompleteProcessedJob(Transaction&, const std::string& key, const std::string& result_json, uint64_t now_ms) override;
  Result FailProcessedJob(Transaction&, const std::string& key, const std::string& error, uint64_t now_ms) override;
  Result ResetProcessedJobAttempts(Transaction&, const std::string& key, uint64_t now_ms) override;
  std::vector<model::QueueJobStatsRecord> GetProcessedJobStats(Transaction&) override;

  Result InsertDeadLetter(Transaction&, const model::DeadLetterRecord&) override;
  std::optional<model::DeadLetterRecord> GetDeadLetter(Transaction&, const std::string&) override;
  std::vector<model::DeadLetterRecord> ListDeadLetters(Transaction&, const std::optional<std::string>& queue, uint32_t limit) override;
  Result DeleteDeadLetter(Transaction&, const std::string&) override;

  std::optional<model::ImportRunRecord> ClaimImportRun(Transaction&, const model::ImportRunRecord&, uint64_t stale_before_ms) override;
  std::optional<model::ImportRunRecord> GetImportRun(Transaction&, const std::string&) override;
  std::optional<model::ImportRunRecord> LockImportRun(Transaction&, const std::string&) override;
  std::optional<model::ImportRunRecord> FindImportRun(Transaction&, const std::string& source_system, const std::string& source_batch_id,
                                                      const std::string& file_hash) override;
  std::vector<model::ImportRunRecord> ListImportRuns(Transaction&, uint32_t limit) override;
  std::vector<model::ImportRunRecord> ListStaleImportRuns(Transaction&, uint64_t stale_before_ms) override;
  Result TouchImportRun(Transaction&, const std::string& run_id, const std::optional<std::string>& worker_id, uint64_t now_ms) override;
  Result UpdateImportRun(Transaction&, const model::ImportRunRecord&) override;

  Result InsertImportRow(Transaction&, const model::ImportRowRecord&) override;
  std::vector<model::ImportRowRecord> ListImportRows(Transaction&, const std::string& run_id) override;
  uint64_t CountImportRows(Transaction&, const std::string& run_id) override;
  uint64_t RollbackImportRows(Transaction&, const std::string& run_id, uint64_t now_ms) override;

  Result UpsertWorkerHeartbeat(Transaction&, const model::WorkerHeartbeatRecord&) override;
  std::vector<model::WorkerHeartbeatRecord> ListWorkerHeartbeats(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
