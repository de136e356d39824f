#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/dead_letter_record.hpp"
#include "internal/db/model/import_row_record.hpp"
#include "internal/db/model/import_run_record.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/processed_job_record.hpp"
#include "internal/db/model/worker_heartbeat_record.hpp"

namespace jobclaim::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Every claim/lease operation is a single conditional statement, so two
    transactions can never both observe "not claimed"
  - Timestamps are supplied by the caller (unix ms)

  The DB is the source of truth for:
    queued messages and their leases
    idempotency records
    dead letters
    import runs and staged rows
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  // Assigns msg_id.
  virtual Result EnqueueMessage(Transaction&, model::MessageRecord&) = 0;

  // Leases up to limit messages whose visibility deadline has passed:
  // deadline := visibility_deadline_ms, read_count += 1.
  virtual std::vector<model::MessageRecord> LeaseMessages(Transaction&, const std::string& queue, uint32_t limit, uint64_t now_ms,
                                                          uint64_t visibility_deadline_ms) = 0;

  virtual Result DeleteMessage(Transaction&, const std::string& queue, int64_t msg_id) = 0;

  virtual Result SetMessageVisibility(Transaction&, const std::string& queue, int64_t msg_id, uint64_t visibility_deadline_ms) = 0;

  virtual model::QueueMetricsRecord GetQueueMetrics(Transaction&, const std::string& queue, uint64_t now_ms) = 0;

  virtual std::vector<std::string> ListQueues(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Idempotency registry
  // ---------------------------------------------------------------------

  // Inserts the candidate (attempts=1), or re-claims an existing row that is
  // failed, or processing under the same job_id (attempts+1). Otherwise
  // returns the blocking row with kind AlreadyExists.
  virtual model::ProcessedJobClaim ClaimProcessedJob(Transaction&, const model::ProcessedJobRecord& candidate) = 0;

  virtual std::optional<model::ProcessedJobRecord> GetProcessedJob(Transaction&, const std::string& key) = 0;

  virtual Result CompleteProcessedJob(Transaction&, const std::string& key, const std::string& result_json, uint64_t now_ms) = 0;

  virtual Result FailProcessedJob(Transaction&, const std::string& key, const std::string& error, uint64_t now_ms) = 0;

  // attempts := 0 and a non-completed row becomes failed (re-claimable).
  virtual Result ResetProcessedJobAttempts(Transaction&, const std::string& key, uint64_t now_ms) = 0;

  virtual std::vector<model::QueueJobStatsRecord> GetProcessedJobStats(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Dead letters
  // ---------------------------------------------------------------------

  virtual Result InsertDeadLetter(Transaction&, const model::DeadLetterRecord&) = 0;

  virtual std::optional<model::DeadLetterRecord> GetDeadLetter(Transaction&, const std::string& id) = 0;

  // Oldest first.
  virtual std::vector<model::DeadLetterRecord> ListDeadLetters(Transaction&, const std::optional<std::string>& queue, uint32_t limit) = 0;

  virtual Result DeleteDeadLetter(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Import runs
  // ---------------------------------------------------------------------

  // Conditional upsert on (source_system, source_batch_id, file_hash).
  // Inserts the candidate, or takes over the existing row when it is failed,
  // rolled_back, or active with heartbeat_at_ms < stale_before_ms. Returns
  // the claimed row, or nullopt when the existing row is not re-claimable.
  // A takeover merges previous_worker_id / previous_status into
  // error_details and keeps rollback_reason and rolled_back_at_ms.
  virtual std::optional<model::ImportRunRecord> ClaimImportRun(Transaction&, const model::ImportRunRecord& candidate, uint64_t stale_before_ms) = 0;

  virtual std::optional<model::ImportRunRecord> GetImportRun(Transaction&, const std::string& run_id) = 0;

  // Same as GetImportRun but locks the row until the transaction ends.
  virtual std::optional<model::ImportRunRecord> LockImportRun(Transaction&, const std::string& run_id) = 0;

  virtual std::optional<model::ImportRunRecord> FindImportRun(Transaction&, const std::string& source_system, const std::string& source_batch_id,
                                                              const std::string& file_hash) = 0;

  // Newest claim first.
  virtual std::vector<model::ImportRunRecord> ListImportRuns(Transaction&, uint32_t limit) = 0;

  // Active runs whose heartbeat is older than stale_before_ms.
  virtual std::vector<model::ImportRunRecord> ListStaleImportRuns(Transaction&, uint64_t stale_before_ms) = 0;

  // Refreshes heartbeat_at_ms of an active run. When worker_id is set only
  // the current holder matches. NotFound when nothing matched.
  virtual Result TouchImportRun(Transaction&, const std::string& run_id, const std::optional<std::string>& worker_id, uint64_t now_ms) = 0;

  virtual Result UpdateImportRun(Transaction&, const model::ImportRunRecord&) = 0;

  // ---------------------------------------------------------------------
  // Import rows
  // ---------------------------------------------------------------------

  // Insert-or-ignore on dedupe_key among rows that are not rolled_back.
  // Rolled back rows are never rewritten; a re-import adds a new row next
  // to them. AlreadyExists when the row was ignored.
  virtual Result InsertImportRow(Transaction&, const model::ImportRowRecord&) = 0;

  virtual std::vector<model::ImportRowRecord> ListImportRows(Transaction&, const std::string& run_id) = 0;

  // Rows of the run that are not rolled_back.
  virtual uint64_t CountImportRows(Transaction&, const std::string& run_id) = 0;

  // Returns the number of rows flipped to rolled_back.
  virtual uint64_t RollbackImportRows(Transaction&, const std::string& run_id, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Worker heartbeats
  // ---------------------------------------------------------------------

  virtual Result UpsertWorkerHeartbeat(Transaction&, const model::WorkerHeartbeatRecord&) = 0;

  virtual std::vector<model::WorkerHeartbeatRecord> ListWorkerHeartbeats(Transaction&) = 0;
};

} // namespace jobclaim::db
