#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/api/repository.hpp"

namespace jobclaim::batch {

enum class ClaimStatus { Claimed, Duplicate, InProgress };

const char* ToString(ClaimStatus status);

struct ClaimResult {
  std::string run_id;
  ClaimStatus status = ClaimStatus::Claimed;

  // Claimed only: the previous holder's active claim had gone stale. A plain
  // re-claim of a failed or rolled back run is not a takeover.
  bool        taken_over = false;
  std::string holder_worker_id;

  bool IsClaimed() const {
    return status == ClaimStatus::Claimed;
  }
};

struct ReconcileResult {
  bool     is_valid       = false;
  uint64_t expected_count = 0;
  uint64_t actual_count   = 0;
  int64_t  delta          = 0; // expected - actual
};

struct RollbackResult {
  bool     success       = false;
  uint64_t rows_affected = 0;
};

struct RowCounts {
  uint64_t fetched  = 0;
  uint64_t inserted = 0;
  uint64_t skipped  = 0;
  uint64_t errored  = 0;
};

struct CoordinatorOptions {
  // An active run whose heartbeat is older than this may be taken over.
  std::chrono::milliseconds stale_after{std::chrono::minutes(30)};
};

/*
  BatchClaimCoordinator

  Batch-level idempotency for bulk imports, keyed by
  (source_system, source_batch_id, file_hash).

    Claim      -> claimed | duplicate | in_progress
    Heartbeat  -> keeps an active claim fresh
    Finalize   -> counts + completed/failed
    Reconcile  -> expected vs staged row count, failed on mismatch
    Rollback   -> soft delete of the run and its rows

  Claim is one conditional upsert, so two workers can never both win the
  same tuple. A completed run makes every later claim a duplicate.
*/
class BatchClaimCoordinator {
 public:
  explicit BatchClaimCoordinator(std::shared_ptr<db::Repository> repository, CoordinatorOptions options = {});

  ClaimResult Claim(const std::string& source_system, const std::string& source_batch_id, const std::string& file_hash,
                    const std::string& filename, const std::string& import_kind, const std::string& worker_id);

  // false when the run is unknown, no longer active, or (with worker_id)
  // held by another worker.
  bool Heartbeat(const std::string& run_id, const std::optional<std::string>& worker_id = std::nullopt);

  // claimed -> in_progress. false unless worker_id holds the claim.
  bool MarkInProgress(const std::string& run_id, const std::string& worker_id);

  // Status becomes completed, or failed when mark_completed is false or
  // error_details has a "fatal" key. false for an unknown run.
  // InvalidState for a rolled back run. With worker_id, ClaimConflict
  // unless that worker holds the claim.
  bool Finalize(const std::string& run_id, const RowCounts& counts, const std::optional<google::protobuf::Struct>& error_details = std::nullopt,
                bool mark_completed = true, const std::optional<std::string>& worker_id = std::nullopt);

  // expected defaults to rows_fetched. NotFound / InvalidState (rolled back).
  // With worker_id, ClaimConflict unless that worker holds the claim.
  ReconcileResult Reconcile(const std::string& run_id, const std::optional<uint64_t>& expected_count = std::nullopt,
                            const std::optional<std::string>& worker_id = std::nullopt);

  // Idempotent. success=false only for an unknown run.
  RollbackResult Rollback(const std::string& run_id, const std::string& reason = "manual_rollback");

  // Row-level dedupe. false when the dedupe key is already staged.
  // invalid_argument when source_system or the normalized natural key is
  // empty.
  bool InsertRow(const std::string& run_id, uint64_t row_number, const std::string& source_system, const std::string& natural_key,
                 const std::string& payload_json);

  bool RecordRowError(const std::string& run_id, uint64_t row_number, const std::string& source_system, const std::string& natural_key,
                      const std::string& payload_json, const std::string& error);

  std::optional<db::model::ImportRunRecord> Get(const std::string& run_id);

  std::vector<db::model::ImportRunRecord> Recent(uint32_t limit = 20);

  // Active runs past the staleness window.
  std::vector<db::model::ImportRunRecord> Stale();

  std::vector<db::model::ImportRowRecord> Rows(const std::string& run_id);

  const CoordinatorOptions& Options() const {
    return options_;
  }

 private:
  bool StageRow(db::model::ImportRowRecord row);

  std::shared_ptr<db::Repository> repository_;
  CoordinatorOptions              options_;
};

// SHA-256 hex of a file, used as the claim's file_hash.
std::string ComputeFileHash(const std::string& path);

std::string ComputeContentHash(const std::string& content);

} // namespace jobclaim::batch
