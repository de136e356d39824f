#include "internal/batch/batch_claim_coordinator.hpp"

#include <stdexcept>

#include "internal/batch/dedupe_key.hpp"
#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobclaim::batch {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;
using db::model::ImportRowStatus;
using db::model::ImportRunStatus;

namespace {

google::protobuf::Struct DetailsOf(const db::model::ImportRunRecord& run) {
  if (run.error_details.empty()) return {};
  try {
    return util::ParseJsonObject(run.error_details);
  } catch (const std::invalid_argument& e) {
    JOBCLAIM_LOG_WARN("discarding unparsable error_details", {StringField("run_id", run.run_id), StringField("error", e.what())});
    return {};
  }
}

void CheckHolder(const db::model::ImportRunRecord& run, const std::optional<std::string>& worker_id, const char* op) {
  if (worker_id && run.worker_id != *worker_id) {
    throw util::ClaimConflict(std::string(op) + ": import run " + run.run_id + " is held by " + run.worker_id + ", not " + *worker_id, run.run_id);
  }
}

std::string RowDedupeKey(const std::string& source_system, const std::string& natural_key) {
  if (source_system.empty()) throw std::invalid_argument("source_system is required");
  if (NormalizeNaturalKey(natural_key).empty()) throw std::invalid_argument("natural_key is empty after normalization");
  return DedupeKey(source_system, natural_key);
}

uint64_t StaleBefore(uint64_t now_ms, std::chrono::milliseconds stale_after) {
  const auto window = static_cast<uint64_t>(stale_after.count());
  return now_ms > window ? now_ms - window : 0;
}

} // namespace

const char* ToString(ClaimStatus status) {
  switch (status) {
    case ClaimStatus::Claimed:
      return "claimed";
    case ClaimStatus::Duplicate:
      return "duplicate";
    case ClaimStatus::InProgress:
      return "in_progress";
  }
  return "in_progress";
}

BatchClaimCoordinator::BatchClaimCoordinator(std::shared_ptr<db::Repository> repository, CoordinatorOptions options)
    : repository_(std::move(repository)), options_(options) {
  if (options_.stale_after.count() <= 0) throw std::invalid_argument("stale_after must be positive");
}

ClaimResult BatchClaimCoordinator::Claim(const std::string& source_system, const std::string& source_batch_id, const std::string& file_hash,
                                         const std::string& filename, const std::string& import_kind, const std::string& worker_id) {
  if (source_system.empty() || source_batch_id.empty() || file_hash.empty()) {
    throw std::invalid_argument("source_system, source_batch_id and file_hash are required");
  }
  if (worker_id.empty()) throw std::invalid_argument("worker_id is required");

  const auto                now = util::NowMillis();
  db::model::ImportRunRecord candidate;
  candidate.run_id          = util::NewUuidString();
  candidate.source_system   = source_system;
  candidate.source_batch_id = source_batch_id;
  candidate.file_hash       = file_hash;
  candidate.filename        = filename;
  candidate.import_kind     = import_kind;
  candidate.status          = ImportRunStatus::Claimed;
  candidate.claimed_at_ms   = now;
  candidate.heartbeat_at_ms = now;
  candidate.worker_id       = worker_id;

  auto tx      = repository_->Begin();
  auto claimed = repository_->ClaimImportRun(*tx, candidate, StaleBefore(now, options_.stale_after));
  std::optional<db::model::ImportRunRecord> existing;
  if (!claimed) existing = repository_->FindImportRun(*tx, source_system, source_batch_id, file_hash);
  tx->Commit();

  ClaimResult result;
  if (claimed) {
    result.run_id = claimed->run_id;
    result.status = ClaimStatus::Claimed;

    if (claimed->run_id != candidate.run_id) {
      auto        details = DetailsOf(*claimed);
      const auto& fields  = details.fields();
      auto        worker  = fields.find("previous_worker_id");
      auto        status  = fields.find("previous_status");
      if (worker != fields.end()) result.holder_worker_id = worker->second.string_value();
      const std::string previous_status = status != fields.end() ? status->second.string_value() : "";
      result.taken_over = previous_status == "claimed" || previous_status == "in_progress";

      if (result.taken_over) {
        JOBCLAIM_LOG_WARN("import run taken over", {StringField("run_id", result.run_id), StringField("worker_id", worker_id),
                                                     StringField("previous_worker_id", result.holder_worker_id)});
      } else {
        JOBCLAIM_LOG_INFO("import run re-claimed", {StringField("run_id", result.run_id), StringField("worker_id", worker_id),
                                                    StringField("previous_status", previous_status)});
      }
    } else {
      JOBCLAIM_LOG_INFO("import run claimed", {StringField("run_id", result.run_id), StringField("source_system", source_system),
                                               StringField("source_batch_id", source_batch_id), StringField("worker_id", worker_id)});
    }
    return result;
  }

  if (!existing) {
    throw util::StorageError("import run claim lost its conflicting row for " + source_system + "/" + source_batch_id);
  }

  result.run_id           = existing->run_id;
  result.holder_worker_id = existing->worker_id;
  result.status           = existing->status == ImportRunStatus::Completed ? ClaimStatus::Duplicate : ClaimStatus::InProgress;

  JOBCLAIM_LOG_INFO("import run not claimed", {StringField("run_id", result.run_id), StringField("outcome", ToString(result.status)),
                                               StringField("holder", result.holder_worker_id)});
  return result;
}

bool BatchClaimCoordinator::Heartbeat(const std::string& run_id, const std::optional<std::string>& worker_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->TouchImportRun(*tx, run_id, worker_id, util::NowMillis());
  if (result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfDbError(result, "heartbeat import run " + run_id);
  tx->Commit();
  return true;
}

bool BatchClaimCoordinator::MarkInProgress(const std::string& run_id, const std::string& worker_id) {
  auto tx  = repository_->Begin();
  auto run = repository_->LockImportRun(*tx, run_id);
  if (!run || run->worker_id != worker_id || !db::model::IsActive(run->status)) {
    tx->Rollback();
    return false;
  }

  if (run->status == ImportRunStatus::Claimed) {
    run->status          = ImportRunStatus::InProgress;
    run->heartbeat_at_ms = util::NowMillis();
    db::ThrowIfDbError(repository_->UpdateImportRun(*tx, *run), "mark import run in progress");
  }
  tx->Commit();
  return true;
}

bool BatchClaimCoordinator::Finalize(const std::string& run_id, const RowCounts& counts,
                                     const std::optional<google::protobuf::Struct>& error_details, bool mark_completed,
                                     const std::optional<std::string>& worker_id) {
  auto tx  = repository_->Begin();
  auto run = repository_->LockImportRun(*tx, run_id);
  if (!run) {
    tx->Rollback();
    return false;
  }
  if (run->status == ImportRunStatus::RolledBack) {
    throw util::InvalidState("cannot finalize rolled back import run " + run_id);
  }
  CheckHolder(*run, worker_id, "finalize");

  const bool fatal = error_details && error_details->fields().count("fatal") > 0;

  run->status          = (fatal || !mark_completed) ? ImportRunStatus::Failed : ImportRunStatus::Completed;
  run->rows_fetched    = counts.fetched;
  run->rows_inserted   = counts.inserted;
  run->rows_skipped    = counts.skipped;
  run->rows_errored    = counts.errored;
  run->completed_at_ms = util::NowMillis();
  run->error_details   = error_details ? util::ToJson(*error_details) : std::string();

  db::ThrowIfDbError(repository_->UpdateImportRun(*tx, *run), "finalize import run " + run_id);
  tx->Commit();

  JOBCLAIM_LOG_INFO("import run finalized",
                    {StringField("run_id", run_id), StringField("status", db::model::ToString(run->status)),
                     IntField("rows_fetched", static_cast<int64_t>(counts.fetched)), IntField("rows_inserted", static_cast<int64_t>(counts.inserted)),
                     IntField("rows_skipped", static_cast<int64_t>(counts.skipped)), IntField("rows_errored", static_cast<int64_t>(counts.errored))});
  return true;
}

ReconcileResult BatchClaimCoordinator::Reconcile(const std::string& run_id, const std::optional<uint64_t>& expected_count,
                                                 const std::optional<std::string>& worker_id) {
  auto tx  = repository_->Begin();
  auto run = repository_->LockImportRun(*tx, run_id);
  if (!run) throw util::NotFound("import run " + run_id + " not found");
  if (run->status == ImportRunStatus::RolledBack) {
    throw util::InvalidState("cannot reconcile rolled back import run " + run_id);
  }
  CheckHolder(*run, worker_id, "reconcile");

  ReconcileResult result;
  result.actual_count   = repository_->CountImportRows(*tx, run_id);
  result.expected_count = expected_count ? *expected_count : run->rows_fetched;
  result.delta          = static_cast<int64_t>(result.expected_count) - static_cast<int64_t>(result.actual_count);
  result.is_valid       = result.delta == 0;

  RowCounts staged;
  for (const auto& row : repository_->ListImportRows(*tx, run_id)) {
    switch (row.status) {
      case ImportRowStatus::Pending:
      case ImportRowStatus::Promoted:
        staged.inserted++;
        break;
      case ImportRowStatus::Skipped:
        staged.skipped++;
        break;
      case ImportRowStatus::Failed:
        staged.errored++;
        break;
      case ImportRowStatus::RolledBack:
        break;
    }
  }

  run->status          = result.is_valid ? ImportRunStatus::Completed : ImportRunStatus::Failed;
  run->completed_at_ms = util::NowMillis();
  run->rows_fetched    = result.expected_count;
  run->rows_inserted   = staged.inserted;
  run->rows_skipped    = staged.skipped;
  run->rows_errored    = staged.errored;

  if (result.is_valid) {
    run->error_details.clear();
  } else {
    google::protobuf::Struct details;
    auto&                    fields = *details.mutable_fields();
    fields["reconciliation_failed"].set_bool_value(true);
    fields["expected_count"].set_number_value(static_cast<double>(result.expected_count));
    fields["actual_count"].set_number_value(static_cast<double>(result.actual_count));
    fields["delta"].set_number_value(static_cast<double>(result.delta));
    run->error_details = util::ToJson(details);
  }

  db::ThrowIfDbError(repository_->UpdateImportRun(*tx, *run), "reconcile import run " + run_id);
  tx->Commit();

  if (result.is_valid) {
    JOBCLAIM_LOG_INFO("import run reconciled", {StringField("run_id", run_id), IntField("rows", static_cast<int64_t>(result.actual_count))});
  } else {
    JOBCLAIM_LOG_WARN("import run reconciliation mismatch",
                      {StringField("run_id", run_id), IntField("expected", static_cast<int64_t>(result.expected_count)),
                       IntField("actual", static_cast<int64_t>(result.actual_count)), IntField("delta", result.delta)});
  }
  return result;
}

RollbackResult BatchClaimCoordinator::Rollback(const std::string& run_id, const std::string& reason) {
  RollbackResult result;

  auto tx  = repository_->Begin();
  auto run = repository_->LockImportRun(*tx, run_id);
  if (!run) {
    tx->Rollback();
    return result;
  }

  result.success = true;
  if (run->status == ImportRunStatus::RolledBack) {
    tx->Rollback();
    return result;
  }

  const auto now       = util::NowMillis();
  result.rows_affected = repository_->RollbackImportRows(*tx, run_id, now);

  auto  details = DetailsOf(*run);
  auto& fields  = *details.mutable_fields();
  fields["rollback_reason"].set_string_value(reason);
  fields["rollback_at"].set_string_value(util::ToRfc3339(util::FromUnixMillis(now)));
  fields["rows_affected"].set_number_value(static_cast<double>(result.rows_affected));

  run->status            = ImportRunStatus::RolledBack;
  run->rollback_reason   = reason;
  run->rolled_back_at_ms = now;
  run->error_details     = util::ToJson(details);

  db::ThrowIfDbError(repository_->UpdateImportRun(*tx, *run), "rollback import run " + run_id);
  tx->Commit();

  JOBCLAIM_LOG_WARN("import run rolled back", {StringField("run_id", run_id), StringField("reason", reason),
                                               IntField("rows_affected", static_cast<int64_t>(result.rows_affected))});
  return result;
}

bool BatchClaimCoordinator::InsertRow(const std::string& run_id, uint64_t row_number, const std::string& source_system,
                                      const std::string& natural_key, const std::string& payload_json) {
  db::model::ImportRowRecord row;
  row.run_id     = run_id;
  row.row_number = row_number;
  row.dedupe_key = RowDedupeKey(source_system, natural_key);
  row.payload    = payload_json;
  row.status     = ImportRowStatus::Pending;
  return StageRow(std::move(row));
}

bool BatchClaimCoordinator::RecordRowError(const std::string& run_id, uint64_t row_number, const std::string& source_system,
                                           const std::string& natural_key, const std::string& payload_json, const std::string& error) {
  db::model::ImportRowRecord row;
  row.run_id        = run_id;
  row.row_number    = row_number;
  row.dedupe_key    = RowDedupeKey(source_system, natural_key);
  row.payload       = payload_json;
  row.status        = ImportRowStatus::Failed;
  row.error_message = error;
  return StageRow(std::move(row));
}

bool BatchClaimCoordinator::StageRow(db::model::ImportRowRecord row) {
  const auto now    = util::NowMillis();
  row.created_at_ms = now;
  row.updated_at_ms = now;

  auto tx     = repository_->Begin();
  auto result = repository_->InsertImportRow(*tx, row);
  if (result.code == db::ErrorCode::AlreadyExists) {
    tx->Rollback();
    JOBCLAIM_LOG_DEBUG("duplicate import row skipped", {StringField("run_id", row.run_id), IntField("row", static_cast<int64_t>(row.row_number))});
    return false;
  }
  db::ThrowIfDbError(result, "stage import row");
  tx->Commit();
  return true;
}

std::optional<db::model::ImportRunRecord> BatchClaimCoordinator::Get(const std::string& run_id) {
  auto tx  = repository_->Begin();
  auto run = repository_->GetImportRun(*tx, run_id);
  tx->Commit();
  return run;
}

std::vector<db::model::ImportRunRecord> BatchClaimCoordinator::Recent(uint32_t limit) {
  auto tx   = repository_->Begin();
  auto runs = repository_->ListImportRuns(*tx, limit);
  tx->Commit();
  return runs;
}

std::vector<db::model::ImportRunRecord> BatchClaimCoordinator::Stale() {
  auto tx   = repository_->Begin();
  auto runs = repository_->ListStaleImportRuns(*tx, StaleBefore(util::NowMillis(), options_.stale_after));
  tx->Commit();
  return runs;
}

std::vector<db::model::ImportRowRecord> BatchClaimCoordinator::Rows(const std::string& run_id) {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListImportRows(*tx, run_id);
  tx->Commit();
  return rows;
}

std::string ComputeFileHash(const std::string& path) {
  return util::Sha256File(path);
}

std::string ComputeContentHash(const std::string& content) {
  return util::Sha256Hex(content);
}

} // namespace jobclaim::batch
