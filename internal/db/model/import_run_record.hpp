#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobclaim::db::model {

/*
  Persisted status of an import run. "duplicate" is never stored; it is
  only a claim outcome.
*/
enum class ImportRunStatus { Claimed, InProgress, Completed, Failed, RolledBack };

inline const char* ToString(ImportRunStatus status) {
  switch (status) {
    case ImportRunStatus::Claimed:
      return "claimed";
    case ImportRunStatus::InProgress:
      return "in_progress";
    case ImportRunStatus::Completed:
      return "completed";
    case ImportRunStatus::Failed:
      return "failed";
    case ImportRunStatus::RolledBack:
      return "rolled_back";
  }
  return "claimed";
}

inline std::optional<ImportRunStatus> ParseImportRunStatus(std::string_view value) {
  if (value == "claimed") return ImportRunStatus::Claimed;
  if (value == "in_progress") return ImportRunStatus::InProgress;
  if (value == "completed") return ImportRunStatus::Completed;
  if (value == "failed") return ImportRunStatus::Failed;
  if (value == "rolled_back") return ImportRunStatus::RolledBack;
  return std::nullopt;
}

inline bool IsActive(ImportRunStatus status) {
  return status == ImportRunStatus::Claimed || status == ImportRunStatus::InProgress;
}

/*
  One row per (source_system, source_batch_id, file_hash).

  Never hard-deleted. A re-claim reuses the row and its run_id.
*/
struct ImportRunRecord {
  std::string run_id; // UUID
  std::string source_system;
  std::string source_batch_id;
  std::string file_hash;
  std::string filename;
  std::string import_kind;

  ImportRunStatus status = ImportRunStatus::Claimed;

  uint64_t rows_fetched  = 0;
  uint64_t rows_inserted = 0;
  uint64_t rows_skipped  = 0;
  uint64_t rows_errored  = 0;

  uint64_t claimed_at_ms   = 0;
  uint64_t heartbeat_at_ms = 0;
  uint64_t completed_at_ms = 0; // 0 = not finished

  std::string worker_id;
  std::string error_details; // JSON object text, empty when unset

  std::string rollback_reason;
  uint64_t    rolled_back_at_ms = 0;
};

} // namespace jobclaim::db::model
