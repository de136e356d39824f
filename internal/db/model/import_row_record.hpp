#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jobclaim::db::model {

enum class ImportRowStatus { Pending, Promoted, Skipped, Failed, RolledBack };

inline const char* ToString(ImportRowStatus status) {
  switch (status) {
    case ImportRowStatus::Pending:
      return "pending";
    case ImportRowStatus::Promoted:
      return "promoted";
    case ImportRowStatus::Skipped:
      return "skipped";
    case ImportRowStatus::Failed:
      return "failed";
    case ImportRowStatus::RolledBack:
      return "rolled_back";
  }
  return "pending";
}

inline std::optional<ImportRowStatus> ParseImportRowStatus(std::string_view value) {
  if (value == "pending") return ImportRowStatus::Pending;
  if (value == "promoted") return ImportRowStatus::Promoted;
  if (value == "skipped") return ImportRowStatus::Skipped;
  if (value == "failed") return ImportRowStatus::Failed;
  if (value == "rolled_back") return ImportRowStatus::RolledBack;
  return std::nullopt;
}

/*
  Staged import row. dedupe_key is unique among rows that are not
  rolled_back; rolled back rows stay in place for audit.
*/
struct ImportRowRecord {
  uint64_t    row_id = 0; // assigned on insert
  std::string run_id;
  uint64_t    row_number = 0;
  std::string dedupe_key;
  std::string payload; // JSON text

  ImportRowStatus status = ImportRowStatus::Pending;
  std::string     error_message;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace jobclaim::db::model
