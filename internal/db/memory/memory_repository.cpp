#include "memory_repository.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/util/json.hpp"
#include "memory_tx.hpp"

namespace jobclaim::db::memory {

namespace {

std::string TupleKey(const std::string& source_system, const std::string& source_batch_id, const std::string& file_hash) {
  return source_system + "#" + source_batch_id + "#" + file_hash;
}

// Merged into the existing details so a rollback audit survives the re-claim.
std::string TakeoverDetails(const model::ImportRunRecord& previous) {
  google::protobuf::Struct details;
  if (!previous.error_details.empty()) {
    try {
      details = util::ParseJsonObject(previous.error_details);
    } catch (const std::invalid_argument&) {
      details.Clear();
    }
  }
  (*details.mutable_fields())["previous_worker_id"].set_string_value(previous.worker_id);
  (*details.mutable_fields())["previous_status"].set_string_value(model::ToString(previous.status));
  return util::ToJson(details);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result MemoryRepository::EnqueueMessage(Transaction& t, model::MessageRecord& r) {
  auto& s  = TX(t).Mutable();
  r.msg_id = s.next_msg_id++;
  s.messages[r.msg_id] = r;
  return Result::Ok();
}

std::vector<model::MessageRecord> MemoryRepository::LeaseMessages(Transaction& t, const std::string& queue, uint32_t limit, uint64_t now_ms,
                                                                  uint64_t visibility_deadline_ms) {
  auto&                             s = TX(t).Mutable();
  std::vector<model::MessageRecord> out;
  for (auto& [_, m] : s.messages) {
    if (out.size() >= limit) break;
    if (m.queue_name != queue || m.visibility_deadline_ms > now_ms) continue;
    m.visibility_deadline_ms = visibility_deadline_ms;
    m.read_count++;
    out.push_back(m);
  }
  return out;
}

Result MemoryRepository::DeleteMessage(Transaction& t, const std::string& queue, int64_t msg_id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.messages.find(msg_id);
  if (it == s.messages.end() || it->second.queue_name != queue) return Result::Err(ErrorCode::NotFound);
  s.messages.erase(it);
  return Result::Ok();
}

Result MemoryRepository::SetMessageVisibility(Transaction& t, const std::string& queue, int64_t msg_id, uint64_t visibility_deadline_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.messages.find(msg_id);
  if (it == s.messages.end() || it->second.queue_name != queue) return Result::Err(ErrorCode::NotFound);
  it->second.visibility_deadline_ms = visibility_deadline_ms;
  return Result::Ok();
}

model::QueueMetricsRecord MemoryRepository::GetQueueMetrics(Transaction& t, const std::string& queue, uint64_t now_ms) {
  model::QueueMetricsRecord out;
  out.queue_name = queue;
  for (const auto& [_, m] : TX(t).View().messages) {
    if (m.queue_name != queue) continue;
    out.total++;
    if (m.visibility_deadline_ms > now_ms) {
      out.in_flight++;
    } else {
      out.readable++;
    }
    if (now_ms > m.enqueued_at_ms) out.oldest_age_ms = std::max(out.oldest_age_ms, now_ms - m.enqueued_at_ms);
  }
  return out;
}

std::vector<std::string> MemoryRepository::ListQueues(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [_, m] : TX(t).View().messages) {
    if (std::find(out.begin(), out.end(), m.queue_name) == out.end()) out.push_back(m.queue_name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

// ------------------------------------------------------------------
// Idempotency registry
// ------------------------------------------------------------------

model::ProcessedJobClaim MemoryRepository::ClaimProcessedJob(Transaction& t, const model::ProcessedJobRecord& candidate) {
  auto&                    s  = TX(t).Mutable();
  auto                     it = s.processed_jobs.find(candidate.idempotency_key);
  model::ProcessedJobClaim claim;

  if (it == s.processed_jobs.end()) {
    model::ProcessedJobRecord r = candidate;
    r.status                    = model::JobStatus::Processing;
    r.attempts                  = 1;
    r.result.clear();
    r.last_error.clear();
    s.processed_jobs[r.idempotency_key] = r;
    claim.kind                          = model::ProcessedJobClaim::Kind::Inserted;
    claim.record                        = r;
    return claim;
  }

  auto& existing = it->second;
  const bool reclaimable =
      existing.status == model::JobStatus::Failed || (existing.status == model::JobStatus::Processing && existing.job_id == candidate.job_id);
  if (!reclaimable) {
    claim.kind   = model::ProcessedJobClaim::Kind::AlreadyExists;
    claim.record = existing;
    return claim;
  }

  existing.job_id        = candidate.job_id;
  existing.queue_name    = candidate.queue_name;
  existing.worker_id     = candidate.worker_id;
  existing.status        = model::JobStatus::Processing;
  existing.attempts      = existing.attempts + 1;
  existing.updated_at_ms = candidate.updated_at_ms;
  claim.kind             = model::ProcessedJobClaim::Kind::Reclaimed;
  claim.record           = existing;
  return claim;
}

std::optional<model::ProcessedJobRecord> MemoryRepository::GetProcessedJob(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.processed_jobs.find(key);
  if (it == s.processed_jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::CompleteProcessedJob(Transaction& t, const std::string& key, const std::string& result_json, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.processed_jobs.find(key);
  if (it == s.processed_jobs.end()) return Result::Err(ErrorCode::NotFound);
  it->second.status        = model::JobStatus::Completed;
  it->second.result        = result_json;
  it->second.last_error.clear();
  it->second.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::FailProcessedJob(Transaction& t, const std::string& key, const std::string& error, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.processed_jobs.find(key);
  if (it == s.processed_jobs.end()) return Result::Err(ErrorCode::NotFound);
  it->second.status        = model::JobStatus::Failed;
  it->second.last_error    = error;
  it->second.updated_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::ResetProcessedJobAttempts(Transaction& t, const std::string& key, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.processed_jobs.find(key);
  if (it == s.processed_jobs.end()) return Result::Err(ErrorCode::NotFound);
  it->second.attempts = 0;
  if (it->second.status != model::JobStatus::Completed) it->second.status = model::JobStatus::Failed;
  it->second.updated_at_ms = now_ms;
  return Result::Ok();
}

std::vector<model::QueueJobStatsRecord> MemoryRepository::GetProcessedJobStats(Transaction& t) {
  std::map<std::string, model::QueueJobStatsRecord> by_queue;
  for (const auto& [_, r] : TX(t).View().processed_jobs) {
    auto& stats      = by_queue[r.queue_name];
    stats.queue_name = r.queue_name;
    switch (r.status) {
      case model::JobStatus::Processing:
        stats.processing++;
        break;
      case model::JobStatus::Completed:
        stats.completed++;
        break;
      case model::JobStatus::Failed:
        stats.failed++;
        break;
    }
  }
  std::vector<model::QueueJobStatsRecord> out;
  for (auto& [_, stats] : by_queue) out.push_back(std::move(stats));
  return out;
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.dead_letters.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.dead_letters[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeadLetterRecord> MemoryRepository::GetDeadLetter(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.dead_letters.find(id);
  if (it == s.dead_letters.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeadLetterRecord> MemoryRepository::ListDeadLetters(Transaction& t, const std::optional<std::string>& queue, uint32_t limit) {
  std::vector<model::DeadLetterRecord> out;
  for (const auto& [_, r] : TX(t).View().dead_letters) {
    if (queue && r.original_queue != *queue) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.moved_at_ms != b.moved_at_ms) return a.moved_at_ms < b.moved_at_ms;
    return a.id < b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::DeleteDeadLetter(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.dead_letters.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Import runs
// ------------------------------------------------------------------

std::optional<model::ImportRunRecord> MemoryRepository::ClaimImportRun(Transaction& t, const model::ImportRunRecord& candidate, uint64_t stale_before_ms) {
  auto&      s     = TX(t).Mutable();
  const auto tuple = TupleKey(candidate.source_system, candidate.source_batch_id, candidate.file_hash);
  auto       it    = s.run_by_tuple.find(tuple);

  if (it == s.run_by_tuple.end()) {
    s.import_runs[candidate.run_id] = candidate;
    s.run_by_tuple[tuple]           = candidate.run_id;
    return candidate;
  }

  auto&      existing    = s.import_runs.at(it->second);
  const bool reclaimable = existing.status == model::ImportRunStatus::Failed || existing.status == model::ImportRunStatus::RolledBack ||
                           (model::IsActive(existing.status) && existing.heartbeat_at_ms < stale_before_ms);
  if (!reclaimable) return std::nullopt;

  existing.error_details   = TakeoverDetails(existing);
  existing.filename        = candidate.filename;
  existing.import_kind     = candidate.import_kind;
  existing.status          = model::ImportRunStatus::Claimed;
  existing.rows_fetched    = 0;
  existing.rows_inserted   = 0;
  existing.rows_skipped    = 0;
  existing.rows_errored    = 0;
  existing.claimed_at_ms   = candidate.claimed_at_ms;
  existing.heartbeat_at_ms = candidate.heartbeat_at_ms;
  existing.completed_at_ms = 0;
  existing.worker_id       = candidate.worker_id;
  return existing;
}

std::optional<model::ImportRunRecord> MemoryRepository::GetImportRun(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.import_runs.find(run_id);
  if (it == s.import_runs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ImportRunRecord> MemoryRepository::LockImportRun(Transaction& t, const std::string& run_id) {
  // the transaction already holds the exclusive lock
  return GetImportRun(t, run_id);
}

std::optional<model::ImportRunRecord> MemoryRepository::FindImportRun(Transaction& t, const std::string& source_system,
                                                                      const std::string& source_batch_id, const std::string& file_hash) {
  const auto& s  = TX(t).View();
  auto        it = s.run_by_tuple.find(TupleKey(source_system, source_batch_id, file_hash));
  if (it == s.run_by_tuple.end()) return std::nullopt;
  return s.import_runs.at(it->second);
}

std::vector<model::ImportRunRecord> MemoryRepository::ListImportRuns(Transaction& t, uint32_t limit) {
  std::vector<model::ImportRunRecord> out;
  for (const auto& [_, r] : TX(t).View().import_runs) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.claimed_at_ms != b.claimed_at_ms) return a.claimed_at_ms > b.claimed_at_ms;
    return a.run_id < b.run_id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ImportRunRecord> MemoryRepository::ListStaleImportRuns(Transaction& t, uint64_t stale_before_ms) {
  std::vector<model::ImportRunRecord> out;
  for (const auto& [_, r] : TX(t).View().import_runs) {
    if (model::IsActive(r.status) && r.heartbeat_at_ms < stale_before_ms) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.heartbeat_at_ms < b.heartbeat_at_ms; });
  return out;
}

Result MemoryRepository::TouchImportRun(Transaction& t, const std::string& run_id, const std::optional<std::string>& worker_id, uint64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.import_runs.find(run_id);
  if (it == s.import_runs.end() || !model::IsActive(it->second.status)) return Result::Err(ErrorCode::NotFound);
  if (worker_id && it->second.worker_id != *worker_id) return Result::Err(ErrorCode::NotFound);
  it->second.heartbeat_at_ms = now_ms;
  return Result::Ok();
}

Result MemoryRepository::UpdateImportRun(Transaction& t, const model::ImportRunRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.import_runs.find(r.run_id);
  if (it == s.import_runs.end()) return Result::Err(ErrorCode::NotFound);
  // the claim tuple is immutable
  auto updated            = r;
  updated.source_system   = it->second.source_system;
  updated.source_batch_id = it->second.source_batch_id;
  updated.file_hash       = it->second.file_hash;
  it->second              = std::move(updated);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Import rows
// ------------------------------------------------------------------

Result MemoryRepository::InsertImportRow(Transaction& t, const model::ImportRowRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.live_rows.count(r.dedupe_key) > 0) return Result::Err(ErrorCode::AlreadyExists);

  auto row   = r;
  row.row_id = s.next_row_id++;
  s.live_rows[row.dedupe_key] = row.row_id;
  s.import_rows[row.row_id]   = std::move(row);
  return Result::Ok();
}

std::vector<model::ImportRowRecord> MemoryRepository::ListImportRows(Transaction& t, const std::string& run_id) {
  std::vector<model::ImportRowRecord> out;
  for (const auto& [_, r] : TX(t).View().import_rows) {
    if (r.run_id == run_id) out.push_back(r);
  }
  // import_rows iterates in row_id order
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.row_number < b.row_number; });
  return out;
}

uint64_t MemoryRepository::CountImportRows(Transaction& t, const std::string& run_id) {
  uint64_t count = 0;
  for (const auto& [_, r] : TX(t).View().import_rows) {
    if (r.run_id == run_id && r.status != model::ImportRowStatus::RolledBack) count++;
  }
  return count;
}

uint64_t MemoryRepository::RollbackImportRows(Transaction& t, const std::string& run_id, uint64_t now_ms) {
  auto&    s        = TX(t).Mutable();
  uint64_t affected = 0;
  for (auto& [_, r] : s.import_rows) {
    if (r.run_id != run_id || r.status == model::ImportRowStatus::RolledBack) continue;
    r.status        = model::ImportRowStatus::RolledBack;
    r.updated_at_ms = now_ms;
    s.live_rows.erase(r.dedupe_key);
    affected++;
  }
  return affected;
}

// ------------------------------------------------------------------
// Worker heartbeats
// ------------------------------------------------------------------

Result MemoryRepository::UpsertWorkerHeartbeat(Transaction& t, const model::WorkerHeartbeatRecord& r) {
  TX(t).Mutable().workers[r.worker_id] = r;
  return Result::Ok();
}

std::vector<model::WorkerHeartbeatRecord> MemoryRepository::ListWorkerHeartbeats(Transaction& t) {
  std::vector<model::WorkerHeartbeatRecord> out;
  for (const auto& [_, r] : TX(t).View().workers) out.push_back(r);
  return out;
}

} // namespace jobclaim::db::memory
