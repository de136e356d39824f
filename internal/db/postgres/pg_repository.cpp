#include "pg_repository.hpp"

#include <algorithm>
#include <stdexcept>

namespace jobclaim::db::postgres {

namespace {

constexpr const char* kMessageColumns = "msg_id,queue_name,payload,enqueued_at_ms,read_count,visibility_deadline_ms";
constexpr const char* kJobColumns     = "idempotency_key,job_id,queue_name,worker_id,status,attempts,result,last_error,created_at_ms,updated_at_ms";
constexpr const char* kDeadLetterColumns =
    "id,original_queue,original_job_id,idempotency_key,original_payload,error_message,attempt_count,worker_id,first_attempt_at_ms,moved_at_ms";
constexpr const char* kRunColumns =
    "run_id,source_system,source_batch_id,file_hash,filename,import_kind,status,rows_fetched,rows_inserted,rows_skipped,rows_errored,"
    "claimed_at_ms,heartbeat_at_ms,completed_at_ms,worker_id,error_details,rollback_reason,rolled_back_at_ms";
constexpr const char* kRowColumns    = "run_id,row_num,dedupe_key,payload,status,error_message,created_at_ms,updated_at_ms";
constexpr const char* kRowSelect     = "run_id,row_num,dedupe_key,payload,status,error_message,created_at_ms,updated_at_ms,row_id";
constexpr const char* kWorkerColumns = "worker_id,queue_name,hostname,pid,status,jobs_processed,jobs_failed,jobs_skipped,jobs_invalid,last_seen_at_ms";

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

model::MessageRecord ReadMessage(const pqxx::row& row) {
  model::MessageRecord r;
  r.msg_id                 = row[0].as<int64_t>();
  r.queue_name             = Text(row[1]);
  r.payload                = Text(row[2]);
  r.enqueued_at_ms         = row[3].as<uint64_t>();
  r.read_count             = row[4].as<uint32_t>();
  r.visibility_deadline_ms = row[5].as<uint64_t>();
  return r;
}

model::ProcessedJobRecord ReadJob(const pqxx::row& row) {
  model::ProcessedJobRecord r;
  r.idempotency_key = Text(row[0]);
  r.job_id          = row[1].as<int64_t>();
  r.queue_name      = Text(row[2]);
  r.worker_id       = Text(row[3]);
  r.status          = model::ParseJobStatus(Text(row[4])).value_or(model::JobStatus::Processing);
  r.attempts        = row[5].as<uint32_t>();
  r.result          = Text(row[6]);
  r.last_error      = Text(row[7]);
  r.created_at_ms   = row[8].as<uint64_t>();
  r.updated_at_ms   = row[9].as<uint64_t>();
  return r;
}

model::DeadLetterRecord ReadDeadLetter(const pqxx::row& row) {
  model::DeadLetterRecord r;
  r.id                  = Text(row[0]);
  r.original_queue      = Text(row[1]);
  r.original_job_id     = row[2].as<int64_t>();
  r.idempotency_key     = Text(row[3]);
  r.original_payload    = Text(row[4]);
  r.error_message       = Text(row[5]);
  r.attempt_count       = row[6].as<uint32_t>();
  r.worker_id           = Text(row[7]);
  r.first_attempt_at_ms = row[8].as<uint64_t>();
  r.moved_at_ms         = row[9].as<uint64_t>();
  return r;
}

model::ImportRunRecord ReadRun(const pqxx::row& row) {
  model::ImportRunRecord r;
  r.run_id            = Text(row[0]);
  r.source_system     = Text(row[1]);
  r.source_batch_id   = Text(row[2]);
  r.file_hash         = Text(row[3]);
  r.filename          = Text(row[4]);
  r.import_kind       = Text(row[5]);
  r.status            = model::ParseImportRunStatus(Text(row[6])).value_or(model::ImportRunStatus::Failed);
  r.rows_fetched      = row[7].as<uint64_t>();
  r.rows_inserted     = row[8].as<uint64_t>();
  r.rows_skipped      = row[9].as<uint64_t>();
  r.rows_errored      = row[10].as<uint64_t>();
  r.claimed_at_ms     = row[11].as<uint64_t>();
  r.heartbeat_at_ms   = row[12].as<uint64_t>();
  r.completed_at_ms   = row[13].as<uint64_t>();
  r.worker_id         = Text(row[14]);
  r.error_details     = Text(row[15]);
  r.rollback_reason   = Text(row[16]);
  r.rolled_back_at_ms = row[17].as<uint64_t>();
  return r;
}

model::ImportRowRecord ReadRow(const pqxx::row& row) {
  model::ImportRowRecord r;
  r.run_id        = Text(row[0]);
  r.row_number    = row[1].as<uint64_t>();
  r.dedupe_key    = Text(row[2]);
  r.payload       = Text(row[3]);
  r.status        = model::ParseImportRowStatus(Text(row[4])).value_or(model::ImportRowStatus::Pending);
  r.error_message = Text(row[5]);
  r.created_at_ms = row[6].as<uint64_t>();
  r.updated_at_ms = row[7].as<uint64_t>();
  r.row_id        = row[8].as<uint64_t>();
  return r;
}

model::WorkerHeartbeatRecord ReadWorker(const pqxx::row& row) {
  model::WorkerHeartbeatRecord r;
  r.worker_id       = Text(row[0]);
  r.queue_name      = Text(row[1]);
  r.hostname        = Text(row[2]);
  r.pid             = row[3].as<int64_t>();
  r.status          = Text(row[4]);
  r.jobs_processed  = row[5].as<uint64_t>();
  r.jobs_failed     = row[6].as<uint64_t>();
  r.jobs_skipped    = row[7].as<uint64_t>();
  r.jobs_invalid    = row[8].as<uint64_t>();
  r.last_seen_at_ms = row[9].as<uint64_t>();
  return r;
}

template <typename Reader>
auto ReadAll(const pqxx::result& res, Reader reader) {
  std::vector<decltype(reader(res[0]))> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(reader(row));
  }
  return out;
}

Result AffectedOrNotFound(const pqxx::result& res) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result PgRepository::EnqueueMessage(Transaction& t, model::MessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO messages(queue_name,payload,enqueued_at_ms,read_count,visibility_deadline_ms) VALUES($1,$2,$3,$4,$5) RETURNING msg_id;",
        r.queue_name, r.payload, r.enqueued_at_ms, r.read_count, r.visibility_deadline_ms);
    r.msg_id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MessageRecord> PgRepository::LeaseMessages(Transaction& t, const std::string& queue, uint32_t limit, uint64_t now_ms,
                                                               uint64_t visibility_deadline_ms) {
  auto res = TX(t).Work().exec_prepared("lease_messages", visibility_deadline_ms, queue, now_ms, limit);
  auto out = ReadAll(res, ReadMessage);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.msg_id < b.msg_id; });
  return out;
}

Result PgRepository::DeleteMessage(Transaction& t, const std::string& queue, int64_t msg_id) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_prepared("delete_message", queue, msg_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetMessageVisibility(Transaction& t, const std::string& queue, int64_t msg_id, uint64_t visibility_deadline_ms) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params("UPDATE messages SET visibility_deadline_ms=$1 WHERE queue_name=$2 AND msg_id=$3;",
                                                       visibility_deadline_ms, queue, msg_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::QueueMetricsRecord PgRepository::GetQueueMetrics(Transaction& t, const std::string& queue, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*), COALESCE(SUM(CASE WHEN visibility_deadline_ms > $2 THEN 1 ELSE 0 END),0)::bigint, "
      "COALESCE(MIN(enqueued_at_ms),0) FROM messages WHERE queue_name=$1;",
      queue, now_ms);

  model::QueueMetricsRecord out;
  out.queue_name = queue;
  out.total      = res[0][0].as<uint64_t>();
  out.in_flight  = res[0][1].as<uint64_t>();
  out.readable   = out.total - out.in_flight;

  const auto oldest = res[0][2].as<uint64_t>();
  if (out.total > 0 && now_ms > oldest) out.oldest_age_ms = now_ms - oldest;
  return out;
}

std::vector<std::string> PgRepository::ListQueues(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT DISTINCT queue_name FROM messages ORDER BY queue_name;");
  return ReadAll(res, [](const pqxx::row& row) { return Text(row[0]); });
}

// ------------------------------------------------------------------
// Idempotency registry
// ------------------------------------------------------------------

model::ProcessedJobClaim PgRepository::ClaimProcessedJob(Transaction& t, const model::ProcessedJobRecord& candidate) {
  auto res = TX(t).Work().exec_prepared("claim_processed_job", candidate.idempotency_key, candidate.job_id, candidate.queue_name,
                                        candidate.worker_id, candidate.updated_at_ms);

  model::ProcessedJobClaim claim;
  if (!res.empty()) {
    claim.kind   = res[0][10].as<bool>() ? model::ProcessedJobClaim::Kind::Inserted : model::ProcessedJobClaim::Kind::Reclaimed;
    claim.record = ReadJob(res[0]);
    return claim;
  }

  auto blocking = GetProcessedJob(t, candidate.idempotency_key);
  if (!blocking) {
    throw std::runtime_error("processed job vanished during claim: " + candidate.idempotency_key);
  }
  claim.kind   = model::ProcessedJobClaim::Kind::AlreadyExists;
  claim.record = std::move(*blocking);
  return claim;
}

std::optional<model::ProcessedJobRecord> PgRepository::GetProcessedJob(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns + " FROM processed_jobs WHERE idempotency_key=$1;", key);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::CompleteProcessedJob(Transaction& t, const std::string& key, const std::string& result_json, uint64_t now_ms) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params(
        "UPDATE processed_jobs SET status='completed', result=$2, last_error='', updated_at_ms=$3 WHERE idempotency_key=$1;", key, result_json,
        now_ms));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FailProcessedJob(Transaction& t, const std::string& key, const std::string& error, uint64_t now_ms) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params(
        "UPDATE processed_jobs SET status='failed', last_error=$2, updated_at_ms=$3 WHERE idempotency_key=$1;", key, error, now_ms));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ResetProcessedJobAttempts(Transaction& t, const std::string& key, uint64_t now_ms) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params(
        "UPDATE processed_jobs SET attempts=0, status=CASE WHEN status='completed' THEN status ELSE 'failed' END, updated_at_ms=$2 "
        "WHERE idempotency_key=$1;",
        key, now_ms));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::QueueJobStatsRecord> PgRepository::GetProcessedJobStats(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT queue_name, "
      "COUNT(*) FILTER (WHERE status='processing'), "
      "COUNT(*) FILTER (WHERE status='completed'), "
      "COUNT(*) FILTER (WHERE status='failed') "
      "FROM processed_jobs GROUP BY queue_name ORDER BY queue_name;");
  return ReadAll(res, [](const pqxx::row& row) {
    model::QueueJobStatsRecord r;
    r.queue_name = Text(row[0]);
    r.processing = row[1].as<uint64_t>();
    r.completed  = row[2].as<uint64_t>();
    r.failed     = row[3].as<uint64_t>();
    return r;
  });
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result PgRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO dead_letters(") + kDeadLetterColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10);", r.id,
                             r.original_queue, r.original_job_id, r.idempotency_key, r.original_payload, r.error_message, r.attempt_count,
                             r.worker_id, r.first_attempt_at_ms, r.moved_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeadLetterRecord> PgRepository::GetDeadLetter(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDeadLetterColumns + " FROM dead_letters WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadDeadLetter(res[0]);
}

std::vector<model::DeadLetterRecord> PgRepository::ListDeadLetters(Transaction& t, const std::optional<std::string>& queue, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kDeadLetterColumns +
                                          " FROM dead_letters WHERE ($1::text IS NULL OR original_queue=$1::text) ORDER BY moved_at_ms, id LIMIT $2;",
                                      queue, limit);
  return ReadAll(res, ReadDeadLetter);
}

Result PgRepository::DeleteDeadLetter(Transaction& t, const std::string& id) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params("DELETE FROM dead_letters WHERE id=$1;", id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Import runs
// ------------------------------------------------------------------

std::optional<model::ImportRunRecord> PgRepository::ClaimImportRun(Transaction& t, const model::ImportRunRecord& candidate, uint64_t stale_before_ms) {
  auto res = TX(t).Work().exec_params(
      std::string("INSERT INTO import_runs(") + kRunColumns +
          ") VALUES($1,$2,$3,$4,$5,$6,'claimed',0,0,0,0,$7,$8,0,$9,'','',0) "
          "ON CONFLICT(source_system,source_batch_id,file_hash) DO UPDATE SET "
          "error_details=(COALESCE(NULLIF(import_runs.error_details,''),'{}')::jsonb || "
          "jsonb_build_object('previous_worker_id',import_runs.worker_id,'previous_status',import_runs.status))::text, "
          "filename=EXCLUDED.filename, import_kind=EXCLUDED.import_kind, status='claimed', "
          "rows_fetched=0, rows_inserted=0, rows_skipped=0, rows_errored=0, "
          "claimed_at_ms=EXCLUDED.claimed_at_ms, heartbeat_at_ms=EXCLUDED.heartbeat_at_ms, completed_at_ms=0, "
          "worker_id=EXCLUDED.worker_id "
          "WHERE import_runs.status IN ('failed','rolled_back') "
          "OR (import_runs.status IN ('claimed','in_progress') AND import_runs.heartbeat_at_ms < $10) "
          "RETURNING " +
          kRunColumns + ";",
      candidate.run_id, candidate.source_system, candidate.source_batch_id, candidate.file_hash, candidate.filename, candidate.import_kind,
      candidate.claimed_at_ms, candidate.heartbeat_at_ms, candidate.worker_id, stale_before_ms);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::optional<model::ImportRunRecord> PgRepository::GetImportRun(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns + " FROM import_runs WHERE run_id=$1;", run_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::optional<model::ImportRunRecord> PgRepository::LockImportRun(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns + " FROM import_runs WHERE run_id=$1 FOR UPDATE;", run_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::optional<model::ImportRunRecord> PgRepository::FindImportRun(Transaction& t, const std::string& source_system,
                                                                  const std::string& source_batch_id, const std::string& file_hash) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunColumns + " FROM import_runs WHERE source_system=$1 AND source_batch_id=$2 AND file_hash=$3;", source_system,
      source_batch_id, file_hash);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<model::ImportRunRecord> PgRepository::ListImportRuns(Transaction& t, uint32_t limit) {
  auto res =
      TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns + " FROM import_runs ORDER BY claimed_at_ms DESC, run_id LIMIT $1;", limit);
  return ReadAll(res, ReadRun);
}

std::vector<model::ImportRunRecord> PgRepository::ListStaleImportRuns(Transaction& t, uint64_t stale_before_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns +
                                          " FROM import_runs WHERE status IN ('claimed','in_progress') AND heartbeat_at_ms < $1 "
                                          "ORDER BY heartbeat_at_ms;",
                                      stale_before_ms);
  return ReadAll(res, ReadRun);
}

Result PgRepository::TouchImportRun(Transaction& t, const std::string& run_id, const std::optional<std::string>& worker_id, uint64_t now_ms) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params(
        "UPDATE import_runs SET heartbeat_at_ms=$1 "
        "WHERE run_id=$2 AND status IN ('claimed','in_progress') AND ($3::text IS NULL OR worker_id=$3::text);",
        now_ms, run_id, worker_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateImportRun(Transaction& t, const model::ImportRunRecord& r) {
  try {
    return AffectedOrNotFound(TX(t).Work().exec_params(
        "UPDATE import_runs SET filename=$2, import_kind=$3, status=$4, rows_fetched=$5, rows_inserted=$6, rows_skipped=$7, "
        "rows_errored=$8, claimed_at_ms=$9, heartbeat_at_ms=$10, completed_at_ms=$11, worker_id=$12, error_details=$13, "
        "rollback_reason=$14, rolled_back_at_ms=$15 WHERE run_id=$1;",
        r.run_id, r.filename, r.import_kind, std::string(model::ToString(r.status)), r.rows_fetched, r.rows_inserted, r.rows_skipped,
        r.rows_errored, r.claimed_at_ms, r.heartbeat_at_ms, r.completed_at_ms, r.worker_id, r.error_details, r.rollback_reason,
        r.rolled_back_at_ms));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Import rows
// ------------------------------------------------------------------

Result PgRepository::InsertImportRow(Transaction& t, const model::ImportRowRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(std::string("INSERT INTO import_rows(") + kRowColumns +
                                            ") VALUES($1,$2,$3,$4,$5,$6,$7,$8) "
                                            "ON CONFLICT (dedupe_key) WHERE status <> 'rolled_back' DO NOTHING;",
                                        r.run_id, r.row_number, r.dedupe_key, r.payload, std::string(model::ToString(r.status)),
                                        r.error_message, r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ImportRowRecord> PgRepository::ListImportRows(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRowSelect + " FROM import_rows WHERE run_id=$1 ORDER BY row_num, row_id;", run_id);
  return ReadAll(res, ReadRow);
}

uint64_t PgRepository::CountImportRows(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM import_rows WHERE run_id=$1 AND status<>'rolled_back';", run_id);
  return res[0][0].as<uint64_t>();
}

uint64_t PgRepository::RollbackImportRows(Transaction& t, const std::string& run_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_params(
      "UPDATE import_rows SET status='rolled_back', updated_at_ms=$2 WHERE run_id=$1 AND status<>'rolled_back';", run_id, now_ms);
  return static_cast<uint64_t>(res.affected_rows());
}

// ------------------------------------------------------------------
// Worker heartbeats
// ------------------------------------------------------------------

Result PgRepository::UpsertWorkerHeartbeat(Transaction& t, const model::WorkerHeartbeatRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO worker_heartbeats(") + kWorkerColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
                                 "ON CONFLICT(worker_id) DO UPDATE SET queue_name=EXCLUDED.queue_name, hostname=EXCLUDED.hostname, "
                                 "pid=EXCLUDED.pid, status=EXCLUDED.status, jobs_processed=EXCLUDED.jobs_processed, "
                                 "jobs_failed=EXCLUDED.jobs_failed, jobs_skipped=EXCLUDED.jobs_skipped, "
                                 "jobs_invalid=EXCLUDED.jobs_invalid, last_seen_at_ms=EXCLUDED.last_seen_at_ms;",
                             r.worker_id, r.queue_name, r.hostname, r.pid, r.status, r.jobs_processed, r.jobs_failed, r.jobs_skipped,
                             r.jobs_invalid, r.last_seen_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::WorkerHeartbeatRecord> PgRepository::ListWorkerHeartbeats(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kWorkerColumns + " FROM worker_heartbeats ORDER BY worker_id;");
  return ReadAll(res, ReadWorker);
}

} // namespace jobclaim::db::postgres
