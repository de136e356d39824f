#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>

namespace jobclaim::db::sqlite {

using jobclaim::db::ErrorCode;
using jobclaim::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

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

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

// read paths throw; write paths report through Translate()
void CheckDone(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
  model::MessageRecord r;
  r.msg_id                 = ColI64(st, 0);
  r.queue_name             = ColText(st, 1);
  r.payload                = ColText(st, 2);
  r.enqueued_at_ms         = ColU64(st, 3);
  r.read_count             = static_cast<uint32_t>(ColU64(st, 4));
  r.visibility_deadline_ms = ColU64(st, 5);
  return r;
}

model::ProcessedJobRecord ReadJob(sqlite3_stmt* st) {
  model::ProcessedJobRecord r;
  r.idempotency_key = ColText(st, 0);
  r.job_id          = ColI64(st, 1);
  r.queue_name      = ColText(st, 2);
  r.worker_id       = ColText(st, 3);
  r.status          = model::ParseJobStatus(ColText(st, 4)).value_or(model::JobStatus::Processing);
  r.attempts        = static_cast<uint32_t>(ColU64(st, 5));
  r.result          = ColText(st, 6);
  r.last_error      = ColText(st, 7);
  r.created_at_ms   = ColU64(st, 8);
  r.updated_at_ms   = ColU64(st, 9);
  return r;
}

model::DeadLetterRecord ReadDeadLetter(sqlite3_stmt* st) {
  model::DeadLetterRecord r;
  r.id                  = ColText(st, 0);
  r.original_queue      = ColText(st, 1);
  r.original_job_id     = ColI64(st, 2);
  r.idempotency_key     = ColText(st, 3);
  r.original_payload    = ColText(st, 4);
  r.error_message       = ColText(st, 5);
  r.attempt_count       = static_cast<uint32_t>(ColU64(st, 6));
  r.worker_id           = ColText(st, 7);
  r.first_attempt_at_ms = ColU64(st, 8);
  r.moved_at_ms         = ColU64(st, 9);
  return r;
}

model::ImportRunRecord ReadRun(sqlite3_stmt* st) {
  model::ImportRunRecord r;
  r.run_id            = ColText(st, 0);
  r.source_system     = ColText(st, 1);
  r.source_batch_id   = ColText(st, 2);
  r.file_hash         = ColText(st, 3);
  r.filename          = ColText(st, 4);
  r.import_kind       = ColText(st, 5);
  r.status            = model::ParseImportRunStatus(ColText(st, 6)).value_or(model::ImportRunStatus::Failed);
  r.rows_fetched      = ColU64(st, 7);
  r.rows_inserted     = ColU64(st, 8);
  r.rows_skipped      = ColU64(st, 9);
  r.rows_errored      = ColU64(st, 10);
  r.claimed_at_ms     = ColU64(st, 11);
  r.heartbeat_at_ms   = ColU64(st, 12);
  r.completed_at_ms   = ColU64(st, 13);
  r.worker_id         = ColText(st, 14);
  r.error_details     = ColText(st, 15);
  r.rollback_reason   = ColText(st, 16);
  r.rolled_back_at_ms = ColU64(st, 17);
  return r;
}

model::ImportRowRecord ReadRow(sqlite3_stmt* st) {
  model::ImportRowRecord r;
  r.run_id        = ColText(st, 0);
  r.row_number    = ColU64(st, 1);
  r.dedupe_key    = ColText(st, 2);
  r.payload       = ColText(st, 3);
  r.status        = model::ParseImportRowStatus(ColText(st, 4)).value_or(model::ImportRowStatus::Pending);
  r.error_message = ColText(st, 5);
  r.created_at_ms = ColU64(st, 6);
  r.updated_at_ms = ColU64(st, 7);
  r.row_id        = ColU64(st, 8);
  return r;
}

model::WorkerHeartbeatRecord ReadWorker(sqlite3_stmt* st) {
  model::WorkerHeartbeatRecord r;
  r.worker_id       = ColText(st, 0);
  r.queue_name      = ColText(st, 1);
  r.hostname        = ColText(st, 2);
  r.pid             = ColI64(st, 3);
  r.status          = ColText(st, 4);
  r.jobs_processed  = ColU64(st, 5);
  r.jobs_failed     = ColU64(st, 6);
  r.jobs_skipped    = ColU64(st, 7);
  r.jobs_invalid    = ColU64(st, 8);
  r.last_seen_at_ms = ColU64(st, 9);
  return r;
}

template <typename Reader>
auto ReadAll(sqlite3* db, sqlite3_stmt* st, Reader reader) {
  std::vector<decltype(reader(st))> out;
  int                               rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(reader(st));
  }
  CheckDone(db, rc);
  return out;
}

template <typename Reader>
auto ReadOne(sqlite3* db, sqlite3_stmt* st, Reader reader) -> std::optional<decltype(reader(st))> {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return reader(st);
  CheckDone(db, rc);
  return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::EnqueueMessage(Transaction& t, model::MessageRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "INSERT INTO messages(queue_name,payload,enqueued_at_ms,read_count,visibility_deadline_ms) "
                     "VALUES(?,?,?,?,?);");

  BindText(st.get(), 1, r.queue_name);
  BindText(st.get(), 2, r.payload);
  BindU64(st.get(), 3, r.enqueued_at_ms);
  BindU64(st.get(), 4, r.read_count);
  BindU64(st.get(), 5, r.visibility_deadline_ms);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) r.msg_id = sqlite3_last_insert_rowid(db);
  return Translate(db, rc);
}

std::vector<model::MessageRecord> SqliteRepository::LeaseMessages(Transaction& t, const std::string& queue, uint32_t limit, uint64_t now_ms,
                                                                  uint64_t visibility_deadline_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("UPDATE messages SET visibility_deadline_ms=?1, read_count=read_count+1 "
                                     "WHERE msg_id IN (SELECT msg_id FROM messages WHERE queue_name=?2 AND visibility_deadline_ms<=?3 "
                                     "ORDER BY msg_id LIMIT ?4) RETURNING ") +
                             kMessageColumns + ";");

  BindU64(st.get(), 1, visibility_deadline_ms);
  BindText(st.get(), 2, queue);
  BindU64(st.get(), 3, now_ms);
  BindU64(st.get(), 4, limit);

  auto out = ReadAll(db, st.get(), ReadMessage);
  // RETURNING order is unspecified
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.msg_id < b.msg_id; });
  return out;
}

Result SqliteRepository::DeleteMessage(Transaction& t, const std::string& queue, int64_t msg_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM messages WHERE queue_name=? AND msg_id=?;");
  BindText(st.get(), 1, queue);
  BindI64(st.get(), 2, msg_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::SetMessageVisibility(Transaction& t, const std::string& queue, int64_t msg_id, uint64_t visibility_deadline_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE messages SET visibility_deadline_ms=? WHERE queue_name=? AND msg_id=?;");
  BindU64(st.get(), 1, visibility_deadline_ms);
  BindText(st.get(), 2, queue);
  BindI64(st.get(), 3, msg_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

model::QueueMetricsRecord SqliteRepository::GetQueueMetrics(Transaction& t, const std::string& queue, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT COUNT(*), "
                     "COALESCE(SUM(CASE WHEN visibility_deadline_ms > ?2 THEN 1 ELSE 0 END),0), "
                     "COALESCE(MIN(enqueued_at_ms),0) "
                     "FROM messages WHERE queue_name=?1;");
  BindText(st.get(), 1, queue);
  BindU64(st.get(), 2, now_ms);

  model::QueueMetricsRecord out;
  out.queue_name = queue;

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite queue metrics: ") + sqlite3_errmsg(db));
  }
  out.total     = ColU64(st.get(), 0);
  out.in_flight = ColU64(st.get(), 1);
  out.readable  = out.total - out.in_flight;

  const uint64_t oldest = ColU64(st.get(), 2);
  if (out.total > 0 && now_ms > oldest) out.oldest_age_ms = now_ms - oldest;
  return out;
}

std::vector<std::string> SqliteRepository::ListQueues(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT DISTINCT queue_name FROM messages ORDER BY queue_name;");
  return ReadAll(db, st.get(), [](sqlite3_stmt* s) { return ColText(s, 0); });
}

// ------------------------------------------------------------------
// Idempotency registry
// ------------------------------------------------------------------

model::ProcessedJobClaim SqliteRepository::ClaimProcessedJob(Transaction& t, const model::ProcessedJobRecord& candidate) {
  auto* db = TX(t).Handle();

  // BEGIN IMMEDIATE holds the write lock, so this read and the upsert below
  // see the same row.
  const bool existed = GetProcessedJob(t, candidate.idempotency_key).has_value();

  auto st = Prepare(db, std::string("INSERT INTO processed_jobs(idempotency_key,job_id,queue_name,worker_id,status,attempts,result,last_error,"
                                    "created_at_ms,updated_at_ms) VALUES(?1,?2,?3,?4,'processing',1,'','',?5,?5) "
                                    "ON CONFLICT(idempotency_key) DO UPDATE SET job_id=excluded.job_id, queue_name=excluded.queue_name, "
                                    "worker_id=excluded.worker_id, status='processing', attempts=processed_jobs.attempts+1, "
                                    "updated_at_ms=excluded.updated_at_ms "
                                    "WHERE processed_jobs.status='failed' OR "
                                    "(processed_jobs.status='processing' AND processed_jobs.job_id=excluded.job_id) "
                                    "RETURNING ") +
                            kJobColumns + ";");

  BindText(st.get(), 1, candidate.idempotency_key);
  BindI64(st.get(), 2, candidate.job_id);
  BindText(st.get(), 3, candidate.queue_name);
  BindText(st.get(), 4, candidate.worker_id);
  BindU64(st.get(), 5, candidate.updated_at_ms);

  model::ProcessedJobClaim claim;
  auto                     claimed = ReadOne(db, st.get(), ReadJob);
  if (claimed) {
    claim.kind   = existed ? model::ProcessedJobClaim::Kind::Reclaimed : model::ProcessedJobClaim::Kind::Inserted;
    claim.record = std::move(*claimed);
    return claim;
  }

  st.reset();
  auto blocking = GetProcessedJob(t, candidate.idempotency_key);
  if (!blocking) {
    throw std::runtime_error("processed job vanished during claim: " + candidate.idempotency_key);
  }
  claim.kind   = model::ProcessedJobClaim::Kind::AlreadyExists;
  claim.record = std::move(*blocking);
  return claim;
}

std::optional<model::ProcessedJobRecord> SqliteRepository::GetProcessedJob(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kJobColumns + " FROM processed_jobs WHERE idempotency_key=?;");
  BindText(st.get(), 1, key);
  return ReadOne(db, st.get(), ReadJob);
}

Result SqliteRepository::CompleteProcessedJob(Transaction& t, const std::string& key, const std::string& result_json, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE processed_jobs SET status='completed', result=?, last_error='', updated_at_ms=? WHERE idempotency_key=?;");
  BindText(st.get(), 1, result_json);
  BindU64(st.get(), 2, now_ms);
  BindText(st.get(), 3, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::FailProcessedJob(Transaction& t, const std::string& key, const std::string& error, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE processed_jobs SET status='failed', last_error=?, updated_at_ms=? WHERE idempotency_key=?;");
  BindText(st.get(), 1, error);
  BindU64(st.get(), 2, now_ms);
  BindText(st.get(), 3, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::ResetProcessedJobAttempts(Transaction& t, const std::string& key, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE processed_jobs SET attempts=0, "
                     "status=CASE WHEN status='completed' THEN status ELSE 'failed' END, updated_at_ms=? "
                     "WHERE idempotency_key=?;");
  BindU64(st.get(), 1, now_ms);
  BindText(st.get(), 2, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

std::vector<model::QueueJobStatsRecord> SqliteRepository::GetProcessedJobStats(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "SELECT queue_name, "
                     "SUM(CASE WHEN status='processing' THEN 1 ELSE 0 END), "
                     "SUM(CASE WHEN status='completed' THEN 1 ELSE 0 END), "
                     "SUM(CASE WHEN status='failed' THEN 1 ELSE 0 END) "
                     "FROM processed_jobs GROUP BY queue_name ORDER BY queue_name;");
  return ReadAll(db, st.get(), [](sqlite3_stmt* s) {
    model::QueueJobStatsRecord r;
    r.queue_name = ColText(s, 0);
    r.processing = ColU64(s, 1);
    r.completed  = ColU64(s, 2);
    r.failed     = ColU64(s, 3);
    return r;
  });
}

// ------------------------------------------------------------------
// Dead letters
// ------------------------------------------------------------------

Result SqliteRepository::InsertDeadLetter(Transaction& t, const model::DeadLetterRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO dead_letters(") + kDeadLetterColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.original_queue);
  BindI64(st.get(), 3, r.original_job_id);
  BindText(st.get(), 4, r.idempotency_key);
  BindText(st.get(), 5, r.original_payload);
  BindText(st.get(), 6, r.error_message);
  BindU64(st.get(), 7, r.attempt_count);
  BindText(st.get(), 8, r.worker_id);
  BindU64(st.get(), 9, r.first_attempt_at_ms);
  BindU64(st.get(), 10, r.moved_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  return Translate(db, rc);
}

std::optional<model::DeadLetterRecord> SqliteRepository::GetDeadLetter(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kDeadLetterColumns + " FROM dead_letters WHERE id=?;");
  BindText(st.get(), 1, id);
  return ReadOne(db, st.get(), ReadDeadLetter);
}

std::vector<model::DeadLetterRecord> SqliteRepository::ListDeadLetters(Transaction& t, const std::optional<std::string>& queue, uint32_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kDeadLetterColumns +
                             " FROM dead_letters WHERE (?1 IS NULL OR original_queue=?1) ORDER BY moved_at_ms, id LIMIT ?2;");
  if (queue) {
    BindText(st.get(), 1, *queue);
  } else {
    sqlite3_bind_null(st.get(), 1);
  }
  BindU64(st.get(), 2, limit);
  return ReadAll(db, st.get(), ReadDeadLetter);
}

Result SqliteRepository::DeleteDeadLetter(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "DELETE FROM dead_letters WHERE id=?;");
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Import runs
// ------------------------------------------------------------------

std::optional<model::ImportRunRecord> SqliteRepository::ClaimImportRun(Transaction& t, const model::ImportRunRecord& candidate, uint64_t stale_before_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO import_runs(") + kRunColumns +
                             ") VALUES(?1,?2,?3,?4,?5,?6,'claimed',0,0,0,0,?7,?8,0,?9,'','',0) "
                             "ON CONFLICT(source_system,source_batch_id,file_hash) DO UPDATE SET "
                             "error_details=json_set(CASE WHEN json_valid(import_runs.error_details) THEN import_runs.error_details ELSE '{}' END, "
                             "'$.previous_worker_id',import_runs.worker_id,'$.previous_status',import_runs.status), "
                             "filename=excluded.filename, import_kind=excluded.import_kind, status='claimed', "
                             "rows_fetched=0, rows_inserted=0, rows_skipped=0, rows_errored=0, "
                             "claimed_at_ms=excluded.claimed_at_ms, heartbeat_at_ms=excluded.heartbeat_at_ms, completed_at_ms=0, "
                             "worker_id=excluded.worker_id "
                             "WHERE import_runs.status IN ('failed','rolled_back') "
                             "OR (import_runs.status IN ('claimed','in_progress') AND import_runs.heartbeat_at_ms < ?10) "
                             "RETURNING " +
                             kRunColumns + ";");

  BindText(st.get(), 1, candidate.run_id);
  BindText(st.get(), 2, candidate.source_system);
  BindText(st.get(), 3, candidate.source_batch_id);
  BindText(st.get(), 4, candidate.file_hash);
  BindText(st.get(), 5, candidate.filename);
  BindText(st.get(), 6, candidate.import_kind);
  BindU64(st.get(), 7, candidate.claimed_at_ms);
  BindU64(st.get(), 8, candidate.heartbeat_at_ms);
  BindText(st.get(), 9, candidate.worker_id);
  BindU64(st.get(), 10, stale_before_ms);

  return ReadOne(db, st.get(), ReadRun);
}

std::optional<model::ImportRunRecord> SqliteRepository::GetImportRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kRunColumns + " FROM import_runs WHERE run_id=?;");
  BindText(st.get(), 1, run_id);
  return ReadOne(db, st.get(), ReadRun);
}

std::optional<model::ImportRunRecord> SqliteRepository::LockImportRun(Transaction& t, const std::string& run_id) {
  // BEGIN IMMEDIATE already excludes other writers
  return GetImportRun(t, run_id);
}

std::optional<model::ImportRunRecord> SqliteRepository::FindImportRun(Transaction& t, const std::string& source_system,
                                                                      const std::string& source_batch_id, const std::string& file_hash) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kRunColumns + " FROM import_runs WHERE source_system=? AND source_batch_id=? AND file_hash=?;");
  BindText(st.get(), 1, source_system);
  BindText(st.get(), 2, source_batch_id);
  BindText(st.get(), 3, file_hash);
  return ReadOne(db, st.get(), ReadRun);
}

std::vector<model::ImportRunRecord> SqliteRepository::ListImportRuns(Transaction& t, uint32_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kRunColumns + " FROM import_runs ORDER BY claimed_at_ms DESC, run_id LIMIT ?;");
  BindU64(st.get(), 1, limit);
  return ReadAll(db, st.get(), ReadRun);
}

std::vector<model::ImportRunRecord> SqliteRepository::ListStaleImportRuns(Transaction& t, uint64_t stale_before_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kRunColumns +
                             " FROM import_runs WHERE status IN ('claimed','in_progress') AND heartbeat_at_ms < ? ORDER BY heartbeat_at_ms;");
  BindU64(st.get(), 1, stale_before_ms);
  return ReadAll(db, st.get(), ReadRun);
}

Result SqliteRepository::TouchImportRun(Transaction& t, const std::string& run_id, const std::optional<std::string>& worker_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE import_runs SET heartbeat_at_ms=?1 "
                     "WHERE run_id=?2 AND status IN ('claimed','in_progress') AND (?3 IS NULL OR worker_id=?3);");
  BindU64(st.get(), 1, now_ms);
  BindText(st.get(), 2, run_id);
  if (worker_id) {
    BindText(st.get(), 3, *worker_id);
  } else {
    sqlite3_bind_null(st.get(), 3);
  }

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateImportRun(Transaction& t, const model::ImportRunRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db,
                     "UPDATE import_runs SET filename=?, import_kind=?, status=?, rows_fetched=?, rows_inserted=?, rows_skipped=?, "
                     "rows_errored=?, claimed_at_ms=?, heartbeat_at_ms=?, completed_at_ms=?, worker_id=?, error_details=?, "
                     "rollback_reason=?, rolled_back_at_ms=? WHERE run_id=?;");

  BindText(st.get(), 1, r.filename);
  BindText(st.get(), 2, r.import_kind);
  BindText(st.get(), 3, model::ToString(r.status));
  BindU64(st.get(), 4, r.rows_fetched);
  BindU64(st.get(), 5, r.rows_inserted);
  BindU64(st.get(), 6, r.rows_skipped);
  BindU64(st.get(), 7, r.rows_errored);
  BindU64(st.get(), 8, r.claimed_at_ms);
  BindU64(st.get(), 9, r.heartbeat_at_ms);
  BindU64(st.get(), 10, r.completed_at_ms);
  BindText(st.get(), 11, r.worker_id);
  BindText(st.get(), 12, r.error_details);
  BindText(st.get(), 13, r.rollback_reason);
  BindU64(st.get(), 14, r.rolled_back_at_ms);
  BindText(st.get(), 15, r.run_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Import rows
// ------------------------------------------------------------------

Result SqliteRepository::InsertImportRow(Transaction& t, const model::ImportRowRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO import_rows(") + kRowColumns +
                             ") VALUES(?,?,?,?,?,?,?,?) ON CONFLICT DO NOTHING;");

  BindText(st.get(), 1, r.run_id);
  BindU64(st.get(), 2, r.row_number);
  BindText(st.get(), 3, r.dedupe_key);
  BindText(st.get(), 4, r.payload);
  BindText(st.get(), 5, model::ToString(r.status));
  BindText(st.get(), 6, r.error_message);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Translate(db, rc);
}

std::vector<model::ImportRowRecord> SqliteRepository::ListImportRows(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kRowSelect + " FROM import_rows WHERE run_id=? ORDER BY row_num, row_id;");
  BindText(st.get(), 1, run_id);
  return ReadAll(db, st.get(), ReadRow);
}

uint64_t SqliteRepository::CountImportRows(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT COUNT(*) FROM import_rows WHERE run_id=? AND status<>'rolled_back';");
  BindText(st.get(), 1, run_id);
  auto count = ReadOne(db, st.get(), [](sqlite3_stmt* s) { return ColU64(s, 0); });
  return count.value_or(0);
}

uint64_t SqliteRepository::RollbackImportRows(Transaction& t, const std::string& run_id, uint64_t now_ms) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "UPDATE import_rows SET status='rolled_back', updated_at_ms=? WHERE run_id=? AND status<>'rolled_back';");
  BindU64(st.get(), 1, now_ms);
  BindText(st.get(), 2, run_id);

  CheckDone(db, sqlite3_step(st.get()));
  return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Worker heartbeats
// ------------------------------------------------------------------

Result SqliteRepository::UpsertWorkerHeartbeat(Transaction& t, const model::WorkerHeartbeatRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("INSERT INTO worker_heartbeats(") + kWorkerColumns +
                             ") VALUES(?,?,?,?,?,?,?,?,?,?) "
                             "ON CONFLICT(worker_id) DO UPDATE SET queue_name=excluded.queue_name, hostname=excluded.hostname, "
                             "pid=excluded.pid, status=excluded.status, jobs_processed=excluded.jobs_processed, "
                             "jobs_failed=excluded.jobs_failed, jobs_skipped=excluded.jobs_skipped, "
                             "jobs_invalid=excluded.jobs_invalid, last_seen_at_ms=excluded.last_seen_at_ms;");

  BindText(st.get(), 1, r.worker_id);
  BindText(st.get(), 2, r.queue_name);
  BindText(st.get(), 3, r.hostname);
  BindI64(st.get(), 4, r.pid);
  BindText(st.get(), 5, r.status);
  BindU64(st.get(), 6, r.jobs_processed);
  BindU64(st.get(), 7, r.jobs_failed);
  BindU64(st.get(), 8, r.jobs_skipped);
  BindU64(st.get(), 9, r.jobs_invalid);
  BindU64(st.get(), 10, r.last_seen_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::WorkerHeartbeatRecord> SqliteRepository::ListWorkerHeartbeats(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kWorkerColumns + " FROM worker_heartbeats ORDER BY worker_id;");
  return ReadAll(db, st.get(), ReadWorker);
}

} // namespace jobclaim::db::sqlite
