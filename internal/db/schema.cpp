#include "internal/db/schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#if JOBCLAIM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if JOBCLAIM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace jobclaim::db {

namespace {

constexpr int kSchemaVersion = 2;

const std::vector<std::string> kProbeSql = {
    "SELECT msg_id,queue_name,payload,enqueued_at_ms,read_count,visibility_deadline_ms FROM messages LIMIT 1;",
    "SELECT idempotency_key,job_id,queue_name,worker_id,status,attempts,result,last_error,created_at_ms,updated_at_ms FROM processed_jobs LIMIT 1;",
    "SELECT id,original_queue,original_job_id,idempotency_key,original_payload,error_message,attempt_count,worker_id,first_attempt_at_ms,"
    "moved_at_ms FROM dead_letters LIMIT 1;",
    "SELECT run_id,source_system,source_batch_id,file_hash,filename,import_kind,status,rows_fetched,rows_inserted,rows_skipped,rows_errored,"
    "claimed_at_ms,heartbeat_at_ms,completed_at_ms,worker_id,error_details,rollback_reason,rolled_back_at_ms FROM import_runs LIMIT 1;",
    "SELECT row_id,run_id,row_num,dedupe_key,payload,status,error_message,created_at_ms,updated_at_ms FROM import_rows LIMIT 1;",
    "SELECT worker_id,queue_name,hostname,pid,status,jobs_processed,jobs_failed,jobs_skipped,jobs_invalid,last_seen_at_ms FROM worker_heartbeats LIMIT 1;",
    "SELECT version FROM jobclaim_schema_migrations LIMIT 1;"};

} // namespace

#if JOBCLAIM_DB_SQLITE
void BootstrapSqliteSchema(sqlite::SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS messages (msg_id INTEGER PRIMARY KEY AUTOINCREMENT, queue_name TEXT NOT NULL, payload TEXT NOT NULL, "
      "enqueued_at_ms INTEGER NOT NULL, read_count INTEGER NOT NULL DEFAULT 0, visibility_deadline_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS messages_queue_visibility ON messages(queue_name, visibility_deadline_ms, msg_id);",
      "CREATE TABLE IF NOT EXISTS processed_jobs (idempotency_key TEXT PRIMARY KEY, job_id INTEGER NOT NULL, queue_name TEXT NOT NULL, "
      "worker_id TEXT NOT NULL, status TEXT NOT NULL CHECK (status IN ('processing','completed','failed')), attempts INTEGER NOT NULL DEFAULT 0, "
      "result TEXT NOT NULL DEFAULT '', last_error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS processed_jobs_queue_status ON processed_jobs(queue_name, status);",
      "CREATE TABLE IF NOT EXISTS dead_letters (id TEXT PRIMARY KEY, original_queue TEXT NOT NULL, original_job_id INTEGER NOT NULL, "
      "idempotency_key TEXT NOT NULL, original_payload TEXT NOT NULL, error_message TEXT NOT NULL, attempt_count INTEGER NOT NULL, "
      "worker_id TEXT NOT NULL, first_attempt_at_ms INTEGER NOT NULL, moved_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS dead_letters_queue ON dead_letters(original_queue, moved_at_ms);",
      "CREATE TABLE IF NOT EXISTS import_runs (run_id TEXT PRIMARY KEY, source_system TEXT NOT NULL, source_batch_id TEXT NOT NULL, "
      "file_hash TEXT NOT NULL, filename TEXT NOT NULL DEFAULT '', import_kind TEXT NOT NULL DEFAULT '', "
      "status TEXT NOT NULL CHECK (status IN ('claimed','in_progress','completed','failed','rolled_back')), "
      "rows_fetched INTEGER NOT NULL DEFAULT 0, rows_inserted INTEGER NOT NULL DEFAULT 0, rows_skipped INTEGER NOT NULL DEFAULT 0, "
      "rows_errored INTEGER NOT NULL DEFAULT 0, claimed_at_ms INTEGER NOT NULL, heartbeat_at_ms INTEGER NOT NULL, "
      "completed_at_ms INTEGER NOT NULL DEFAULT 0, worker_id TEXT NOT NULL, error_details TEXT NOT NULL DEFAULT '', "
      "rollback_reason TEXT NOT NULL DEFAULT '', rolled_back_at_ms INTEGER NOT NULL DEFAULT 0, "
      "UNIQUE(source_system, source_batch_id, file_hash));",
      "CREATE INDEX IF NOT EXISTS import_runs_active ON import_runs(status, heartbeat_at_ms);",
      "CREATE TABLE IF NOT EXISTS import_rows (row_id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "run_id TEXT NOT NULL REFERENCES import_runs(run_id), dedupe_key TEXT NOT NULL, row_num INTEGER NOT NULL, payload TEXT NOT NULL, "
      "status TEXT NOT NULL CHECK (status IN ('pending','promoted','skipped','failed','rolled_back')), "
      "error_message TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      // rolled back rows keep their key; only live rows are deduplicated
      "CREATE UNIQUE INDEX IF NOT EXISTS import_rows_live_dedupe ON import_rows(dedupe_key) WHERE status <> 'rolled_back';",
      "CREATE INDEX IF NOT EXISTS import_rows_run ON import_rows(run_id, row_num);",
      "CREATE TABLE IF NOT EXISTS worker_heartbeats (worker_id TEXT PRIMARY KEY, queue_name TEXT NOT NULL, hostname TEXT NOT NULL, "
      "pid INTEGER NOT NULL, status TEXT NOT NULL, jobs_processed INTEGER NOT NULL DEFAULT 0, jobs_failed INTEGER NOT NULL DEFAULT 0, "
      "jobs_skipped INTEGER NOT NULL DEFAULT 0, jobs_invalid INTEGER NOT NULL DEFAULT 0, last_seen_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS jobclaim_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("INSERT OR IGNORE INTO jobclaim_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(kSchemaVersion) +
          ", CAST((julianday('now') - 2440587.5) * 86400000 AS INTEGER));");

  for (const auto& sql : kProbeSql) {
    db.Exec(sql);
  }
}
#else
void BootstrapSqliteSchema(sqlite::SqliteDB&) {
  throw std::runtime_error("sqlite backend requested but not enabled at build time");
}
#endif

#if JOBCLAIM_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS messages (msg_id BIGSERIAL PRIMARY KEY, queue_name TEXT NOT NULL, payload TEXT NOT NULL, "
          "enqueued_at_ms BIGINT NOT NULL, read_count INTEGER NOT NULL DEFAULT 0, visibility_deadline_ms BIGINT NOT NULL DEFAULT 0);");
  tx.exec("CREATE INDEX IF NOT EXISTS messages_queue_visibility ON messages(queue_name, visibility_deadline_ms, msg_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS processed_jobs (idempotency_key VARCHAR(512) PRIMARY KEY, job_id BIGINT NOT NULL, queue_name TEXT NOT NULL, "
          "worker_id TEXT NOT NULL, status TEXT NOT NULL CHECK (status IN ('processing','completed','failed')), attempts INTEGER NOT NULL DEFAULT 0, "
          "result TEXT NOT NULL DEFAULT '', last_error TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS processed_jobs_queue_status ON processed_jobs(queue_name, status);");
  tx.exec("CREATE TABLE IF NOT EXISTS dead_letters (id TEXT PRIMARY KEY, original_queue TEXT NOT NULL, original_job_id BIGINT NOT NULL, "
          "idempotency_key TEXT NOT NULL, original_payload TEXT NOT NULL, error_message TEXT NOT NULL, attempt_count INTEGER NOT NULL, "
          "worker_id TEXT NOT NULL, first_attempt_at_ms BIGINT NOT NULL, moved_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS dead_letters_queue ON dead_letters(original_queue, moved_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS import_runs (run_id TEXT PRIMARY KEY, source_system TEXT NOT NULL, source_batch_id TEXT NOT NULL, "
          "file_hash TEXT NOT NULL, filename TEXT NOT NULL DEFAULT '', import_kind TEXT NOT NULL DEFAULT '', "
          "status TEXT NOT NULL CHECK (status IN ('claimed','in_progress','completed','failed','rolled_back')), "
          "rows_fetched BIGINT NOT NULL DEFAULT 0, rows_inserted BIGINT NOT NULL DEFAULT 0, rows_skipped BIGINT NOT NULL DEFAULT 0, "
          "rows_errored BIGINT NOT NULL DEFAULT 0, claimed_at_ms BIGINT NOT NULL, heartbeat_at_ms BIGINT NOT NULL, "
          "completed_at_ms BIGINT NOT NULL DEFAULT 0, worker_id TEXT NOT NULL, error_details TEXT NOT NULL DEFAULT '', "
          "rollback_reason TEXT NOT NULL DEFAULT '', rolled_back_at_ms BIGINT NOT NULL DEFAULT 0, "
          "UNIQUE(source_system, source_batch_id, file_hash));");
  tx.exec("CREATE INDEX IF NOT EXISTS import_runs_active ON import_runs(status, heartbeat_at_ms);");
  tx.exec("CREATE TABLE IF NOT EXISTS import_rows (row_id BIGSERIAL PRIMARY KEY, "
          "run_id TEXT NOT NULL REFERENCES import_runs(run_id), dedupe_key TEXT NOT NULL, row_num BIGINT NOT NULL, payload TEXT NOT NULL, "
          "status TEXT NOT NULL CHECK (status IN ('pending','promoted','skipped','failed','rolled_back')), "
          "error_message TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS import_rows_live_dedupe ON import_rows(dedupe_key) WHERE status <> 'rolled_back';");
  tx.exec("CREATE INDEX IF NOT EXISTS import_rows_run ON import_rows(run_id, row_num);");
  tx.exec("CREATE TABLE IF NOT EXISTS worker_heartbeats (worker_id TEXT PRIMARY KEY, queue_name TEXT NOT NULL, hostname TEXT NOT NULL, "
          "pid BIGINT NOT NULL, status TEXT NOT NULL, jobs_processed BIGINT NOT NULL DEFAULT 0, jobs_failed BIGINT NOT NULL DEFAULT 0, "
          "jobs_skipped BIGINT NOT NULL DEFAULT 0, jobs_invalid BIGINT NOT NULL DEFAULT 0, last_seen_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE TABLE IF NOT EXISTS jobclaim_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());");
  tx.exec("INSERT INTO jobclaim_schema_migrations(version) VALUES(" + std::to_string(kSchemaVersion) + ") ON CONFLICT DO NOTHING;");

  for (const auto& sql : kProbeSql) {
    tx.exec(sql);
  }
  tx.commit();
}
#else
void BootstrapPostgresSchema(const std::shared_ptr<postgres::PgPool>&) {
  throw std::runtime_error("postgres backend requested but not enabled at build time");
}
#endif

} // namespace jobclaim::db
