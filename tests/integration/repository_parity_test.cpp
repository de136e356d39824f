#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/batch/batch_claim_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/schema.hpp"
#include "internal/idempotency/idempotency_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

#if JOBCLAIM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if JOBCLAIM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using jobclaim::db::ErrorCode;
using jobclaim::db::Repository;
using jobclaim::db::memory::MemoryRepository;
using jobclaim::db::model::DeadLetterRecord;
using jobclaim::db::model::ImportRowStatus;
using jobclaim::db::model::ImportRunRecord;
using jobclaim::db::model::ImportRunStatus;
using jobclaim::db::model::JobStatus;
using jobclaim::db::model::MessageRecord;
using jobclaim::db::model::ProcessedJobClaim;
using jobclaim::db::model::ProcessedJobRecord;
using jobclaim::db::model::WorkerHeartbeatRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyLeaseAndVisibility(Repository& repo, const std::string& queue) {
  const auto now = NowMs();
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 3; ++i) {
      MessageRecord message{.queue_name = queue, .payload = R"({"n":)" + std::to_string(i) + "}", .enqueued_at_ms = now, .visibility_deadline_ms = now};
      assert(repo.EnqueueMessage(*tx, message));
      assert(message.msg_id != 0);
    }
    tx->Commit();
  }

  std::vector<MessageRecord> leased;
  {
    auto tx = repo.Begin();
    leased  = repo.LeaseMessages(*tx, queue, 2, now, now + 60'000);
    tx->Commit();
  }
  assert(leased.size() == 2);
  assert(leased[0].msg_id < leased[1].msg_id);
  assert(leased[0].read_count == 1);

  {
    auto tx   = repo.Begin();
    auto rest = repo.LeaseMessages(*tx, queue, 10, now, now + 60'000);
    assert(rest.size() == 1);
    assert(repo.LeaseMessages(*tx, queue, 10, now, now + 60'000).empty());

    auto metrics = repo.GetQueueMetrics(*tx, queue, now);
    assert(metrics.total == 3);
    assert(metrics.in_flight == 3);
    assert(metrics.readable == 0);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.SetMessageVisibility(*tx, queue, leased[0].msg_id, now));
    assert(repo.DeleteMessage(*tx, queue, leased[1].msg_id));
    assert(repo.DeleteMessage(*tx, queue, leased[1].msg_id).code == ErrorCode::NotFound);
    assert(repo.DeleteMessage(*tx, queue + "-other", leased[0].msg_id).code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx    = repo.Begin();
    auto again = repo.LeaseMessages(*tx, queue, 10, now, now + 60'000);
    assert(again.size() == 1);
    assert(again[0].msg_id == leased[0].msg_id);
    assert(again[0].read_count == 2);

    bool listed = false;
    for (const auto& name : repo.ListQueues(*tx)) listed = listed || name == queue;
    assert(listed);
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& queue) {
  {
    auto          tx = repo.Begin();
    MessageRecord message{.queue_name = queue, .payload = "{}", .enqueued_at_ms = NowMs(), .visibility_deadline_ms = NowMs()};
    assert(repo.EnqueueMessage(*tx, message));
    tx->Rollback();
  }
  auto check_tx = repo.Begin();
  assert(repo.GetQueueMetrics(*check_tx, queue, NowMs()).total == 0);
  check_tx->Commit();
}

void VerifyProcessedJobClaims(Repository& repo, const std::string& key) {
  const auto now = NowMs();
  auto       tx  = repo.Begin();

  ProcessedJobRecord candidate{.idempotency_key = key, .job_id = 1, .queue_name = "parity", .worker_id = "w1", .created_at_ms = now,
                               .updated_at_ms = now};
  auto first = repo.ClaimProcessedJob(*tx, candidate);
  assert(first.kind == ProcessedJobClaim::Kind::Inserted);
  assert(first.record.attempts == 1);
  assert(first.record.status == JobStatus::Processing);

  // same message redelivered: re-claim and count the attempt
  auto redelivered = repo.ClaimProcessedJob(*tx, candidate);
  assert(redelivered.kind == ProcessedJobClaim::Kind::Reclaimed);
  assert(redelivered.record.attempts == 2);

  // a duplicate message must not steal a live claim
  auto other   = candidate;
  other.job_id = 2;
  auto blocked = repo.ClaimProcessedJob(*tx, other);
  assert(blocked.kind == ProcessedJobClaim::Kind::AlreadyExists);
  assert(blocked.record.job_id == 1);

  assert(repo.FailProcessedJob(*tx, key, "boom", now));
  auto after_failure = repo.ClaimProcessedJob(*tx, other);
  assert(after_failure.kind == ProcessedJobClaim::Kind::Reclaimed);
  assert(after_failure.record.attempts == 3);
  assert(after_failure.record.job_id == 2);

  assert(repo.CompleteProcessedJob(*tx, key, R"({"ok":true})", now));
  auto done = repo.GetProcessedJob(*tx, key);
  assert(done.has_value());
  assert(done->status == JobStatus::Completed);
  assert(repo.ClaimProcessedJob(*tx, candidate).kind == ProcessedJobClaim::Kind::AlreadyExists);

  // resetting a completed job keeps it completed
  assert(repo.ResetProcessedJobAttempts(*tx, key, now));
  auto reset = repo.GetProcessedJob(*tx, key);
  assert(reset->attempts == 0);
  assert(reset->status == JobStatus::Completed);

  assert(repo.ResetProcessedJobAttempts(*tx, key + "-missing", now).code == ErrorCode::NotFound);
  assert(repo.CompleteProcessedJob(*tx, key + "-missing", "{}", now).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyConcurrentClaims(std::shared_ptr<Repository> repo, const std::string& key) {
  jobclaim::idempotency::IdempotencyRegistry registry(repo);

  std::atomic<int>         inserted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      auto outcome = registry.Claim(key, 100 + i, "parity", "w-" + std::to_string(i));
      if (outcome.kind == jobclaim::idempotency::ClaimKind::Inserted) inserted++;
    });
  }
  for (auto& t : threads) t.join();
  assert(inserted == 1);
  assert(registry.Get(key)->attempts == 1);
}

void VerifyDeadLetterOrdering(Repository& repo, const std::string& queue) {
  const auto base = NowMs();
  auto       tx   = repo.Begin();
  for (int i = 0; i < 3; ++i) {
    DeadLetterRecord entry{.id = queue + "-dlq-" + std::to_string(i), .original_queue = queue, .original_job_id = i, .idempotency_key = queue + "-key",
                           .original_payload = "{}", .error_message = "boom", .attempt_count = 3, .worker_id = "w",
                           .first_attempt_at_ms = base, .moved_at_ms = base + static_cast<uint64_t>(i)};
    assert(repo.InsertDeadLetter(*tx, entry));
  }

  auto listed = repo.ListDeadLetters(*tx, queue, 10);
  assert(listed.size() == 3);
  assert(listed[0].id == queue + "-dlq-0");
  assert(listed[2].id == queue + "-dlq-2");
  assert(listed[1].attempt_count == 3);
  assert(repo.ListDeadLetters(*tx, queue, 2).size() == 2);

  assert(repo.DeleteDeadLetter(*tx, listed[0].id));
  assert(!repo.GetDeadLetter(*tx, listed[0].id).has_value());
  assert(repo.DeleteDeadLetter(*tx, listed[0].id).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyImportRunLifecycle(std::shared_ptr<Repository> repo, const std::string& batch) {
  jobclaim::batch::CoordinatorOptions options;
  options.stale_after = std::chrono::milliseconds(50);
  jobclaim::batch::BatchClaimCoordinator coordinator(repo, options);

  auto first = coordinator.Claim("parity", batch, "hash", batch + ".csv", "plaintiff", "worker-a");
  assert(first.IsClaimed());
  assert(coordinator.Claim("parity", batch, "hash", "", "plaintiff", "worker-b").status == jobclaim::batch::ClaimStatus::InProgress);

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  auto takeover = coordinator.Claim("parity", batch, "hash", "", "plaintiff", "worker-b");
  assert(takeover.IsClaimed());
  assert(takeover.taken_over);
  assert(takeover.run_id == first.run_id);
  assert(takeover.holder_worker_id == "worker-a");
  assert(!coordinator.Heartbeat(first.run_id, std::string("worker-a")));
  assert(coordinator.Heartbeat(first.run_id, std::string("worker-b")));

  bool conflict = false;
  try {
    coordinator.Finalize(first.run_id, {.fetched = 1, .inserted = 1}, std::nullopt, true, std::string("worker-a"));
  } catch (const jobclaim::util::ClaimConflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(coordinator.Get(first.run_id)->status == ImportRunStatus::Claimed);

  for (int i = 1; i <= 4; ++i) {
    assert(coordinator.InsertRow(first.run_id, static_cast<uint64_t>(i), "parity", batch + "-row-" + std::to_string(i), "{}"));
  }
  assert(!coordinator.InsertRow(first.run_id, 5, "parity", batch + "-ROW-1 ", "{}"));

  assert(coordinator.Finalize(first.run_id, {.fetched = 5, .inserted = 4, .skipped = 1}));
  auto reconciled = coordinator.Reconcile(first.run_id, 5);
  assert(!reconciled.is_valid);
  assert(reconciled.delta == 1);
  assert(coordinator.Get(first.run_id)->status == ImportRunStatus::Failed);

  auto rollback = coordinator.Rollback(first.run_id, "parity");
  assert(rollback.success);
  assert(rollback.rows_affected == 4);
  assert(coordinator.Rollback(first.run_id, "parity").rows_affected == 0);

  // re-import stages new rows; the rolled back ones and the reason stay
  auto redo = coordinator.Claim("parity", batch, "hash", "", "plaintiff", "worker-c");
  assert(redo.IsClaimed());
  assert(!redo.taken_over);
  assert(redo.run_id == first.run_id);
  auto reclaimed = coordinator.Get(redo.run_id);
  assert(reclaimed->rollback_reason == "parity");
  assert(reclaimed->rolled_back_at_ms != 0);
  auto details = jobclaim::util::ParseJsonObject(reclaimed->error_details);
  assert(details.fields().at("previous_status").string_value() == "rolled_back");
  assert(details.fields().at("rollback_reason").string_value() == "parity");

  assert(coordinator.InsertRow(redo.run_id, 1, "parity", batch + "-row-1", R"({"redo":true})"));
  assert(!coordinator.InsertRow(redo.run_id, 2, "parity", batch + "-row-1", "{}"));
  auto rows = coordinator.Rows(redo.run_id);
  assert(rows.size() == 5);
  assert(rows[0].row_number == 1 && rows[1].row_number == 1);
  assert(rows[0].status == ImportRowStatus::RolledBack);
  assert(rows[0].payload == "{}");
  assert(rows[1].status == ImportRowStatus::Pending);
  assert(rows[1].row_id > rows[0].row_id);
  assert(rows[2].status == ImportRowStatus::RolledBack);

  assert(coordinator.Finalize(redo.run_id, {.fetched = 1, .inserted = 1}));
  assert(coordinator.Reconcile(redo.run_id).is_valid);
  assert(coordinator.Claim("parity", batch, "hash", "", "plaintiff", "worker-d").status == jobclaim::batch::ClaimStatus::Duplicate);

  bool found = false;
  for (const auto& run : coordinator.Recent(50)) found = found || run.run_id == first.run_id;
  assert(found);
}

void VerifyImportRunIdentityIsImmutable(Repository& repo, const std::string& batch) {
  const auto      now = NowMs();
  ImportRunRecord candidate{.run_id = batch + "-run", .source_system = "parity", .source_batch_id = batch, .file_hash = "h", .claimed_at_ms = now,
                            .heartbeat_at_ms = now, .worker_id = "w"};

  auto tx      = repo.Begin();
  auto claimed = repo.ClaimImportRun(*tx, candidate, 0);
  assert(claimed.has_value());
  assert(!repo.ClaimImportRun(*tx, candidate, 0).has_value());

  auto changed            = *claimed;
  changed.source_batch_id = batch + "-other";
  changed.worker_id       = "w2";
  assert(repo.UpdateImportRun(*tx, changed));
  auto stored = repo.GetImportRun(*tx, candidate.run_id);
  assert(stored->source_batch_id == batch);
  assert(stored->worker_id == "w2");
  assert(repo.FindImportRun(*tx, "parity", batch, "h").has_value());
  assert(!repo.FindImportRun(*tx, "parity", batch + "-other", "h").has_value());
  assert(repo.TouchImportRun(*tx, batch + "-missing", std::nullopt, now).code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyWorkerHeartbeats(Repository& repo, const std::string& worker_id) {
  WorkerHeartbeatRecord heartbeat{.worker_id = worker_id, .queue_name = "parity", .hostname = "host", .pid = 42, .status = "starting",
                                  .last_seen_at_ms = NowMs()};
  auto tx = repo.Begin();
  assert(repo.UpsertWorkerHeartbeat(*tx, heartbeat));
  heartbeat.status         = "healthy";
  heartbeat.jobs_processed = 7;
  assert(repo.UpsertWorkerHeartbeat(*tx, heartbeat));

  int matches = 0;
  for (const auto& row : repo.ListWorkerHeartbeats(*tx)) {
    if (row.worker_id != worker_id) continue;
    matches++;
    assert(row.status == "healthy");
    assert(row.jobs_processed == 7);
    assert(row.pid == 42);
  }
  assert(matches == 1);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto          tx = repo->Begin();
    MessageRecord message{.queue_name = prefix + "-queue", .payload = R"({"durable":true})", .enqueued_at_ms = NowMs(), .visibility_deadline_ms = NowMs()};
    assert(repo->EnqueueMessage(*tx, message));
    ProcessedJobRecord job{.idempotency_key = prefix + "-key", .job_id = message.msg_id, .queue_name = prefix + "-queue", .worker_id = "w",
                           .created_at_ms = NowMs(), .updated_at_ms = NowMs()};
    assert(repo->ClaimProcessedJob(*tx, job).kind == ProcessedJobClaim::Kind::Inserted);
    assert(repo->CompleteProcessedJob(*tx, job.idempotency_key, "{}", NowMs()));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetQueueMetrics(*tx, prefix + "-queue", NowMs()).total == 1);
  auto job = repo->GetProcessedJob(*tx, prefix + "-key");
  assert(job.has_value());
  assert(job->status == JobStatus::Completed);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  auto shared = std::make_shared<MemoryRepository>();
  return BackendFactory{
      .name             = "memory",
      .make_repository  = [shared]() { return shared; },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if JOBCLAIM_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("jobclaim_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<jobclaim::db::sqlite::SqliteDB>(db_path);
    jobclaim::db::BootstrapSqliteSchema(*db);
    return std::make_shared<jobclaim::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if JOBCLAIM_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("JOBCLAIM_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("JOBCLAIM_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<jobclaim::db::postgres::PgPool>(conninfo);
    jobclaim::db::BootstrapPostgresSchema(pool);
    return std::make_shared<jobclaim::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // postgres keeps rows between runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyLeaseAndVisibility(*repo, prefix + "-lease");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyProcessedJobClaims(*repo, prefix + "-claims");
  VerifyConcurrentClaims(repo, prefix + "-race");
  VerifyDeadLetterOrdering(*repo, prefix + "-dlq");
  VerifyImportRunLifecycle(repo, prefix + "-batch");
  VerifyImportRunIdentityIsImmutable(*repo, prefix + "-identity");
  VerifyWorkerHeartbeats(*repo, prefix + "-worker");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if JOBCLAIM_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if JOBCLAIM_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "jobclaim_integration_repository_parity: pass\n";
  return 0;
}
