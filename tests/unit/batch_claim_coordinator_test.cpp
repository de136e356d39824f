#include "internal/batch/batch_claim_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace std::chrono_literals;
using jobclaim::batch::BatchClaimCoordinator;
using jobclaim::batch::ClaimStatus;
using jobclaim::batch::CoordinatorOptions;
using jobclaim::batch::RowCounts;
using jobclaim::db::model::ImportRowStatus;
using jobclaim::db::model::ImportRunStatus;

std::shared_ptr<BatchClaimCoordinator> MakeCoordinator(std::chrono::milliseconds stale_after = 30min) {
  CoordinatorOptions options;
  options.stale_after = stale_after;
  return std::make_shared<BatchClaimCoordinator>(std::make_shared<jobclaim::db::memory::MemoryRepository>(), options);
}

RowCounts Counts(uint64_t fetched, uint64_t inserted, uint64_t skipped = 0, uint64_t errored = 0) {
  RowCounts counts;
  counts.fetched  = fetched;
  counts.inserted = inserted;
  counts.skipped  = skipped;
  counts.errored  = errored;
  return counts;
}

void InsertRows(BatchClaimCoordinator& c, const std::string& run_id, int first, int count) {
  for (int i = first; i < first + count; ++i) {
    assert(c.InsertRow(run_id, static_cast<uint64_t>(i), "simplicity", "case-" + std::to_string(i), "{\"row\":" + std::to_string(i) + "}"));
  }
}

void TestWorkerScenarioABC() {
  auto c = MakeCoordinator();

  auto a = c->Claim("simplicity", "b1", "hashX", "b1.csv", "plaintiff", "worker-a");
  assert(a.status == ClaimStatus::Claimed);
  assert(!a.taken_over);

  auto b = c->Claim("simplicity", "b1", "hashX", "b1.csv", "plaintiff", "worker-b");
  assert(b.status == ClaimStatus::InProgress);
  assert(b.run_id == a.run_id);
  assert(b.holder_worker_id == "worker-a");

  InsertRows(*c, a.run_id, 1, 100);
  assert(c->Finalize(a.run_id, Counts(100, 100)));
  assert(c->Get(a.run_id)->status == ImportRunStatus::Completed);

  auto cc = c->Claim("simplicity", "b1", "hashX", "b1.csv", "plaintiff", "worker-c");
  assert(cc.status == ClaimStatus::Duplicate);
  assert(cc.run_id == a.run_id);

  // worker C re-reads the same file: every row is already staged
  for (int i = 1; i <= 100; ++i) {
    assert(!c->InsertRow(cc.run_id, static_cast<uint64_t>(i), "simplicity", "case-" + std::to_string(i), "{}"));
  }
  assert(c->Rows(a.run_id).size() == 100);
}

void TestDifferentFileHashIsADifferentBatch() {
  auto c  = MakeCoordinator();
  auto r1 = c->Claim("simplicity", "b1", "hash1", "", "plaintiff", "w");
  auto r2 = c->Claim("simplicity", "b1", "hash2", "", "plaintiff", "w");
  assert(r1.IsClaimed() && r2.IsClaimed());
  assert(r1.run_id != r2.run_id);
}

void TestConcurrentClaimsHaveOneWinner() {
  auto              c = MakeCoordinator();
  std::atomic<int>  claimed{0};
  std::atomic<int>  in_progress{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&, i] {
      auto r = c->Claim("jbi", "race", "h", "race.csv", "plaintiff", "w-" + std::to_string(i));
      if (r.status == ClaimStatus::Claimed) claimed++;
      if (r.status == ClaimStatus::InProgress) in_progress++;
    });
  }
  for (auto& t : threads) t.join();
  assert(claimed == 1);
  assert(in_progress == 15);
}

void TestDedupeKeyInsertsOnce() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b2", "h", "", "plaintiff", "w");

  assert(c->InsertRow(run.run_id, 1, "simplicity", "Jane Doe|2024-001", R"({"n":1})"));
  assert(!c->InsertRow(run.run_id, 2, "simplicity", "  JANE  doe|2024-001", R"({"n":2})"));
  assert(c->InsertRow(run.run_id, 3, "jbi", "Jane Doe|2024-001", R"({"n":3})"));

  auto rows = c->Rows(run.run_id);
  assert(rows.size() == 2);
  assert(rows[0].row_number == 1);
  assert(rows[0].status == ImportRowStatus::Pending);
}

void TestEmptyNaturalKeyIsRejected() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b2e", "h", "", "plaintiff", "w");

  auto rejects = [&](const std::string& source_system, const std::string& natural_key) {
    bool threw = false;
    try {
      c->InsertRow(run.run_id, 1, source_system, natural_key, R"({"name":"Alice"})");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    return threw;
  };
  assert(rejects("simplicity", ""));
  assert(rejects("simplicity", "   \t "));
  assert(rejects("", "Jane Doe"));

  bool threw = false;
  try {
    c->RecordRowError(run.run_id, 2, "simplicity", " ", R"({"name":"Bob"})", "bad row");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(c->Rows(run.run_id).empty());
}

void TestStaleClaimIsTakenOverByAnotherWorker() {
  auto c = MakeCoordinator(50ms);
  auto a = c->Claim("simplicity", "b3", "h", "b3.csv", "plaintiff", "worker-a");
  assert(a.IsClaimed());

  std::this_thread::sleep_for(120ms);
  assert(c->Stale().size() == 1);

  auto b = c->Claim("simplicity", "b3", "h", "b3.csv", "plaintiff", "worker-b");
  assert(b.status == ClaimStatus::Claimed);
  assert(b.run_id == a.run_id);
  assert(b.taken_over);
  assert(b.holder_worker_id == "worker-a");

  auto run = c->Get(a.run_id);
  assert(run->worker_id == "worker-b");
  auto details = jobclaim::util::ParseJsonObject(run->error_details);
  assert(details.fields().at("previous_worker_id").string_value() == "worker-a");

  // fenced: the old holder can no longer heartbeat
  assert(!c->Heartbeat(a.run_id, std::string("worker-a")));
  assert(c->Heartbeat(a.run_id, std::string("worker-b")));
  assert(c->Heartbeat(a.run_id));
  assert(c->Stale().empty());
}

void TestSupersededWorkerCannotFinalizeOrReconcile() {
  auto c = MakeCoordinator(50ms);
  auto a = c->Claim("simplicity", "b3f", "h", "", "plaintiff", "worker-a");
  InsertRows(*c, a.run_id, 1, 2);

  std::this_thread::sleep_for(120ms);
  auto b = c->Claim("simplicity", "b3f", "h", "", "plaintiff", "worker-b");
  assert(b.taken_over);

  bool conflict = false;
  try {
    c->Finalize(a.run_id, Counts(5, 5), std::nullopt, true, std::string("worker-a"));
  } catch (const jobclaim::util::ClaimConflict& e) {
    conflict = true;
    assert(e.RunId() == a.run_id);
  }
  assert(conflict);

  conflict = false;
  try {
    c->Reconcile(a.run_id, 2, std::string("worker-a"));
  } catch (const jobclaim::util::ClaimConflict&) {
    conflict = true;
  }
  assert(conflict);

  auto run = c->Get(a.run_id);
  assert(run->status == ImportRunStatus::Claimed);
  assert(run->worker_id == "worker-b");
  assert(run->rows_fetched == 0);

  assert(c->Finalize(b.run_id, Counts(2, 2), std::nullopt, true, std::string("worker-b")));
  assert(c->Reconcile(b.run_id, std::nullopt, std::string("worker-b")).is_valid);
  assert(c->Get(b.run_id)->status == ImportRunStatus::Completed);
}

void TestFreshClaimIsNotTakenOver() {
  auto c = MakeCoordinator(10s);
  auto a = c->Claim("simplicity", "b4", "h", "", "plaintiff", "worker-a");
  assert(c->Heartbeat(a.run_id, std::string("worker-a")));
  auto b = c->Claim("simplicity", "b4", "h", "", "plaintiff", "worker-b");
  assert(b.status == ClaimStatus::InProgress);
}

void TestHeartbeatOnFinishedOrUnknownRunFails() {
  auto c = MakeCoordinator();
  auto a = c->Claim("simplicity", "b5", "h", "", "plaintiff", "w");
  assert(c->Finalize(a.run_id, Counts(0, 0)));
  assert(!c->Heartbeat(a.run_id));
  assert(!c->Heartbeat("00000000-0000-0000-0000-000000000000"));
}

void TestMarkInProgressRequiresHolder() {
  auto c = MakeCoordinator();
  auto a = c->Claim("simplicity", "b6", "h", "", "plaintiff", "worker-a");
  assert(!c->MarkInProgress(a.run_id, "worker-b"));
  assert(c->MarkInProgress(a.run_id, "worker-a"));
  assert(c->Get(a.run_id)->status == ImportRunStatus::InProgress);

  // still active: a second claimant sees in_progress
  assert(c->Claim("simplicity", "b6", "h", "", "plaintiff", "worker-b").status == ClaimStatus::InProgress);
}

void TestFinalizeStatusRules() {
  auto c = MakeCoordinator();

  auto fatal = c->Claim("s", "fatal", "h", "", "k", "w");
  auto details = jobclaim::util::ParseJsonObject(R"({"fatal":true,"message":"parse error"})");
  assert(c->Finalize(fatal.run_id, Counts(10, 3, 0, 7), details, true));
  auto run = c->Get(fatal.run_id);
  assert(run->status == ImportRunStatus::Failed);
  assert(run->rows_errored == 7);
  assert(run->completed_at_ms != 0);

  auto incomplete = c->Claim("s", "incomplete", "h", "", "k", "w");
  assert(c->Finalize(incomplete.run_id, Counts(10, 10), std::nullopt, false));
  assert(c->Get(incomplete.run_id)->status == ImportRunStatus::Failed);

  // a failed run may be claimed again
  auto retry = c->Claim("s", "incomplete", "h", "", "k", "w2");
  assert(retry.IsClaimed());
  assert(!retry.taken_over);
  assert(retry.run_id == incomplete.run_id);
  assert(c->Get(retry.run_id)->rows_fetched == 0);

  assert(!c->Finalize("00000000-0000-0000-0000-000000000000", Counts(1, 1)));
}

void TestReconcileMismatchMarksRunFailed() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b7", "h", "", "plaintiff", "w");

  InsertRows(*c, run.run_id, 1, 97);
  assert(c->Finalize(run.run_id, Counts(100, 100)));
  assert(c->Get(run.run_id)->status == ImportRunStatus::Completed);

  auto result = c->Reconcile(run.run_id, 100);
  assert(!result.is_valid);
  assert(result.expected_count == 100);
  assert(result.actual_count == 97);
  assert(result.delta == 3);

  auto after = c->Get(run.run_id);
  assert(after->status == ImportRunStatus::Failed);
  assert(after->rows_inserted == 97);
  auto details = jobclaim::util::ParseJsonObject(after->error_details);
  assert(details.fields().at("reconciliation_failed").bool_value());
  assert(details.fields().at("delta").number_value() == 3);
}

void TestReconcileDefaultsToRowsFetched() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b8", "h", "", "plaintiff", "w");
  InsertRows(*c, run.run_id, 1, 5);
  assert(c->RecordRowError(run.run_id, 6, "simplicity", "case-6", "{}", "missing amount"));
  assert(c->Finalize(run.run_id, Counts(6, 5, 0, 1)));

  auto result = c->Reconcile(run.run_id);
  assert(result.is_valid);
  assert(result.expected_count == 6);
  assert(result.actual_count == 6);
  assert(result.delta == 0);

  auto after = c->Get(run.run_id);
  assert(after->status == ImportRunStatus::Completed);
  assert(after->rows_inserted == 5);
  assert(after->rows_errored == 1);

  auto rows = c->Rows(run.run_id);
  assert(rows.back().status == ImportRowStatus::Failed);
  assert(rows.back().error_message == "missing amount");
}

void TestReconcileErrors() {
  auto c = MakeCoordinator();

  bool not_found = false;
  try {
    c->Reconcile("00000000-0000-0000-0000-000000000000");
  } catch (const jobclaim::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  auto run = c->Claim("simplicity", "b9", "h", "", "plaintiff", "w");
  assert(c->Rollback(run.run_id, "bad file").success);

  bool invalid = false;
  try {
    c->Reconcile(run.run_id, 0);
  } catch (const jobclaim::util::InvalidState&) {
    invalid = true;
  }
  assert(invalid);
}

void TestRollbackOfCompletedRun() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b10", "h", "b10.csv", "plaintiff", "w");
  InsertRows(*c, run.run_id, 1, 5);
  assert(c->Finalize(run.run_id, Counts(5, 5)));

  auto result = c->Rollback(run.run_id, "wrong county");
  assert(result.success);
  assert(result.rows_affected == 5);

  auto after = c->Get(run.run_id);
  assert(after->status == ImportRunStatus::RolledBack);
  assert(after->rollback_reason == "wrong county");
  assert(after->rolled_back_at_ms != 0);
  assert(after->rows_fetched == 5);
  assert(after->rows_inserted == 5);
  auto details = jobclaim::util::ParseJsonObject(after->error_details);
  assert(details.fields().at("rollback_reason").string_value() == "wrong county");

  for (const auto& row : c->Rows(run.run_id)) assert(row.status == ImportRowStatus::RolledBack);

  auto again = c->Rollback(run.run_id, "again");
  assert(again.success);
  assert(again.rows_affected == 0);

  assert(!c->Rollback("00000000-0000-0000-0000-000000000000", "x").success);

  bool threw = false;
  try {
    c->Finalize(run.run_id, Counts(5, 5));
  } catch (const jobclaim::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRolledBackBatchCanBeReimported() {
  auto c   = MakeCoordinator();
  auto run = c->Claim("simplicity", "b11", "h", "", "plaintiff", "w");
  InsertRows(*c, run.run_id, 1, 3);
  assert(c->Finalize(run.run_id, Counts(3, 3)));
  assert(c->Rollback(run.run_id, "redo").success);

  auto redo = c->Claim("simplicity", "b11", "h", "", "plaintiff", "w2");
  assert(redo.IsClaimed());
  assert(!redo.taken_over);
  assert(redo.run_id == run.run_id);

  // the rollback audit survives the re-claim
  auto reclaimed = c->Get(redo.run_id);
  assert(reclaimed->status == ImportRunStatus::Claimed);
  assert(reclaimed->rollback_reason == "redo");
  assert(reclaimed->rolled_back_at_ms != 0);
  auto details = jobclaim::util::ParseJsonObject(reclaimed->error_details);
  assert(details.fields().at("rollback_reason").string_value() == "redo");
  assert(details.fields().at("previous_status").string_value() == "rolled_back");
  assert(details.fields().at("previous_worker_id").string_value() == "w");

  InsertRows(*c, redo.run_id, 1, 3);
  assert(c->Finalize(redo.run_id, Counts(3, 3)));
  assert(c->Reconcile(redo.run_id).is_valid);

  // old rows stay rolled back next to the new ones
  auto rows = c->Rows(redo.run_id);
  assert(rows.size() == 6);
  uint64_t rolled_back = 0;
  for (const auto& row : rows) {
    if (row.status == ImportRowStatus::RolledBack) rolled_back++;
  }
  assert(rolled_back == 3);
  assert(c->Get(redo.run_id)->rollback_reason == "redo");
}

void TestRolledBackRowKeepsItsRunAndPayload() {
  auto c  = MakeCoordinator();
  auto r1 = c->Claim("simplicity", "vendor-1", "h1", "", "plaintiff", "w1");
  assert(c->InsertRow(r1.run_id, 1, "simplicity", "Jane Doe", R"({"amount":"100"})"));
  assert(c->Finalize(r1.run_id, Counts(1, 1)));
  assert(c->Rollback(r1.run_id, "bad vendor file").success);

  // the same person arrives in another batch
  auto r2 = c->Claim("simplicity", "vendor-2", "h2", "", "plaintiff", "w2");
  assert(c->InsertRow(r2.run_id, 1, "simplicity", "jane  doe", R"({"amount":"250"})"));
  assert(!c->InsertRow(r2.run_id, 2, "simplicity", "JANE DOE", R"({"amount":"250"})"));

  auto old_rows = c->Rows(r1.run_id);
  assert(old_rows.size() == 1);
  assert(old_rows[0].run_id == r1.run_id);
  assert(old_rows[0].payload == R"({"amount":"100"})");
  assert(old_rows[0].status == ImportRowStatus::RolledBack);

  auto new_rows = c->Rows(r2.run_id);
  assert(new_rows.size() == 1);
  assert(new_rows[0].dedupe_key == old_rows[0].dedupe_key);
  assert(new_rows[0].payload == R"({"amount":"250"})");
  assert(new_rows[0].row_id != old_rows[0].row_id);

  auto again = c->Claim("simplicity", "vendor-1", "h1", "", "plaintiff", "w3");
  assert(again.IsClaimed());
  auto run = c->Get(r1.run_id);
  assert(run->rollback_reason == "bad vendor file");
  assert(run->rolled_back_at_ms != 0);
  assert(c->Rows(r1.run_id).size() == 1);
}

void TestRecentNewestFirst() {
  auto c = MakeCoordinator();
  auto first = c->Claim("s", "r1", "h", "", "k", "w");
  std::this_thread::sleep_for(5ms);
  auto second = c->Claim("s", "r2", "h", "", "k", "w");

  auto recent = c->Recent(10);
  assert(recent.size() == 2);
  assert(recent[0].run_id == second.run_id);
  assert(recent[1].run_id == first.run_id);
  assert(c->Recent(1).size() == 1);
}

void TestClaimValidatesArguments() {
  auto c     = MakeCoordinator();
  bool threw = false;
  try {
    c->Claim("", "b", "h", "", "k", "w");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFileHash() {
  const auto path = std::filesystem::temp_directory_path() / "jobclaim_file_hash_test.csv";
  {
    std::ofstream out(path, std::ios::binary);
    out << "abc";
  }
  assert(jobclaim::batch::ComputeFileHash(path.string()) == jobclaim::util::Sha256Hex("abc"));
  assert(jobclaim::batch::ComputeContentHash("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestWorkerScenarioABC();
  TestDifferentFileHashIsADifferentBatch();
  TestConcurrentClaimsHaveOneWinner();
  TestDedupeKeyInsertsOnce();
  TestEmptyNaturalKeyIsRejected();
  TestStaleClaimIsTakenOverByAnotherWorker();
  TestSupersededWorkerCannotFinalizeOrReconcile();
  TestFreshClaimIsNotTakenOver();
  TestHeartbeatOnFinishedOrUnknownRunFails();
  TestMarkInProgressRequiresHolder();
  TestFinalizeStatusRules();
  TestReconcileMismatchMarksRunFailed();
  TestReconcileDefaultsToRowsFetched();
  TestReconcileErrors();
  TestRollbackOfCompletedRun();
  TestRolledBackBatchCanBeReimported();
  TestRolledBackRowKeepsItsRunAndPayload();
  TestRecentNewestFirst();
  TestClaimValidatesArguments();
  TestFileHash();

  std::cout << "jobclaim_unit_batch_claim_coordinator: pass\n";
  return 0;
}
