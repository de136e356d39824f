#include "internal/dlq/dead_letter_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/idempotency/idempotency_registry.hpp"
#include "internal/queue/message_store.hpp"

namespace {

using namespace std::chrono_literals;
using jobclaim::db::model::DeadLetterRecord;
using jobclaim::db::model::JobStatus;

struct Fixture {
  std::shared_ptr<jobclaim::db::Repository>                    repo     = std::make_shared<jobclaim::db::memory::MemoryRepository>();
  std::shared_ptr<jobclaim::dlq::DeadLetterQueue>              dlq      = std::make_shared<jobclaim::dlq::DeadLetterQueue>(repo);
  std::shared_ptr<jobclaim::queue::MessageStore>               store    = std::make_shared<jobclaim::queue::MessageStore>(repo, dlq);
  std::shared_ptr<jobclaim::idempotency::IdempotencyRegistry> registry = std::make_shared<jobclaim::idempotency::IdempotencyRegistry>(repo);
};

DeadLetterRecord Entry(const std::string& queue, const std::string& key, const std::string& payload) {
  DeadLetterRecord entry;
  entry.original_queue   = queue;
  entry.original_job_id  = 7;
  entry.idempotency_key  = key;
  entry.original_payload = payload;
  entry.error_message    = "boom";
  entry.attempt_count    = 3;
  entry.worker_id        = "worker-1";
  return entry;
}

void TestRecordFillsIdAndTimestamps() {
  Fixture f;
  auto    id = f.dlq->Record(Entry("ingest", "k1", R"({"n":1})"));
  assert(!id.empty());

  auto stored = f.dlq->Get(id);
  assert(stored.has_value());
  assert(stored->moved_at_ms != 0);
  assert(stored->first_attempt_at_ms == stored->moved_at_ms);
  assert(stored->attempt_count == 3);
  assert(stored->error_message == "boom");
}

void TestListFiltersByQueueOldestFirst() {
  Fixture f;
  auto    a = f.dlq->Record(Entry("ingest", "k1", "{}"));
  std::this_thread::sleep_for(2ms);
  auto b = f.dlq->Record(Entry("enrich", "k2", "{}"));
  std::this_thread::sleep_for(2ms);
  auto c = f.dlq->Record(Entry("ingest", "k3", "{}"));

  auto all = f.dlq->List();
  assert(all.size() == 3);
  assert(all[0].id == a);
  assert(all[1].id == b);
  assert(all[2].id == c);

  auto ingest = f.dlq->List(std::string("ingest"));
  assert(ingest.size() == 2);
  assert(ingest[0].id == a);
  assert(ingest[1].id == c);

  assert(f.dlq->List(std::nullopt, 1).size() == 1);
}

void TestReplayRequeuesAndResetsAttempts() {
  Fixture f;

  f.registry->Claim("ingest:k1", 7, "ingest", "worker-1");
  f.registry->Fail("ingest:k1", "boom");
  auto id = f.dlq->Record(Entry("ingest", "ingest:k1", R"({"n":1})"));

  auto result = f.dlq->Replay(id);
  assert(result.success);
  assert(result.original_queue == "ingest");
  assert(result.new_msg_id != 0);
  assert(!f.dlq->Get(id).has_value());

  auto messages = f.store->Read("ingest", 10, 30s);
  assert(messages.size() == 1);
  assert(messages[0].msg_id == result.new_msg_id);
  assert(messages[0].payload == R"({"n":1})");
  assert(messages[0].read_count == 1);

  auto record = f.registry->Get("ingest:k1");
  assert(record->attempts == 0);
  assert(record->status == JobStatus::Failed);
}

void TestReplayWithoutRegistryRow() {
  Fixture f;
  // quarantined before a key was ever claimed
  auto id     = f.dlq->Record(Entry("ingest", "", "not json"));
  auto result = f.dlq->Replay(id);
  assert(result.success);
  assert(f.store->Metrics("ingest").total == 1);
}

void TestReplayUnknownId() {
  Fixture f;
  auto    result = f.dlq->Replay("00000000-0000-0000-0000-000000000000");
  assert(!result.success);
  assert(!result.error.empty());
}

void TestReplayAllDryRunDoesNotMutate() {
  Fixture f;
  f.dlq->Record(Entry("ingest", "k1", "{}"));
  f.dlq->Record(Entry("ingest", "k2", "{}"));
  f.dlq->Record(Entry("enrich", "k3", "{}"));

  auto preview = f.dlq->ReplayAll(std::string("ingest"), 10, true);
  assert(preview.size() == 2);
  for (const auto& r : preview) {
    assert(r.success);
    assert(r.new_msg_id == 0);
  }
  assert(f.dlq->List().size() == 3);
  assert(f.store->Metrics("ingest").total == 0);

  auto replayed = f.dlq->ReplayAll(std::string("ingest"), 1, false);
  assert(replayed.size() == 1);
  assert(replayed[0].success);
  assert(f.dlq->List().size() == 2);

  auto rest = f.dlq->ReplayAll(std::nullopt, 100, false);
  assert(rest.size() == 2);
  assert(f.dlq->List().empty());
  assert(f.store->Metrics("ingest").total == 2);
  assert(f.store->Metrics("enrich").total == 1);
}

} // namespace

int main() {
  TestRecordFillsIdAndTimestamps();
  TestListFiltersByQueueOldestFirst();
  TestReplayRequeuesAndResetsAttempts();
  TestReplayWithoutRegistryRow();
  TestReplayUnknownId();
  TestReplayAllDryRunDoesNotMutate();

  std::cout << "jobclaim_unit_dead_letter_queue: pass\n";
  return 0;
}
