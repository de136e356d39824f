#include "internal/queue/message_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/dlq/dead_letter_queue.hpp"
#include "internal/queue/envelope.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace std::chrono_literals;

struct Fixture {
  std::shared_ptr<jobclaim::db::Repository>            repo = std::make_shared<jobclaim::db::memory::MemoryRepository>();
  std::shared_ptr<jobclaim::dlq::DeadLetterQueue>      dlq  = std::make_shared<jobclaim::dlq::DeadLetterQueue>(repo);
  std::shared_ptr<jobclaim::queue::MessageStore>       store = std::make_shared<jobclaim::queue::MessageStore>(repo, dlq);
};

void TestLeaseHidesMessageUntilDeadline() {
  Fixture f;
  auto    id = f.store->Enqueue("ingest", R"({"n":1})");

  auto first = f.store->Read("ingest", 10, 200ms);
  assert(first.size() == 1);
  assert(first[0].msg_id == id);
  assert(first[0].read_count == 1);

  // leased: invisible to a second reader
  assert(f.store->Read("ingest", 10, 200ms).empty());

  std::this_thread::sleep_for(300ms);

  // lease expired: redelivered with a higher read_count
  auto second = f.store->Read("ingest", 10, 200ms);
  assert(second.size() == 1);
  assert(second[0].msg_id == id);
  assert(second[0].read_count == 2);
}

void TestConcurrentReadersNeverShareALease() {
  Fixture f;
  constexpr int kMessages = 200;
  for (int i = 0; i < kMessages; ++i) f.store->Enqueue("ingest", "{\"n\":" + std::to_string(i) + "}");

  std::vector<std::vector<int64_t>> seen(8);
  std::vector<std::thread>          readers;
  for (std::size_t r = 0; r < seen.size(); ++r) {
    readers.emplace_back([&, r] {
      while (true) {
        auto batch = f.store->Read("ingest", 7, 60s);
        if (batch.empty()) break;
        for (const auto& m : batch) seen[r].push_back(m.msg_id);
      }
    });
  }
  for (auto& t : readers) t.join();

  std::set<int64_t> unique;
  std::size_t       total = 0;
  for (const auto& ids : seen) {
    total += ids.size();
    unique.insert(ids.begin(), ids.end());
  }
  assert(total == kMessages);
  assert(unique.size() == kMessages);
}

void TestArchiveAndRelease() {
  Fixture f;
  auto    a = f.store->Enqueue("q", R"({"a":1})");
  auto    b = f.store->Enqueue("q", R"({"b":1})");

  auto leased = f.store->Read("q", 10, 60s);
  assert(leased.size() == 2);

  assert(f.store->Archive("q", a));
  assert(!f.store->Archive("q", a));
  assert(!f.store->Archive("other", b));

  assert(f.store->Release("q", b));
  auto again = f.store->Read("q", 10, 60s);
  assert(again.size() == 1);
  assert(again[0].msg_id == b);
  assert(again[0].read_count == 2);

  assert(!f.store->Release("q", 424242));
}

void TestMetricsAndQueueListing() {
  Fixture f;
  f.store->Enqueue("alpha", R"({"i":1})");
  f.store->Enqueue("alpha", R"({"i":2})");
  f.store->Enqueue("alpha", R"({"i":3})");
  f.store->Enqueue("beta", R"({"i":4})");

  (void)f.store->Read("alpha", 1, 60s);

  auto metrics = f.store->Metrics("alpha");
  assert(metrics.total == 3);
  assert(metrics.in_flight == 1);
  assert(metrics.readable == 2);

  auto empty = f.store->Metrics("nothing");
  assert(empty.total == 0);
  assert(empty.oldest_age_ms == 0);

  auto queues = f.store->ListQueues();
  assert(queues.size() == 2);
  assert(queues[0] == "alpha");
  assert(queues[1] == "beta");
}

void TestInvalidEnvelopeIsQuarantinedAtEnqueue() {
  Fixture f;
  auto    envelope = jobclaim::queue::NewEnvelope("org", "judgment", "J-1", "judgment:J-1", jobclaim::util::ParseJsonObject("{}"));
  envelope.set_entity_id("");

  bool threw = false;
  try {
    f.store->Enqueue("ingest", envelope);
  } catch (const jobclaim::util::InvalidEnvelope& e) {
    threw = true;
    assert(!e.Errors().empty());
  }
  assert(threw);

  assert(f.store->Metrics("ingest").total == 0);
  auto dead = f.dlq->List();
  assert(dead.size() == 1);
  assert(dead[0].original_queue == "ingest");
  assert(dead[0].attempt_count == 0);
  assert(dead[0].worker_id == "producer");
  assert(dead[0].error_message.rfind("invalid envelope:", 0) == 0);

  // the quarantined payload is the full envelope, not a placeholder
  assert(dead[0].idempotency_key == "judgment:J-1");
  auto raw = jobclaim::util::ParseJsonObject(dead[0].original_payload);
  assert(raw.fields().at("job_id").string_value() == envelope.job_id());
  assert(raw.fields().at("entity_type").string_value() == "judgment");
  assert(raw.fields().at("idempotency_key").string_value() == "judgment:J-1");
  assert(raw.fields().count("payload") == 1);
}

void TestValidEnvelopeIsEnqueued() {
  Fixture f;
  auto    envelope = jobclaim::queue::NewEnvelope("org", "judgment", "J-1", "judgment:J-1", jobclaim::util::ParseJsonObject(R"({"x":1})"));
  auto    id       = f.store->Enqueue("ingest", envelope);

  auto leased = f.store->Read("ingest", 1, 60s);
  assert(leased.size() == 1);
  assert(leased[0].msg_id == id);
  assert(jobclaim::queue::DecodeEnvelope(leased[0].payload).job_id() == envelope.job_id());
  assert(f.dlq->List().empty());
}

} // namespace

int main() {
  TestLeaseHidesMessageUntilDeadline();
  TestConcurrentReadersNeverShareALease();
  TestArchiveAndRelease();
  TestMetricsAndQueueListing();
  TestInvalidEnvelopeIsQuarantinedAtEnqueue();
  TestValidEnvelopeIsEnqueued();

  std::cout << "jobclaim_unit_message_store: pass\n";
  return 0;
}
