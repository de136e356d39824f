#include "internal/queue/message_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/errors.hpp"
#include "internal/dlq/dead_letter_queue.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/envelope.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace jobclaim::queue {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

MessageStore::MessageStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<dlq::DeadLetterQueue> dead_letters)
    : repository_(std::move(repository)), dead_letters_(std::move(dead_letters)) {
}

int64_t MessageStore::Enqueue(const std::string& queue, const std::string& payload_json) {
  auto tx     = repository_->Begin();
  auto msg_id = Enqueue(*tx, queue, payload_json);
  tx->Commit();
  return msg_id;
}

int64_t MessageStore::Enqueue(db::Transaction& tx, const std::string& queue, const std::string& payload_json) {
  if (queue.empty()) {
    throw std::invalid_argument("enqueue: queue name is required");
  }

  const auto           now = util::NowMillis();
  db::model::MessageRecord record;
  record.queue_name             = queue;
  record.payload                = payload_json;
  record.enqueued_at_ms         = now;
  record.visibility_deadline_ms = now;

  db::ThrowIfDbError(repository_->EnqueueMessage(tx, record), "enqueue on " + queue);
  JOBCLAIM_LOG_DEBUG("enqueued message", {StringField("queue", queue), IntField("msg_id", record.msg_id)});
  return record.msg_id;
}

int64_t MessageStore::Enqueue(const std::string& queue, const jobclaim::v1::JobEnvelope& envelope) {
  auto errors = ValidateEnvelope(envelope);
  if (errors.empty()) {
    return Enqueue(queue, EncodeEnvelope(envelope));
  }

  db::model::DeadLetterRecord entry;
  entry.original_queue   = queue;
  entry.idempotency_key  = envelope.idempotency_key();
  entry.original_payload = EnvelopeToJson(envelope);
  entry.error_message    = "invalid envelope: " + errors.front();
  entry.attempt_count    = 0;
  entry.worker_id        = "producer";
  dead_letters_->Record(std::move(entry));

  throw util::InvalidEnvelope("invalid envelope for queue " + queue + ": " + errors.front(), std::move(errors));
}

std::vector<db::model::MessageRecord> MessageStore::Read(const std::string& queue, uint32_t batch_size, std::chrono::milliseconds visibility_timeout) {
  if (batch_size == 0) return {};

  const auto now      = util::NowMillis();
  const auto deadline = now + static_cast<uint64_t>(std::max<int64_t>(visibility_timeout.count(), 0));

  auto tx       = repository_->Begin();
  auto messages = repository_->LeaseMessages(*tx, queue, batch_size, now, deadline);
  tx->Commit();
  return messages;
}

bool MessageStore::Archive(const std::string& queue, int64_t msg_id) {
  auto tx       = repository_->Begin();
  auto archived = Archive(*tx, queue, msg_id);
  tx->Commit();
  return archived;
}

bool MessageStore::Archive(db::Transaction& tx, const std::string& queue, int64_t msg_id) {
  auto result = repository_->DeleteMessage(tx, queue, msg_id);
  if (result.code == db::ErrorCode::NotFound) return false;
  db::ThrowIfDbError(result, "archive message");
  return true;
}

bool MessageStore::Release(const std::string& queue, int64_t msg_id) {
  auto tx     = repository_->Begin();
  auto result = repository_->SetMessageVisibility(*tx, queue, msg_id, util::NowMillis());
  if (result.code == db::ErrorCode::NotFound) {
    tx->Rollback();
    return false;
  }
  db::ThrowIfDbError(result, "release message");
  tx->Commit();
  return true;
}

db::model::QueueMetricsRecord MessageStore::Metrics(const std::string& queue) {
  auto tx      = repository_->Begin();
  auto metrics = repository_->GetQueueMetrics(*tx, queue, util::NowMillis());
  tx->Commit();
  return metrics;
}

std::vector<std::string> MessageStore::ListQueues() {
  auto tx     = repository_->Begin();
  auto queues = repository_->ListQueues(*tx);
  tx->Commit();
  return queues;
}

} // namespace jobclaim::queue
