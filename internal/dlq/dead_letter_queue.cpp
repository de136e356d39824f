#include "internal/dlq/dead_letter_queue.hpp"

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobclaim::dlq {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

DeadLetterQueue::DeadLetterQueue(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::string DeadLetterQueue::Record(db::model::DeadLetterRecord entry) {
  auto tx = repository_->Begin();
  auto id = Record(*tx, entry);
  tx->Commit();
  return id;
}

std::string DeadLetterQueue::Record(db::Transaction& tx, db::model::DeadLetterRecord& entry) {
  if (entry.id.empty()) entry.id = util::NewUuidString();
  if (entry.moved_at_ms == 0) entry.moved_at_ms = util::NowMillis();
  if (entry.first_attempt_at_ms == 0) entry.first_attempt_at_ms = entry.moved_at_ms;

  db::ThrowIfDbError(repository_->InsertDeadLetter(tx, entry), "record dead letter");

  JOBCLAIM_LOG_WARN("dead-lettered message", {StringField("dlq_id", entry.id), StringField("queue", entry.original_queue),
                                               IntField("msg_id", entry.original_job_id), IntField("attempts", entry.attempt_count),
                                               StringField("error", entry.error_message)});
  return entry.id;
}

std::vector<db::model::DeadLetterRecord> DeadLetterQueue::List(const std::optional<std::string>& queue, uint32_t limit) {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListDeadLetters(*tx, queue, limit);
  tx->Commit();
  return entries;
}

std::optional<db::model::DeadLetterRecord> DeadLetterQueue::Get(const std::string& id) {
  auto tx    = repository_->Begin();
  auto entry = repository_->GetDeadLetter(*tx, id);
  tx->Commit();
  return entry;
}

ReplayResult DeadLetterQueue::Replay(const std::string& id) {
  ReplayResult result;
  result.dead_letter_id = id;

  auto tx    = repository_->Begin();
  auto entry = repository_->GetDeadLetter(*tx, id);
  if (!entry) {
    tx->Rollback();
    result.error = "dead letter not found";
    return result;
  }
  result.original_queue = entry->original_queue;

  const auto           now = util::NowMillis();
  db::model::MessageRecord message;
  message.queue_name             = entry->original_queue;
  message.payload                = entry->original_payload;
  message.enqueued_at_ms         = now;
  message.visibility_deadline_ms = now;
  db::ThrowIfDbError(repository_->EnqueueMessage(*tx, message), "replay enqueue");

  if (!entry->idempotency_key.empty()) {
    auto reset = repository_->ResetProcessedJobAttempts(*tx, entry->idempotency_key, now);
    if (!reset && reset.code != db::ErrorCode::NotFound) {
      db::ThrowIfDbError(reset, "replay reset attempts");
    }
  }

  db::ThrowIfDbError(repository_->DeleteDeadLetter(*tx, id), "replay delete dead letter");
  tx->Commit();

  result.success    = true;
  result.new_msg_id = message.msg_id;
  JOBCLAIM_LOG_INFO("replayed dead letter",
                    {StringField("dlq_id", id), StringField("queue", result.original_queue), IntField("new_msg_id", result.new_msg_id)});
  return result;
}

std::vector<ReplayResult> DeadLetterQueue::ReplayAll(const std::optional<std::string>& queue, uint32_t limit, bool dry_run) {
  std::vector<ReplayResult> results;
  for (const auto& entry : List(queue, limit)) {
    if (dry_run) {
      ReplayResult preview;
      preview.dead_letter_id = entry.id;
      preview.original_queue = entry.original_queue;
      preview.success        = true;
      results.push_back(std::move(preview));
      continue;
    }
    results.push_back(Replay(entry.id));
  }
  return results;
}

} // namespace jobclaim::dlq
