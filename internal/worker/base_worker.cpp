#include "internal/worker/base_worker.hpp"

#include <unistd.h>

#include <algorithm>

#include "internal/db/api/errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/envelope.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace jobclaim::worker {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

namespace {

std::string LocalHostname() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) return "unknown";
  return buffer;
}

} // namespace

BaseWorker::BaseWorker(WorkerContext context, WorkerOptions options)
    : context_(std::move(context)), options_(std::move(options)), hostname_(LocalHostname()), pid_(static_cast<int64_t>(getpid())) {
  if (options_.queue.empty()) throw std::invalid_argument("worker queue must not be empty");
  if (options_.batch_size == 0) throw std::invalid_argument("worker batch_size must be positive");
  if (options_.max_retries == 0) throw std::invalid_argument("worker max_retries must be positive");
  if (options_.worker_id.empty()) {
    options_.worker_id = options_.queue + "-" + hostname_ + "-" + std::to_string(pid_) + "-" + util::NewUuidString().substr(0, 8);
  }
}

BaseWorker::~BaseWorker() {
  Stop();
}

void BaseWorker::Start() {
  if (thread_.joinable()) return;
  stop_requested_ = false;
  thread_         = std::thread([this] {
    std::atomic<bool> never{false};
    Run(never);
  });
}

void BaseWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    stop_requested_ = true;
  }
  sleep_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool BaseWorker::StopRequested() const {
  if (stop_requested_) return true;
  return external_stop_ != nullptr && external_stop_->load();
}

void BaseWorker::SleepFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, duration, [this] { return StopRequested(); });
}

WorkerStats BaseWorker::Stats() const {
  WorkerStats stats;
  stats.processed = processed_.load();
  stats.failed    = failed_.load();
  stats.skipped   = skipped_.load();
  stats.invalid   = invalid_.load();
  return stats;
}

void BaseWorker::Run(const std::atomic<bool>& stop) {
  external_stop_ = &stop;

  JOBCLAIM_LOG_INFO("worker starting", {StringField("worker_id", options_.worker_id), StringField("queue", options_.queue)});
  SendHeartbeat("starting");
  SendHeartbeat("healthy");
  auto last_heartbeat = util::Now();

  while (!StopRequested()) {
    if (util::Now() - last_heartbeat >= options_.heartbeat_interval) {
      SendHeartbeat("healthy");
      last_heartbeat = util::Now();
    }

    std::size_t leased = 0;
    try {
      leased = RunOnce();
    } catch (const std::exception& e) {
      JOBCLAIM_LOG_ERROR("worker poll failed", {StringField("worker_id", options_.worker_id), StringField("error", e.what())});
      SleepFor(options_.poll_interval * 2);
      continue;
    }

    if (leased == 0) SleepFor(options_.poll_interval);
  }

  SendHeartbeat("draining");
  SendHeartbeat("stopped");
  JOBCLAIM_LOG_INFO("worker stopped", {StringField("worker_id", options_.worker_id), IntField("processed", processed_.load()),
                                       IntField("failed", failed_.load())});
  external_stop_ = nullptr;
}

std::size_t BaseWorker::RunOnce() {
  auto messages = context_.messages->Read(options_.queue, options_.batch_size, options_.visibility_timeout);

  for (const auto& message : messages) {
    // unhandled messages become readable again when their lease expires
    if (StopRequested()) break;

    try {
      HandleMessage(message);
    } catch (const std::exception& e) {
      JOBCLAIM_LOG_ERROR("message handling failed",
                         {StringField("queue", options_.queue), IntField("msg_id", message.msg_id), StringField("error", e.what())});
    }
  }
  return messages.size();
}

std::string BaseWorker::IdempotencyKey(const db::model::MessageRecord& message, const std::optional<jobclaim::v1::JobEnvelope>& envelope) {
  if (envelope) return envelope->idempotency_key();
  return idempotency::PayloadHashKey(message.queue_name, message.payload, options_.hash_algorithm);
}

void BaseWorker::SendToQueue(const std::string& queue, const jobclaim::v1::JobEnvelope& envelope) {
  outbox_.emplace_back(queue, queue::EncodeEnvelope(envelope));
}

void BaseWorker::HandleMessage(const db::model::MessageRecord& message) {
  JobContext ctx;
  ctx.msg_id         = message.msg_id;
  ctx.queue_name     = message.queue_name;
  ctx.worker_id      = options_.worker_id;
  ctx.read_count     = message.read_count;
  ctx.enqueued_at_ms = message.enqueued_at_ms;

  try {
    if (options_.require_envelope) {
      ctx.envelope = queue::DecodeEnvelope(message.payload);
      *ctx.payload.mutable_struct_value() = ctx.envelope->payload();
    } else {
      ctx.payload = util::ParseJson(message.payload);
    }
  } catch (const util::InvalidEnvelope& e) {
    invalid_++;
    Quarantine(message, "", e.what(), message.read_count);
    return;
  } catch (const std::invalid_argument& e) {
    invalid_++;
    Quarantine(message, "", std::string("invalid payload: ") + e.what(), message.read_count);
    return;
  }

  ctx.idempotency_key = IdempotencyKey(message, ctx.envelope);

  if (message.read_count > options_.max_retries) {
    failed_++;
    Quarantine(message, ctx.idempotency_key, "poison message: read_count exceeded", message.read_count);
    return;
  }

  if (context_.registry->IsCompleted(ctx.idempotency_key)) {
    skipped_++;
    JOBCLAIM_LOG_DEBUG("skipping completed job", {StringField("key", ctx.idempotency_key), IntField("msg_id", message.msg_id)});
    context_.messages->Archive(message.queue_name, message.msg_id);
    return;
  }

  auto claim = context_.registry->Claim(ctx.idempotency_key, message.msg_id, message.queue_name, options_.worker_id);
  if (!claim.Claimed()) {
    skipped_++;
    JOBCLAIM_LOG_INFO("duplicate job skipped", {StringField("key", ctx.idempotency_key), IntField("msg_id", message.msg_id),
                                                IntField("holder_msg_id", claim.holder_job_id),
                                                StringField("status", db::model::ToString(claim.existing_status))});
    context_.messages->Archive(message.queue_name, message.msg_id);
    return;
  }
  ctx.attempt = claim.attempts;

  outbox_.clear();
  std::optional<google::protobuf::Struct> result;
  std::string                             error;
  bool                                    ok = true;
  try {
    result = Process(ctx);
  } catch (const std::exception& e) {
    ok    = false;
    error = e.what();
  }

  if (ok) {
    auto tx = context_.repository->Begin();
    context_.registry->Complete(*tx, ctx.idempotency_key, result ? util::ToJson(*result) : std::string());
    for (const auto& [queue, payload] : outbox_) context_.messages->Enqueue(*tx, queue, payload);
    context_.messages->Archive(*tx, message.queue_name, message.msg_id);
    tx->Commit();
    outbox_.clear();

    processed_++;
    JOBCLAIM_LOG_DEBUG("job completed", {StringField("key", ctx.idempotency_key), IntField("msg_id", message.msg_id),
                                         IntField("attempt", ctx.attempt)});
    return;
  }

  outbox_.clear();
  failed_++;

  const bool exhausted = ctx.attempt >= options_.max_retries || message.read_count >= options_.max_retries;

  auto tx = context_.repository->Begin();
  context_.registry->Fail(*tx, ctx.idempotency_key, error);
  if (exhausted) {
    db::model::DeadLetterRecord entry;
    entry.original_queue      = message.queue_name;
    entry.original_job_id     = message.msg_id;
    entry.idempotency_key     = ctx.idempotency_key;
    entry.original_payload    = message.payload;
    entry.error_message       = error;
    entry.attempt_count       = std::max(ctx.attempt, message.read_count);
    entry.worker_id           = options_.worker_id;
    entry.first_attempt_at_ms = message.enqueued_at_ms;
    context_.dead_letters->Record(*tx, entry);
    context_.messages->Archive(*tx, message.queue_name, message.msg_id);
  }
  tx->Commit();

  if (!exhausted) {
    JOBCLAIM_LOG_WARN("job failed, will retry", {StringField("key", ctx.idempotency_key), IntField("msg_id", message.msg_id),
                                                 IntField("attempt", ctx.attempt), StringField("error", error)});
  }
}

void BaseWorker::Quarantine(const db::model::MessageRecord& message, const std::string& key, const std::string& error, uint32_t attempts) {
  db::model::DeadLetterRecord entry;
  entry.original_queue      = message.queue_name;
  entry.original_job_id     = message.msg_id;
  entry.idempotency_key     = key;
  entry.original_payload    = message.payload;
  entry.error_message       = error;
  entry.attempt_count       = attempts;
  entry.worker_id           = options_.worker_id;
  entry.first_attempt_at_ms = message.enqueued_at_ms;

  auto tx = context_.repository->Begin();
  context_.dead_letters->Record(*tx, entry);
  context_.messages->Archive(*tx, message.queue_name, message.msg_id);
  tx->Commit();
}

void BaseWorker::SendHeartbeat(const std::string& status) {
  db::model::WorkerHeartbeatRecord record;
  record.worker_id       = options_.worker_id;
  record.queue_name      = options_.queue;
  record.hostname        = hostname_;
  record.pid             = pid_;
  record.status          = status;
  record.jobs_processed  = processed_.load();
  record.jobs_failed     = failed_.load();
  record.jobs_skipped    = skipped_.load();
  record.jobs_invalid    = invalid_.load();
  record.last_seen_at_ms = util::NowMillis();

  try {
    auto tx = context_.repository->Begin();
    db::ThrowIfDbError(context_.repository->UpsertWorkerHeartbeat(*tx, record), "worker heartbeat");
    tx->Commit();
  } catch (const std::exception& e) {
    JOBCLAIM_LOG_WARN("worker heartbeat failed", {StringField("worker_id", options_.worker_id), StringField("error", e.what())});
  }
}

} // namespace jobclaim::worker
