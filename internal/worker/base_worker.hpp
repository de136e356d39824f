#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/message_record.hpp"
#include "internal/worker/worker_context.hpp"
#include "jobclaim/v1/envelope.pb.h"

namespace jobclaim::worker {

struct WorkerOptions {
  std::string               queue;
  std::string               worker_id; // generated when empty
  uint32_t                  batch_size = 10;
  std::chrono::milliseconds visibility_timeout{30000};
  std::chrono::milliseconds poll_interval{1000};
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds heartbeat_interval{30000};
  std::string               hash_algorithm = "sha256";

  // false: payloads are plain JSON and keys default to the payload hash
  bool require_envelope = true;
};

struct WorkerStats {
  uint64_t processed = 0;
  uint64_t failed    = 0;
  uint64_t skipped   = 0;
  uint64_t invalid   = 0;
};

struct JobContext {
  int64_t     msg_id = 0;
  std::string queue_name;
  std::string idempotency_key;
  std::string worker_id;
  uint32_t    read_count     = 0; // deliveries of this message
  uint32_t    attempt        = 0; // registry attempts for the key, this one included
  uint64_t    enqueued_at_ms = 0;

  std::optional<jobclaim::v1::JobEnvelope> envelope; // set on envelope queues
  google::protobuf::Value                  payload;  // envelope payload, or the raw message
};

/*
  BaseWorker

  Generic poll -> lease -> validate -> claim -> process -> ack loop.

  Per message:
    1. invalid envelope          -> dead letter, archive (never retried)
    2. read_count > max_retries  -> dead letter as poison, archive
    3. key already completed     -> archive, skip
    4. claim held by another msg -> archive, skip
    5. Process()
    6. success -> complete + follow-ups + archive in one transaction
    7. failure -> fail; dead letter + archive once attempts reach
                  max_retries, otherwise the lease expires and the
                  message is redelivered

  Subclasses implement Process() and call Stop() from their destructor.
  One instance is driven by one thread.
*/
class BaseWorker {
 public:
  BaseWorker(WorkerContext context, WorkerOptions options);
  virtual ~BaseWorker();

  BaseWorker(const BaseWorker&)            = delete;
  BaseWorker& operator=(const BaseWorker&) = delete;

  // Polls once and handles every leased message. Returns the count leased.
  std::size_t RunOnce();

  // Blocking loop until Stop() or stop becomes true.
  void Run(const std::atomic<bool>& stop);

  // Run() on a dedicated thread.
  void Start();
  void Stop();

  WorkerStats          Stats() const;
  const std::string&   WorkerId() const {
    return options_.worker_id;
  }
  const WorkerOptions& Options() const {
    return options_;
  }

 protected:
  // Throw to fail the attempt. The optional object is stored as the job result.
  virtual std::optional<google::protobuf::Struct> Process(const JobContext& ctx) = 0;

  // Envelope queues use the envelope's key, plain queues the payload hash.
  virtual std::string IdempotencyKey(const db::model::MessageRecord& message, const std::optional<jobclaim::v1::JobEnvelope>& envelope);

  // Buffered follow-up, enqueued only if the current job succeeds.
  void SendToQueue(const std::string& queue, const jobclaim::v1::JobEnvelope& envelope);

  const WorkerContext& Context() const {
    return context_;
  }

 private:
  void HandleMessage(const db::model::MessageRecord& message);
  void Quarantine(const db::model::MessageRecord& message, const std::string& key, const std::string& error, uint32_t attempts);
  void SendHeartbeat(const std::string& status);
  void SleepFor(std::chrono::milliseconds duration);
  bool StopRequested() const;

  WorkerContext context_;
  WorkerOptions options_;
  std::string   hostname_;
  int64_t       pid_ = 0;

  std::vector<std::pair<std::string, std::string>> outbox_;

  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> skipped_{0};
  std::atomic<uint64_t> invalid_{0};

  const std::atomic<bool>* external_stop_ = nullptr;
  std::atomic<bool>        stop_requested_{false};
  std::mutex               sleep_mutex_;
  std::condition_variable  sleep_cv_;
  std::thread              thread_;
};

} // namespace jobclaim::worker
