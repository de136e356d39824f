#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "jobclaim/v1/envelope.pb.h"

namespace jobclaim::dlq {
class DeadLetterQueue;
}

namespace jobclaim::queue {

/*
  Durable per-queue message storage with visibility-timeout leasing.

  Delivery is at-least-once: a leased message becomes readable again once
  its visibility deadline passes unless it is archived first. No two
  readers hold an unexpired lease on the same message.
*/
class MessageStore {
 public:
  MessageStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<dlq::DeadLetterQueue> dead_letters);

  int64_t Enqueue(const std::string& queue, const std::string& payload_json);
  int64_t Enqueue(db::Transaction& tx, const std::string& queue, const std::string& payload_json);

  // Validates first. An invalid envelope is dead-lettered with zero
  // retries and util::InvalidEnvelope is thrown.
  int64_t Enqueue(const std::string& queue, const jobclaim::v1::JobEnvelope& envelope);

  std::vector<db::model::MessageRecord> Read(const std::string& queue, uint32_t batch_size, std::chrono::milliseconds visibility_timeout);

  // false when the message is already gone
  bool Archive(const std::string& queue, int64_t msg_id);
  bool Archive(db::Transaction& tx, const std::string& queue, int64_t msg_id);

  // Makes a leased message readable immediately.
  bool Release(const std::string& queue, int64_t msg_id);

  db::model::QueueMetricsRecord Metrics(const std::string& queue);

  std::vector<std::string> ListQueues();

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<dlq::DeadLetterQueue> dead_letters_;
};

} // namespace jobclaim::queue
