#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/dlq/dead_letter_queue.hpp"
#include "internal/idempotency/idempotency_registry.hpp"
#include "internal/queue/message_store.hpp"

namespace jobclaim::worker {

// Shared services handed to every worker instance.
struct WorkerContext {
  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<queue::MessageStore>              messages;
  std::shared_ptr<idempotency::IdempotencyRegistry> registry;
  std::shared_ptr<dlq::DeadLetterQueue>             dead_letters;
};

} // namespace jobclaim::worker
