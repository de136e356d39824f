#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/batch/batch_claim_coordinator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dlq/dead_letter_queue.hpp"
#include "internal/idempotency/idempotency_registry.hpp"
#include "internal/queue/message_store.hpp"
#include "internal/worker/base_worker.hpp"
#include "internal/worker/worker_pool.hpp"

namespace jobclaim::factory {

/*
  Runtime

  Owns all long-lived services shared by jobclaimd and jobctl.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<queue::MessageStore>              messages;
  std::shared_ptr<idempotency::IdempotencyRegistry> registry;
  std::shared_ptr<dlq::DeadLetterQueue>             dead_letters;
  std::shared_ptr<batch::BatchClaimCoordinator>     coordinator;

  worker::WorkerContext WorkerContext() const;
};

/*
  BuildRepository / BuildRuntime

  Composition root. The ONLY place allowed to know concrete DB types.
  The schema is bootstrapped before the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const jobclaim::runtime::config::RuntimeConfig& config);

Runtime BuildRuntime(const jobclaim::runtime::config::RuntimeConfig& config);

// Worker defaults from config, compiled-in values for zero fields.
worker::WorkerOptions WorkerOptionsFor(const jobclaim::runtime::config::RuntimeConfig& config, const std::string& queue);

batch::CoordinatorOptions CoordinatorOptionsFor(const jobclaim::runtime::config::RuntimeConfig& config);

std::chrono::milliseconds BatchHeartbeatInterval(const jobclaim::runtime::config::RuntimeConfig& config);
std::chrono::milliseconds MonitorInterval(const jobclaim::runtime::config::RuntimeConfig& config);

// One pool of PipelineWorkers per configured pipeline. Not started.
std::vector<std::unique_ptr<worker::WorkerPool>> BuildPipelines(const jobclaim::runtime::config::RuntimeConfig& config, const Runtime& runtime);

} // namespace jobclaim::factory
