#include "internal/factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"
#include "internal/worker/pipeline_worker.hpp"
#if JOBCLAIM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBCLAIM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace jobclaim::factory {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;
using jobclaim::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultBatchSize           = 10;
constexpr uint32_t kDefaultVisibilitySec       = 30;
constexpr uint32_t kDefaultPollIntervalMs      = 1000;
constexpr uint32_t kDefaultMaxRetries          = 3;
constexpr uint32_t kDefaultWorkerHeartbeatSec  = 30;
constexpr uint32_t kDefaultStaleAfterSec       = 1800;
constexpr uint32_t kDefaultClaimHeartbeatSec   = 60;
constexpr uint32_t kDefaultMonitorIntervalSec  = 300;
constexpr char     kDefaultHashAlgorithm[]     = "sha256";

uint32_t OrDefault(uint32_t value, uint32_t fallback) {
  return value != 0 ? value : fallback;
}

} // namespace

worker::WorkerContext Runtime::WorkerContext() const {
  worker::WorkerContext ctx;
  ctx.repository   = repository;
  ctx.messages     = messages;
  ctx.registry     = registry;
  ctx.dead_letters = dead_letters;
  return ctx;
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if JOBCLAIM_DB_SQLITE
    if (database.sqlite().path().empty()) throw std::invalid_argument("database.sqlite.path is required");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::BootstrapSqliteSchema(*sqlite_db);
    JOBCLAIM_LOG_INFO("using sqlite backend", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if JOBCLAIM_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() != 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::BootstrapPostgresSchema(pool);
    JOBCLAIM_LOG_INFO("using postgres backend", {IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  JOBCLAIM_LOG_INFO("using in-memory backend");
  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const RuntimeConfig& config) {
  Runtime runtime;
  runtime.repository   = BuildRepository(config);
  runtime.dead_letters = std::make_shared<dlq::DeadLetterQueue>(runtime.repository);
  runtime.messages     = std::make_shared<queue::MessageStore>(runtime.repository, runtime.dead_letters);
  runtime.registry     = std::make_shared<idempotency::IdempotencyRegistry>(runtime.repository);
  runtime.coordinator  = std::make_shared<batch::BatchClaimCoordinator>(runtime.repository, CoordinatorOptionsFor(config));
  return runtime;
}

worker::WorkerOptions WorkerOptionsFor(const RuntimeConfig& config, const std::string& queue) {
  const auto& defaults = config.workers();

  worker::WorkerOptions options;
  options.queue              = queue;
  options.batch_size         = OrDefault(defaults.batch_size(), kDefaultBatchSize);
  options.visibility_timeout = std::chrono::seconds(OrDefault(defaults.visibility_timeout_sec(), kDefaultVisibilitySec));
  options.poll_interval      = std::chrono::milliseconds(OrDefault(defaults.poll_interval_ms(), kDefaultPollIntervalMs));
  options.max_retries        = OrDefault(defaults.max_retries(), kDefaultMaxRetries);
  options.heartbeat_interval = std::chrono::seconds(OrDefault(defaults.heartbeat_interval_sec(), kDefaultWorkerHeartbeatSec));
  options.hash_algorithm     = defaults.idempotency_hash_algorithm().empty() ? kDefaultHashAlgorithm : defaults.idempotency_hash_algorithm();

  // fail at startup, not on the first plain-JSON message
  util::HexDigest(options.hash_algorithm, "");
  return options;
}

batch::CoordinatorOptions CoordinatorOptionsFor(const RuntimeConfig& config) {
  batch::CoordinatorOptions options;
  options.stale_after = std::chrono::seconds(OrDefault(config.batch().stale_after_sec(), kDefaultStaleAfterSec));
  return options;
}

std::chrono::milliseconds BatchHeartbeatInterval(const RuntimeConfig& config) {
  return std::chrono::seconds(OrDefault(config.batch().heartbeat_interval_sec(), kDefaultClaimHeartbeatSec));
}

std::chrono::milliseconds MonitorInterval(const RuntimeConfig& config) {
  return std::chrono::seconds(OrDefault(config.batch().monitor_interval_sec(), kDefaultMonitorIntervalSec));
}

std::vector<std::unique_ptr<worker::WorkerPool>> BuildPipelines(const RuntimeConfig& config, const Runtime& runtime) {
  std::vector<std::unique_ptr<worker::WorkerPool>> pools;
  for (const auto& pipeline : config.pipelines()) {
    if (pipeline.queue().empty()) throw std::invalid_argument("pipelines[].queue is required");
    if (pipeline.queue() == pipeline.downstream_queue()) {
      throw std::invalid_argument("pipeline " + pipeline.queue() + " forwards to itself");
    }

    auto options             = WorkerOptionsFor(config, pipeline.queue());
    options.require_envelope = !pipeline.plain_json();
    auto context             = runtime.WorkerContext();
    auto downstream          = pipeline.downstream_queue();

    pools.push_back(std::make_unique<worker::WorkerPool>(pipeline.queue(), OrDefault(pipeline.concurrency(), 1),
                                                         [context, options, downstream](std::size_t) {
                                                           return std::make_unique<worker::PipelineWorker>(context, options, downstream);
                                                         }));
  }
  return pools;
}

} // namespace jobclaim::factory
