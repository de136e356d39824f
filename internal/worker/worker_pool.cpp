#include "internal/worker/worker_pool.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace jobclaim::worker {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

WorkerPool::WorkerPool(std::string name, std::size_t concurrency, Factory factory) : name_(std::move(name)) {
  if (concurrency == 0) throw std::invalid_argument("pool " + name_ + ": concurrency must be positive");
  workers_.reserve(concurrency);
  for (std::size_t i = 0; i < concurrency; ++i) {
    auto worker = factory(i);
    if (!worker) throw std::invalid_argument("pool " + name_ + ": factory returned null worker");
    workers_.push_back(std::move(worker));
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  JOBCLAIM_LOG_INFO("starting worker pool", {StringField("pool", name_), IntField("workers", static_cast<int64_t>(workers_.size()))});
  for (auto& worker : workers_) worker->Start();
}

void WorkerPool::Stop() {
  std::vector<std::thread> joiners;
  joiners.reserve(workers_.size());
  for (auto& worker : workers_) joiners.emplace_back([&worker] { worker->Stop(); });
  for (auto& t : joiners) t.join();
}

WorkerStats WorkerPool::Stats() const {
  WorkerStats total;
  for (const auto& worker : workers_) {
    auto stats = worker->Stats();
    total.processed += stats.processed;
    total.failed += stats.failed;
    total.skipped += stats.skipped;
    total.invalid += stats.invalid;
  }
  return total;
}

} // namespace jobclaim::worker
