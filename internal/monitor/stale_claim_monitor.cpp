#include "internal/monitor/stale_claim_monitor.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace jobclaim::monitor {

using jobclaim::observability::IntField;
using jobclaim::observability::StringField;

StaleClaimMonitor::StaleClaimMonitor(std::shared_ptr<batch::BatchClaimCoordinator> coordinator, std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)), interval_(interval) {
  if (interval_.count() <= 0) throw std::invalid_argument("monitor interval must be positive");
}

StaleClaimMonitor::~StaleClaimMonitor() {
  Stop();
}

void StaleClaimMonitor::Start() {
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&StaleClaimMonitor::Run, this);
}

void StaleClaimMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

SweepResult StaleClaimMonitor::SweepOnce() {
  SweepResult result;
  result.swept_at_ms = util::NowMillis();
  result.stale_runs  = coordinator_->Stale();

  for (const auto& run : result.stale_runs) {
    const auto age = result.swept_at_ms > run.heartbeat_at_ms ? result.swept_at_ms - run.heartbeat_at_ms : 0;
    JOBCLAIM_LOG_WARN("stale import claim", {StringField("run_id", run.run_id), StringField("source_system", run.source_system),
                                             StringField("source_batch_id", run.source_batch_id), StringField("worker_id", run.worker_id),
                                             StringField("status", db::model::ToString(run.status)), StringField("heartbeat_age", util::FormatAge(age))});
  }

  {
    std::lock_guard<std::mutex> lock(result_mutex_);
    last_ = result;
  }
  return result;
}

SweepResult StaleClaimMonitor::LastSweep() const {
  std::lock_guard<std::mutex> lock(result_mutex_);
  return last_;
}

void StaleClaimMonitor::Run() {
  while (running_) {
    try {
      auto result = SweepOnce();
      JOBCLAIM_LOG_DEBUG("stale claim sweep", {IntField("stale", static_cast<int64_t>(result.stale_runs.size()))});
    } catch (const std::exception& e) {
      JOBCLAIM_LOG_ERROR("stale claim sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(wait_mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace jobclaim::monitor
