#include "internal/batch/claim_heartbeat.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace jobclaim::batch {

using jobclaim::observability::StringField;

ClaimHeartbeat::ClaimHeartbeat(std::shared_ptr<BatchClaimCoordinator> coordinator, std::string run_id, std::string worker_id,
                               std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)), run_id_(std::move(run_id)), worker_id_(std::move(worker_id)), interval_(interval) {
  if (!coordinator_) throw std::invalid_argument("claim heartbeat requires a coordinator");
  if (interval_.count() <= 0) throw std::invalid_argument("heartbeat interval must be positive");
  if (interval_ >= coordinator_->Options().stale_after) {
    throw std::invalid_argument("heartbeat interval must be shorter than the staleness window");
  }
}

ClaimHeartbeat::~ClaimHeartbeat() {
  Stop();
}

void ClaimHeartbeat::Start() {
  if (running_) return;
  if (thread_.joinable()) thread_.join();
  running_ = true;
  thread_  = std::thread(&ClaimHeartbeat::Run, this);
}

void ClaimHeartbeat::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ClaimHeartbeat::Run() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;
    }

    try {
      if (!coordinator_->Heartbeat(run_id_, worker_id_)) {
        lost_ = true;
        JOBCLAIM_LOG_ERROR("import claim lost", {StringField("run_id", run_id_), StringField("worker_id", worker_id_)});
        break;
      }
      beats_++;
    } catch (const std::exception& e) {
      // transient; the next beat retries within the staleness window
      JOBCLAIM_LOG_WARN("import claim heartbeat failed", {StringField("run_id", run_id_), StringField("error", e.what())});
    }
  }
  running_ = false;
}

} // namespace jobclaim::batch
