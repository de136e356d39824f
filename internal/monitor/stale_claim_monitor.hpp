#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/batch/batch_claim_coordinator.hpp"

namespace jobclaim::monitor {

struct SweepResult {
  uint64_t                                swept_at_ms = 0;
  std::vector<db::model::ImportRunRecord> stale_runs;
};

/*
  Periodic read-only sweep for active import runs past the staleness
  window. Each one is logged at warn level. Takeover itself happens in
  BatchClaimCoordinator::Claim.
*/
class StaleClaimMonitor {
 public:
  StaleClaimMonitor(std::shared_ptr<batch::BatchClaimCoordinator> coordinator, std::chrono::milliseconds interval);
  ~StaleClaimMonitor();

  void Start();
  void Stop();

  // One sweep on the caller's thread.
  SweepResult SweepOnce();

  SweepResult LastSweep() const;

 private:
  void Run();

  std::shared_ptr<batch::BatchClaimCoordinator> coordinator_;
  std::chrono::milliseconds                     interval_;

  std::atomic<bool>       running_{false};
  std::mutex              wait_mutex_;
  std::condition_variable cv_;
  std::thread             thread_;

  mutable std::mutex result_mutex_;
  SweepResult        last_;
};

} // namespace jobclaim::monitor
