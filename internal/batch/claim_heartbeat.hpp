#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/batch/batch_claim_coordinator.hpp"

namespace jobclaim::batch {

/*
  Keeps one import claim alive while the importer works.

  Heartbeats (run_id, worker_id) every interval on its own thread. When a
  heartbeat is rejected the claim has been taken over; the task stops and
  Lost() turns true. The importer should then abandon the run.
*/
class ClaimHeartbeat {
 public:
  // Throws std::invalid_argument unless 0 < interval < stale_after.
  ClaimHeartbeat(std::shared_ptr<BatchClaimCoordinator> coordinator, std::string run_id, std::string worker_id,
                 std::chrono::milliseconds interval);
  ~ClaimHeartbeat();

  ClaimHeartbeat(const ClaimHeartbeat&)            = delete;
  ClaimHeartbeat& operator=(const ClaimHeartbeat&) = delete;

  void Start();
  void Stop();

  bool Lost() const {
    return lost_;
  }

  uint64_t Beats() const {
    return beats_;
  }

 private:
  void Run();

  std::shared_ptr<BatchClaimCoordinator> coordinator_;
  std::string                            run_id_;
  std::string                            worker_id_;
  std::chrono::milliseconds              interval_;

  std::atomic<bool>     running_{false};
  std::atomic<bool>     lost_{false};
  std::atomic<uint64_t> beats_{0};

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
};

} // namespace jobclaim::batch
