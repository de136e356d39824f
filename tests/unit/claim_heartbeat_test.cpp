#include "internal/batch/claim_heartbeat.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using namespace std::chrono_literals;
using jobclaim::batch::BatchClaimCoordinator;
using jobclaim::batch::ClaimHeartbeat;

std::shared_ptr<BatchClaimCoordinator> MakeCoordinator(std::chrono::milliseconds stale_after) {
  jobclaim::batch::CoordinatorOptions options;
  options.stale_after = stale_after;
  return std::make_shared<BatchClaimCoordinator>(std::make_shared<jobclaim::db::memory::MemoryRepository>(), options);
}

void TestIntervalMustBeShorterThanStaleWindow() {
  auto c     = MakeCoordinator(1s);
  bool threw = false;
  try {
    ClaimHeartbeat heartbeat(c, "run", "w", 1s);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ClaimHeartbeat heartbeat(c, "run", "w", 0ms);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestHeartbeatKeepsClaimFresh() {
  auto c   = MakeCoordinator(200ms);
  auto run = c->Claim("simplicity", "hb1", "h", "", "plaintiff", "worker-a");

  ClaimHeartbeat heartbeat(c, run.run_id, "worker-a", 20ms);
  heartbeat.Start();
  std::this_thread::sleep_for(400ms);

  // without the heartbeat this claim would have gone stale twice over
  assert(c->Stale().empty());
  auto other = c->Claim("simplicity", "hb1", "h", "", "plaintiff", "worker-b");
  assert(other.status == jobclaim::batch::ClaimStatus::InProgress);

  heartbeat.Stop();
  assert(heartbeat.Beats() > 0);
  assert(!heartbeat.Lost());
}

void TestHeartbeatDetectsLostClaim() {
  auto c   = MakeCoordinator(10s);
  auto run = c->Claim("simplicity", "hb2", "h", "", "plaintiff", "worker-a");

  ClaimHeartbeat heartbeat(c, run.run_id, "worker-a", 10ms);
  heartbeat.Start();
  assert(c->Rollback(run.run_id, "operator").success);

  for (int i = 0; i < 200 && !heartbeat.Lost(); ++i) std::this_thread::sleep_for(5ms);
  assert(heartbeat.Lost());
  heartbeat.Stop();
}

void TestStopIsIdempotent() {
  auto c   = MakeCoordinator(10s);
  auto run = c->Claim("simplicity", "hb3", "h", "", "plaintiff", "worker-a");

  ClaimHeartbeat heartbeat(c, run.run_id, "worker-a", 1s);
  heartbeat.Start();
  heartbeat.Stop();
  heartbeat.Stop();
  assert(heartbeat.Beats() == 0);
}

} // namespace

int main() {
  TestIntervalMustBeShorterThanStaleWindow();
  TestHeartbeatKeepsClaimFresh();
  TestHeartbeatDetectsLostClaim();
  TestStopIsIdempotent();

  std::cout << "jobclaim_unit_claim_heartbeat: pass\n";
  return 0;
}
