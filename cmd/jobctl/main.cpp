#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/batch/batch_claim_coordinator.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/envelope.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using jobclaim::factory::Runtime;

namespace {

constexpr int kExitOk            = 0;
constexpr int kExitUsage         = 1;
constexpr int kExitError         = 2;
constexpr int kExitClaimConflict = 3;
constexpr int kExitMismatch      = 4;
constexpr int kExitNotFound      = 5;
constexpr int kExitInvalid       = 6;

void Usage() {
  std::cout << "Usage:\n"
            << "  jobctl <config.yaml> enqueue <queue> <json>\n"
            << "  jobctl <config.yaml> submit <queue> <org_id> <entity_type> <entity_id> <idempotency_key> [payload_json]\n"
            << "  jobctl <config.yaml> queues\n"
            << "  jobctl <config.yaml> metrics <queue>\n"
            << "  jobctl <config.yaml> jobs stats\n"
            << "  jobctl <config.yaml> jobs get <idempotency_key>\n"
            << "  jobctl <config.yaml> jobs reset <idempotency_key>\n"
            << "  jobctl <config.yaml> dlq list [queue] [--limit n]\n"
            << "  jobctl <config.yaml> dlq replay <id>\n"
            << "  jobctl <config.yaml> dlq replay-all [queue] [--limit n] [--dry-run]\n"
            << "  jobctl <config.yaml> workers\n"
            << "  jobctl <config.yaml> runs [--limit n]\n"
            << "  jobctl <config.yaml> run <run_id>\n"
            << "  jobctl <config.yaml> stale\n"
            << "  jobctl <config.yaml> batch claim <source_system> <source_batch_id> <file> [--hash hex] [--kind k] [--worker id] [--require]\n"
            << "  jobctl <config.yaml> batch start <run_id> <worker_id>\n"
            << "  jobctl <config.yaml> batch heartbeat <run_id> [worker_id]\n"
            << "  jobctl <config.yaml> batch row <run_id> <row_number> <source_system> <natural_key> <payload_json>\n"
            << "  jobctl <config.yaml> batch finalize <run_id> <fetched> <inserted> <skipped> <errored> [--failed] [--details json] [--worker id]\n"
            << "  jobctl <config.yaml> batch reconcile <run_id> [expected] [--strict] [--worker id]\n"
            << "  jobctl <config.yaml> batch rollback <run_id> [reason]\n"
            << "\n"
            << "Exit codes: 0 ok, 1 usage, 2 error, 3 claim held elsewhere, 4 reconciliation mismatch,\n"
            << "            5 not found, 6 invalid input\n";
}

// Removes a boolean flag from args. Returns whether it was present.
bool TakeFlag(std::vector<std::string>& args, const std::string& flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end()) return false;
  args.erase(it);
  return true;
}

// Removes "--name value" from args.
std::optional<std::string> TakeOption(std::vector<std::string>& args, const std::string& name) {
  auto it = std::find(args.begin(), args.end(), name);
  if (it == args.end()) return std::nullopt;
  if (it + 1 == args.end()) throw std::invalid_argument(name + " requires a value");
  std::string value = *(it + 1);
  args.erase(it, it + 2);
  return value;
}

uint64_t ParseCount(const std::string& value, const std::string& what) {
  std::size_t pos = 0;
  long long   n   = 0;
  try {
    n = std::stoll(value, &pos);
  } catch (const std::exception&) {
    throw std::invalid_argument(what + " must be a number: " + value);
  }
  if (pos != value.size() || n < 0) throw std::invalid_argument(what + " must be a non-negative integer: " + value);
  return static_cast<uint64_t>(n);
}

std::string DefaultWorkerId() {
  char host[64] = {};
  if (gethostname(host, sizeof(host) - 1) != 0) std::snprintf(host, sizeof(host), "unknown");
  return std::string(host) + "-" + std::to_string(getpid()) + "-" + jobclaim::util::NewUuidString().substr(0, 8);
}

std::string Age(uint64_t since_ms) {
  const auto now = jobclaim::util::NowMillis();
  return jobclaim::util::FormatAge(now > since_ms ? now - since_ms : 0);
}

void PrintRun(const jobclaim::db::model::ImportRunRecord& run) {
  std::cout << "run_id=" << run.run_id << " status=" << jobclaim::db::model::ToString(run.status) << " source=" << run.source_system << "/"
            << run.source_batch_id << " file=" << run.filename << " kind=" << run.import_kind << " worker=" << run.worker_id
            << " fetched=" << run.rows_fetched << " inserted=" << run.rows_inserted << " skipped=" << run.rows_skipped
            << " errored=" << run.rows_errored << " heartbeat_age=" << Age(run.heartbeat_at_ms);
  if (!run.error_details.empty()) std::cout << " details=" << run.error_details;
  std::cout << "\n";
}

void PrintMetrics(const jobclaim::db::model::QueueMetricsRecord& m) {
  std::cout << "queue=" << m.queue_name << " total=" << m.total << " readable=" << m.readable << " in_flight=" << m.in_flight
            << " oldest_age=" << jobclaim::util::FormatAge(m.oldest_age_ms) << "\n";
}

// ------------------------------------------------------------
// queue / registry / dlq / workers
// ------------------------------------------------------------

int RunQueueCommand(Runtime& rt, const std::string& cmd, std::vector<std::string>& args) {
  if (cmd == "enqueue") {
    if (args.size() != 2) return kExitUsage;
    jobclaim::util::ParseJson(args[1]);
    std::cout << "msg_id=" << rt.messages->Enqueue(args[0], args[1]) << "\n";
    return kExitOk;
  }

  if (cmd == "submit") {
    if (args.size() < 5 || args.size() > 6) return kExitUsage;
    google::protobuf::Struct payload;
    if (args.size() == 6) payload = jobclaim::util::ParseJsonObject(args[5]);
    auto envelope = jobclaim::queue::NewEnvelope(args[1], args[2], args[3], args[4], payload);
    auto msg_id   = rt.messages->Enqueue(args[0], envelope);
    std::cout << "msg_id=" << msg_id << " job_id=" << envelope.job_id() << " trace_id=" << envelope.trace_id() << "\n";
    return kExitOk;
  }

  if (cmd == "queues") {
    for (const auto& queue : rt.messages->ListQueues()) PrintMetrics(rt.messages->Metrics(queue));
    return kExitOk;
  }

  if (cmd == "metrics") {
    if (args.size() != 1) return kExitUsage;
    PrintMetrics(rt.messages->Metrics(args[0]));
    return kExitOk;
  }

  if (cmd == "workers") {
    auto tx      = rt.repository->Begin();
    auto workers = rt.repository->ListWorkerHeartbeats(*tx);
    tx->Commit();
    for (const auto& w : workers) {
      std::cout << "worker_id=" << w.worker_id << " queue=" << w.queue_name << " host=" << w.hostname << " pid=" << w.pid
                << " status=" << w.status << " processed=" << w.jobs_processed << " failed=" << w.jobs_failed
                << " skipped=" << w.jobs_skipped << " invalid=" << w.jobs_invalid << " last_seen=" << Age(w.last_seen_at_ms) << "\n";
    }
    return kExitOk;
  }

  return -1;
}

int RunJobsCommand(Runtime& rt, std::vector<std::string>& args) {
  if (args.empty()) return kExitUsage;
  const auto sub = args[0];

  if (sub == "stats" && args.size() == 1) {
    for (const auto& s : rt.registry->Stats()) {
      std::cout << "queue=" << s.queue_name << " processing=" << s.processing << " completed=" << s.completed << " failed=" << s.failed
                << "\n";
    }
    return kExitOk;
  }

  if (sub == "get" && args.size() == 2) {
    auto job = rt.registry->Get(args[1]);
    if (!job) throw jobclaim::util::NotFound("no job with key " + args[1]);
    std::cout << "key=" << job->idempotency_key << " status=" << jobclaim::db::model::ToString(job->status) << " attempts=" << job->attempts
              << " msg_id=" << job->job_id << " queue=" << job->queue_name << " worker=" << job->worker_id;
    if (!job->last_error.empty()) std::cout << " last_error=" << job->last_error;
    if (!job->result.empty()) std::cout << " result=" << job->result;
    std::cout << "\n";
    return kExitOk;
  }

  if (sub == "reset" && args.size() == 2) {
    rt.registry->ResetAttempts(args[1]);
    std::cout << "reset\n";
    return kExitOk;
  }

  return kExitUsage;
}

int RunDlqCommand(Runtime& rt, std::vector<std::string>& args) {
  if (args.empty()) return kExitUsage;
  const auto sub = args[0];
  args.erase(args.begin());

  const auto limit_opt = TakeOption(args, "--limit");
  const auto limit     = static_cast<uint32_t>(limit_opt ? ParseCount(*limit_opt, "--limit") : 100);

  if (sub == "list") {
    if (args.size() > 1) return kExitUsage;
    std::optional<std::string> queue;
    if (!args.empty()) queue = args[0];
    for (const auto& e : rt.dead_letters->List(queue, limit)) {
      std::cout << "id=" << e.id << " queue=" << e.original_queue << " msg_id=" << e.original_job_id << " attempts=" << e.attempt_count
                << " age=" << Age(e.moved_at_ms) << " key=" << e.idempotency_key << " error=" << e.error_message << "\n";
    }
    return kExitOk;
  }

  if (sub == "replay") {
    if (args.size() != 1) return kExitUsage;
    auto result = rt.dead_letters->Replay(args[0]);
    if (!result.success) throw jobclaim::util::NotFound(result.error + ": " + args[0]);
    std::cout << "replayed queue=" << result.original_queue << " msg_id=" << result.new_msg_id << "\n";
    return kExitOk;
  }

  if (sub == "replay-all") {
    const bool dry_run = TakeFlag(args, "--dry-run");
    if (args.size() > 1) return kExitUsage;
    std::optional<std::string> queue;
    if (!args.empty()) queue = args[0];

    int failures = 0;
    for (const auto& r : rt.dead_letters->ReplayAll(queue, limit, dry_run)) {
      std::cout << "id=" << r.dead_letter_id << " queue=" << r.original_queue << (r.success ? " ok" : " failed");
      if (r.new_msg_id != 0) std::cout << " msg_id=" << r.new_msg_id;
      if (!r.error.empty()) std::cout << " error=" << r.error;
      std::cout << "\n";
      if (!r.success) failures++;
    }
    return failures == 0 ? kExitOk : kExitError;
  }

  return kExitUsage;
}

// ------------------------------------------------------------
// batch imports
// ------------------------------------------------------------

int RunBatchCommand(Runtime& rt, const jobclaim::runtime::config::RuntimeConfig& config, std::vector<std::string>& args) {
  if (args.empty()) return kExitUsage;
  const auto sub = args[0];
  args.erase(args.begin());

  auto& coordinator = *rt.coordinator;

  if (sub == "claim") {
    const bool require = TakeFlag(args, "--require");
    const auto hash    = TakeOption(args, "--hash");
    const auto kind    = TakeOption(args, "--kind").value_or("default");
    const auto worker  = TakeOption(args, "--worker").value_or(DefaultWorkerId());
    if (args.size() != 3) return kExitUsage;

    const auto file_hash = hash ? *hash : jobclaim::batch::ComputeFileHash(args[2]);
    auto       result    = coordinator.Claim(args[0], args[1], file_hash, args[2], kind, worker);

    std::cout << "run_id=" << result.run_id << " status=" << jobclaim::batch::ToString(result.status) << " worker_id=" << worker
              << " file_hash=" << file_hash;
    if (result.taken_over) std::cout << " previous_worker_id=" << result.holder_worker_id;
    std::cout << " heartbeat_interval_sec="
              << std::chrono::duration_cast<std::chrono::seconds>(jobclaim::factory::BatchHeartbeatInterval(config)).count() << "\n";

    if (require && result.status == jobclaim::batch::ClaimStatus::InProgress) {
      throw jobclaim::util::ClaimConflict("batch is held by " + result.holder_worker_id, result.run_id);
    }
    return kExitOk;
  }

  if (sub == "start") {
    if (args.size() != 2) return kExitUsage;
    if (!coordinator.MarkInProgress(args[0], args[1])) {
      throw jobclaim::util::ClaimConflict("claim not held by " + args[1], args[0]);
    }
    std::cout << "in_progress\n";
    return kExitOk;
  }

  if (sub == "heartbeat") {
    if (args.empty() || args.size() > 2) return kExitUsage;
    std::optional<std::string> worker;
    if (args.size() == 2) worker = args[1];
    if (!coordinator.Heartbeat(args[0], worker)) {
      throw jobclaim::util::ClaimConflict("claim lost or run not active", args[0]);
    }
    std::cout << "ok\n";
    return kExitOk;
  }

  if (sub == "row") {
    if (args.size() != 5) return kExitUsage;
    jobclaim::util::ParseJson(args[4]);
    bool inserted = coordinator.InsertRow(args[0], ParseCount(args[1], "row_number"), args[2], args[3], args[4]);
    std::cout << (inserted ? "inserted" : "duplicate") << "\n";
    return kExitOk;
  }

  if (sub == "finalize") {
    const bool failed  = TakeFlag(args, "--failed");
    const auto details = TakeOption(args, "--details");
    const auto worker  = TakeOption(args, "--worker");
    if (args.size() != 5) return kExitUsage;

    jobclaim::batch::RowCounts counts;
    counts.fetched  = ParseCount(args[1], "fetched");
    counts.inserted = ParseCount(args[2], "inserted");
    counts.skipped  = ParseCount(args[3], "skipped");
    counts.errored  = ParseCount(args[4], "errored");

    std::optional<google::protobuf::Struct> error_details;
    if (details) error_details = jobclaim::util::ParseJsonObject(*details);

    if (!coordinator.Finalize(args[0], counts, error_details, !failed, worker)) {
      throw jobclaim::util::NotFound("import run " + args[0] + " not found");
    }
    auto run = coordinator.Get(args[0]);
    std::cout << "status=" << (run ? jobclaim::db::model::ToString(run->status) : "unknown") << "\n";
    return kExitOk;
  }

  if (sub == "reconcile") {
    const bool strict = TakeFlag(args, "--strict");
    const auto worker = TakeOption(args, "--worker");
    if (args.empty() || args.size() > 2) return kExitUsage;
    std::optional<uint64_t> expected;
    if (args.size() == 2) expected = ParseCount(args[1], "expected");

    auto result = coordinator.Reconcile(args[0], expected, worker);
    std::cout << "is_valid=" << (result.is_valid ? "true" : "false") << " expected=" << result.expected_count
              << " actual=" << result.actual_count << " delta=" << result.delta << "\n";
    if (strict && !result.is_valid) {
      throw jobclaim::util::ReconciliationMismatch("import run " + args[0] + " failed reconciliation", result.delta);
    }
    return kExitOk;
  }

  if (sub == "rollback") {
    if (args.empty() || args.size() > 2) return kExitUsage;
    auto result = coordinator.Rollback(args[0], args.size() == 2 ? args[1] : "manual_rollback");
    if (!result.success) throw jobclaim::util::NotFound("import run " + args[0] + " not found");
    std::cout << "rolled_back rows_affected=" << result.rows_affected << "\n";
    return kExitOk;
  }

  return kExitUsage;
}

int Dispatch(Runtime& rt, const jobclaim::runtime::config::RuntimeConfig& config, const std::string& cmd, std::vector<std::string>& args) {
  if (cmd == "jobs") return RunJobsCommand(rt, args);
  if (cmd == "dlq") return RunDlqCommand(rt, args);
  if (cmd == "batch") return RunBatchCommand(rt, config, args);

  if (cmd == "runs") {
    const auto limit_opt = TakeOption(args, "--limit");
    if (!args.empty()) return kExitUsage;
    for (const auto& run : rt.coordinator->Recent(static_cast<uint32_t>(limit_opt ? ParseCount(*limit_opt, "--limit") : 20))) PrintRun(run);
    return kExitOk;
  }

  if (cmd == "run") {
    if (args.size() != 1) return kExitUsage;
    auto run = rt.coordinator->Get(args[0]);
    if (!run) throw jobclaim::util::NotFound("import run " + args[0] + " not found");
    PrintRun(*run);
    for (const auto& row : rt.coordinator->Rows(args[0])) {
      std::cout << "  row=" << row.row_number << " status=" << jobclaim::db::model::ToString(row.status) << " key=" << row.dedupe_key;
      if (!row.error_message.empty()) std::cout << " error=" << row.error_message;
      std::cout << "\n";
    }
    return kExitOk;
  }

  if (cmd == "stale") {
    for (const auto& run : rt.coordinator->Stale()) PrintRun(run);
    return kExitOk;
  }

  return RunQueueCommand(rt, cmd, args);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return kExitUsage;
  }

  std::string              config_path = argv[1];
  std::string              cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = jobclaim::config::ConfigLoader::LoadFromYaml(config_path);
    jobclaim::observability::InitializeLogging(config);

    auto runtime = jobclaim::factory::BuildRuntime(config);

    int code = Dispatch(runtime, config, cmd, args);
    if (code == kExitUsage || code < 0) {
      Usage();
      code = kExitUsage;
    }
    jobclaim::observability::ShutdownLogging();
    return code;
  } catch (const jobclaim::util::ClaimConflict& e) {
    std::cerr << "claim conflict: " << e.what() << " run_id=" << e.RunId() << "\n";
    return kExitClaimConflict;
  } catch (const jobclaim::util::ReconciliationMismatch& e) {
    std::cerr << e.what() << " delta=" << e.Delta() << "\n";
    return kExitMismatch;
  } catch (const jobclaim::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return kExitNotFound;
  } catch (const jobclaim::util::InvalidEnvelope& e) {
    std::cerr << e.what() << "\n";
    for (const auto& error : e.Errors()) std::cerr << "  " << error << "\n";
    return kExitInvalid;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return kExitInvalid;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return kExitError;
  }
}
