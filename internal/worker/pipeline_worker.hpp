#pragma once

#include <optional>
#include <string>

#include "internal/worker/base_worker.hpp"

namespace jobclaim::worker {

/*
  Configured pipeline stage.

  Forwards each job to downstream (when set) as a new envelope carrying the
  same trace, entity and payload. The downstream idempotency key is
  "<downstream>:<upstream key>", so a stage forwards each job exactly once.
  Without a downstream the stage is a sink that only records completion.
*/
class PipelineWorker : public BaseWorker {
 public:
  PipelineWorker(WorkerContext context, WorkerOptions options, std::string downstream);
  ~PipelineWorker() override;

 protected:
  std::optional<google::protobuf::Struct> Process(const JobContext& ctx) override;

 private:
  std::string downstream_;
};

} // namespace jobclaim::worker
