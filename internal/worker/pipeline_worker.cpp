#include "internal/worker/pipeline_worker.hpp"

#include "internal/queue/envelope.hpp"
#include "internal/util/hash.hpp"

namespace jobclaim::worker {

PipelineWorker::PipelineWorker(WorkerContext context, WorkerOptions options, std::string downstream)
    : BaseWorker(std::move(context), std::move(options)), downstream_(std::move(downstream)) {
}

PipelineWorker::~PipelineWorker() {
  Stop();
}

std::optional<google::protobuf::Struct> PipelineWorker::Process(const JobContext& ctx) {
  google::protobuf::Struct result;
  auto&                    fields = *result.mutable_fields();
  fields["stage"].set_string_value(ctx.queue_name);

  if (downstream_.empty()) return result;

  google::protobuf::Struct payload;
  if (ctx.envelope) {
    payload = ctx.envelope->payload();
  } else if (ctx.payload.has_struct_value()) {
    payload = ctx.payload.struct_value();
  } else {
    (*payload.mutable_fields())["value"] = ctx.payload;
  }

  std::string key = downstream_ + ":" + ctx.idempotency_key;
  if (key.size() > queue::kMaxIdempotencyKeyLength) key = downstream_ + ":" + util::Sha256Hex(ctx.idempotency_key);

  auto next = ctx.envelope ? queue::NewEnvelope(ctx.envelope->org_id(), ctx.envelope->entity_type(), ctx.envelope->entity_id(), key, payload)
                           : queue::NewEnvelope("default", "message", std::to_string(ctx.msg_id), key, payload);
  if (ctx.envelope && !ctx.envelope->trace_id().empty()) next.set_trace_id(ctx.envelope->trace_id());

  SendToQueue(downstream_, next);

  fields["forwarded_to"].set_string_value(downstream_);
  fields["forwarded_job_id"].set_string_value(next.job_id());
  return result;
}

} // namespace jobclaim::worker
