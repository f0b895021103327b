#include "pipeline_service.hpp"

#include "instrumented.hpp"
#include "internal/outcome/outcome_sync.hpp"
#include "internal/survival/curve_engine.hpp"

namespace deliveryiq::service {

using namespace deliveryiq::v1;

PipelineService::PipelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SyncOutcomesResponse PipelineService::DoSync() {
  const auto result = ctx_.outcome_sync->Run(ctx_.now_ms());

  SyncOutcomesResponse resp;
  resp.set_scanned(result.scanned);
  resp.set_added(result.added);
  resp.set_reevaluated(result.reevaluated);
  resp.set_errors(result.errors);
  return resp;
}

RecomputeCurvesResponse PipelineService::DoRecompute() {
  const auto result = ctx_.curve_engine->RecomputeAll(ctx_.now_ms());

  RecomputeCurvesResponse resp;
  resp.set_segments(result.segments);
  resp.set_computed(result.computed);
  resp.set_errors(result.errors);
  return resp;
}

SyncOutcomesResponse PipelineService::SyncOutcomes(const SyncOutcomesRequest&) {
  return Instrumented("PipelineService.SyncOutcomes", [&] { return DoSync(); });
}

RecomputeCurvesResponse PipelineService::RecomputeCurves(const RecomputeCurvesRequest&) {
  return Instrumented("PipelineService.RecomputeCurves", [&] { return DoRecompute(); });
}

RunPipelineResponse PipelineService::RunAll(const RunPipelineRequest&) {
  return Instrumented("PipelineService.RunAll", [&] {
    RunPipelineResponse resp;
    *resp.mutable_sync()   = DoSync();
    *resp.mutable_curves() = DoRecompute();
    return resp;
  });
}

} // namespace deliveryiq::service
