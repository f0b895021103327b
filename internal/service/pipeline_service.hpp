#pragma once

#include "deliveryiq/v1.hpp"
#include "service_context.hpp"

namespace deliveryiq::service {

// Batch triggers: outcome sync, curve recompute, and both in order.
class PipelineService {
 public:
  explicit PipelineService(ServiceContext ctx);

  deliveryiq::v1::SyncOutcomesResponse SyncOutcomes(const deliveryiq::v1::SyncOutcomesRequest& req);

  deliveryiq::v1::RecomputeCurvesResponse RecomputeCurves(const deliveryiq::v1::RecomputeCurvesRequest& req);

  deliveryiq::v1::RunPipelineResponse RunAll(const deliveryiq::v1::RunPipelineRequest& req);

 private:
  deliveryiq::v1::SyncOutcomesResponse    DoSync();
  deliveryiq::v1::RecomputeCurvesResponse DoRecompute();

  ServiceContext ctx_;
};

} // namespace deliveryiq::service
