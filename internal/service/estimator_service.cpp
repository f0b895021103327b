#include "estimator_service.hpp"

#include <string>
#include <vector>

#include "instrumented.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/probability/presentation.hpp"
#include "internal/probability/probability_estimator.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::service {

using namespace deliveryiq::v1;

EstimatorService::EstimatorService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EstimateDeliveryResponse EstimatorService::EstimateDelivery(const EstimateDeliveryRequest& req) {
  return Instrumented("EstimatorService.EstimateDelivery", [&] {
    if (req.shipment_id().empty()) {
      throw util::InvalidArgument("shipment_id is required");
    }

    auto tx        = ctx_.repository->BeginRead();
    auto snapshots = ctx_.repository->GetTrackingSnapshots(*tx, {req.shipment_id()});
    if (snapshots.empty()) {
      throw util::NotFound("shipment not found: " + req.shipment_id());
    }

    EstimateDeliveryResponse resp;
    if (auto estimate = ctx_.estimator->Estimate(*tx, snapshots.front(), ctx_.now_ms())) {
      *resp.mutable_estimate() = probability::ToProto(*estimate);
    }
    tx->Commit();
    return resp;
  });
}

EstimateDeliveryBatchResponse EstimatorService::EstimateDeliveryBatch(const EstimateDeliveryBatchRequest& req) {
  return Instrumented("EstimatorService.EstimateDeliveryBatch", [&] {
    std::vector<std::string> ids(req.shipment_ids().begin(), req.shipment_ids().end());

    EstimateDeliveryBatchResponse resp;
    for (const auto& [id, estimate] : ctx_.estimator->EstimateBatch(ids, ctx_.now_ms())) {
      (*resp.mutable_estimates())[id] = probability::ToProto(estimate);
    }
    return resp;
  });
}

} // namespace deliveryiq::service
