#pragma once

#include "deliveryiq/v1.hpp"
#include "service_context.hpp"

namespace deliveryiq::service {

class EstimatorService {
 public:
  explicit EstimatorService(ServiceContext ctx);

  // NotFound for an unknown shipment; estimate left unset without a transit-start scan.
  deliveryiq::v1::EstimateDeliveryResponse EstimateDelivery(const deliveryiq::v1::EstimateDeliveryRequest& req);

  deliveryiq::v1::EstimateDeliveryBatchResponse EstimateDeliveryBatch(const deliveryiq::v1::EstimateDeliveryBatchRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace deliveryiq::service
