#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "deliveryiq/v1.hpp"
#include "internal/service/estimator_service.hpp"

namespace deliveryiq::grpc {

class DeliveryServer final : public deliveryiq::v1::DeliveryIntelligenceService::Service {
 public:
  explicit DeliveryServer(std::shared_ptr<deliveryiq::service::EstimatorService> svc);

  ::grpc::Status EstimateDelivery(::grpc::ServerContext*,
                                  const deliveryiq::v1::EstimateDeliveryRequest*,
                                  deliveryiq::v1::EstimateDeliveryResponse*) override;

  ::grpc::Status EstimateDeliveryBatch(::grpc::ServerContext*,
                                       const deliveryiq::v1::EstimateDeliveryBatchRequest*,
                                       deliveryiq::v1::EstimateDeliveryBatchResponse*) override;

 private:
  std::shared_ptr<deliveryiq::service::EstimatorService> service_;
};

} // namespace deliveryiq::grpc
