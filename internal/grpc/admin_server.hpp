#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "deliveryiq/v1.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/pipeline_service.hpp"

namespace deliveryiq::grpc {

class AdminServer final : public deliveryiq::v1::DeliveryAdminService::Service {
 public:
  AdminServer(std::shared_ptr<deliveryiq::service::PipelineService> pipeline, std::shared_ptr<deliveryiq::service::AdminService> admin);

  ::grpc::Status SyncOutcomes(::grpc::ServerContext*, const deliveryiq::v1::SyncOutcomesRequest*, deliveryiq::v1::SyncOutcomesResponse*) override;

  ::grpc::Status RecomputeCurves(::grpc::ServerContext*,
                                 const deliveryiq::v1::RecomputeCurvesRequest*,
                                 deliveryiq::v1::RecomputeCurvesResponse*) override;

  ::grpc::Status RunPipeline(::grpc::ServerContext*, const deliveryiq::v1::RunPipelineRequest*, deliveryiq::v1::RunPipelineResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const deliveryiq::v1::StatsRequest*, deliveryiq::v1::StatsResponse*) override;

 private:
  std::shared_ptr<deliveryiq::service::PipelineService> pipeline_;
  std::shared_ptr<deliveryiq::service::AdminService>    admin_;
};

} // namespace deliveryiq::grpc
