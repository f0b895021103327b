#include "delivery_server.hpp"

#include "grpc_error.hpp"

namespace deliveryiq::grpc {

using namespace deliveryiq::v1;

DeliveryServer::DeliveryServer(std::shared_ptr<deliveryiq::service::EstimatorService> svc) : service_(std::move(svc)) {
}

::grpc::Status DeliveryServer::EstimateDelivery(::grpc::ServerContext*, const EstimateDeliveryRequest* req, EstimateDeliveryResponse* resp) {
  try {
    *resp = service_->EstimateDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DeliveryServer::EstimateDeliveryBatch(::grpc::ServerContext*, const EstimateDeliveryBatchRequest* req, EstimateDeliveryBatchResponse* resp) {
  try {
    *resp = service_->EstimateDeliveryBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace deliveryiq::grpc
