#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace deliveryiq::grpc {

using namespace deliveryiq::v1;

AdminServer::AdminServer(std::shared_ptr<deliveryiq::service::PipelineService> pipeline, std::shared_ptr<deliveryiq::service::AdminService> admin)
    : pipeline_(std::move(pipeline)), admin_(std::move(admin)) {
}

::grpc::Status AdminServer::SyncOutcomes(::grpc::ServerContext*, const SyncOutcomesRequest* req, SyncOutcomesResponse* resp) {
  try {
    *resp = pipeline_->SyncOutcomes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RecomputeCurves(::grpc::ServerContext*, const RecomputeCurvesRequest* req, RecomputeCurvesResponse* resp) {
  try {
    *resp = pipeline_->RecomputeCurves(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RunPipeline(::grpc::ServerContext*, const RunPipelineRequest* req, RunPipelineResponse* resp) {
  try {
    *resp = pipeline_->RunAll(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = admin_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace deliveryiq::grpc
