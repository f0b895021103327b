#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <iostream>
#include <string>

#include "deliveryiq/v1.hpp"

using namespace deliveryiq::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  deliveryctl <addr> estimate <shipment_id>\n"
            << "  deliveryctl <addr> estimate-batch <shipment_id> [shipment_id...]\n"
            << "  deliveryctl <addr> sync\n"
            << "  deliveryctl <addr> recompute\n"
            << "  deliveryctl <addr> pipeline\n"
            << "  deliveryctl <addr> stats\n";
}

static int Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto delivery_stub = DeliveryIntelligenceService::NewStub(channel);
  auto admin_stub    = DeliveryAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "estimate") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    EstimateDeliveryRequest req;
    req.set_shipment_id(argv[3]);

    EstimateDeliveryResponse resp;

    auto status = delivery_stub->EstimateDelivery(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.has_estimate()) {
      std::cout << "no estimate: shipment has not started transit\n";
      return 0;
    }
    return Print(resp.estimate());
  }

  // ------------------------------------------------------------

  if (cmd == "estimate-batch") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    EstimateDeliveryBatchRequest req;
    for (int i = 3; i < argc; ++i) {
      req.add_shipment_ids(argv[i]);
    }

    EstimateDeliveryBatchResponse resp;

    auto status = delivery_stub->EstimateDeliveryBatch(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return Print(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "sync") {
    SyncOutcomesRequest  req;
    SyncOutcomesResponse resp;

    auto status = admin_stub->SyncOutcomes(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "scanned=" << resp.scanned() << "\n";
    std::cout << "added=" << resp.added() << "\n";
    std::cout << "reevaluated=" << resp.reevaluated() << "\n";
    std::cout << "errors=" << resp.errors() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recompute") {
    RecomputeCurvesRequest  req;
    RecomputeCurvesResponse resp;

    auto status = admin_stub->RecomputeCurves(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "segments=" << resp.segments() << "\n";
    std::cout << "computed=" << resp.computed() << "\n";
    std::cout << "errors=" << resp.errors() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "pipeline") {
    RunPipelineRequest  req;
    RunPipelineResponse resp;

    auto status = admin_stub->RunPipeline(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return Print(resp);
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return Print(resp);
  }

  Usage();
  return 1;
}
