#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using deliveryiq::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Shutdown() {
  deliveryiq::observability::ShutdownLogging();
  deliveryiq::observability::ShutdownMetrics();
  deliveryiq::observability::ShutdownTracing();
}

static void Usage() {
  std::cerr << "Usage: delivery-iq [--config] <config.yaml> [--run-pipeline]\n"
               "  --run-pipeline  run outcome sync + curve recompute once, print the result and exit"
            << std::endl;
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        run_pipeline = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--run-pipeline") {
      run_pipeline = true;
    } else if (config_path.empty() && !arg.empty() && arg[0] != '-') {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = deliveryiq::config::ConfigLoader::LoadFromYaml(config_path);

    deliveryiq::observability::InitializeLogging(config);
    deliveryiq::observability::InitializeTracing(config);
    deliveryiq::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = deliveryiq::factory::Build(config);

    if (run_pipeline) {
      const auto result = app.pipeline_service->RunAll(deliveryiq::v1::RunPipelineRequest{});

      google::protobuf::util::JsonPrintOptions options;
      options.add_whitespace                = true;
      options.preserve_proto_field_names    = true;
      options.always_print_primitive_fields = true;

      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(result, &json, options);
      if (!status.ok()) {
        throw std::runtime_error("failed to render pipeline result: " + std::string(status.message()));
      }
      std::cout << json << std::endl;
      Shutdown();
      return result.sync().errors() + result.curves().errors() == 0 ? 0 : 3;
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    DELIVERYIQ_LOG_INFO("Shutting down delivery-iq");

    server.Stop();
    Shutdown();
  } catch (const std::exception& e) {
    DELIVERYIQ_LOG_ERROR("Fatal error", {deliveryiq::observability::StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
