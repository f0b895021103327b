#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

namespace deliveryiq::observability {

OtlpConfig ToOtlpConfig(const deliveryiq::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  OtlpConfig  otlp;
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.otlp_http() ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return otlp;
}

} // namespace deliveryiq::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

namespace deliveryiq::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = config.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = config.endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> unit_errors;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> curves_computed;
};

bool InitializeMetrics(const deliveryiq::runtime::config::RuntimeConfig& config) {
  auto otlp_config = ToOtlpConfig(config);
  if (otlp_config.endpoint.empty()) {
    ShutdownMetrics();
    return false;
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("delivery-iq", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("deliveryiq.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("deliveryiq.request.latency_ms", "End-to-end request latency", "ms");
  impl_->unit_errors        = impl_->meter->CreateUInt64Counter("deliveryiq.batch.unit_errors", "Shipments or segments skipped by a batch job", "1");
  impl_->curves_computed    = impl_->meter->CreateUInt64Counter("deliveryiq.curves.computed", "Survival curves written", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordUnitError(std::string_view job) {
  if (!impl_ || !impl_->unit_errors) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"job", std::string(job)}};
  impl_->unit_errors->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::AddCurvesComputed(std::uint64_t count) {
  if (!impl_ || !impl_->curves_computed || count == 0) {
    return;
  }
  impl_->curves_computed->Add(count);
}

} // namespace deliveryiq::observability

#endif
