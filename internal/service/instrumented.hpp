#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace deliveryiq::service {

/*
  Runs one RPC body inside a span, records request count and latency for
  `route`, logs and rethrows failures.
*/
template <typename Fn>
auto Instrumented(std::string_view route, Fn&& fn) -> decltype(fn()) {
  deliveryiq::observability::SpanScope span(route);
  const auto                           started_at = std::chrono::steady_clock::now();
  auto&                                metrics    = deliveryiq::observability::Metrics::Instance();

  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto response = std::forward<Fn>(fn)();
    metrics.RecordRequest(route, true);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    return response;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DELIVERYIQ_LOG_ERROR("RPC failed", {deliveryiq::observability::StringField("route", route), deliveryiq::observability::StringField("error", ex.what())});
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace deliveryiq::service
