#include "presentation.hpp"

#include <cmath>

namespace deliveryiq::probability {

namespace {

double Round(double value, double scale) {
  return std::round(value * scale) / scale;
}

double RoundProbability(double value) {
  return Round(value, 1000.0);
}

} // namespace

std::string ProbabilitySummary(const DeliveryEstimate& estimate) {
  const double probability = RoundProbability(estimate.delivery_probability);
  const auto   pct         = std::to_string(static_cast<int>(std::lround(probability * 100.0)));

  if (probability >= 0.99) {
    return "Very likely to deliver";
  }
  if (probability >= 0.95) {
    return pct + "% likely to deliver";
  }
  if (probability >= 0.85) {
    return pct + "% delivery probability - monitor closely";
  }
  if (probability >= 0.70) {
    return pct + "% delivery probability - at risk";
  }
  return pct + "% delivery probability - high risk of loss";
}

std::string RecommendedAction(const DeliveryEstimate& estimate) {
  switch (estimate.risk_level) {
    case deliveryiq::v1::RISK_LEVEL_CRITICAL:
      if (HasFactor(estimate.risk_factors, kExceptionDetected)) {
        return "File lost in transit claim or consider reshipment";
      }
      return "Contact carrier for investigation";
    case deliveryiq::v1::RISK_LEVEL_HIGH:
      return "Monitor closely - proactively contact customer";
    case deliveryiq::v1::RISK_LEVEL_MEDIUM:
      return "Add to watchlist - check again tomorrow";
    default:
      return "No action needed - normal transit";
  }
}

deliveryiq::v1::DeliveryProbability ToProto(const DeliveryEstimate& estimate) {
  deliveryiq::v1::DeliveryProbability out;
  out.set_shipment_id(estimate.shipment_id);
  out.set_delivery_probability(RoundProbability(estimate.delivery_probability));
  out.set_still_in_transit_probability(RoundProbability(estimate.still_in_transit_probability));
  out.set_days_in_transit(Round(estimate.days_in_transit, 100.0));
  if (estimate.expected_delivery_day) {
    out.set_expected_delivery_day(Round(*estimate.expected_delivery_day, 100.0));
  }
  out.set_risk_level(estimate.risk_level);
  for (const auto& factor : estimate.risk_factors) {
    out.add_risk_factors(factor);
  }
  out.set_confidence(estimate.confidence);
  out.set_sample_size(estimate.sample_size);

  auto* segment = out.mutable_segment_used();
  segment->set_carrier(estimate.segment_used.carrier);
  segment->set_service_bucket(estimate.segment_used.service_bucket);
  segment->set_zone_bucket(estimate.segment_used.zone_bucket);
  segment->set_season_bucket(estimate.segment_used.season_bucket);

  auto* percentiles = out.mutable_percentiles();
  if (estimate.percentiles.p50) percentiles->set_p50(*estimate.percentiles.p50);
  if (estimate.percentiles.p75) percentiles->set_p75(*estimate.percentiles.p75);
  if (estimate.percentiles.p90) percentiles->set_p90(*estimate.percentiles.p90);
  if (estimate.percentiles.p95) percentiles->set_p95(*estimate.percentiles.p95);

  out.set_fallback_level(estimate.fallback_level);
  out.set_summary(ProbabilitySummary(estimate));
  out.set_recommended_action(RecommendedAction(estimate));
  return out;
}

} // namespace deliveryiq::probability
