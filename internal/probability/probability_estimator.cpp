#include "probability_estimator.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/outcome/outcome_classifier.hpp"
#include "internal/segment/segment_classifier.hpp"
#include "internal/survival/kaplan_meier.hpp"
#include "internal/util/time.hpp"

namespace deliveryiq::probability {

namespace {

PercentileSnapshot PercentilesOf(const db::model::SurvivalCurveRecord& curve) {
  return {curve.median_days, curve.p75_days, curve.p90_days, curve.p95_days};
}

} // namespace

ProbabilityEstimator::ProbabilityEstimator(std::shared_ptr<db::Repository>   repository,
                                           std::shared_ptr<const RiskPolicy> policy,
                                           uint64_t                          min_sample_size)
    : repository_(repository), resolver_(repository), policy_(std::move(policy)), min_sample_size_(min_sample_size) {
}

std::optional<DeliveryEstimate> ProbabilityEstimator::Estimate(db::Transaction& tx, const db::model::TrackingSnapshotRecord& snapshot, int64_t now_ms) {
  DeliveryEstimate estimate;
  estimate.shipment_id = snapshot.shipment_id;

  const auto service_bucket = segment::ServiceBucket(snapshot.carrier_service);
  const auto zone_bucket    = segment::ZoneBucket(snapshot.zone_used);

  if (snapshot.delivered_ms) {
    estimate.delivery_probability         = 1.0;
    estimate.still_in_transit_probability = 0.0;
    estimate.days_in_transit              = snapshot.in_transit_ms ? util::DaysBetween(*snapshot.in_transit_ms, *snapshot.delivered_ms) : 0.0;
    estimate.risk_level                   = deliveryiq::v1::RISK_LEVEL_LOW;
    estimate.confidence                   = deliveryiq::v1::CONFIDENCE_LEVEL_HIGH;
    estimate.segment_used                 = {snapshot.carrier, service_bucket, zone_bucket, std::string(kDeliveredSeason)};
    return estimate;
  }

  if (!snapshot.in_transit_ms) {
    return std::nullopt;
  }

  const auto& params        = policy_->params();
  const auto  season_bucket = segment::SeasonBucket(*snapshot.in_transit_ms);
  estimate.days_in_transit  = util::DaysBetween(*snapshot.in_transit_ms, now_ms);

  resolver::CurveRequest request{
      .carrier         = snapshot.carrier,
      .carrier_service = snapshot.carrier_service,
      .service_bucket  = service_bucket,
      .zone_bucket     = zone_bucket,
      .season_bucket   = season_bucket,
      .min_sample_size = min_sample_size_,
  };
  auto resolved = resolver_.Resolve(tx, request);

  if (!resolved) {
    RiskInputs inputs{.days_in_transit = estimate.days_in_transit};

    estimate.delivery_probability         = policy_->EventualProbability(inputs);
    estimate.still_in_transit_probability = std::exp(-params.no_curve_decay_rate * std::max(0.0, estimate.days_in_transit));
    estimate.expected_delivery_day        = params.no_curve_expected_day;
    estimate.risk_level                   = policy_->ClassifyRisk(inputs);
    estimate.confidence                   = deliveryiq::v1::CONFIDENCE_LEVEL_INSUFFICIENT;
    estimate.segment_used                 = {snapshot.carrier, service_bucket, zone_bucket, season_bucket};
    return estimate;
  }

  const auto& curve = resolved->curve;

  RiskInputs inputs;
  inputs.days_in_transit = estimate.days_in_transit;
  inputs.has_exception   = outcome::HasExceptionLanguage(snapshot.event_log);
  inputs.failed_attempt  = snapshot.delivery_attempt_failed_ms.has_value();
  inputs.curve           = &curve;

  const double p90 = curve.p90_days && *curve.p90_days > 0 ? static_cast<double>(*curve.p90_days) : params.default_p90_days;
  const double p95 = curve.p95_days && *curve.p95_days > 0 ? static_cast<double>(*curve.p95_days) : params.default_p95_days;
  if (inputs.has_exception) {
    inputs.risk_factors.emplace_back(kExceptionDetected);
  }
  if (inputs.failed_attempt) {
    inputs.risk_factors.emplace_back(kDeliveryAttemptFailed);
  }
  if (estimate.days_in_transit > p90) {
    inputs.risk_factors.emplace_back(kPastP90);
  }
  if (estimate.days_in_transit > p95) {
    inputs.risk_factors.emplace_back(kPastP95);
  }

  estimate.still_in_transit_probability = survival::InterpolateSurvival(curve.curve_data, estimate.days_in_transit);
  estimate.delivery_probability         = policy_->EventualProbability(inputs);
  estimate.risk_level                   = policy_->ClassifyRisk(inputs);
  estimate.risk_factors                 = inputs.risk_factors;
  if (curve.median_days) {
    estimate.expected_delivery_day = static_cast<double>(*curve.median_days);
  }
  estimate.confidence     = curve.confidence_level;
  estimate.sample_size    = curve.sample_size;
  estimate.segment_used   = {curve.key.carrier, curve.key.service_bucket, curve.key.zone_bucket, curve.key.season_bucket};
  estimate.percentiles    = PercentilesOf(curve);
  estimate.fallback_level = resolved->level;
  return estimate;
}

std::optional<DeliveryEstimate> ProbabilityEstimator::Estimate(const db::model::TrackingSnapshotRecord& snapshot, int64_t now_ms) {
  auto tx       = repository_->BeginRead();
  auto estimate = Estimate(*tx, snapshot, now_ms);
  tx->Commit();
  return estimate;
}

std::unordered_map<std::string, DeliveryEstimate> ProbabilityEstimator::EstimateBatch(const std::vector<std::string>& shipment_ids, int64_t now_ms) {
  std::unordered_map<std::string, DeliveryEstimate> estimates;
  if (shipment_ids.empty()) {
    return estimates;
  }

  auto tx = repository_->BeginRead();

  // one read unless the id list exceeds the per-query row cap
  std::vector<db::model::TrackingSnapshotRecord> snapshots;
  for (std::size_t offset = 0; offset < shipment_ids.size(); offset += db::kMaxPageRows) {
    const auto end = std::min(shipment_ids.size(), offset + db::kMaxPageRows);
    auto chunk     = repository_->GetTrackingSnapshots(*tx, std::vector<std::string>(shipment_ids.begin() + offset, shipment_ids.begin() + end));
    std::move(chunk.begin(), chunk.end(), std::back_inserter(snapshots));
  }

  for (const auto& snapshot : snapshots) {
    try {
      if (auto estimate = Estimate(*tx, snapshot, now_ms)) {
        estimates.emplace(snapshot.shipment_id, std::move(*estimate));
      }
    } catch (const std::exception& ex) {
      DELIVERYIQ_LOG_WARN("estimate skipped",
                          {deliveryiq::observability::StringField("shipment_id", snapshot.shipment_id),
                           deliveryiq::observability::StringField("error", ex.what())});
      deliveryiq::observability::Metrics::Instance().RecordUnitError("estimate_batch");
    }
  }
  tx->Commit();
  return estimates;
}

} // namespace deliveryiq::probability
