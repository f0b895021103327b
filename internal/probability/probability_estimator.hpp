#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "deliveryiq/v1.hpp"
#include "internal/db/model/tracking_snapshot_record.hpp"
#include "internal/probability/risk_policy.hpp"
#include "internal/resolver/curve_resolver.hpp"

namespace deliveryiq::probability {

struct SegmentUsed {
  std::string carrier;
  std::string service_bucket;
  std::string zone_bucket;
  std::string season_bucket;
};

struct PercentileSnapshot {
  std::optional<int64_t> p50;
  std::optional<int64_t> p75;
  std::optional<int64_t> p90;
  std::optional<int64_t> p95;
};

// Ephemeral, never persisted.
struct DeliveryEstimate {
  std::string shipment_id;

  double                delivery_probability         = 0.0;
  double                still_in_transit_probability = 0.0;
  double                days_in_transit              = 0.0;
  std::optional<double> expected_delivery_day;

  deliveryiq::v1::RiskLevel risk_level = deliveryiq::v1::RISK_LEVEL_LOW;
  std::vector<std::string>  risk_factors;

  deliveryiq::v1::ConfidenceLevel confidence  = deliveryiq::v1::CONFIDENCE_LEVEL_INSUFFICIENT;
  uint64_t                        sample_size = 0;

  SegmentUsed        segment_used;
  PercentileSnapshot percentiles;

  // resolver level 1..5, 0 when no curve was used
  uint32_t fallback_level = 0;
};

inline constexpr std::string_view kDeliveredSeason = "delivered";

/*
  On-demand delivery probability for one shipment.

  Delivered shipments short-circuit to certainty. Otherwise the shipment's
  segment is resolved to a survival curve and the risk policy blends the
  curve with live signals. Without any qualifying curve a fixed heuristic
  is returned with insufficient confidence.
*/
class ProbabilityEstimator {
 public:
  ProbabilityEstimator(std::shared_ptr<db::Repository> repository,
                       std::shared_ptr<const RiskPolicy> policy,
                       uint64_t                          min_sample_size = resolver::kDefaultMinSampleSize);

  // nullopt when the shipment has neither a delivery nor an in_transit timestamp
  std::optional<DeliveryEstimate> Estimate(db::Transaction& tx, const db::model::TrackingSnapshotRecord& snapshot, int64_t now_ms);

  std::optional<DeliveryEstimate> Estimate(const db::model::TrackingSnapshotRecord& snapshot, int64_t now_ms);

  // One snapshot read for all ids; unknown ids and shipments without an estimate are omitted.
  std::unordered_map<std::string, DeliveryEstimate> EstimateBatch(const std::vector<std::string>& shipment_ids, int64_t now_ms);

 private:
  std::shared_ptr<db::Repository>   repository_;
  resolver::CurveResolver           resolver_;
  std::shared_ptr<const RiskPolicy> policy_;
  uint64_t                          min_sample_size_;
};

} // namespace deliveryiq::probability
