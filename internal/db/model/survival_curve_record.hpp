#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "deliveryiq/v1.hpp"
#include "internal/model/segment.hpp"

namespace deliveryiq::db::model {

struct SurvivalPoint {
  int64_t  day                  = 0;
  double   survival_probability = 1.0;
  uint64_t at_risk_count        = 0;
  uint64_t event_count          = 0;
  uint64_t cumulative_events    = 0;

  bool operator==(const SurvivalPoint&) const = default;
};

/*
  Fitted Kaplan-Meier curve for one segment key.

  Replaced wholesale on recompute (delete-then-insert by key, the service
  may be null). delivered + lost + censored == sample_size.
*/
struct SurvivalCurveRecord {
  deliveryiq::model::SegmentKey key;

  std::vector<SurvivalPoint> curve_data; // stored as JSON text

  uint64_t sample_size     = 0;
  uint64_t delivered_count = 0;
  uint64_t lost_count      = 0;
  uint64_t censored_count  = 0;

  std::optional<int64_t> median_days;
  std::optional<int64_t> p75_days;
  std::optional<int64_t> p90_days;
  std::optional<int64_t> p95_days;

  deliveryiq::v1::ConfidenceLevel confidence_level = deliveryiq::v1::CONFIDENCE_LEVEL_INSUFFICIENT;

  int64_t computed_at_ms = 0;
};

} // namespace deliveryiq::db::model
