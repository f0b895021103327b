#pragma once

#include <array>
#include <string_view>

#include "internal/db/api/types.hpp"
#include "internal/model/segment.hpp"

namespace deliveryiq::survival {

/*
  Coarser curves fitted next to every exact segment.

  Each rule names the dimensions it collapses; a collapsed carrier or
  service bucket becomes model::kAll, a collapsed service becomes null.
  Zone and season are never collapsed.
*/
struct AggregationRule {
  std::string_view name;
  bool             drop_carrier;
  bool             drop_service_bucket;
};

inline constexpr std::array<AggregationRule, 3> kAggregationTiers = {{
    {"carrier_service_bucket", false, false},
    {"service_bucket_zone_season", true, false},
    {"zone_season", true, true},
}};

// Exact segment -> aggregated key for `rule`. carrier_service is always dropped.
model::SegmentKey Aggregate(const model::SegmentKey& exact, const AggregationRule& rule);

// Outcome query selecting every record that contributes to the curve for `key`.
db::OutcomeFilter OutcomesFor(const model::SegmentKey& key);

} // namespace deliveryiq::survival
