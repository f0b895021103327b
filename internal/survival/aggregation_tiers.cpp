#include "aggregation_tiers.hpp"

#include <string>

namespace deliveryiq::survival {

model::SegmentKey Aggregate(const model::SegmentKey& exact, const AggregationRule& rule) {
  model::SegmentKey key = exact;
  key.carrier_service.reset();
  if (rule.drop_carrier) {
    key.carrier = std::string(model::kAll);
  }
  if (rule.drop_service_bucket) {
    key.service_bucket = std::string(model::kAll);
  }
  return key;
}

db::OutcomeFilter OutcomesFor(const model::SegmentKey& key) {
  db::OutcomeFilter filter;
  if (key.carrier != model::kAll) {
    filter.carrier = key.carrier;
  }
  // null service aggregates every service of the carrier
  filter.carrier_service = key.carrier_service;
  if (key.service_bucket != model::kAll) {
    filter.service_bucket = key.service_bucket;
  }
  filter.zone_bucket   = key.zone_bucket;
  filter.season_bucket = key.season_bucket;
  return filter;
}

} // namespace deliveryiq::survival
