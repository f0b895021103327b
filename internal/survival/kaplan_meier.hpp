#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/model/survival_curve_record.hpp"

namespace deliveryiq::survival {

using db::model::SurvivalPoint;

/*
  How lost_* outcomes enter the at-risk pool.

  kCensor: removed at their observed day without counting as a delivery.
  kRetain: never removed, so they keep pulling the curve's tail up.
*/
enum class LostHandling {
  kCensor,
  kRetain,
};

std::optional<LostHandling> ParseLostHandling(std::string_view value);
std::string_view            ToString(LostHandling handling);

struct Observation {
  double                  observed_days = 0.0;
  deliveryiq::v1::Outcome outcome       = deliveryiq::v1::OUTCOME_CENSORED;
};

/*
  Kaplan-Meier estimate where the event is "delivered".

  survival_probability is P(still in transit at day); the first point is
  always {0, 1.0, N, 0, 0}. Observations are binned by floor(observed_days).
  Points carry the at-risk count before that day's removals. Empty input
  yields an empty curve.
*/
std::vector<SurvivalPoint> ComputeKaplanMeier(const std::vector<Observation>& observations, LostHandling lost_handling);

// First day whose survival is <= 1 - p, nullopt when the curve never gets there.
std::optional<int64_t> PercentileDay(const std::vector<SurvivalPoint>& curve, double p);

// Linear interpolation of survival at a fractional day; 1.0 before the curve, last value past it.
double InterpolateSurvival(const std::vector<SurvivalPoint>& curve, double day);

inline double DeliveryProbabilityAtDay(const std::vector<SurvivalPoint>& curve, double day) {
  return 1.0 - InterpolateSurvival(curve, day);
}

} // namespace deliveryiq::survival
