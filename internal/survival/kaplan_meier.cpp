#include "kaplan_meier.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "internal/model/labels.hpp"

namespace deliveryiq::survival {

namespace {

struct DayGroup {
  uint64_t events   = 0;
  uint64_t censored = 0;
  uint64_t lost     = 0;
};

} // namespace

std::optional<LostHandling> ParseLostHandling(std::string_view value) {
  if (value == "censor") return LostHandling::kCensor;
  if (value == "retain") return LostHandling::kRetain;
  return std::nullopt;
}

std::string_view ToString(LostHandling handling) {
  return handling == LostHandling::kRetain ? "retain" : "censor";
}

std::vector<SurvivalPoint> ComputeKaplanMeier(const std::vector<Observation>& observations, LostHandling lost_handling) {
  std::vector<SurvivalPoint> curve;
  if (observations.empty()) {
    return curve;
  }

  std::map<int64_t, DayGroup> groups;
  for (const auto& obs : observations) {
    const auto day = static_cast<int64_t>(std::floor(std::max(0.0, obs.observed_days)));
    if (obs.outcome == deliveryiq::v1::OUTCOME_DELIVERED) {
      ++groups[day].events;
    } else if (obs.outcome == deliveryiq::v1::OUTCOME_CENSORED) {
      ++groups[day].censored;
    } else if (model::IsLost(obs.outcome) && lost_handling == LostHandling::kCensor) {
      ++groups[day].lost;
    }
  }

  uint64_t at_risk    = observations.size();
  double   survival   = 1.0;
  uint64_t cumulative = 0;

  curve.reserve(groups.size() + 1);
  curve.push_back({0, 1.0, at_risk, 0, 0});

  for (const auto& [day, group] : groups) {
    if (at_risk > 0 && group.events > 0) {
      survival *= 1.0 - static_cast<double>(group.events) / static_cast<double>(at_risk);
      survival = std::clamp(survival, 0.0, 1.0);
    }
    cumulative += group.events;
    curve.push_back({day, survival, at_risk, group.events, cumulative});

    const uint64_t removed = group.events + group.censored + group.lost;
    at_risk                = removed >= at_risk ? 0 : at_risk - removed;
  }
  return curve;
}

std::optional<int64_t> PercentileDay(const std::vector<SurvivalPoint>& curve, double p) {
  const double target = 1.0 - p;
  for (const auto& point : curve) {
    if (point.survival_probability <= target) {
      return point.day;
    }
  }
  return std::nullopt;
}

double InterpolateSurvival(const std::vector<SurvivalPoint>& curve, double day) {
  if (curve.empty() || day <= 0.0) {
    return 1.0;
  }

  const SurvivalPoint* lower = nullptr;
  const SurvivalPoint* upper = nullptr;
  for (const auto& point : curve) {
    const auto point_day = static_cast<double>(point.day);
    if (point_day <= day) {
      lower = &point;
    }
    if (point_day >= day && upper == nullptr) {
      upper = &point;
    }
  }

  if (upper == nullptr) {
    return lower != nullptr ? lower->survival_probability : 0.0;
  }
  if (lower == nullptr) {
    return 1.0;
  }
  if (static_cast<double>(lower->day) == day || upper->day == lower->day) {
    return lower->survival_probability;
  }

  const double fraction = (day - static_cast<double>(lower->day)) / static_cast<double>(upper->day - lower->day);
  return lower->survival_probability + fraction * (upper->survival_probability - lower->survival_probability);
}

} // namespace deliveryiq::survival
