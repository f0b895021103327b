#include "risk_policy.hpp"

#include <algorithm>
#include <cmath>

#include "config/config.pb.h"

namespace deliveryiq::probability {

namespace {

void Override(double& target, double configured) {
  if (configured > 0) {
    target = configured;
  }
}

} // namespace

RiskPolicyParams RiskPolicyParams::FromConfig(const deliveryiq::runtime::config::RiskPolicyConfig& config) {
  RiskPolicyParams params;
  Override(params.decay_per_interval, config.decay_per_interval());
  Override(params.exception_penalty_per_interval, config.exception_penalty_per_interval());
  Override(params.exception_penalty_cap, config.exception_penalty_cap());
  Override(params.failed_attempt_factor, config.failed_attempt_factor());
  Override(params.probability_floor, config.probability_floor());
  Override(params.probability_ceiling, config.probability_ceiling());
  Override(params.default_p90_days, config.default_p90_days());
  Override(params.default_p95_days, config.default_p95_days());
  Override(params.default_decay_p95_days, config.default_decay_p95_days());
  Override(params.critical_days, config.critical_days());
  Override(params.elevated_days, config.elevated_days());
  Override(params.no_curve_probability, config.no_curve_probability());
  Override(params.no_curve_decay_rate, config.no_curve_decay_rate());
  Override(params.no_curve_expected_day, config.no_curve_expected_day());
  return params;
}

bool HasFactor(const std::vector<std::string>& factors, std::string_view factor) {
  return std::find(factors.begin(), factors.end(), factor) != factors.end();
}

OverdueDecayPolicy::OverdueDecayPolicy(RiskPolicyParams params) : params_(params) {
}

double OverdueDecayPolicy::EventualProbability(const RiskInputs& inputs) const {
  if (inputs.curve == nullptr || inputs.curve->sample_size == 0) {
    return params_.no_curve_probability;
  }

  const auto&  curve = *inputs.curve;
  const double rate  = static_cast<double>(curve.delivered_count) / static_cast<double>(curve.sample_size);
  const double p95 =
      curve.p95_days && *curve.p95_days > 0 ? static_cast<double>(*curve.p95_days) : params_.default_decay_p95_days;
  const double overdue = inputs.days_in_transit / p95;

  double probability = rate;
  if (inputs.days_in_transit > p95) {
    probability = rate * std::pow(params_.decay_per_interval, overdue - 1.0);
  }

  if (inputs.has_exception) {
    const double penalty = std::min(params_.exception_penalty_cap, params_.exception_penalty_per_interval * overdue);
    probability *= 1.0 - penalty;
  }
  if (inputs.failed_attempt) {
    probability *= params_.failed_attempt_factor;
  }

  return std::clamp(probability, params_.probability_floor, params_.probability_ceiling);
}

deliveryiq::v1::RiskLevel OverdueDecayPolicy::ClassifyRisk(const RiskInputs& inputs) const {
  const bool exception = HasFactor(inputs.risk_factors, kExceptionDetected);
  const bool failed    = HasFactor(inputs.risk_factors, kDeliveryAttemptFailed);
  const bool past_p90  = HasFactor(inputs.risk_factors, kPastP90);
  const bool past_p95  = HasFactor(inputs.risk_factors, kPastP95);
  const auto days      = inputs.days_in_transit;

  if ((past_p95 && (exception || failed)) || (days > params_.critical_days && exception)) {
    return deliveryiq::v1::RISK_LEVEL_CRITICAL;
  }
  if (past_p95 || (exception && days > params_.elevated_days)) {
    return deliveryiq::v1::RISK_LEVEL_HIGH;
  }
  if (past_p90 || failed || (days > params_.elevated_days && !inputs.risk_factors.empty())) {
    return deliveryiq::v1::RISK_LEVEL_MEDIUM;
  }
  return deliveryiq::v1::RISK_LEVEL_LOW;
}

std::unique_ptr<RiskPolicy> MakeRiskPolicy(const deliveryiq::runtime::config::RiskPolicyConfig& config) {
  return std::make_unique<OverdueDecayPolicy>(RiskPolicyParams::FromConfig(config));
}

} // namespace deliveryiq::probability
