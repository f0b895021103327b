#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "deliveryiq/v1.hpp"
#include "internal/db/model/survival_curve_record.hpp"

namespace deliveryiq::runtime::config {
class RiskPolicyConfig;
}

namespace deliveryiq::probability {

inline constexpr std::string_view kExceptionDetected     = "exception_detected";
inline constexpr std::string_view kDeliveryAttemptFailed = "delivery_attempt_failed";
inline constexpr std::string_view kPastP90               = "past_p90_delivery_time";
inline constexpr std::string_view kPastP95               = "past_p95_delivery_time";

struct RiskPolicyParams {
  double decay_per_interval             = 0.7;
  double exception_penalty_per_interval = 0.1;
  double exception_penalty_cap          = 0.5;
  double failed_attempt_factor          = 0.85;
  double probability_floor              = 0.05;
  double probability_ceiling            = 0.999;

  // Risk-factor thresholds when the curve has no p90 / p95.
  double default_p90_days = 7;
  double default_p95_days = 10;
  // Overdue reference when the curve has no p95.
  double default_decay_p95_days = 7;

  double critical_days = 15;
  double elevated_days = 8;

  double no_curve_probability  = 0.95;
  double no_curve_decay_rate   = 0.5;
  double no_curve_expected_day = 4;

  static RiskPolicyParams FromConfig(const deliveryiq::runtime::config::RiskPolicyConfig& config);
};

struct RiskInputs {
  double                                days_in_transit = 0.0;
  bool                                  has_exception   = false;
  bool                                  failed_attempt  = false;
  std::vector<std::string>              risk_factors;
  const db::model::SurvivalCurveRecord* curve = nullptr; // null when no curve resolved
};

bool HasFactor(const std::vector<std::string>& factors, std::string_view factor);

/*
  Strategy turning curve statistics and live signals into an eventual
  delivery probability and a risk level.
*/
class RiskPolicy {
 public:
  virtual ~RiskPolicy() = default;

  virtual double EventualProbability(const RiskInputs& inputs) const = 0;

  virtual deliveryiq::v1::RiskLevel ClassifyRisk(const RiskInputs& inputs) const = 0;

  virtual const RiskPolicyParams& params() const = 0;
};

/*
  Historical delivery rate, decayed per p95 interval once the shipment is
  overdue, then penalised for exception language and failed attempts and
  clamped to [floor, ceiling].
*/
class OverdueDecayPolicy final : public RiskPolicy {
 public:
  explicit OverdueDecayPolicy(RiskPolicyParams params = {});

  double EventualProbability(const RiskInputs& inputs) const override;

  deliveryiq::v1::RiskLevel ClassifyRisk(const RiskInputs& inputs) const override;

  const RiskPolicyParams& params() const override {
    return params_;
  }

 private:
  RiskPolicyParams params_;
};

std::unique_ptr<RiskPolicy> MakeRiskPolicy(const deliveryiq::runtime::config::RiskPolicyConfig& config);

} // namespace deliveryiq::probability
