#include "internal/probability/probability_estimator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/probability/presentation.hpp"
#include "internal/probability/risk_policy.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace deliveryiq::v1;
using deliveryiq::db::memory::MemoryRepository;
using deliveryiq::probability::DeliveryEstimate;
using deliveryiq::probability::HasFactor;
using deliveryiq::probability::OverdueDecayPolicy;
using deliveryiq::probability::ProbabilityEstimator;
using deliveryiq::probability::RiskInputs;
using deliveryiq::probability::RiskPolicyParams;
using deliveryiq::testing::DaysMs;
using deliveryiq::testing::Snapshot;
using deliveryiq::testing::UtcMs;

namespace db          = deliveryiq::db;
namespace model       = deliveryiq::db::model;
namespace probability = deliveryiq::probability;

const int64_t kStart = UtcMs(2024, 5, 1);

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

model::SurvivalCurveRecord UpsGroundCurve() {
  model::SurvivalCurveRecord curve;
  curve.key              = {"UPS", std::string("UPS Ground"), "ground", "zone_4", "normal"};
  curve.curve_data       = {{0, 1.0, 200, 0, 0}, {2, 0.8, 200, 40, 40}, {3, 0.5, 160, 60, 100}, {5, 0.1, 100, 80, 180}, {6, 0.04, 20, 0, 180}};
  curve.sample_size      = 200;
  curve.delivered_count  = 180;
  curve.lost_count       = 10;
  curve.censored_count   = 10;
  curve.median_days      = 3;
  curve.p75_days         = 4;
  curve.p90_days         = 5;
  curve.p95_days         = 6;
  curve.confidence_level = CONFIDENCE_LEVEL_MEDIUM;
  return curve;
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  ProbabilityEstimator              estimator{repo, std::make_shared<OverdueDecayPolicy>()};

  explicit Fixture(bool with_curve = true) {
    if (with_curve) {
      auto tx = repo->Begin();
      db::ThrowIfError(repo->ReplaceSurvivalCurve(*tx, UpsGroundCurve()), "store curve");
      tx->Commit();
    }
  }
};

model::TrackingSnapshotRecord InTransit() {
  return Snapshot("a", "UPS", std::string("UPS Ground"), 4, kStart);
}

void TestDeliveredIsCertain() {
  Fixture f;
  auto    snapshot      = InTransit();
  snapshot.delivered_ms = kStart + DaysMs(3.25);

  const auto estimate = f.estimator.Estimate(snapshot, kStart + DaysMs(30));
  assert(estimate);
  assert(estimate->delivery_probability == 1.0);
  assert(estimate->still_in_transit_probability == 0.0);
  assert(Near(estimate->days_in_transit, 3.25));
  assert(estimate->risk_level == RISK_LEVEL_LOW);
  assert(estimate->confidence == CONFIDENCE_LEVEL_HIGH);
  assert(estimate->segment_used.season_bucket == "delivered");
  assert(estimate->fallback_level == 0);
}

void TestNotInTransitHasNoEstimate() {
  Fixture f;
  const auto snapshot = Snapshot("a", "UPS", std::nullopt, 4, std::nullopt);
  assert(!f.estimator.Estimate(snapshot, kStart).has_value());
}

void TestWithinNormalWindow() {
  Fixture    f;
  const auto estimate = f.estimator.Estimate(InTransit(), kStart + DaysMs(2.5));
  assert(estimate);

  assert(Near(estimate->still_in_transit_probability, 0.65));
  assert(Near(estimate->delivery_probability, 0.9));
  assert(estimate->risk_level == RISK_LEVEL_LOW);
  assert(estimate->risk_factors.empty());
  assert(estimate->expected_delivery_day == std::optional<double>(3.0));
  assert(estimate->confidence == CONFIDENCE_LEVEL_MEDIUM);
  assert(estimate->sample_size == 200);
  assert(estimate->fallback_level == 1);
  assert(estimate->segment_used.carrier == "UPS");
  assert(estimate->segment_used.zone_bucket == "zone_4");
  assert(estimate->percentiles.p95 == std::optional<int64_t>(6));

  const auto proto = probability::ToProto(*estimate);
  assert(proto.delivery_probability() == 0.9);
  assert(proto.still_in_transit_probability() == 0.65);
  assert(proto.days_in_transit() == 2.5);
  assert(proto.fallback_level() == 1);
  assert(proto.percentiles().p50() == 3);
  assert(proto.summary() == "90% delivery probability - monitor closely");
  assert(proto.recommended_action() == "No action needed - normal transit");
}

void TestOverdueDecays() {
  Fixture    f;
  const auto estimate = f.estimator.Estimate(InTransit(), kStart + DaysMs(12));

  // two p95 intervals in: one decay step
  assert(Near(estimate->delivery_probability, 0.9 * 0.7));
  assert(Near(estimate->still_in_transit_probability, 0.04));
  assert(HasFactor(estimate->risk_factors, probability::kPastP90));
  assert(HasFactor(estimate->risk_factors, probability::kPastP95));
  assert(estimate->risk_level == RISK_LEVEL_HIGH);
  assert(probability::RecommendedAction(*estimate) == "Monitor closely - proactively contact customer");
}

void TestExceptionAndFailedAttemptPenalties() {
  Fixture f;
  auto    snapshot                    = InTransit();
  snapshot.event_log                  = {{kStart + DaysMs(4), "Delivery exception: damaged label", "Reno, NV"}};
  snapshot.delivery_attempt_failed_ms = kStart + DaysMs(5);

  const auto estimate = f.estimator.Estimate(snapshot, kStart + DaysMs(12));
  assert(Near(estimate->delivery_probability, 0.9 * 0.7 * 0.8 * 0.85));
  assert(HasFactor(estimate->risk_factors, probability::kExceptionDetected));
  assert(HasFactor(estimate->risk_factors, probability::kDeliveryAttemptFailed));
  assert(estimate->risk_level == RISK_LEVEL_CRITICAL);

  const auto proto = probability::ToProto(*estimate);
  assert(proto.delivery_probability() == 0.428);
  assert(proto.summary() == "43% delivery probability - high risk of loss");
  assert(proto.recommended_action() == "File lost in transit claim or consider reshipment");
}

void TestProbabilityIsClamped() {
  Fixture    f;
  const auto estimate = f.estimator.Estimate(InTransit(), kStart + DaysMs(60));
  assert(Near(estimate->delivery_probability, 0.05));
}

void TestNoCurveHeuristic() {
  Fixture    f(false);
  const auto estimate = f.estimator.Estimate(InTransit(), kStart + DaysMs(2));
  assert(estimate);

  assert(estimate->delivery_probability == 0.95);
  assert(Near(estimate->still_in_transit_probability, std::exp(-1.0)));
  assert(estimate->expected_delivery_day == std::optional<double>(4.0));
  assert(estimate->confidence == CONFIDENCE_LEVEL_INSUFFICIENT);
  assert(estimate->risk_level == RISK_LEVEL_LOW);
  assert(estimate->sample_size == 0);
  assert(estimate->fallback_level == 0);
  assert(estimate->segment_used.season_bucket == "normal");
  assert(!estimate->percentiles.p50.has_value());
}

void TestBatchSkipsUnknownAndPending() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    db::ThrowIfError(f.repo->UpsertTrackingSnapshot(*tx, InTransit()), "seed");
    db::ThrowIfError(f.repo->UpsertTrackingSnapshot(*tx, Snapshot("pending", "UPS", std::nullopt, 4, std::nullopt)), "seed");
    auto delivered         = Snapshot("done", "UPS", std::nullopt, 4, kStart);
    delivered.delivered_ms = kStart + DaysMs(2);
    db::ThrowIfError(f.repo->UpsertTrackingSnapshot(*tx, delivered), "seed");
    tx->Commit();
  }

  const auto estimates = f.estimator.EstimateBatch({"a", "pending", "done", "missing"}, kStart + DaysMs(2.5));
  assert(estimates.size() == 2);
  assert(estimates.count("a") == 1);
  assert(estimates.at("done").delivery_probability == 1.0);
  assert(f.estimator.EstimateBatch({}, kStart).empty());
}

void TestRiskClassification() {
  const OverdueDecayPolicy policy;
  auto                     risk = [&](double days, std::vector<std::string> factors) {
    RiskInputs inputs;
    inputs.days_in_transit = days;
    inputs.risk_factors    = std::move(factors);
    return policy.ClassifyRisk(inputs);
  };

  const std::string exception(probability::kExceptionDetected);
  const std::string failed(probability::kDeliveryAttemptFailed);
  const std::string p90(probability::kPastP90);
  const std::string p95(probability::kPastP95);

  assert(risk(16, {exception}) == RISK_LEVEL_CRITICAL);
  assert(risk(5, {p95, failed}) == RISK_LEVEL_CRITICAL);
  assert(risk(9, {exception}) == RISK_LEVEL_HIGH);
  assert(risk(5, {p95}) == RISK_LEVEL_HIGH);
  assert(risk(5, {p90}) == RISK_LEVEL_MEDIUM);
  assert(risk(2, {failed}) == RISK_LEVEL_MEDIUM);
  assert(risk(5, {exception}) == RISK_LEVEL_LOW);
  assert(risk(20, {}) == RISK_LEVEL_LOW);
}

void TestPolicyParamsFromConfig() {
  deliveryiq::runtime::config::RiskPolicyConfig config;
  config.set_decay_per_interval(0.5);
  config.set_no_curve_probability(0.9);

  const auto params = RiskPolicyParams::FromConfig(config);
  assert(params.decay_per_interval == 0.5);
  assert(params.no_curve_probability == 0.9);
  assert(params.failed_attempt_factor == 0.85);

  const auto policy = probability::MakeRiskPolicy(config);
  assert(policy->EventualProbability(RiskInputs{}) == 0.9);
}

void TestSummaryBands() {
  DeliveryEstimate estimate;
  estimate.delivery_probability = 0.9996;
  assert(probability::ProbabilitySummary(estimate) == "Very likely to deliver");
  estimate.delivery_probability = 0.96;
  assert(probability::ProbabilitySummary(estimate) == "96% likely to deliver");
  estimate.delivery_probability = 0.75;
  assert(probability::ProbabilitySummary(estimate) == "75% delivery probability - at risk");

  estimate.risk_level = RISK_LEVEL_MEDIUM;
  assert(probability::RecommendedAction(estimate) == "Add to watchlist - check again tomorrow");
  estimate.risk_level = RISK_LEVEL_CRITICAL;
  assert(probability::RecommendedAction(estimate) == "Contact carrier for investigation");
}

void TestDeliveredIgnoresRiskSignals() {
  Fixture f;
  auto    snapshot                    = InTransit();
  snapshot.event_log                  = {{kStart + DaysMs(4), "Delivery exception: address not found", "Reno, NV"}};
  snapshot.delivery_attempt_failed_ms = kStart + DaysMs(5);
  snapshot.delivered_ms               = kStart + DaysMs(20);

  const auto estimate = f.estimator.Estimate(snapshot, kStart + DaysMs(30));
  assert(estimate);
  assert(estimate->delivery_probability == 1.0);
  assert(estimate->still_in_transit_probability == 0.0);
  assert(estimate->risk_level == RISK_LEVEL_LOW);
  assert(estimate->risk_factors.empty());
}

void TestDecayStartsPastP95() {
  Fixture f;

  const auto at_p95 = f.estimator.Estimate(InTransit(), kStart + DaysMs(6));
  assert(Near(at_p95->delivery_probability, 0.9));
  assert(!HasFactor(at_p95->risk_factors, probability::kPastP95));

  const auto past_p95 = f.estimator.Estimate(InTransit(), kStart + DaysMs(7));
  assert(past_p95->delivery_probability < at_p95->delivery_probability);
  assert(Near(past_p95->delivery_probability, 0.9 * std::pow(0.7, 7.0 / 6.0 - 1.0)));
  assert(HasFactor(past_p95->risk_factors, probability::kPastP95));
}

} // namespace

int main() {
  TestDeliveredIsCertain();
  TestNotInTransitHasNoEstimate();
  TestWithinNormalWindow();
  TestOverdueDecays();
  TestExceptionAndFailedAttemptPenalties();
  TestProbabilityIsClamped();
  TestNoCurveHeuristic();
  TestBatchSkipsUnknownAndPending();
  TestRiskClassification();
  TestPolicyParamsFromConfig();
  TestSummaryBands();
  TestDeliveredIgnoresRiskSignals();
  TestDecayStartsPastP95();

  std::cout << "deliveryiq_unit_probability_estimator: pass\n";
  return 0;
}
