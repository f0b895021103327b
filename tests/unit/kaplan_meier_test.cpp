#include "internal/survival/kaplan_meier.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

using namespace deliveryiq::v1;
using deliveryiq::survival::ComputeKaplanMeier;
using deliveryiq::survival::DeliveryProbabilityAtDay;
using deliveryiq::survival::InterpolateSurvival;
using deliveryiq::survival::LostHandling;
using deliveryiq::survival::Observation;
using deliveryiq::survival::ParseLostHandling;
using deliveryiq::survival::PercentileDay;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

std::vector<Observation> Sample() {
  return {
      {1.2, OUTCOME_DELIVERED},
      {1.5, OUTCOME_LOST_TIMEOUT},
      {2.0, OUTCOME_DELIVERED},
      {2.5, OUTCOME_DELIVERED},
      {2.7, OUTCOME_CENSORED},
      {3.1, OUTCOME_DELIVERED},
  };
}

void TestEmptyInputYieldsEmptyCurve() {
  assert(ComputeKaplanMeier({}, LostHandling::kCensor).empty());
  assert(InterpolateSurvival({}, 3.0) == 1.0);
  assert(!PercentileDay({}, 0.5).has_value());
}

void TestLostOutcomesCensoredAtObservedDay() {
  const auto curve = ComputeKaplanMeier(Sample(), LostHandling::kCensor);
  assert(curve.size() == 4);

  assert(curve[0].day == 0 && curve[0].survival_probability == 1.0 && curve[0].at_risk_count == 6);
  assert(curve[0].event_count == 0 && curve[0].cumulative_events == 0);

  assert(curve[1].day == 1 && Near(curve[1].survival_probability, 5.0 / 6.0));
  assert(curve[1].at_risk_count == 6 && curve[1].event_count == 1 && curve[1].cumulative_events == 1);

  // the lost shipment left the pool after day 1
  assert(curve[2].day == 2 && Near(curve[2].survival_probability, 5.0 / 6.0 * 0.5));
  assert(curve[2].at_risk_count == 4 && curve[2].event_count == 2 && curve[2].cumulative_events == 3);

  assert(curve[3].day == 3 && Near(curve[3].survival_probability, 0.0));
  assert(curve[3].at_risk_count == 1 && curve[3].cumulative_events == 4);

  assert(PercentileDay(curve, 0.50) == std::optional<int64_t>(2));
  assert(PercentileDay(curve, 0.95) == std::optional<int64_t>(3));
}

void TestRetainedLostOutcomesStayAtRisk() {
  const auto curve = ComputeKaplanMeier(Sample(), LostHandling::kRetain);
  assert(curve.size() == 4);

  assert(Near(curve[1].survival_probability, 5.0 / 6.0));
  assert(curve[2].at_risk_count == 5);
  assert(Near(curve[2].survival_probability, 0.5));
  assert(curve[3].at_risk_count == 2);
  assert(Near(curve[3].survival_probability, 0.25));

  assert(PercentileDay(curve, 0.50) == std::optional<int64_t>(2));
  assert(!PercentileDay(curve, 0.90).has_value());
}

void TestCensoredOnlyDayKeepsSurvival() {
  const std::vector<Observation> observations = {
      {0.4, OUTCOME_DELIVERED},
      {4.9, OUTCOME_CENSORED},
      {6.0, OUTCOME_DELIVERED},
  };
  const auto curve = ComputeKaplanMeier(observations, LostHandling::kCensor);
  assert(curve.size() == 4);

  // same-day delivery shares day 0 with the initial point
  assert(curve[1].day == 0 && Near(curve[1].survival_probability, 2.0 / 3.0));
  assert(curve[2].day == 4 && curve[2].event_count == 0 && Near(curve[2].survival_probability, 2.0 / 3.0));
  assert(curve[3].day == 6 && curve[3].at_risk_count == 1 && Near(curve[3].survival_probability, 0.0));
}

void TestInterpolation() {
  const auto curve = ComputeKaplanMeier(Sample(), LostHandling::kCensor);

  assert(InterpolateSurvival(curve, -1.0) == 1.0);
  assert(InterpolateSurvival(curve, 0.0) == 1.0);
  assert(Near(InterpolateSurvival(curve, 0.5), 1.0 - 0.5 / 6.0));
  assert(Near(InterpolateSurvival(curve, 1.0), 5.0 / 6.0));
  assert(Near(InterpolateSurvival(curve, 1.5), (5.0 / 6.0 + 5.0 / 12.0) / 2.0));
  assert(Near(InterpolateSurvival(curve, 10.0), 0.0));

  assert(Near(DeliveryProbabilityAtDay(curve, 1.0), 1.0 / 6.0));
}

void TestParseLostHandling() {
  assert(ParseLostHandling("censor") == std::optional<LostHandling>(LostHandling::kCensor));
  assert(ParseLostHandling("retain") == std::optional<LostHandling>(LostHandling::kRetain));
  assert(!ParseLostHandling("drop").has_value());
}

} // namespace

int main() {
  TestEmptyInputYieldsEmptyCurve();
  TestLostOutcomesCensoredAtObservedDay();
  TestRetainedLostOutcomesStayAtRisk();
  TestCensoredOnlyDayKeepsSurvival();
  TestInterpolation();
  TestParseLostHandling();

  std::cout << "deliveryiq_unit_kaplan_meier: pass\n";
  return 0;
}
