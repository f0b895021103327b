#pragma once

#include <string>

#include "deliveryiq/v1.hpp"
#include "internal/probability/probability_estimator.hpp"

namespace deliveryiq::probability {

// "Very likely to deliver", "87% delivery probability - monitor closely", ...
std::string ProbabilitySummary(const DeliveryEstimate& estimate);

std::string RecommendedAction(const DeliveryEstimate& estimate);

// Probabilities rounded to three decimals, days to two. Summary and action filled in.
deliveryiq::v1::DeliveryProbability ToProto(const DeliveryEstimate& estimate);

} // namespace deliveryiq::probability
