#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "deliveryiq/v1.hpp"

namespace deliveryiq::model {

using v1::ConfidenceLevel;
using v1::Outcome;
using v1::RiskLevel;

// Sample-size thresholds for confidence grading.
inline constexpr uint64_t kHighConfidenceSamples   = 500;
inline constexpr uint64_t kMediumConfidenceSamples = 100;
inline constexpr uint64_t kLowConfidenceSamples    = 50;

constexpr std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case v1::OUTCOME_DELIVERED:
      return "delivered";
    case v1::OUTCOME_LOST_CLAIM:
      return "lost_claim";
    case v1::OUTCOME_LOST_EXCEPTION:
      return "lost_exception";
    case v1::OUTCOME_LOST_TIMEOUT:
      return "lost_timeout";
    case v1::OUTCOME_CENSORED:
      return "censored";
    default:
      return "unspecified";
  }
}

constexpr std::optional<Outcome> ParseOutcome(std::string_view value) {
  if (value == "delivered") return v1::OUTCOME_DELIVERED;
  if (value == "lost_claim") return v1::OUTCOME_LOST_CLAIM;
  if (value == "lost_exception") return v1::OUTCOME_LOST_EXCEPTION;
  if (value == "lost_timeout") return v1::OUTCOME_LOST_TIMEOUT;
  if (value == "censored") return v1::OUTCOME_CENSORED;
  return std::nullopt;
}

constexpr bool IsLost(Outcome outcome) {
  return outcome == v1::OUTCOME_LOST_CLAIM || outcome == v1::OUTCOME_LOST_EXCEPTION || outcome == v1::OUTCOME_LOST_TIMEOUT;
}

constexpr std::string_view ToString(ConfidenceLevel level) {
  switch (level) {
    case v1::CONFIDENCE_LEVEL_HIGH:
      return "high";
    case v1::CONFIDENCE_LEVEL_MEDIUM:
      return "medium";
    case v1::CONFIDENCE_LEVEL_LOW:
      return "low";
    case v1::CONFIDENCE_LEVEL_INSUFFICIENT:
      return "insufficient";
    default:
      return "unspecified";
  }
}

constexpr std::optional<ConfidenceLevel> ParseConfidence(std::string_view value) {
  if (value == "high") return v1::CONFIDENCE_LEVEL_HIGH;
  if (value == "medium") return v1::CONFIDENCE_LEVEL_MEDIUM;
  if (value == "low") return v1::CONFIDENCE_LEVEL_LOW;
  if (value == "insufficient") return v1::CONFIDENCE_LEVEL_INSUFFICIENT;
  return std::nullopt;
}

constexpr ConfidenceLevel ConfidenceForSampleSize(uint64_t sample_size) {
  if (sample_size >= kHighConfidenceSamples) return v1::CONFIDENCE_LEVEL_HIGH;
  if (sample_size >= kMediumConfidenceSamples) return v1::CONFIDENCE_LEVEL_MEDIUM;
  if (sample_size >= kLowConfidenceSamples) return v1::CONFIDENCE_LEVEL_LOW;
  return v1::CONFIDENCE_LEVEL_INSUFFICIENT;
}

constexpr std::string_view ToString(RiskLevel level) {
  switch (level) {
    case v1::RISK_LEVEL_LOW:
      return "low";
    case v1::RISK_LEVEL_MEDIUM:
      return "medium";
    case v1::RISK_LEVEL_HIGH:
      return "high";
    case v1::RISK_LEVEL_CRITICAL:
      return "critical";
    default:
      return "unspecified";
  }
}

} // namespace deliveryiq::model
