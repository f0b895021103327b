#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/tracking_snapshot_record.hpp"

namespace deliveryiq::runtime::config {
class OutcomeConfig;
}

namespace deliveryiq::outcome {

struct OutcomeThresholds {
  int64_t domestic_too_fresh_days      = 15;
  int64_t international_too_fresh_days = 20;
  int64_t lost_timeout_days            = 45;

  static OutcomeThresholds FromConfig(const deliveryiq::runtime::config::OutcomeConfig& config);
};

// Case-insensitive search of every event's description and location for exception
// language. These are the only free-text fields of a stored event log; its
// timestamps and JSON keys never contain a phrase.
bool HasExceptionLanguage(const std::vector<db::model::TrackingEvent>& events);

// Rounds a day-valued metric to two decimals.
double RoundDays(double days);

/*
  Labels one shipment's delivery outcome as of `now_ms`.

  Decision order: delivered, approved loss claim, too fresh (censored),
  timed out with exception language, timed out, otherwise censored.
  Returns nullopt when the snapshot has no in_transit timestamp.
*/
class OutcomeClassifier {
 public:
  explicit OutcomeClassifier(OutcomeThresholds thresholds = {});

  std::optional<db::model::OutcomeRecord> Classify(const db::model::TrackingSnapshotRecord& snapshot,
                                                   const db::model::ClaimRecord*            claim,
                                                   int64_t                                  now_ms) const;

  const OutcomeThresholds& thresholds() const {
    return thresholds_;
  }

 private:
  struct Label {
    deliveryiq::v1::Outcome outcome;
    std::string_view        source;
    std::optional<int64_t>  date_ms;
  };

  Label Decide(const db::model::TrackingSnapshotRecord& snapshot, const db::model::ClaimRecord* claim, bool has_exception, int64_t now_ms) const;

  OutcomeThresholds thresholds_;
};

} // namespace deliveryiq::outcome
