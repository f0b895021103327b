#include "outcome_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

#include "config/config.pb.h"
#include "internal/segment/segment_classifier.hpp"
#include "internal/util/time.hpp"

namespace deliveryiq::outcome {

namespace {

constexpr std::array<std::string_view, 4> kExceptionPhrases = {
    "exception",
    "unable to locate",
    "delivery attempt failed",
    "address issue",
};

constexpr std::array<std::string_view, 2> kApprovedClaimStatuses = {"Credit Approved", "Resolved"};

bool ContainsExceptionPhrase(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::any_of(kExceptionPhrases.begin(), kExceptionPhrases.end(), [&](std::string_view phrase) { return lower.find(phrase) != std::string::npos; });
}

bool IsApprovedLossClaim(const db::model::ClaimRecord* claim) {
  if (claim == nullptr || claim->issue_type != "Loss") {
    return false;
  }
  return std::find(kApprovedClaimStatuses.begin(), kApprovedClaimStatuses.end(), claim->status) != kApprovedClaimStatuses.end();
}

} // namespace

OutcomeThresholds OutcomeThresholds::FromConfig(const deliveryiq::runtime::config::OutcomeConfig& config) {
  OutcomeThresholds thresholds;
  if (config.domestic_too_fresh_days() > 0) {
    thresholds.domestic_too_fresh_days = config.domestic_too_fresh_days();
  }
  if (config.international_too_fresh_days() > 0) {
    thresholds.international_too_fresh_days = config.international_too_fresh_days();
  }
  if (config.lost_timeout_days() > 0) {
    thresholds.lost_timeout_days = config.lost_timeout_days();
  }
  return thresholds;
}

bool HasExceptionLanguage(const std::vector<db::model::TrackingEvent>& events) {
  return std::any_of(events.begin(), events.end(), [](const db::model::TrackingEvent& event) {
    return ContainsExceptionPhrase(event.description) || ContainsExceptionPhrase(event.location);
  });
}

double RoundDays(double days) {
  return std::round(days * 100.0) / 100.0;
}

OutcomeClassifier::OutcomeClassifier(OutcomeThresholds thresholds) : thresholds_(thresholds) {
}

OutcomeClassifier::Label OutcomeClassifier::Decide(const db::model::TrackingSnapshotRecord& snapshot,
                                                   const db::model::ClaimRecord*            claim,
                                                   bool                                     has_exception,
                                                   int64_t                                  now_ms) const {
  if (snapshot.delivered_ms) {
    return {deliveryiq::v1::OUTCOME_DELIVERED, "event_delivered", snapshot.delivered_ms};
  }

  if (IsApprovedLossClaim(claim)) {
    return {deliveryiq::v1::OUTCOME_LOST_CLAIM, "claim", std::nullopt};
  }

  const int64_t in_transit_ms = *snapshot.in_transit_ms;
  int64_t       last_activity = in_transit_ms;
  for (const auto& ts : {snapshot.out_for_delivery_ms, snapshot.delivery_attempt_failed_ms}) {
    if (ts) {
      last_activity = std::max(last_activity, *ts);
    }
  }

  const int64_t days_since_activity = util::WholeDaysBetween(last_activity, now_ms);
  const int64_t total_days          = util::WholeDaysBetween(in_transit_ms, now_ms);
  const int64_t too_fresh_days =
      segment::IsInternationalZone(snapshot.zone_used) ? thresholds_.international_too_fresh_days : thresholds_.domestic_too_fresh_days;

  if (days_since_activity < too_fresh_days) {
    return {deliveryiq::v1::OUTCOME_CENSORED, "", std::nullopt};
  }

  if (total_days > thresholds_.lost_timeout_days) {
    if (has_exception) {
      return {deliveryiq::v1::OUTCOME_LOST_EXCEPTION, "event_logs", std::nullopt};
    }
    return {deliveryiq::v1::OUTCOME_LOST_TIMEOUT, "timeout", std::nullopt};
  }

  return {deliveryiq::v1::OUTCOME_CENSORED, "", std::nullopt};
}

std::optional<db::model::OutcomeRecord> OutcomeClassifier::Classify(const db::model::TrackingSnapshotRecord& snapshot,
                                                                    const db::model::ClaimRecord*            claim,
                                                                    int64_t                                  now_ms) const {
  if (!snapshot.in_transit_ms) {
    return std::nullopt;
  }

  const int64_t start         = *snapshot.in_transit_ms;
  const bool    has_exception = HasExceptionLanguage(snapshot.event_log);
  const auto    label         = Decide(snapshot, claim, has_exception, now_ms);

  db::model::OutcomeRecord record;
  record.shipment_id     = snapshot.shipment_id;
  record.tracking_number = snapshot.tracking_number;

  record.carrier         = snapshot.carrier;
  record.carrier_service = snapshot.carrier_service;
  record.service_bucket  = segment::ServiceBucket(snapshot.carrier_service);
  record.zone_used       = snapshot.zone_used;
  record.zone_bucket     = segment::ZoneBucket(snapshot.zone_used);
  record.season_bucket   = segment::SeasonBucket(start);

  record.destination_state   = snapshot.destination_state;
  record.destination_country = snapshot.destination_country;
  record.destination_region  = segment::Region(snapshot.destination_state, snapshot.destination_country);

  record.transit_start_ms    = start;
  record.transit_start_month = util::UtcMonth(start);
  record.transit_start_week  = util::IsoWeek(start);

  record.outcome         = label.outcome;
  record.outcome_source  = std::string(label.source);
  record.outcome_date_ms = label.date_ms;

  const int64_t end_ms      = snapshot.delivered_ms.value_or(now_ms);
  record.total_transit_days = RoundDays(util::DaysBetween(start, end_ms));
  if (snapshot.out_for_delivery_ms) {
    record.days_to_out_for_delivery = RoundDays(util::DaysBetween(start, *snapshot.out_for_delivery_ms));
    if (snapshot.delivered_ms) {
      record.days_last_mile = RoundDays(util::DaysBetween(*snapshot.out_for_delivery_ms, *snapshot.delivered_ms));
    }
  }

  const int64_t observed_end = label.outcome == deliveryiq::v1::OUTCOME_DELIVERED ? *snapshot.delivered_ms : now_ms;
  record.observed_days       = std::max(0.0, RoundDays(util::DaysBetween(start, observed_end)));

  record.is_censored                 = label.outcome == deliveryiq::v1::OUTCOME_CENSORED;
  record.has_exception               = has_exception;
  record.has_delivery_attempt_failed = snapshot.delivery_attempt_failed_ms.has_value();
  record.event_count                 = static_cast<uint32_t>(snapshot.event_log.size());
  record.evaluated_at_ms             = now_ms;
  return record;
}

} // namespace deliveryiq::outcome
