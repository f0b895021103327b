#include "internal/outcome/outcome_classifier.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/outcome/claims_index.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace deliveryiq::v1;
using deliveryiq::outcome::ClaimsIndex;
using deliveryiq::outcome::HasExceptionLanguage;
using deliveryiq::outcome::OutcomeClassifier;
using deliveryiq::outcome::OutcomeThresholds;
using deliveryiq::testing::Claim;
using deliveryiq::testing::DaysMs;
using deliveryiq::testing::Snapshot;
using deliveryiq::testing::UtcMs;

const int64_t kStart = UtcMs(2024, 3, 1);

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestNoTransitStartIsNotEligible() {
  OutcomeClassifier classifier;
  auto              snapshot = Snapshot("a", "UPS", std::string("Ground"), 4, std::nullopt);
  snapshot.delivered_ms      = kStart;

  assert(!classifier.Classify(snapshot, nullptr, kStart + DaysMs(10)).has_value());
}

void TestDeliveredRecordsMetrics() {
  OutcomeClassifier classifier;
  auto              snapshot   = Snapshot("a", "UPS", std::string("UPS Ground"), 4, kStart);
  snapshot.out_for_delivery_ms = kStart + DaysMs(3);
  snapshot.delivered_ms        = kStart + DaysMs(3.5);
  snapshot.destination_state   = "ca";
  snapshot.event_log           = {{kStart, "Origin scan", "Louisville, KY"}, {kStart + DaysMs(3.5), "Delivered", "Fresno, CA"}};

  const int64_t now    = kStart + DaysMs(40);
  auto          record = classifier.Classify(snapshot, nullptr, now);
  assert(record.has_value());

  assert(record->outcome == OUTCOME_DELIVERED);
  assert(record->outcome_source == "event_delivered");
  assert(record->outcome_date_ms == snapshot.delivered_ms);
  assert(!record->is_censored);
  assert(Near(record->observed_days, 3.5));
  assert(Near(record->total_transit_days, 3.5));
  assert(record->days_to_out_for_delivery && Near(*record->days_to_out_for_delivery, 3.0));
  assert(record->days_last_mile && Near(*record->days_last_mile, 0.5));

  assert(record->service_bucket == "ground");
  assert(record->zone_bucket == "zone_4");
  assert(record->season_bucket == "normal");
  assert(record->destination_region == std::optional<std::string>("west_coast"));
  assert(record->transit_start_month == 3);
  assert(record->transit_start_week == 9);
  assert(record->event_count == 2);
  assert(record->evaluated_at_ms == now);
}

void TestDeliveredWinsOverLossClaim() {
  OutcomeClassifier classifier;
  auto              snapshot = Snapshot("a", "UPS", std::nullopt, 4, kStart);
  snapshot.delivered_ms      = kStart + DaysMs(2);
  const auto claim           = Claim("c1", "a", "Credit Approved", "Loss", kStart);

  auto record = classifier.Classify(snapshot, &claim, kStart + DaysMs(60));
  assert(record->outcome == OUTCOME_DELIVERED);
}

void TestApprovedLossClaim() {
  OutcomeClassifier classifier;
  const auto        snapshot = Snapshot("a", "USPS", std::nullopt, 4, kStart);

  // a claim beats the too-fresh rule
  const auto approved = Claim("c1", "a", "Credit Approved", "Loss", kStart);
  auto       record   = classifier.Classify(snapshot, &approved, kStart + DaysMs(2));
  assert(record->outcome == OUTCOME_LOST_CLAIM);
  assert(record->outcome_source == "claim");
  assert(Near(record->observed_days, 2.0));

  const auto resolved = Claim("c2", "a", "Resolved", "Loss", kStart);
  assert(classifier.Classify(snapshot, &resolved, kStart + DaysMs(2))->outcome == OUTCOME_LOST_CLAIM);

  const auto pending = Claim("c3", "a", "Pending", "Loss", kStart);
  assert(classifier.Classify(snapshot, &pending, kStart + DaysMs(2))->outcome == OUTCOME_CENSORED);

  const auto damage = Claim("c4", "a", "Credit Approved", "Damage", kStart);
  assert(classifier.Classify(snapshot, &damage, kStart + DaysMs(2))->outcome == OUTCOME_CENSORED);
}

void TestTooFreshIsCensored() {
  OutcomeClassifier classifier;
  auto              snapshot   = Snapshot("a", "UPS", std::nullopt, 4, kStart);
  snapshot.out_for_delivery_ms = kStart + DaysMs(40);

  // 50 days in transit, but the last scan is only 10 days old
  auto record = classifier.Classify(snapshot, nullptr, kStart + DaysMs(50));
  assert(record->outcome == OUTCOME_CENSORED);
  assert(record->is_censored);
  assert(record->outcome_source.empty());
  assert(!record->outcome_date_ms.has_value());
  assert(Near(record->observed_days, 50.0));
}

void TestInternationalUsesLongerFreshWindow() {
  OutcomeClassifier classifier;
  const int64_t     now = kStart + DaysMs(50);

  auto domestic                = Snapshot("d", "UPS", std::nullopt, 8, kStart);
  domestic.out_for_delivery_ms = now - DaysMs(17);
  assert(classifier.Classify(domestic, nullptr, now)->outcome == OUTCOME_LOST_TIMEOUT);

  auto international                = Snapshot("i", "UPS", std::nullopt, 12, kStart);
  international.out_for_delivery_ms = now - DaysMs(17);
  auto record                       = classifier.Classify(international, nullptr, now);
  assert(record->outcome == OUTCOME_CENSORED);
  assert(record->zone_bucket == "international");
}

void TestTimeoutAndExceptionLabels() {
  OutcomeClassifier classifier;
  const int64_t     now = kStart + DaysMs(50);

  const auto quiet = Snapshot("q", "FedEx", std::nullopt, 3, kStart);
  auto       timed = classifier.Classify(quiet, nullptr, now);
  assert(timed->outcome == OUTCOME_LOST_TIMEOUT);
  assert(timed->outcome_source == "timeout");
  assert(!timed->has_exception);

  auto noisy      = Snapshot("n", "FedEx", std::nullopt, 3, kStart);
  noisy.event_log = {{kStart + DaysMs(1), "Shipment EXCEPTION: weather delay", "Memphis, TN"}};
  auto lost       = classifier.Classify(noisy, nullptr, now);
  assert(lost->outcome == OUTCOME_LOST_EXCEPTION);
  assert(lost->outcome_source == "event_logs");
  assert(lost->has_exception);

  // 30 days with no activity is neither fresh nor timed out
  assert(classifier.Classify(quiet, nullptr, kStart + DaysMs(30))->outcome == OUTCOME_CENSORED);
}

void TestFailedAttemptCountsAsActivity() {
  OutcomeClassifier classifier;
  auto              snapshot          = Snapshot("a", "UPS", std::nullopt, 4, kStart);
  snapshot.delivery_attempt_failed_ms = kStart + DaysMs(45);

  auto record = classifier.Classify(snapshot, nullptr, kStart + DaysMs(50));
  assert(record->outcome == OUTCOME_CENSORED);
  assert(record->has_delivery_attempt_failed);
}

void TestCustomThresholds() {
  OutcomeThresholds thresholds;
  thresholds.lost_timeout_days = 30;
  OutcomeClassifier classifier(thresholds);

  const auto snapshot = Snapshot("a", "UPS", std::nullopt, 4, kStart);
  assert(classifier.Classify(snapshot, nullptr, kStart + DaysMs(35))->outcome == OUTCOME_LOST_TIMEOUT);
}

void TestExceptionLanguageScan() {
  using deliveryiq::db::model::TrackingEvent;
  assert(!HasExceptionLanguage({}));
  assert(!HasExceptionLanguage({TrackingEvent{0, "In transit", "Chicago, IL"}}));
  assert(HasExceptionLanguage({TrackingEvent{0, "Carrier was Unable To Locate the address", ""}}));
  assert(HasExceptionLanguage({TrackingEvent{0, "Delivery attempt failed", ""}}));
  assert(HasExceptionLanguage({TrackingEvent{0, "Held", "ADDRESS ISSUE - hub"}}));

  // an early exception still counts after later scans look normal
  assert(HasExceptionLanguage({TrackingEvent{1, "Shipment exception", "Memphis, TN"},
                               TrackingEvent{2, "In transit", "Dallas, TX"},
                               TrackingEvent{3, "Out for delivery", "Austin, TX"}}));
}

void TestClaimsIndexPrefersLatestLossClaim() {
  ClaimsIndex index;
  index.Add(Claim("c1", "a", "Pending", "Damage", 100));
  assert(index.Find("a")->claim_id == "c1");

  index.Add(Claim("c2", "a", "Pending", "Loss", 50));
  assert(index.Find("a")->claim_id == "c2");

  // a non-loss claim never displaces a loss claim
  index.Add(Claim("c3", "a", "Resolved", "Damage", 500));
  assert(index.Find("a")->claim_id == "c2");

  index.Add(Claim("c4", "a", "Credit Approved", "Loss", 200));
  assert(index.Find("a")->claim_id == "c4");

  index.Add(Claim("c5", "a", "Denied", "Loss", 150));
  assert(index.Find("a")->claim_id == "c4");

  assert(index.Find("missing") == nullptr);
  assert(index.Size() == 1);
}

} // namespace

int main() {
  TestNoTransitStartIsNotEligible();
  TestDeliveredRecordsMetrics();
  TestDeliveredWinsOverLossClaim();
  TestApprovedLossClaim();
  TestTooFreshIsCensored();
  TestInternationalUsesLongerFreshWindow();
  TestTimeoutAndExceptionLabels();
  TestFailedAttemptCountsAsActivity();
  TestCustomThresholds();
  TestExceptionLanguageScan();
  TestClaimsIndexPrefersLatestLossClaim();

  std::cout << "deliveryiq_unit_outcome_classifier: pass\n";
  return 0;
}
