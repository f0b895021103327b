#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/tracking_snapshot_record.hpp"
#include "internal/util/time.hpp"

namespace deliveryiq::testing {

// Midnight UTC of the given civil date, in unix ms.
inline int64_t UtcMs(int year, unsigned month, unsigned day) {
  const auto date = std::chrono::sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
  return std::chrono::duration_cast<std::chrono::milliseconds>(date.time_since_epoch()).count();
}

inline int64_t DaysMs(double days) {
  return static_cast<int64_t>(days * static_cast<double>(util::kMillisPerDay));
}

inline db::model::TrackingSnapshotRecord Snapshot(const std::string&         id,
                                                  const std::string&         carrier,
                                                  std::optional<std::string> service,
                                                  std::optional<int32_t>     zone,
                                                  std::optional<int64_t>     in_transit_ms) {
  db::model::TrackingSnapshotRecord snapshot;
  snapshot.shipment_id     = id;
  snapshot.tracking_number = "1Z" + id;
  snapshot.carrier         = carrier;
  snapshot.carrier_service = std::move(service);
  snapshot.zone_used       = zone;
  snapshot.in_transit_ms   = in_transit_ms;
  return snapshot;
}

inline db::model::ClaimRecord Claim(const std::string& claim_id, const std::string& shipment_id, const std::string& status, const std::string& issue_type, int64_t updated_at_ms) {
  return {claim_id, shipment_id, status, issue_type, updated_at_ms};
}

// Minimal outcome record for curve and stats tests.
inline db::model::OutcomeRecord OutcomeRow(const std::string&         id,
                                        const std::string&         carrier,
                                        std::optional<std::string> service,
                                        const std::string&         service_bucket,
                                        const std::string&         zone_bucket,
                                        const std::string&         season_bucket,
                                        deliveryiq::v1::Outcome    outcome,
                                        double                     observed_days) {
  db::model::OutcomeRecord record;
  record.shipment_id     = id;
  record.carrier         = carrier;
  record.carrier_service = std::move(service);
  record.service_bucket  = service_bucket;
  record.zone_bucket     = zone_bucket;
  record.season_bucket   = season_bucket;
  record.outcome         = outcome;
  record.observed_days   = observed_days;
  record.is_censored     = outcome == deliveryiq::v1::OUTCOME_CENSORED;
  return record;
}

// Zero-padded so lexical order equals numeric order.
inline std::string ShipmentId(int n) {
  std::string digits = std::to_string(n);
  return "shp-" + std::string(digits.size() < 6 ? 6 - digits.size() : 0, '0') + digits;
}

} // namespace deliveryiq::testing
