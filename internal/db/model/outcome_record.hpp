#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "deliveryiq/v1.hpp"

namespace deliveryiq::db::model {

/*
  Labeled delivery outcome of one shipment, keyed by shipment_id.

  Invariants:
  - is_censored <=> outcome == OUTCOME_CENSORED
  - observed_days >= 0
  - day-valued metrics are rounded to two decimals before they are written
*/
struct OutcomeRecord {
  std::string                shipment_id;
  std::optional<std::string> tracking_number;

  std::string                carrier;
  std::optional<std::string> carrier_service;
  std::string                service_bucket;
  std::optional<int32_t>     zone_used;
  std::string                zone_bucket;
  std::string                season_bucket;

  std::optional<std::string> destination_state;
  std::optional<std::string> destination_country;
  std::optional<std::string> destination_region;

  int64_t  transit_start_ms    = 0;
  uint32_t transit_start_month = 0;
  uint32_t transit_start_week  = 0;

  deliveryiq::v1::Outcome outcome = deliveryiq::v1::OUTCOME_UNSPECIFIED;
  std::string             outcome_source; // event_delivered | claim | event_logs | timeout | ""
  std::optional<int64_t>  outcome_date_ms;

  double                total_transit_days = 0.0;
  std::optional<double> days_to_out_for_delivery;
  std::optional<double> days_last_mile;
  double                observed_days = 0.0;

  bool     is_censored                 = false;
  bool     has_exception               = false;
  bool     has_delivery_attempt_failed = false;
  uint32_t event_count                 = 0;

  int64_t evaluated_at_ms = 0;
};

} // namespace deliveryiq::db::model
