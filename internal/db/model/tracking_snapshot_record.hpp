#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace deliveryiq::db::model {

struct TrackingEvent {
  int64_t     timestamp_ms = 0;
  std::string description;
  std::string location;
};

/*
  Latest normalized tracking state of one shipment.

  Written by the upstream tracking importer, read-only to the engine.
  Event timestamps are unix epoch milliseconds; a missing timestamp means
  the milestone has not happened yet.
*/
struct TrackingSnapshotRecord {
  std::string                shipment_id;
  std::optional<std::string> tracking_number;
  std::string                carrier;
  std::optional<std::string> carrier_service;
  std::optional<int32_t>     zone_used;
  std::optional<std::string> destination_state;
  std::optional<std::string> destination_country;

  std::optional<int64_t> in_transit_ms;
  std::optional<int64_t> out_for_delivery_ms;
  std::optional<int64_t> delivered_ms;
  std::optional<int64_t> delivery_attempt_failed_ms;

  // Stored as JSON text (see record_codec.hpp)
  std::vector<TrackingEvent> event_log;
};

} // namespace deliveryiq::db::model
