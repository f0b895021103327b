#pragma once

#include <string>
#include <vector>

#include "survival_curve_record.hpp"
#include "tracking_snapshot_record.hpp"

namespace deliveryiq::db::model {

/*
  JSON text forms of the list-valued columns.

  Encoding goes through the protobuf messages TrackingEventLog and
  SurvivalCurveData so every backend stores the same text. Decoding
  failures throw util::StorageError.
*/

std::string                EncodeEventLog(const std::vector<TrackingEvent>& events);
std::vector<TrackingEvent> DecodeEventLog(const std::string& json);

std::string                EncodeCurveData(const std::vector<SurvivalPoint>& points);
std::vector<SurvivalPoint> DecodeCurveData(const std::string& json);

} // namespace deliveryiq::db::model
