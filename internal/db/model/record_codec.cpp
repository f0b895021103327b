#include "record_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "deliveryiq/v1.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::db::model {

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::StorageError("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  if (json.empty()) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw util::StorageError("corrupt " + message->GetTypeName() + " column: " + std::string(status.message()));
  }
}

} // namespace

std::string EncodeEventLog(const std::vector<TrackingEvent>& events) {
  v1::TrackingEventLog log;
  for (const auto& event : events) {
    auto* out = log.add_events();
    out->set_timestamp_ms(event.timestamp_ms);
    out->set_description(event.description);
    out->set_location(event.location);
  }
  return ToJson(log);
}

std::vector<TrackingEvent> DecodeEventLog(const std::string& json) {
  v1::TrackingEventLog log;
  FromJson(json, &log);

  std::vector<TrackingEvent> events;
  events.reserve(log.events_size());
  for (const auto& event : log.events()) {
    events.push_back(TrackingEvent{event.timestamp_ms(), event.description(), event.location()});
  }
  return events;
}

std::string EncodeCurveData(const std::vector<SurvivalPoint>& points) {
  v1::SurvivalCurveData data;
  for (const auto& point : points) {
    auto* out = data.add_points();
    out->set_day(point.day);
    out->set_survival_probability(point.survival_probability);
    out->set_at_risk_count(point.at_risk_count);
    out->set_event_count(point.event_count);
    out->set_cumulative_events(point.cumulative_events);
  }
  return ToJson(data);
}

std::vector<SurvivalPoint> DecodeCurveData(const std::string& json) {
  v1::SurvivalCurveData data;
  FromJson(json, &data);

  std::vector<SurvivalPoint> points;
  points.reserve(data.points_size());
  for (const auto& point : data.points()) {
    points.push_back(SurvivalPoint{point.day(), point.survival_probability(), point.at_risk_count(), point.event_count(), point.cumulative_events()});
  }
  return points;
}

} // namespace deliveryiq::db::model
