#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace deliveryiq::model {

// Sentinel for an aggregated carrier or service-bucket dimension.
inline constexpr std::string_view kAll = "all";

/*
  Identity of a traffic segment / survival curve.

  carrier_service is nullable: a null service means "every service of the
  carrier within service_bucket". Two keys that differ only by null vs. ""
  are different segments.
*/
struct SegmentKey {
  std::string                carrier;
  std::optional<std::string> carrier_service;
  std::string                service_bucket;
  std::string                zone_bucket;
  std::string                season_bucket;

  bool operator==(const SegmentKey&) const = default;

  // Stable, null-aware text form. Used as map key and pagination cursor.
  std::string Canonical() const {
    std::string out;
    out.reserve(carrier.size() + service_bucket.size() + zone_bucket.size() + season_bucket.size() + 16);
    out.append(carrier).push_back('\x1f');
    if (carrier_service) {
      out.push_back('=');
      out.append(*carrier_service);
    } else {
      out.push_back('~');
    }
    out.push_back('\x1f');
    out.append(service_bucket).push_back('\x1f');
    out.append(zone_bucket).push_back('\x1f');
    out.append(season_bucket);
    return out;
  }
};

} // namespace deliveryiq::model
