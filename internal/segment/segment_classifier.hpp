#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deliveryiq::segment {

/*
  Pure mapping from raw shipment attributes to segment buckets.

  zone:    null / <= 0 -> zone_5, 1..10 -> zone_<n>, >= 11 -> international
  service: case-insensitive substring rules, first match wins, default ground
  season:  Nov, Dec, Jan (UTC) -> peak, else normal
*/

inline constexpr std::string_view kDefaultZoneBucket  = "zone_5";
inline constexpr std::string_view kInternationalZone  = "international";
inline constexpr std::string_view kPeakSeason         = "peak";
inline constexpr std::string_view kNormalSeason       = "normal";
inline constexpr int32_t          kMaxDomesticZone    = 10;

std::string ZoneBucket(std::optional<int32_t> zone);

// Neighbouring domestic zone buckets; empty for international or unknown buckets.
std::vector<std::string> AdjacentZoneBuckets(std::string_view bucket);

std::string ServiceBucket(const std::optional<std::string>& carrier_service);

std::string SeasonBucket(int64_t unix_ms);

// west_coast | mountain | midwest | south | northeast | remote | international, or nullopt.
std::optional<std::string> Region(const std::optional<std::string>& state, const std::optional<std::string>& country);

// True when the zone marks an international shipment (zone > 10).
bool IsInternationalZone(std::optional<int32_t> zone);

} // namespace deliveryiq::segment
