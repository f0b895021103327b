#include "segment_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

#include "internal/util/time.hpp"

namespace deliveryiq::segment {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Upper(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

struct ServiceRule {
  std::string_view                bucket;
  std::array<std::string_view, 5> needles;
};

// Order matters: "priority overnight" must resolve before any broader rule.
constexpr std::array<ServiceRule, 4> kServiceRules = {{
    {"express", {"overnight", "priority overnight", "next day", {}, {}}},
    {"2day", {"2day", "2 day", {}, {}, {}}},
    {"premium", {"premium", {}, {}, {}, {}}},
    {"ground", {"ground", "parcel", "standard", "economy", "advantage"}},
}};

struct RegionRule {
  std::string_view              region;
  std::vector<std::string_view> states;
};

const std::vector<RegionRule>& RegionRules() {
  static const std::vector<RegionRule> rules = {
      {"west_coast", {"CA", "OR", "WA", "NV", "AZ"}},
      {"mountain", {"CO", "UT", "NM", "MT", "ID", "WY"}},
      {"midwest", {"IL", "OH", "MI", "IN", "WI", "MN", "IA", "MO", "ND", "SD", "NE", "KS"}},
      {"south", {"TX", "FL", "GA", "NC", "VA", "TN", "AL", "SC", "LA", "KY", "OK", "AR", "MS", "WV"}},
      {"northeast", {"NY", "PA", "NJ", "MA", "CT", "MD", "DC", "DE", "NH", "VT", "ME", "RI"}},
      {"remote", {"AK", "HI"}},
  };
  return rules;
}

} // namespace

std::string ZoneBucket(std::optional<int32_t> zone) {
  if (!zone || *zone <= 0) {
    return std::string(kDefaultZoneBucket);
  }
  if (*zone <= kMaxDomesticZone) {
    return "zone_" + std::to_string(*zone);
  }
  return std::string(kInternationalZone);
}

std::vector<std::string> AdjacentZoneBuckets(std::string_view bucket) {
  constexpr std::string_view prefix = "zone_";
  if (bucket.substr(0, prefix.size()) != prefix || bucket.size() == prefix.size()) {
    return {};
  }

  const auto digits = bucket.substr(prefix.size());
  int        zone   = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), zone);
  if (ec != std::errc{} || ptr != digits.data() + digits.size() || zone < 1 || zone > kMaxDomesticZone) {
    return {};
  }

  std::vector<std::string> adjacent;
  if (zone > 1) {
    adjacent.push_back("zone_" + std::to_string(zone - 1));
  }
  if (zone < kMaxDomesticZone) {
    adjacent.push_back("zone_" + std::to_string(zone + 1));
  }
  return adjacent;
}

std::string ServiceBucket(const std::optional<std::string>& carrier_service) {
  if (!carrier_service) {
    return "ground";
  }

  const auto service = Lower(*carrier_service);
  for (const auto& rule : kServiceRules) {
    for (const auto needle : rule.needles) {
      if (!needle.empty() && service.find(needle) != std::string::npos) {
        return std::string(rule.bucket);
      }
    }
  }
  return "ground";
}

std::string SeasonBucket(int64_t unix_ms) {
  const auto month = util::UtcMonth(unix_ms);
  return (month >= 11 || month == 1) ? std::string(kPeakSeason) : std::string(kNormalSeason);
}

std::optional<std::string> Region(const std::optional<std::string>& state, const std::optional<std::string>& country) {
  if (country && !country->empty() && Upper(*country) != "US") {
    return std::string(kInternationalZone);
  }
  if (!state || state->empty()) {
    return std::nullopt;
  }

  const auto code = Upper(*state);
  for (const auto& rule : RegionRules()) {
    if (std::find(rule.states.begin(), rule.states.end(), code) != rule.states.end()) {
      return std::string(rule.region);
    }
  }
  return std::nullopt;
}

bool IsInternationalZone(std::optional<int32_t> zone) {
  return zone && *zone > kMaxDomesticZone;
}

} // namespace deliveryiq::segment
