#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "deliveryiq/v1.hpp"

namespace deliveryiq::db {

// Hard per-query row cap shared by every backend.
inline constexpr std::size_t kMaxPageRows = 1000;

constexpr std::size_t ClampPageSize(std::size_t requested) {
  return requested == 0 ? kMaxPageRows : std::min(requested, kMaxPageRows);
}

/*
  Ascending-key cursor page.

  Rows with key > after are returned in ascending key order, at most
  ClampPageSize(limit) of them. An empty after starts from the beginning.
  A page shorter than the limit is the last one.
*/
struct PageRequest {
  std::string after;
  std::size_t limit = kMaxPageRows;
};

// Unset members do not constrain the query.
struct OutcomeFilter {
  std::optional<std::string> carrier;
  std::optional<std::string> carrier_service;
  std::optional<std::string> service_bucket;
  std::optional<std::string> zone_bucket;
  std::optional<std::string> season_bucket;

  // empty = any outcome
  std::vector<deliveryiq::v1::Outcome> outcomes;
};

/*
  Exact match on carrier, carrier_service (nullopt matches IS NULL),
  service_bucket and zone_bucket. season_bucket is optional.
*/
struct CurveFilter {
  std::string                carrier;
  std::optional<std::string> carrier_service;
  std::string                service_bucket;
  std::string                zone_bucket;
  std::optional<std::string> season_bucket;
  uint64_t                   min_sample_size = 0;
};

} // namespace deliveryiq::db
