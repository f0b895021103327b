#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/model/survival_curve_record.hpp"

namespace deliveryiq::db {
class Repository;
class Transaction;
} // namespace deliveryiq::db

namespace deliveryiq::resolver {

inline constexpr uint64_t kDefaultMinSampleSize = 100;

struct CurveRequest {
  std::string                carrier;
  std::optional<std::string> carrier_service;
  std::string                service_bucket;
  std::string                zone_bucket;
  std::string                season_bucket;
  uint64_t                   min_sample_size = kDefaultMinSampleSize;
};

struct ResolvedCurve {
  db::model::SurvivalCurveRecord curve;
  // 1 = most specific ... 5 = all carriers, all services
  uint32_t level = 0;
};

/*
  Finds the most specific stored curve with enough samples.

  1. carrier + exact service + service bucket + zone + season
  2. carrier + exact service + service bucket + zone
  3. carrier + null service + service bucket + zone
  4. all carriers + null service + service bucket + zone
  5. all carriers + null service + all services + zone

  Levels 1-2 are skipped when the request has no exact service. Where the
  season is ignored, a curve for the requested season wins, then the
  larger sample. The service bucket of a returned curve is always the
  requested one or model::kAll.
*/
class CurveResolver {
 public:
  explicit CurveResolver(std::shared_ptr<db::Repository> repository);

  // Opens its own read transaction.
  std::optional<ResolvedCurve> Resolve(const CurveRequest& request);

  std::optional<ResolvedCurve> Resolve(db::Transaction& tx, const CurveRequest& request);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace deliveryiq::resolver
