#include "curve_resolver.hpp"

#include <algorithm>
#include <array>

#include "internal/db/api/repository.hpp"
#include "internal/model/segment.hpp"

namespace deliveryiq::resolver {

namespace {

struct Level {
  uint32_t number;
  bool     exact_service;
  bool     all_carriers;
  bool     all_service_buckets;
  bool     match_season;
};

constexpr std::array<Level, 5> kLevels = {{
    {1, true, false, false, true},
    {2, true, false, false, false},
    {3, false, false, false, false},
    {4, false, true, false, false},
    {5, false, true, true, false},
}};

db::CurveFilter FilterFor(const Level& level, const CurveRequest& request) {
  db::CurveFilter filter;
  filter.carrier         = level.all_carriers ? std::string(model::kAll) : request.carrier;
  filter.carrier_service = level.exact_service ? request.carrier_service : std::nullopt;
  filter.service_bucket  = level.all_service_buckets ? std::string(model::kAll) : request.service_bucket;
  filter.zone_bucket     = request.zone_bucket;
  if (level.match_season) {
    filter.season_bucket = request.season_bucket;
  }
  filter.min_sample_size = request.min_sample_size;
  return filter;
}

} // namespace

CurveResolver::CurveResolver(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<ResolvedCurve> CurveResolver::Resolve(const CurveRequest& request) {
  auto tx       = repository_->BeginRead();
  auto resolved = Resolve(*tx, request);
  tx->Commit();
  return resolved;
}

std::optional<ResolvedCurve> CurveResolver::Resolve(db::Transaction& tx, const CurveRequest& request) {
  for (const auto& level : kLevels) {
    if (level.exact_service && !request.carrier_service) {
      continue;
    }

    auto candidates = repository_->FindSurvivalCurves(tx, FilterFor(level, request));
    if (candidates.empty()) {
      continue;
    }

    const auto best = std::min_element(candidates.begin(), candidates.end(), [&](const auto& a, const auto& b) {
      const bool a_season = a.key.season_bucket == request.season_bucket;
      const bool b_season = b.key.season_bucket == request.season_bucket;
      if (a_season != b_season) {
        return a_season;
      }
      if (a.sample_size != b.sample_size) {
        return a.sample_size > b.sample_size;
      }
      // deterministic across backends
      return a.key.season_bucket < b.key.season_bucket;
    });
    return ResolvedCurve{std::move(*best), level.number};
  }
  return std::nullopt;
}

} // namespace deliveryiq::resolver
