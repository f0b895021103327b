#include "admin_service.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "instrumented.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/labels.hpp"
#include "internal/model/segment.hpp"

namespace deliveryiq::service {

using namespace deliveryiq::v1;

namespace {

constexpr std::size_t kTopCarriers = 20;

constexpr Outcome kOutcomes[] = {
    OUTCOME_DELIVERED,
    OUTCOME_LOST_CLAIM,
    OUTCOME_LOST_EXCEPTION,
    OUTCOME_LOST_TIMEOUT,
    OUTCOME_CENSORED,
};

const std::vector<Outcome> kLostOutcomes = {OUTCOME_LOST_CLAIM, OUTCOME_LOST_EXCEPTION, OUTCOME_LOST_TIMEOUT};

// percent, two decimals
double Rate(uint64_t part, uint64_t total) {
  if (total == 0) {
    return 0.0;
  }
  return std::round(static_cast<double>(part) * 10000.0 / static_cast<double>(total)) / 100.0;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return Instrumented("AdminService.Stats", [&] {
    auto& repo = *ctx_.repository;
    auto  tx   = repo.BeginRead();

    StatsResponse resp;

    // outcome distribution
    uint64_t total = 0;
    for (const auto outcome : kOutcomes) {
      db::OutcomeFilter filter;
      filter.outcomes = {outcome};
      const auto count = repo.CountOutcomes(*tx, filter);
      (*resp.mutable_outcomes())[std::string(model::ToString(outcome))] = count;
      total += count;
      if (outcome == OUTCOME_DELIVERED) {
        resp.set_delivered_count(count);
      } else if (outcome == OUTCOME_CENSORED) {
        resp.set_censored_count(count);
      } else {
        resp.set_lost_count(resp.lost_count() + count);
      }
    }
    resp.set_total_outcomes(total);
    resp.set_delivery_rate(Rate(resp.delivered_count(), total));
    resp.set_loss_rate(Rate(resp.lost_count(), total));

    // curve scan
    std::set<std::string>  carriers;
    uint64_t               curve_count = 0;
    int64_t                median_sum  = 0;
    std::optional<int64_t> last_computed;

    db::PageRequest page;
    while (true) {
      auto curves = repo.ListSurvivalCurves(*tx, page);
      for (const auto& curve : curves) {
        ++curve_count;
        ++(*resp.mutable_curves_by_confidence())[std::string(model::ToString(curve.confidence_level))];
        median_sum += curve.median_days.value_or(0);
        if (!last_computed || curve.computed_at_ms > *last_computed) {
          last_computed = curve.computed_at_ms;
        }

        if (curve.key.carrier == model::kAll) {
          continue;
        }
        carriers.insert(curve.key.carrier);

        auto& zones = *(*resp.mutable_confidence_heatmap())[curve.key.carrier].mutable_zones();
        auto  it    = zones.find(curve.key.zone_bucket);
        if (it == zones.end() || curve.sample_size > it->second.sample_size()) {
          HeatmapCell cell;
          cell.set_confidence(std::string(model::ToString(curve.confidence_level)));
          cell.set_sample_size(curve.sample_size);
          zones[curve.key.zone_bucket] = cell;
        }
      }
      if (curves.size() < db::ClampPageSize(page.limit)) {
        break;
      }
      page.after = curves.back().key.Canonical();
    }

    resp.set_total_curves(curve_count);
    if (curve_count > 0) {
      resp.set_avg_median_days(std::round(static_cast<double>(median_sum) * 100.0 / static_cast<double>(curve_count)) / 100.0);
    }
    if (last_computed) {
      resp.set_last_computed_at_ms(*last_computed);
    }
    resp.set_carriers_tracked(carriers.size());

    // per-carrier performance
    std::vector<CarrierStats> rows;
    rows.reserve(carriers.size());
    for (const auto& carrier : carriers) {
      db::OutcomeFilter filter;
      filter.carrier = carrier;
      const auto carrier_total = repo.CountOutcomes(*tx, filter);

      filter.outcomes      = {OUTCOME_DELIVERED};
      const auto delivered = repo.CountOutcomes(*tx, filter);
      filter.outcomes      = kLostOutcomes;
      const auto lost      = repo.CountOutcomes(*tx, filter);

      CarrierStats row;
      row.set_carrier(carrier);
      row.set_total(carrier_total);
      row.set_delivery_rate(Rate(delivered, carrier_total));
      row.set_loss_rate(Rate(lost, carrier_total));
      rows.push_back(std::move(row));
    }
    std::stable_sort(rows.begin(), rows.end(), [](const CarrierStats& a, const CarrierStats& b) { return a.total() > b.total(); });
    if (rows.size() > kTopCarriers) {
      rows.resize(kTopCarriers);
    }
    for (auto& row : rows) {
      *resp.add_carriers() = std::move(row);
    }

    tx->Commit();
    return resp;
  });
}

} // namespace deliveryiq::service
