#include "curve_engine.hpp"

#include <map>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/labels.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/survival/aggregation_tiers.hpp"

namespace deliveryiq::survival {

using deliveryiq::observability::IntField;
using deliveryiq::observability::StringField;

namespace {

std::string Describe(const model::SegmentKey& key) {
  return key.carrier + "/" + key.carrier_service.value_or("*") + "/" + key.service_bucket + "/" + key.zone_bucket + "/" + key.season_bucket;
}

} // namespace

CurveEngineOptions CurveEngineOptions::FromConfig(const deliveryiq::runtime::config::SurvivalConfig& config) {
  CurveEngineOptions options;
  if (auto handling = ParseLostHandling(config.lost_handling())) {
    options.lost_handling = *handling;
  }
  options.page_size = db::ClampPageSize(config.page_size());
  return options;
}

db::model::SurvivalCurveRecord FitCurve(const model::SegmentKey&        key,
                                        const std::vector<Observation>& observations,
                                        LostHandling                    lost_handling,
                                        int64_t                         computed_at_ms) {
  db::model::SurvivalCurveRecord curve;
  curve.key        = key;
  curve.curve_data = ComputeKaplanMeier(observations, lost_handling);

  for (const auto& obs : observations) {
    if (obs.outcome == deliveryiq::v1::OUTCOME_DELIVERED) {
      ++curve.delivered_count;
    } else if (model::IsLost(obs.outcome)) {
      ++curve.lost_count;
    } else {
      ++curve.censored_count;
    }
  }
  curve.sample_size = observations.size();

  curve.median_days      = PercentileDay(curve.curve_data, 0.50);
  curve.p75_days         = PercentileDay(curve.curve_data, 0.75);
  curve.p90_days         = PercentileDay(curve.curve_data, 0.90);
  curve.p95_days         = PercentileDay(curve.curve_data, 0.95);
  curve.confidence_level = model::ConfidenceForSampleSize(curve.sample_size);
  curve.computed_at_ms   = computed_at_ms;
  return curve;
}

CurveEngine::CurveEngine(std::shared_ptr<db::Repository> repository, CurveEngineOptions options)
    : repository_(std::move(repository)), options_(options) {
  options_.page_size = db::ClampPageSize(options_.page_size);
}

std::vector<model::SegmentKey> CurveEngine::DiscoverSegments() {
  // ordered by canonical key so runs are deterministic
  std::map<std::string, model::SegmentKey> keys;

  auto            tx = repository_->Begin();
  db::PageRequest page{.after = {}, .limit = options_.page_size};
  while (true) {
    auto records = repository_->ListOutcomes(*tx, db::OutcomeFilter{}, page);
    for (const auto& record : records) {
      // a record without a carrier still counts toward the all-carrier tiers
      const bool        has_carrier = !record.carrier.empty();
      model::SegmentKey exact{record.carrier, record.carrier_service, record.service_bucket, record.zone_bucket, record.season_bucket};
      for (const auto& rule : kAggregationTiers) {
        if (!has_carrier && !rule.drop_carrier) {
          continue;
        }
        auto aggregated = Aggregate(exact, rule);
        keys.try_emplace(aggregated.Canonical(), std::move(aggregated));
      }
      if (has_carrier) {
        keys.try_emplace(exact.Canonical(), std::move(exact));
      }
    }
    if (records.size() < page.limit) {
      break;
    }
    page.after = records.back().shipment_id;
  }
  tx->Commit();

  std::vector<model::SegmentKey> out;
  out.reserve(keys.size());
  for (auto& [canonical, key] : keys) {
    out.push_back(std::move(key));
  }
  return out;
}

std::vector<Observation> CurveEngine::LoadObservations(db::Transaction& tx, const model::SegmentKey& key) {
  std::vector<Observation> observations;

  const auto      filter = OutcomesFor(key);
  db::PageRequest page{.after = {}, .limit = options_.page_size};
  while (true) {
    auto records = repository_->ListOutcomes(tx, filter, page);
    for (const auto& record : records) {
      observations.push_back({record.observed_days, record.outcome});
    }
    if (records.size() < page.limit) {
      break;
    }
    page.after = records.back().shipment_id;
  }
  return observations;
}

RecomputeResult CurveEngine::RecomputeAll(int64_t now_ms) {
  deliveryiq::observability::SpanScope span("CurveEngine.RecomputeAll");
  RecomputeResult                      result;

  DELIVERYIQ_LOG_INFO("curve recompute started", {StringField("lost_handling", ToString(options_.lost_handling))});

  std::vector<model::SegmentKey> segments;
  try {
    segments = DiscoverSegments();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    DELIVERYIQ_LOG_ERROR("curve recompute aborted: segment discovery failed", {StringField("error", ex.what())});
    deliveryiq::observability::Metrics::Instance().RecordUnitError("recompute");
    ++result.errors;
    return result;
  }
  result.segments = segments.size();

  DELIVERYIQ_LOG_INFO("segments discovered", {IntField("segments", static_cast<int64_t>(segments.size()))});

  for (const auto& key : segments) {
    try {
      auto tx           = repository_->Begin();
      auto observations = LoadObservations(*tx, key);
      if (observations.empty()) {
        tx->Rollback();
        continue;
      }

      const auto curve = FitCurve(key, observations, options_.lost_handling, now_ms);
      db::ThrowIfError(repository_->ReplaceSurvivalCurve(*tx, curve), "replace survival curve");
      tx->Commit();
      ++result.computed;

      DELIVERYIQ_LOG_DEBUG("curve computed",
                           {StringField("segment", Describe(key)),
                            IntField("sample_size", static_cast<int64_t>(curve.sample_size)),
                            StringField("confidence", model::ToString(curve.confidence_level))});
    } catch (const std::exception& ex) {
      DELIVERYIQ_LOG_ERROR("curve computation failed", {StringField("segment", Describe(key)), StringField("error", ex.what())});
      deliveryiq::observability::Metrics::Instance().RecordUnitError("recompute");
      ++result.errors;
    }
  }

  deliveryiq::observability::Metrics::Instance().AddCurvesComputed(result.computed);
  span.SetAttribute("segments", static_cast<int64_t>(result.segments));
  span.SetAttribute("computed", static_cast<int64_t>(result.computed));
  DELIVERYIQ_LOG_INFO("curve recompute finished",
                      {IntField("segments", static_cast<int64_t>(result.segments)),
                       IntField("computed", static_cast<int64_t>(result.computed)),
                       IntField("errors", static_cast<int64_t>(result.errors))});
  return result;
}

} // namespace deliveryiq::survival
