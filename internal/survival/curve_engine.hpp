#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/survival_curve_record.hpp"
#include "internal/survival/kaplan_meier.hpp"

namespace deliveryiq::db {
class Repository;
class Transaction;
} // namespace deliveryiq::db

namespace deliveryiq::runtime::config {
class SurvivalConfig;
}

namespace deliveryiq::survival {

struct CurveEngineOptions {
  LostHandling lost_handling = LostHandling::kCensor;
  std::size_t  page_size     = 1000;

  static CurveEngineOptions FromConfig(const deliveryiq::runtime::config::SurvivalConfig& config);
};

struct RecomputeResult {
  uint64_t segments = 0;
  uint64_t computed = 0;
  uint64_t errors   = 0;
};

// Fits one curve: counts, percentiles and confidence derived from `observations`.
db::model::SurvivalCurveRecord FitCurve(const model::SegmentKey&        key,
                                        const std::vector<Observation>& observations,
                                        LostHandling                    lost_handling,
                                        int64_t                         computed_at_ms);

/*
  Batch recomputation of every survival curve.

  Exact segments are discovered by paging the outcome records, every
  aggregation tier adds its coarser key, and each distinct key is fitted
  and replaced in its own transaction. A failed segment is logged and
  counted; the job continues.
*/
class CurveEngine {
 public:
  CurveEngine(std::shared_ptr<db::Repository> repository, CurveEngineOptions options);

  RecomputeResult RecomputeAll(int64_t now_ms);

 private:
  std::vector<model::SegmentKey> DiscoverSegments();
  std::vector<Observation>       LoadObservations(db::Transaction& tx, const model::SegmentKey& key);

  std::shared_ptr<db::Repository> repository_;
  CurveEngineOptions              options_;
};

} // namespace deliveryiq::survival
