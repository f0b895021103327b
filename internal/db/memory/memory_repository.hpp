#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace deliveryiq::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and when no database is configured.

  Ordered maps give the ascending-key cursor order the other backends get
  from ORDER BY.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertTrackingSnapshot(Transaction&, const model::TrackingSnapshotRecord&) override;
  std::vector<model::TrackingSnapshotRecord> ListInTransitSnapshots(Transaction&, const PageRequest&) override;
  std::vector<model::TrackingSnapshotRecord> GetTrackingSnapshots(Transaction&, const std::vector<std::string>&) override;

  Result UpsertClaim(Transaction&, const model::ClaimRecord&) override;
  std::vector<model::ClaimRecord> ListClaims(Transaction&, const PageRequest&) override;

  Result UpsertOutcomes(Transaction&, const std::vector<model::OutcomeRecord>&) override;
  std::vector<model::OutcomeRecord> GetOutcomes(Transaction&, const std::vector<std::string>&) override;
  std::vector<model::OutcomeRecord> ListOutcomes(Transaction&, const OutcomeFilter&, const PageRequest&) override;
  uint64_t CountOutcomes(Transaction&, const OutcomeFilter&) override;

  Result ReplaceSurvivalCurve(Transaction&, const model::SurvivalCurveRecord&) override;
  std::vector<model::SurvivalCurveRecord> FindSurvivalCurves(Transaction&, const CurveFilter&) override;
  std::vector<model::SurvivalCurveRecord> ListSurvivalCurves(Transaction&, const PageRequest&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::TrackingSnapshotRecord> snapshots;
    std::map<std::string, model::ClaimRecord>            claims;
    std::map<std::string, model::OutcomeRecord>          outcomes;
    std::map<std::string, model::SurvivalCurveRecord>    curves; // SegmentKey::Canonical()
  };

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
};

} // namespace deliveryiq::db::memory
