#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace deliveryiq::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

} // namespace deliveryiq::db::sqlite
