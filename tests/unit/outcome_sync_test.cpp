#include "internal/outcome/outcome_sync.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "support/fixtures.hpp"

namespace {

using namespace deliveryiq::v1;
using deliveryiq::db::Repository;
using deliveryiq::db::memory::MemoryRepository;
using deliveryiq::outcome::OutcomeClassifier;
using deliveryiq::outcome::OutcomeSync;
using deliveryiq::outcome::SyncOptions;
using deliveryiq::testing::Claim;
using deliveryiq::testing::DaysMs;
using deliveryiq::testing::ShipmentId;
using deliveryiq::testing::Snapshot;
using deliveryiq::testing::UtcMs;

namespace model = deliveryiq::db::model;
namespace db    = deliveryiq::db;

const int64_t kStart = UtcMs(2024, 5, 1);

// Forwards to an in-memory store; outcome writes touching `poisoned_id` fail.
class FailingRepository final : public Repository {
 public:
  explicit FailingRepository(std::string poisoned_id) : poisoned_id_(std::move(poisoned_id)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result UpsertTrackingSnapshot(db::Transaction& tx, const model::TrackingSnapshotRecord& r) override {
    return inner_.UpsertTrackingSnapshot(tx, r);
  }
  std::vector<model::TrackingSnapshotRecord> ListInTransitSnapshots(db::Transaction& tx, const db::PageRequest& p) override {
    return inner_.ListInTransitSnapshots(tx, p);
  }
  std::vector<model::TrackingSnapshotRecord> GetTrackingSnapshots(db::Transaction& tx, const std::vector<std::string>& ids) override {
    return inner_.GetTrackingSnapshots(tx, ids);
  }

  db::Result UpsertClaim(db::Transaction& tx, const model::ClaimRecord& r) override {
    return inner_.UpsertClaim(tx, r);
  }
  std::vector<model::ClaimRecord> ListClaims(db::Transaction& tx, const db::PageRequest& p) override {
    return inner_.ListClaims(tx, p);
  }

  db::Result UpsertOutcomes(db::Transaction& tx, const std::vector<model::OutcomeRecord>& records) override {
    for (const auto& record : records) {
      if (record.shipment_id == poisoned_id_) {
        return db::Result::Err(db::ErrorCode::IOError, "disk full");
      }
    }
    return inner_.UpsertOutcomes(tx, records);
  }
  std::vector<model::OutcomeRecord> GetOutcomes(db::Transaction& tx, const std::vector<std::string>& ids) override {
    return inner_.GetOutcomes(tx, ids);
  }
  std::vector<model::OutcomeRecord> ListOutcomes(db::Transaction& tx, const db::OutcomeFilter& f, const db::PageRequest& p) override {
    return inner_.ListOutcomes(tx, f, p);
  }
  uint64_t CountOutcomes(db::Transaction& tx, const db::OutcomeFilter& f) override {
    return inner_.CountOutcomes(tx, f);
  }

  db::Result ReplaceSurvivalCurve(db::Transaction& tx, const model::SurvivalCurveRecord& r) override {
    return inner_.ReplaceSurvivalCurve(tx, r);
  }
  std::vector<model::SurvivalCurveRecord> FindSurvivalCurves(db::Transaction& tx, const db::CurveFilter& f) override {
    return inner_.FindSurvivalCurves(tx, f);
  }
  std::vector<model::SurvivalCurveRecord> ListSurvivalCurves(db::Transaction& tx, const db::PageRequest& p) override {
    return inner_.ListSurvivalCurves(tx, p);
  }

 private:
  MemoryRepository inner_;
  std::string      poisoned_id_;
};

void Seed(Repository& repo, int count) {
  auto tx = repo.Begin();
  for (int i = 0; i < count; ++i) {
    auto snapshot         = Snapshot(ShipmentId(i), "UPS", std::string("UPS Ground"), 4, kStart);
    snapshot.delivered_ms = kStart + DaysMs(2 + i % 5);
    db::ThrowIfError(repo.UpsertTrackingSnapshot(*tx, snapshot), "seed snapshot");
  }
  tx->Commit();
}

uint64_t CountAll(Repository& repo) {
  auto       tx    = repo.Begin();
  const auto count = repo.CountOutcomes(*tx, db::OutcomeFilter{});
  tx->Commit();
  return count;
}

model::OutcomeRecord Get(Repository& repo, const std::string& id) {
  auto tx      = repo.Begin();
  auto records = repo.GetOutcomes(*tx, {id});
  tx->Commit();
  assert(records.size() == 1);
  return records.front();
}

void TestSyncPagesPastRowCap() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 2500);

  // not yet in transit: never labeled
  {
    auto tx = repo->Begin();
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, Snapshot("zzz-pending", "UPS", std::nullopt, 4, std::nullopt)), "seed");
    tx->Commit();
  }

  OutcomeSync sync(repo, OutcomeClassifier{}, SyncOptions{});
  const auto  result = sync.Run(kStart + DaysMs(30));

  assert(result.scanned == 2500);
  assert(result.added == 2500);
  assert(result.reevaluated == 0);
  assert(result.errors == 0);
  assert(CountAll(*repo) == 2500);

  // a second run finds nothing new
  const auto again = sync.Run(kStart + DaysMs(31));
  assert(again.scanned == 2500);
  assert(again.added == 0);
  assert(CountAll(*repo) == 2500);
}

void TestSmallPagesCoverEveryRow() {
  auto repo = std::make_shared<MemoryRepository>();
  Seed(*repo, 23);

  SyncOptions options;
  options.page_size = 5;
  OutcomeSync sync(repo, OutcomeClassifier{}, options);

  const auto result = sync.Run(kStart + DaysMs(30));
  assert(result.scanned == 23);
  assert(result.added == 23);
  assert(CountAll(*repo) == 23);
}

void TestClaimsDriveLossLabels() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, Snapshot("a", "USPS", std::nullopt, 4, kStart)), "seed");
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, Snapshot("b", "USPS", std::nullopt, 4, kStart)), "seed");
    db::ThrowIfError(repo->UpsertClaim(*tx, Claim("c1", "a", "Credit Approved", "Loss", kStart + DaysMs(5))), "seed");
    db::ThrowIfError(repo->UpsertClaim(*tx, Claim("c2", "a", "Denied", "Loss", kStart + DaysMs(1))), "seed");
    db::ThrowIfError(repo->UpsertClaim(*tx, Claim("c3", "b", "Resolved", "Damage", kStart + DaysMs(5))), "seed");
    tx->Commit();
  }

  OutcomeSync sync(repo, OutcomeClassifier{}, SyncOptions{});
  const auto  result = sync.Run(kStart + DaysMs(3));
  assert(result.added == 2);

  assert(Get(*repo, "a").outcome == OUTCOME_LOST_CLAIM);
  assert(Get(*repo, "b").outcome == OUTCOME_CENSORED);
}

void TestCensoredRecordsAreReevaluated() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, Snapshot("a", "UPS", std::nullopt, 4, kStart)), "seed");
    tx->Commit();
  }

  OutcomeSync sync(repo, OutcomeClassifier{}, SyncOptions{});
  assert(sync.Run(kStart + DaysMs(2)).added == 1);
  assert(Get(*repo, "a").outcome == OUTCOME_CENSORED);

  // the package shows up delivered later
  {
    auto tx               = repo->Begin();
    auto snapshot         = Snapshot("a", "UPS", std::nullopt, 4, kStart);
    snapshot.delivered_ms = kStart + DaysMs(6);
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, snapshot), "update");
    tx->Commit();
  }

  const auto result = sync.Run(kStart + DaysMs(7));
  assert(result.added == 0);
  assert(result.reevaluated == 1);

  const auto record = Get(*repo, "a");
  assert(record.outcome == OUTCOME_DELIVERED);
  assert(!record.is_censored);
  assert(record.observed_days == 6.0);

  // settled labels stay put
  assert(sync.Run(kStart + DaysMs(8)).reevaluated == 0);
}

void TestReevaluationRespectsWindowAndSwitch() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    auto tx = repo->Begin();
    db::ThrowIfError(repo->UpsertTrackingSnapshot(*tx, Snapshot("a", "UPS", std::nullopt, 4, kStart)), "seed");
    tx->Commit();
  }

  SyncOptions disabled;
  disabled.reevaluate_censored = false;
  OutcomeSync frozen(repo, OutcomeClassifier{}, disabled);
  assert(frozen.Run(kStart + DaysMs(2)).added == 1);

  // 50 days in: would now be lost_timeout
  assert(frozen.Run(kStart + DaysMs(50)).reevaluated == 0);
  assert(Get(*repo, "a").outcome == OUTCOME_CENSORED);

  SyncOptions narrow;
  narrow.reevaluation_window_days = 30;
  OutcomeSync windowed(repo, OutcomeClassifier{}, narrow);
  assert(windowed.Run(kStart + DaysMs(50)).reevaluated == 0);

  OutcomeSync open(repo, OutcomeClassifier{}, SyncOptions{});
  assert(open.Run(kStart + DaysMs(50)).reevaluated == 1);
  assert(Get(*repo, "a").outcome == OUTCOME_LOST_TIMEOUT);
}

void TestFailedPageIsCountedAndSkipped() {
  auto repo = std::make_shared<FailingRepository>(ShipmentId(7));
  Seed(*repo, 25);

  SyncOptions options;
  options.page_size = 10;
  OutcomeSync sync(repo, OutcomeClassifier{}, options);

  const auto result = sync.Run(kStart + DaysMs(30));
  assert(result.scanned == 25);
  assert(result.errors == 1);
  assert(result.added == 15);
  assert(CountAll(*repo) == 15);
}

} // namespace

int main() {
  TestSyncPagesPastRowCap();
  TestSmallPagesCoverEveryRow();
  TestClaimsDriveLossLabels();
  TestCensoredRecordsAreReevaluated();
  TestReevaluationRespectsWindowAndSwitch();
  TestFailedPageIsCountedAndSkipped();

  std::cout << "deliveryiq_unit_outcome_sync: pass\n";
  return 0;
}
