#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/survival_curve_record.hpp"
#include "internal/db/model/tracking_snapshot_record.hpp"

namespace deliveryiq::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - BeginRead() transactions see committed state only and never wait
    behind a writer
  - Reads inside a transaction see its writes
  - Writes return a portable Result; reads throw util::StorageError
  - Every list query is cursor paginated and returns at most
    kMaxPageRows rows, whatever limit the caller asks for

  The DB is the source of truth for:
    tracking snapshots and claims (written upstream)
    outcome records
    survival curves
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only unit of work. Backends that serialize writers run it without
  // the write lock; writes through it fail.
  virtual std::unique_ptr<Transaction> BeginRead() {
    return Begin();
  }

  // ---------------------------------------------------------------------
  // Tracking snapshots (upstream input)
  // ---------------------------------------------------------------------

  virtual Result UpsertTrackingSnapshot(Transaction&, const model::TrackingSnapshotRecord&) = 0;

  // Snapshots having an in_transit timestamp, keyed by shipment_id.
  virtual std::vector<model::TrackingSnapshotRecord> ListInTransitSnapshots(Transaction&, const PageRequest&) = 0;

  // Unknown ids are skipped. Callers keep id lists within kMaxPageRows.
  virtual std::vector<model::TrackingSnapshotRecord> GetTrackingSnapshots(Transaction&, const std::vector<std::string>& shipment_ids) = 0;

  // ---------------------------------------------------------------------
  // Claims (upstream input)
  // ---------------------------------------------------------------------

  virtual Result UpsertClaim(Transaction&, const model::ClaimRecord&) = 0;

  // Keyed by claim_id.
  virtual std::vector<model::ClaimRecord> ListClaims(Transaction&, const PageRequest&) = 0;

  // ---------------------------------------------------------------------
  // Outcome records
  // ---------------------------------------------------------------------

  // Insert or overwrite by shipment_id.
  virtual Result UpsertOutcomes(Transaction&, const std::vector<model::OutcomeRecord>&) = 0;

  virtual std::vector<model::OutcomeRecord> GetOutcomes(Transaction&, const std::vector<std::string>& shipment_ids) = 0;

  // Keyed by shipment_id.
  virtual std::vector<model::OutcomeRecord> ListOutcomes(Transaction&, const OutcomeFilter&, const PageRequest&) = 0;

  virtual uint64_t CountOutcomes(Transaction&, const OutcomeFilter&) = 0;

  // ---------------------------------------------------------------------
  // Survival curves
  // ---------------------------------------------------------------------

  // Delete-then-insert by key; a null carrier_service matches IS NULL.
  virtual Result ReplaceSurvivalCurve(Transaction&, const model::SurvivalCurveRecord&) = 0;

  // Curves matching the filter with sample_size >= min_sample_size, unordered.
  virtual std::vector<model::SurvivalCurveRecord> FindSurvivalCurves(Transaction&, const CurveFilter&) = 0;

  // Keyed by SegmentKey::Canonical().
  virtual std::vector<model::SurvivalCurveRecord> ListSurvivalCurves(Transaction&, const PageRequest&) = 0;
};

} // namespace deliveryiq::db
