#pragma once

#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/db/model/claim_record.hpp"
#include "internal/db/model/outcome_record.hpp"
#include "internal/db/model/survival_curve_record.hpp"
#include "internal/db/model/tracking_snapshot_record.hpp"
#include "internal/model/segment.hpp"
#include "sql_params.hpp"
#include "sql_row.hpp"

namespace deliveryiq::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  Statements are written in the SQLite-compatible subset (ON CONFLICT
  upserts, LIMIT) with ? placeholders so they work in both engines.
  Render() rewrites placeholders to $n for Postgres and pins text-key
  ordering to byte order so cursors page identically everywhere.
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

struct Query {
  std::string text;
  Params      params;
};

Query UpsertSnapshot(Dialect, const model::TrackingSnapshotRecord&);
Query ListInTransitSnapshots(Dialect, const PageRequest&);
Query GetSnapshots(Dialect, const std::vector<std::string>& shipment_ids);

Query UpsertClaim(Dialect, const model::ClaimRecord&);
Query ListClaims(Dialect, const PageRequest&);

Query UpsertOutcome(Dialect, const model::OutcomeRecord&);
Query GetOutcomes(Dialect, const std::vector<std::string>& shipment_ids);
Query ListOutcomes(Dialect, const OutcomeFilter&, const PageRequest&);
Query CountOutcomes(Dialect, const OutcomeFilter&);

Query DeleteCurve(Dialect, const deliveryiq::model::SegmentKey&);
Query InsertCurve(Dialect, const model::SurvivalCurveRecord&);
Query FindCurves(Dialect, const CurveFilter&);
Query ListCurves(Dialect, const PageRequest&);

// Column order matches the SELECTs above. Throw util::StorageError on bad data.
model::TrackingSnapshotRecord ReadSnapshot(const Row&);
model::ClaimRecord            ReadClaim(const Row&);
model::OutcomeRecord          ReadOutcome(const Row&);
model::SurvivalCurveRecord    ReadCurve(const Row&);

} // namespace deliveryiq::db::sql
