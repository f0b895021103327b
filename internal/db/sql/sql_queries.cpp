#include "sql_queries.hpp"

#include "internal/db/model/record_codec.hpp"
#include "internal/model/labels.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::db::sql {

namespace {

constexpr const char* kSnapshotColumns =
    "shipment_id,tracking_number,carrier,carrier_service,zone_used,destination_state,destination_country,"
    "in_transit_ms,out_for_delivery_ms,delivered_ms,delivery_attempt_failed_ms,event_log";

constexpr const char* kClaimColumns = "claim_id,shipment_id,status,issue_type,updated_at_ms";

constexpr const char* kOutcomeColumns =
    "shipment_id,tracking_number,carrier,carrier_service,service_bucket,zone_used,zone_bucket,season_bucket,"
    "destination_state,destination_country,destination_region,transit_start_ms,transit_start_month,transit_start_week,"
    "outcome,outcome_source,outcome_date_ms,total_transit_days,days_to_out_for_delivery,days_last_mile,observed_days,"
    "is_censored,has_exception,has_delivery_attempt_failed,event_count,evaluated_at_ms";

constexpr const char* kCurveColumns =
    "segment_key,carrier,carrier_service,service_bucket,zone_bucket,season_bucket,curve_data,sample_size,"
    "delivered_count,lost_count,censored_count,median_days,p75_days,p90_days,p95_days,confidence_level,computed_at_ms";

std::vector<std::string> SplitColumns(const std::string& columns) {
  std::vector<std::string> out;
  std::size_t              start = 0;
  while (start <= columns.size()) {
    auto end = columns.find(',', start);
    if (end == std::string::npos) end = columns.size();
    out.push_back(columns.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

std::string Placeholders(std::size_t n) {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) {
    if (i > 0) out += ',';
    out += '?';
  }
  return out;
}

std::string UpsertSql(const std::string& table, const std::string& columns, const std::string& key) {
  const auto  names = SplitColumns(columns);
  std::string sql   = "INSERT INTO " + table + "(" + columns + ") VALUES(" + Placeholders(names.size()) + ") ON CONFLICT(" + key + ") DO UPDATE SET ";
  bool        first = true;
  for (const auto& name : names) {
    if (name == key) continue;
    if (!first) sql += ',';
    first = false;
    sql += name + "=excluded." + name;
  }
  return sql + ";";
}

// Text keys compare bytewise on every backend.
std::string KeyColumn(Dialect dialect, const std::string& column) {
  return dialect == Dialect::kPostgres ? column + " COLLATE \"C\"" : column;
}

// Rewrites ? placeholders into $1..$n for Postgres.
std::string Render(Dialect dialect, const std::string& sql) {
  if (dialect == Dialect::kSqlite) {
    return sql;
  }

  std::string out;
  out.reserve(sql.size() + 16);
  int index = 0;
  for (char c : sql) {
    if (c == '?') {
      out += '$' + std::to_string(++index);
    } else {
      out += c;
    }
  }
  return out;
}

/*
  Appends "WHERE ... <key> > ? ORDER BY <key> LIMIT ?" to a SELECT whose
  other conditions are already in `conditions`.
*/
Query Paged(Dialect dialect, std::string select, std::vector<std::string> conditions, Params params, const std::string& key,
            const PageRequest& page) {
  if (!page.after.empty()) {
    conditions.push_back(KeyColumn(dialect, key) + " > ?");
    params.emplace_back(page.after);
  }

  for (std::size_t i = 0; i < conditions.size(); ++i) {
    select += (i == 0 ? " WHERE " : " AND ") + conditions[i];
  }
  select += " ORDER BY " + KeyColumn(dialect, key) + " LIMIT ?;";
  params.emplace_back(static_cast<int64_t>(ClampPageSize(page.limit)));

  return Query{Render(dialect, select), std::move(params)};
}

Query ByIds(Dialect dialect, const std::string& columns, const std::string& table, const std::string& key, const std::vector<std::string>& ids) {
  if (ids.empty()) {
    return Query{"SELECT " + columns + " FROM " + table + " WHERE 1=0;", {}};
  }

  Params params;
  params.reserve(ids.size());
  for (const auto& id : ids) {
    params.emplace_back(id);
  }
  return Query{Render(dialect, "SELECT " + columns + " FROM " + table + " WHERE " + key + " IN (" + Placeholders(ids.size()) + ");"),
               std::move(params)};
}

void AppendOutcomeConditions(const OutcomeFilter& filter, std::vector<std::string>& conditions, Params& params) {
  auto eq = [&](const char* column, const std::optional<std::string>& value) {
    if (!value) return;
    conditions.push_back(std::string(column) + "=?");
    params.emplace_back(*value);
  };
  eq("carrier", filter.carrier);
  eq("carrier_service", filter.carrier_service);
  eq("service_bucket", filter.service_bucket);
  eq("zone_bucket", filter.zone_bucket);
  eq("season_bucket", filter.season_bucket);

  if (!filter.outcomes.empty()) {
    conditions.push_back("outcome IN (" + Placeholders(filter.outcomes.size()) + ")");
    for (auto outcome : filter.outcomes) {
      params.emplace_back(std::string(deliveryiq::model::ToString(outcome)));
    }
  }
}

int64_t Bool(bool value) {
  return value ? 1 : 0;
}

} // namespace

// ------------------------------------------------------------------
// Tracking snapshots
// ------------------------------------------------------------------

Query UpsertSnapshot(Dialect dialect, const model::TrackingSnapshotRecord& r) {
  return Query{Render(dialect, UpsertSql("tracking_snapshots", kSnapshotColumns, "shipment_id")),
               {r.shipment_id, Nullable(r.tracking_number), r.carrier, Nullable(r.carrier_service), Nullable(r.zone_used),
                Nullable(r.destination_state), Nullable(r.destination_country), Nullable(r.in_transit_ms), Nullable(r.out_for_delivery_ms),
                Nullable(r.delivered_ms), Nullable(r.delivery_attempt_failed_ms), model::EncodeEventLog(r.event_log)}};
}

Query ListInTransitSnapshots(Dialect dialect, const PageRequest& page) {
  return Paged(dialect, std::string("SELECT ") + kSnapshotColumns + " FROM tracking_snapshots", {"in_transit_ms IS NOT NULL"}, {}, "shipment_id",
               page);
}

Query GetSnapshots(Dialect dialect, const std::vector<std::string>& ids) {
  return ByIds(dialect, kSnapshotColumns, "tracking_snapshots", "shipment_id", ids);
}

model::TrackingSnapshotRecord ReadSnapshot(const Row& row) {
  model::TrackingSnapshotRecord r;
  r.shipment_id                = row.GetText(0);
  r.tracking_number            = row.GetOptionalText(1);
  r.carrier                    = row.GetText(2);
  r.carrier_service            = row.GetOptionalText(3);
  if (!row.IsNull(4)) r.zone_used = static_cast<int32_t>(row.GetInt64(4));
  r.destination_state          = row.GetOptionalText(5);
  r.destination_country        = row.GetOptionalText(6);
  r.in_transit_ms              = row.GetOptionalInt64(7);
  r.out_for_delivery_ms        = row.GetOptionalInt64(8);
  r.delivered_ms               = row.GetOptionalInt64(9);
  r.delivery_attempt_failed_ms = row.GetOptionalInt64(10);
  r.event_log                  = model::DecodeEventLog(row.IsNull(11) ? std::string() : row.GetText(11));
  return r;
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Query UpsertClaim(Dialect dialect, const model::ClaimRecord& r) {
  return Query{Render(dialect, UpsertSql("claims", kClaimColumns, "claim_id")), {r.claim_id, r.shipment_id, r.status, r.issue_type, r.updated_at_ms}};
}

Query ListClaims(Dialect dialect, const PageRequest& page) {
  return Paged(dialect, std::string("SELECT ") + kClaimColumns + " FROM claims", {}, {}, "claim_id", page);
}

model::ClaimRecord ReadClaim(const Row& row) {
  model::ClaimRecord r;
  r.claim_id      = row.GetText(0);
  r.shipment_id   = row.GetText(1);
  r.status        = row.GetText(2);
  r.issue_type    = row.GetText(3);
  r.updated_at_ms = row.GetInt64(4);
  return r;
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Query UpsertOutcome(Dialect dialect, const model::OutcomeRecord& r) {
  return Query{Render(dialect, UpsertSql("delivery_outcomes", kOutcomeColumns, "shipment_id")),
               {r.shipment_id,
                Nullable(r.tracking_number),
                r.carrier,
                Nullable(r.carrier_service),
                r.service_bucket,
                Nullable(r.zone_used),
                r.zone_bucket,
                r.season_bucket,
                Nullable(r.destination_state),
                Nullable(r.destination_country),
                Nullable(r.destination_region),
                r.transit_start_ms,
                static_cast<int64_t>(r.transit_start_month),
                static_cast<int64_t>(r.transit_start_week),
                std::string(deliveryiq::model::ToString(r.outcome)),
                r.outcome_source,
                Nullable(r.outcome_date_ms),
                r.total_transit_days,
                Nullable(r.days_to_out_for_delivery),
                Nullable(r.days_last_mile),
                r.observed_days,
                Bool(r.is_censored),
                Bool(r.has_exception),
                Bool(r.has_delivery_attempt_failed),
                static_cast<int64_t>(r.event_count),
                r.evaluated_at_ms}};
}

Query GetOutcomes(Dialect dialect, const std::vector<std::string>& ids) {
  return ByIds(dialect, kOutcomeColumns, "delivery_outcomes", "shipment_id", ids);
}

Query ListOutcomes(Dialect dialect, const OutcomeFilter& filter, const PageRequest& page) {
  std::vector<std::string> conditions;
  Params                   params;
  AppendOutcomeConditions(filter, conditions, params);
  return Paged(dialect, std::string("SELECT ") + kOutcomeColumns + " FROM delivery_outcomes", std::move(conditions), std::move(params),
               "shipment_id", page);
}

Query CountOutcomes(Dialect dialect, const OutcomeFilter& filter) {
  std::vector<std::string> conditions;
  Params                   params;
  AppendOutcomeConditions(filter, conditions, params);

  std::string sql = "SELECT COUNT(*) FROM delivery_outcomes";
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
  }
  return Query{Render(dialect, sql + ";"), std::move(params)};
}

model::OutcomeRecord ReadOutcome(const Row& row) {
  model::OutcomeRecord r;
  r.shipment_id     = row.GetText(0);
  r.tracking_number = row.GetOptionalText(1);
  r.carrier         = row.GetText(2);
  r.carrier_service = row.GetOptionalText(3);
  r.service_bucket  = row.GetText(4);
  if (!row.IsNull(5)) r.zone_used = static_cast<int32_t>(row.GetInt64(5));
  r.zone_bucket         = row.GetText(6);
  r.season_bucket       = row.GetText(7);
  r.destination_state   = row.GetOptionalText(8);
  r.destination_country = row.GetOptionalText(9);
  r.destination_region  = row.GetOptionalText(10);
  r.transit_start_ms    = row.GetInt64(11);
  r.transit_start_month = static_cast<uint32_t>(row.GetInt64(12));
  r.transit_start_week  = static_cast<uint32_t>(row.GetInt64(13));

  const auto outcome = deliveryiq::model::ParseOutcome(row.GetText(14));
  if (!outcome) {
    throw util::StorageError("unknown outcome '" + row.GetText(14) + "' for shipment " + r.shipment_id);
  }
  r.outcome = *outcome;

  r.outcome_source              = row.GetText(15);
  r.outcome_date_ms             = row.GetOptionalInt64(16);
  r.total_transit_days          = row.GetDouble(17);
  r.days_to_out_for_delivery    = row.GetOptionalDouble(18);
  r.days_last_mile              = row.GetOptionalDouble(19);
  r.observed_days               = row.GetDouble(20);
  r.is_censored                 = row.GetBool(21);
  r.has_exception               = row.GetBool(22);
  r.has_delivery_attempt_failed = row.GetBool(23);
  r.event_count                 = static_cast<uint32_t>(row.GetInt64(24));
  r.evaluated_at_ms             = row.GetInt64(25);
  return r;
}

// ------------------------------------------------------------------
// Survival curves
// ------------------------------------------------------------------

Query DeleteCurve(Dialect dialect, const deliveryiq::model::SegmentKey& key) {
  Params      params{key.carrier};
  std::string sql = "DELETE FROM survival_curves WHERE carrier=?";
  if (key.carrier_service) {
    sql += " AND carrier_service=?";
    params.emplace_back(*key.carrier_service);
  } else {
    sql += " AND carrier_service IS NULL";
  }
  sql += " AND service_bucket=? AND zone_bucket=? AND season_bucket=?;";
  params.emplace_back(key.service_bucket);
  params.emplace_back(key.zone_bucket);
  params.emplace_back(key.season_bucket);
  return Query{Render(dialect, sql), std::move(params)};
}

Query InsertCurve(Dialect dialect, const model::SurvivalCurveRecord& r) {
  const auto names = SplitColumns(kCurveColumns);
  return Query{Render(dialect, std::string("INSERT INTO survival_curves(") + kCurveColumns + ") VALUES(" + Placeholders(names.size()) + ");"),
               {r.key.Canonical(), r.key.carrier, Nullable(r.key.carrier_service), r.key.service_bucket, r.key.zone_bucket, r.key.season_bucket,
                model::EncodeCurveData(r.curve_data), static_cast<int64_t>(r.sample_size), static_cast<int64_t>(r.delivered_count),
                static_cast<int64_t>(r.lost_count), static_cast<int64_t>(r.censored_count), Nullable(r.median_days), Nullable(r.p75_days),
                Nullable(r.p90_days), Nullable(r.p95_days), std::string(deliveryiq::model::ToString(r.confidence_level)), r.computed_at_ms}};
}

Query FindCurves(Dialect dialect, const CurveFilter& filter) {
  Params      params{filter.carrier};
  std::string sql = std::string("SELECT ") + kCurveColumns + " FROM survival_curves WHERE carrier=?";
  if (filter.carrier_service) {
    sql += " AND carrier_service=?";
    params.emplace_back(*filter.carrier_service);
  } else {
    sql += " AND carrier_service IS NULL";
  }
  sql += " AND service_bucket=? AND zone_bucket=?";
  params.emplace_back(filter.service_bucket);
  params.emplace_back(filter.zone_bucket);
  if (filter.season_bucket) {
    sql += " AND season_bucket=?";
    params.emplace_back(*filter.season_bucket);
  }
  sql += " AND sample_size >= ?;";
  params.emplace_back(static_cast<int64_t>(filter.min_sample_size));
  return Query{Render(dialect, sql), std::move(params)};
}

Query ListCurves(Dialect dialect, const PageRequest& page) {
  return Paged(dialect, std::string("SELECT ") + kCurveColumns + " FROM survival_curves", {}, {}, "segment_key", page);
}

model::SurvivalCurveRecord ReadCurve(const Row& row) {
  model::SurvivalCurveRecord r;
  // column 0 is the derived segment_key
  r.key.carrier         = row.GetText(1);
  r.key.carrier_service = row.GetOptionalText(2);
  r.key.service_bucket  = row.GetText(3);
  r.key.zone_bucket     = row.GetText(4);
  r.key.season_bucket   = row.GetText(5);
  r.curve_data          = model::DecodeCurveData(row.GetText(6));
  r.sample_size         = row.GetU64(7);
  r.delivered_count     = row.GetU64(8);
  r.lost_count          = row.GetU64(9);
  r.censored_count      = row.GetU64(10);
  r.median_days         = row.GetOptionalInt64(11);
  r.p75_days            = row.GetOptionalInt64(12);
  r.p90_days            = row.GetOptionalInt64(13);
  r.p95_days            = row.GetOptionalInt64(14);

  const auto confidence = deliveryiq::model::ParseConfidence(row.GetText(15));
  if (!confidence) {
    throw util::StorageError("unknown confidence level '" + row.GetText(15) + "'");
  }
  r.confidence_level = *confidence;
  r.computed_at_ms   = row.GetInt64(16);
  return r;
}

} // namespace deliveryiq::db::sql
