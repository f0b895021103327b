#include "migrations.hpp"

namespace deliveryiq::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tracking_snapshots (shipment_id TEXT PRIMARY KEY, tracking_number TEXT, carrier TEXT NOT NULL, "
      "carrier_service TEXT, zone_used INTEGER, destination_state TEXT, destination_country TEXT, in_transit_ms INTEGER, "
      "out_for_delivery_ms INTEGER, delivered_ms INTEGER, delivery_attempt_failed_ms INTEGER, event_log TEXT NOT NULL DEFAULT '{}');",
      "CREATE TABLE IF NOT EXISTS claims (claim_id TEXT PRIMARY KEY, shipment_id TEXT NOT NULL, status TEXT NOT NULL, issue_type TEXT NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS delivery_outcomes (shipment_id TEXT PRIMARY KEY, tracking_number TEXT, carrier TEXT NOT NULL, "
      "carrier_service TEXT, service_bucket TEXT NOT NULL, zone_used INTEGER, zone_bucket TEXT NOT NULL, season_bucket TEXT NOT NULL, "
      "destination_state TEXT, destination_country TEXT, destination_region TEXT, transit_start_ms INTEGER NOT NULL, "
      "transit_start_month INTEGER NOT NULL, transit_start_week INTEGER NOT NULL, outcome TEXT NOT NULL, outcome_source TEXT NOT NULL, "
      "outcome_date_ms INTEGER, total_transit_days REAL NOT NULL, days_to_out_for_delivery REAL, days_last_mile REAL, "
      "observed_days REAL NOT NULL, is_censored INTEGER NOT NULL, has_exception INTEGER NOT NULL, has_delivery_attempt_failed INTEGER NOT NULL, "
      "event_count INTEGER NOT NULL, evaluated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS delivery_outcomes_segment_idx ON delivery_outcomes (carrier, service_bucket, zone_bucket, season_bucket);",
      "CREATE TABLE IF NOT EXISTS survival_curves (segment_key TEXT PRIMARY KEY, carrier TEXT NOT NULL, carrier_service TEXT, "
      "service_bucket TEXT NOT NULL, zone_bucket TEXT NOT NULL, season_bucket TEXT NOT NULL, curve_data TEXT NOT NULL, "
      "sample_size INTEGER NOT NULL, delivered_count INTEGER NOT NULL, lost_count INTEGER NOT NULL, censored_count INTEGER NOT NULL, "
      "median_days INTEGER, p75_days INTEGER, p90_days INTEGER, p95_days INTEGER, confidence_level TEXT NOT NULL, "
      "computed_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS survival_curves_lookup_idx ON survival_curves (carrier, service_bucket, zone_bucket);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tracking_snapshots (shipment_id TEXT PRIMARY KEY, tracking_number TEXT, carrier TEXT NOT NULL, "
      "carrier_service TEXT, zone_used INTEGER, destination_state TEXT, destination_country TEXT, in_transit_ms BIGINT, "
      "out_for_delivery_ms BIGINT, delivered_ms BIGINT, delivery_attempt_failed_ms BIGINT, event_log TEXT NOT NULL DEFAULT '{}');",
      "CREATE TABLE IF NOT EXISTS claims (claim_id TEXT PRIMARY KEY, shipment_id TEXT NOT NULL, status TEXT NOT NULL, issue_type TEXT NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS delivery_outcomes (shipment_id TEXT PRIMARY KEY, tracking_number TEXT, carrier TEXT NOT NULL, "
      "carrier_service TEXT, service_bucket TEXT NOT NULL, zone_used INTEGER, zone_bucket TEXT NOT NULL, season_bucket TEXT NOT NULL, "
      "destination_state TEXT, destination_country TEXT, destination_region TEXT, transit_start_ms BIGINT NOT NULL, "
      "transit_start_month SMALLINT NOT NULL, transit_start_week SMALLINT NOT NULL, outcome TEXT NOT NULL, outcome_source TEXT NOT NULL, "
      "outcome_date_ms BIGINT, total_transit_days DOUBLE PRECISION NOT NULL, days_to_out_for_delivery DOUBLE PRECISION, "
      "days_last_mile DOUBLE PRECISION, observed_days DOUBLE PRECISION NOT NULL, is_censored SMALLINT NOT NULL, "
      "has_exception SMALLINT NOT NULL, has_delivery_attempt_failed SMALLINT NOT NULL, event_count INTEGER NOT NULL, "
      "evaluated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS delivery_outcomes_segment_idx ON delivery_outcomes (carrier, service_bucket, zone_bucket, season_bucket);",
      "CREATE TABLE IF NOT EXISTS survival_curves (segment_key TEXT PRIMARY KEY, carrier TEXT NOT NULL, carrier_service TEXT, "
      "service_bucket TEXT NOT NULL, zone_bucket TEXT NOT NULL, season_bucket TEXT NOT NULL, curve_data TEXT NOT NULL, "
      "sample_size BIGINT NOT NULL, delivered_count BIGINT NOT NULL, lost_count BIGINT NOT NULL, censored_count BIGINT NOT NULL, "
      "median_days INTEGER, p75_days INTEGER, p90_days INTEGER, p95_days INTEGER, confidence_level TEXT NOT NULL, "
      "computed_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS survival_curves_lookup_idx ON survival_curves (carrier, service_bucket, zone_bucket);"};
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace deliveryiq::db::sql
