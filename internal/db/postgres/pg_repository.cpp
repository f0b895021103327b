#include "pg_repository.hpp"

#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::db::postgres {

namespace {

constexpr auto kDialect = sql::Dialect::kPostgres;

class PqxxRow final : public sql::Row {
 public:
  explicit PqxxRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : std::string(row_[col].c_str());
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].as<double>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

pqxx::params ToParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&out](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result Execute(pqxx::work& work, const sql::Query& query) {
  try {
    work.exec_params(query.text, ToParams(query.params));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

pqxx::result Select(pqxx::work& work, const sql::Query& query) {
  try {
    return work.exec_params(query.text, ToParams(query.params));
  } catch (const pqxx::failure& e) {
    throw util::StorageError(std::string("postgres query failed: ") + e.what());
  }
}

template <typename Record, typename Read>
std::vector<Record> Collect(pqxx::work& work, const sql::Query& query, Read&& read) {
  const auto          res = Select(work, query);
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(PqxxRow(row)));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

// ------------------------------------------------------------------
// Tracking snapshots
// ------------------------------------------------------------------

Result PgRepository::UpsertTrackingSnapshot(Transaction& t, const model::TrackingSnapshotRecord& r) {
  if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
  return Execute(TX(t).Work(), sql::UpsertSnapshot(kDialect, r));
}

std::vector<model::TrackingSnapshotRecord> PgRepository::ListInTransitSnapshots(Transaction& t, const PageRequest& page) {
  return Collect<model::TrackingSnapshotRecord>(TX(t).Work(), sql::ListInTransitSnapshots(kDialect, page), sql::ReadSnapshot);
}

std::vector<model::TrackingSnapshotRecord> PgRepository::GetTrackingSnapshots(Transaction& t, const std::vector<std::string>& ids) {
  if (ids.empty()) return {};
  return Collect<model::TrackingSnapshotRecord>(TX(t).Work(), sql::GetSnapshots(kDialect, ids), sql::ReadSnapshot);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result PgRepository::UpsertClaim(Transaction& t, const model::ClaimRecord& r) {
  if (r.claim_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim_id is required");
  return Execute(TX(t).Work(), sql::UpsertClaim(kDialect, r));
}

std::vector<model::ClaimRecord> PgRepository::ListClaims(Transaction& t, const PageRequest& page) {
  return Collect<model::ClaimRecord>(TX(t).Work(), sql::ListClaims(kDialect, page), sql::ReadClaim);
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Result PgRepository::UpsertOutcomes(Transaction& t, const std::vector<model::OutcomeRecord>& records) {
  for (const auto& r : records) {
    if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
    auto result = Execute(TX(t).Work(), sql::UpsertOutcome(kDialect, r));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::OutcomeRecord> PgRepository::GetOutcomes(Transaction& t, const std::vector<std::string>& ids) {
  if (ids.empty()) return {};
  return Collect<model::OutcomeRecord>(TX(t).Work(), sql::GetOutcomes(kDialect, ids), sql::ReadOutcome);
}

std::vector<model::OutcomeRecord> PgRepository::ListOutcomes(Transaction& t, const OutcomeFilter& filter, const PageRequest& page) {
  return Collect<model::OutcomeRecord>(TX(t).Work(), sql::ListOutcomes(kDialect, filter, page), sql::ReadOutcome);
}

uint64_t PgRepository::CountOutcomes(Transaction& t, const OutcomeFilter& filter) {
  const auto res = Select(TX(t).Work(), sql::CountOutcomes(kDialect, filter));
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Survival curves
// ------------------------------------------------------------------

Result PgRepository::ReplaceSurvivalCurve(Transaction& t, const model::SurvivalCurveRecord& r) {
  auto result = Execute(TX(t).Work(), sql::DeleteCurve(kDialect, r.key));
  if (!result) return result;
  return Execute(TX(t).Work(), sql::InsertCurve(kDialect, r));
}

std::vector<model::SurvivalCurveRecord> PgRepository::FindSurvivalCurves(Transaction& t, const CurveFilter& filter) {
  return Collect<model::SurvivalCurveRecord>(TX(t).Work(), sql::FindCurves(kDialect, filter), sql::ReadCurve);
}

std::vector<model::SurvivalCurveRecord> PgRepository::ListSurvivalCurves(Transaction& t, const PageRequest& page) {
  return Collect<model::SurvivalCurveRecord>(TX(t).Work(), sql::ListCurves(kDialect, page), sql::ReadCurve);
}

} // namespace deliveryiq::db::postgres
