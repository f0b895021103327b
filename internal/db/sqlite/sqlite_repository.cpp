#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace deliveryiq::db::sqlite {

using deliveryiq::db::ErrorCode;
using deliveryiq::db::Result;

namespace {

constexpr auto kDialect = sql::Dialect::kSqlite;

class StatementRow final : public sql::Row {
 public:
  explicit StatementRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st_, col))) : std::string();
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const sql::Query& query) {
    if (sqlite3_prepare_v2(db, query.text.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
      return;
    }

    int idx = 1;
    for (const auto& param : query.params) {
      std::visit(
          [this, idx](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
              sqlite3_bind_null(st_, idx);
            } else if constexpr (std::is_same_v<T, int64_t>) {
              sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(value));
            } else if constexpr (std::is_same_v<T, double>) {
              sqlite3_bind_double(st_, idx, value);
            } else {
              sqlite3_bind_text(st_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
            }
          },
          param);
      ++idx;
    }
  }

  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result Execute(sqlite3* db, const sql::Query& query) {
  Statement st(db, query);
  if (!st.get()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

template <typename Fn>
void ForEachRow(sqlite3* db, const sql::Query& query, Fn&& fn) {
  Statement st(db, query);
  if (!st.get()) {
    throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }

  StatementRow row(st.get());
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return;
    if (rc != SQLITE_ROW) {
      throw util::StorageError(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    fn(row);
  }
}

template <typename Record, typename Read>
std::vector<Record> Collect(sqlite3* db, const sql::Query& query, Read&& read) {
  std::vector<Record> out;
  ForEachRow(db, query, [&](const sql::Row& row) { out.push_back(read(row)); });
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Tracking snapshots
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTrackingSnapshot(Transaction& t, const model::TrackingSnapshotRecord& r) {
  if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
  return Execute(TX(t).Handle(), sql::UpsertSnapshot(kDialect, r));
}

std::vector<model::TrackingSnapshotRecord> SqliteRepository::ListInTransitSnapshots(Transaction& t, const PageRequest& page) {
  return Collect<model::TrackingSnapshotRecord>(TX(t).Handle(), sql::ListInTransitSnapshots(kDialect, page), sql::ReadSnapshot);
}

std::vector<model::TrackingSnapshotRecord> SqliteRepository::GetTrackingSnapshots(Transaction& t, const std::vector<std::string>& ids) {
  if (ids.empty()) return {};
  return Collect<model::TrackingSnapshotRecord>(TX(t).Handle(), sql::GetSnapshots(kDialect, ids), sql::ReadSnapshot);
}

// ------------------------------------------------------------------
// Claims
// ------------------------------------------------------------------

Result SqliteRepository::UpsertClaim(Transaction& t, const model::ClaimRecord& r) {
  if (r.claim_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "claim_id is required");
  return Execute(TX(t).Handle(), sql::UpsertClaim(kDialect, r));
}

std::vector<model::ClaimRecord> SqliteRepository::ListClaims(Transaction& t, const PageRequest& page) {
  return Collect<model::ClaimRecord>(TX(t).Handle(), sql::ListClaims(kDialect, page), sql::ReadClaim);
}

// ------------------------------------------------------------------
// Outcomes
// ------------------------------------------------------------------

Result SqliteRepository::UpsertOutcomes(Transaction& t, const std::vector<model::OutcomeRecord>& records) {
  auto* db = TX(t).Handle();
  for (const auto& r : records) {
    if (r.shipment_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "shipment_id is required");
    auto result = Execute(db, sql::UpsertOutcome(kDialect, r));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::OutcomeRecord> SqliteRepository::GetOutcomes(Transaction& t, const std::vector<std::string>& ids) {
  if (ids.empty()) return {};
  return Collect<model::OutcomeRecord>(TX(t).Handle(), sql::GetOutcomes(kDialect, ids), sql::ReadOutcome);
}

std::vector<model::OutcomeRecord> SqliteRepository::ListOutcomes(Transaction& t, const OutcomeFilter& filter, const PageRequest& page) {
  return Collect<model::OutcomeRecord>(TX(t).Handle(), sql::ListOutcomes(kDialect, filter, page), sql::ReadOutcome);
}

uint64_t SqliteRepository::CountOutcomes(Transaction& t, const OutcomeFilter& filter) {
  uint64_t count = 0;
  ForEachRow(TX(t).Handle(), sql::CountOutcomes(kDialect, filter), [&count](const sql::Row& row) { count = row.GetU64(0); });
  return count;
}

// ------------------------------------------------------------------
// Survival curves
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceSurvivalCurve(Transaction& t, const model::SurvivalCurveRecord& r) {
  auto* db     = TX(t).Handle();
  auto  result = Execute(db, sql::DeleteCurve(kDialect, r.key));
  if (!result) return result;
  return Execute(db, sql::InsertCurve(kDialect, r));
}

std::vector<model::SurvivalCurveRecord> SqliteRepository::FindSurvivalCurves(Transaction& t, const CurveFilter& filter) {
  return Collect<model::SurvivalCurveRecord>(TX(t).Handle(), sql::FindCurves(kDialect, filter), sql::ReadCurve);
}

std::vector<model::SurvivalCurveRecord> SqliteRepository::ListSurvivalCurves(Transaction& t, const PageRequest& page) {
  return Collect<model::SurvivalCurveRecord>(TX(t).Handle(), sql::ListCurves(kDialect, page), sql::ReadCurve);
}

} // namespace deliveryiq::db::sqlite
