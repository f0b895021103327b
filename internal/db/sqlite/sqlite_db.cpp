#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace deliveryiq::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  for (auto* reader : idle_readers_) {
    sqlite3_close(reader);
  }
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  Exec(db_, sql);
}

void SqliteDB::Exec(sqlite3* handle, const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(handle, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while a writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

std::shared_ptr<sqlite3> SqliteDB::AcquireReader() {
  if (path_.empty() || path_ == ":memory:" || path_.rfind("file::memory:", 0) == 0) {
    return nullptr;
  }

  sqlite3* reader = nullptr;
  {
    std::scoped_lock lock(readers_mutex_);
    if (!idle_readers_.empty()) {
      reader = idle_readers_.back();
      idle_readers_.pop_back();
    }
  }

  if (reader == nullptr) {
    int rc = sqlite3_open_v2(path_.c_str(), &reader, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
      std::string msg = reader ? sqlite3_errmsg(reader) : "sqlite open failed";
      if (reader) sqlite3_close(reader);
      throw util::StorageError("sqlite open reader " + path_ + ": " + msg);
    }
    if (sqlite3_busy_timeout(reader, 5000) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(reader);
      sqlite3_close(reader);
      throw util::StorageError("busy_timeout: " + msg);
    }
  }

  // the owning transaction keeps this SqliteDB alive past the reader
  return std::shared_ptr<sqlite3>(reader, [this](sqlite3* released) { ReleaseReader(released); });
}

void SqliteDB::ReleaseReader(sqlite3* reader) {
  std::scoped_lock lock(readers_mutex_);
  idle_readers_.push_back(reader);
}

} // namespace deliveryiq::db::sqlite
