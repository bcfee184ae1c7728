#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace market::db::sqlite {

namespace {

constexpr int kOpenFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("sqlite path must not be empty");
  }

  const int rc = sqlite3_open_v2(options_.path.c_str(), &db_, kOpenFlags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite store " + options_.path + ": " + reason);
  }

  try {
    ApplyPragmas();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  std::string reason = err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw std::runtime_error("sqlite: " + reason);
}

void SqliteDB::ApplyPragmas() {
  if (sqlite3_busy_timeout(db_, options_.busy_timeout_ms) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // Without WAL every commit is synced to disk.
  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;" : "PRAGMA synchronous=FULL;");
}

} // namespace market::db::sqlite
