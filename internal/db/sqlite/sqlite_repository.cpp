#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "market/protocol/v1/types.pb.h"

namespace market::db::sqlite {

using market::db::ErrorCode;
using market::db::Result;

namespace {

constexpr const char* kAdminKey           = "admin";
constexpr const char* kFeeDestinationKey  = "fee_destination";
constexpr const char* kRequestCounterKey  = "last_request_id";
constexpr const char* kProductCounterKey  = "last_product_id";

// Finalizes the statement when it goes out of scope.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  const char* error() const {
    return sqlite3_errmsg(db_);
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Reads that cannot report a Result throw instead of pretending the row is absent.
[[noreturn]] void ThrowReadError(sqlite3* db, const char* what) {
  throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  for (const char* sql : sql::SCHEMA_STATEMENTS) {
    db.Exec(sql);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result SqliteRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_PRODUCT);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.producer);
  BindU64(st.get(), 3, r.price);
  BindI32(st.get(), 4, static_cast<int>(r.commission));
  BindI32(st.get(), 5, static_cast<int>(r.type));
  BindText(st.get(), 6, r.destination);
  BindText(st.get(), 7, r.uri);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "product " + std::to_string(r.id) + ": " + sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::ProductRecord> SqliteRepository::GetProduct(Transaction& t, uint64_t product_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_PRODUCT);
  if (!st) ThrowReadError(db, "select product");

  BindU64(st.get(), 1, product_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select product");

  model::ProductRecord r;
  r.id          = ColU64(st.get(), 0);
  r.producer    = ColText(st.get(), 1);
  r.price       = ColU64(st.get(), 2);
  r.commission  = static_cast<uint32_t>(ColI32(st.get(), 3));
  r.type        = static_cast<market::protocol::v1::ProductType>(ColI32(st.get(), 4));
  r.destination = ColText(st.get(), 5);
  r.uri         = ColText(st.get(), 6);
  return r;
}

uint64_t SqliteRepository::NextProductId(Transaction& t) {
  return AdvanceCounter(t, kProductCounterKey);
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

uint64_t SqliteRepository::NextRequestId(Transaction& t) {
  return AdvanceCounter(t, kRequestCounterKey);
}

Result SqliteRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_REQUEST);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.product_id);
  BindText(st.get(), 3, r.publisher);
  BindI32(st.get(), 4, static_cast<int>(r.status));

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "request " + std::to_string(r.id) + ": " + sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::RequestRecord> SqliteRepository::GetRequest(Transaction& t, uint64_t request_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_REQUEST);
  if (!st) ThrowReadError(db, "select request");

  BindU64(st.get(), 1, request_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select request");

  model::RequestRecord r;
  r.id         = ColU64(st.get(), 0);
  r.product_id = ColU64(st.get(), 1);
  r.publisher  = ColText(st.get(), 2);
  r.status     = static_cast<market::protocol::v1::RequestStatus>(ColI32(st.get(), 3));
  return r;
}

Result SqliteRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPDATE_REQUEST);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, r.product_id);
  BindText(st.get(), 2, r.publisher);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindU64(st.get(), 4, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "request " + std::to_string(r.id));
  }
  return Translate(db, rc);
}

Result SqliteRepository::DeleteRequest(Transaction& t, uint64_t request_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_REQUEST);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, request_id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Membership
// ------------------------------------------------------------------

std::optional<uint64_t> SqliteRepository::GetActiveRequest(Transaction& t, uint64_t product_id, const std::string& publisher) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_MEMBERSHIP);
  if (!st) ThrowReadError(db, "select membership");

  BindU64(st.get(), 1, product_id);
  BindText(st.get(), 2, publisher);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select membership");
  return ColU64(st.get(), 0);
}

Result SqliteRepository::MarkRequested(Transaction& t, uint64_t product_id, const std::string& publisher, uint64_t request_id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_MEMBERSHIP);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, product_id);
  BindText(st.get(), 2, publisher);
  BindU64(st.get(), 3, request_id);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "membership already recorded");
  }
  return Translate(db, rc);
}

Result SqliteRepository::ClearRequested(Transaction& t, uint64_t product_id, const std::string& publisher) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_MEMBERSHIP);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, product_id);
  BindText(st.get(), 2, publisher);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Singletons and counters
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetSingleton(Transaction& t, const char* name) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_SINGLETON);
  if (!st) ThrowReadError(db, "select singleton");

  BindText(st.get(), 1, name);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select singleton");
  return ColText(st.get(), 0);
}

Result SqliteRepository::SetSingleton(Transaction& t, const char* name, const std::string& value) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_SINGLETON);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindText(st.get(), 1, name);
  BindText(st.get(), 2, value);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::AdvanceCounter(Transaction& t, const char* name) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::ADVANCE_COUNTER);
  if (!st) ThrowReadError(db, "advance counter");

  BindText(st.get(), 1, name);

  if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowReadError(db, "advance counter");
  return ColU64(st.get(), 0);
}

std::optional<std::string> SqliteRepository::GetAdmin(Transaction& t) {
  return GetSingleton(t, kAdminKey);
}

Result SqliteRepository::SetAdmin(Transaction& t, const std::string& admin) {
  return SetSingleton(t, kAdminKey, admin);
}

std::optional<std::string> SqliteRepository::GetFeeDestination(Transaction& t) {
  return GetSingleton(t, kFeeDestinationKey);
}

Result SqliteRepository::SetFeeDestination(Transaction& t, const std::string& destination) {
  return SetSingleton(t, kFeeDestinationKey, destination);
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

uint64_t SqliteRepository::GetBalance(Transaction& t, const std::string& account) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_BALANCE);
  if (!st) ThrowReadError(db, "select balance");

  BindText(st.get(), 1, account);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return 0;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select balance");
  return ColU64(st.get(), 0);
}

Result SqliteRepository::SetBalance(Transaction& t, const std::string& account, uint64_t amount) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_BALANCE);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindText(st.get(), 1, account);
  BindU64(st.get(), 2, amount);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::GetHolding(Transaction& t, uint64_t product_id, const std::string& owner) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_HOLDING);
  if (!st) ThrowReadError(db, "select holding");

  BindU64(st.get(), 1, product_id);
  BindText(st.get(), 2, owner);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return 0;
  if (rc != SQLITE_ROW) ThrowReadError(db, "select holding");
  return ColU64(st.get(), 0);
}

Result SqliteRepository::SetHolding(Transaction& t, uint64_t product_id, const std::string& owner, uint64_t amount) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_HOLDING);
  if (!st) return Result::Err(ErrorCode::InternalError, st.error());

  BindU64(st.get(), 1, product_id);
  BindText(st.get(), 2, owner);
  BindU64(st.get(), 3, amount);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace market::db::sqlite
