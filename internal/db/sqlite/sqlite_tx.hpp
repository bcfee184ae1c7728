#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace market::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front. Only one transaction
  may be open per connection; a second Begin() throws.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

 private:
  void DoCommit() override;
  void DoRollback() override;

  std::shared_ptr<SqliteDB> db_;
};

} // namespace market::db::sqlite
