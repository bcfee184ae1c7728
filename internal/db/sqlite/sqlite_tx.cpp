#include "sqlite_tx.hpp"

#include <utility>

namespace market::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  AbandonIfOpen();
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
}

void SqliteTransaction::DoRollback() {
  db_->Exec("ROLLBACK;");
}

} // namespace market::db::sqlite
