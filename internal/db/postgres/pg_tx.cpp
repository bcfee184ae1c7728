#include "pg_tx.hpp"

namespace market::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  AbandonIfOpen();
  // The work must end before its connection returns to the pool.
  work_.reset();
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace market::db::postgres
