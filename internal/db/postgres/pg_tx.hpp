#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace market::db::postgres {

// Holds a pooled connection for the lifetime of one pqxx::work.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *work_;
  }

 private:
  void DoCommit() override;
  void DoRollback() override;

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace market::db::postgres
