#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace market::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the tables if they do not exist yet.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProduct(Transaction&, const model::ProductRecord&) override;
  std::optional<model::ProductRecord> GetProduct(Transaction&, uint64_t product_id) override;
  uint64_t NextProductId(Transaction&) override;

  uint64_t NextRequestId(Transaction&) override;
  Result InsertRequest(Transaction&, const model::RequestRecord&) override;
  std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t request_id) override;
  Result UpdateRequest(Transaction&, const model::RequestRecord&) override;
  Result DeleteRequest(Transaction&, uint64_t request_id) override;

  std::optional<uint64_t> GetActiveRequest(Transaction&, uint64_t product_id, const std::string& publisher) override;
  Result MarkRequested(Transaction&, uint64_t product_id, const std::string& publisher, uint64_t request_id) override;
  Result ClearRequested(Transaction&, uint64_t product_id, const std::string& publisher) override;

  std::optional<std::string> GetAdmin(Transaction&) override;
  Result SetAdmin(Transaction&, const std::string& admin) override;
  std::optional<std::string> GetFeeDestination(Transaction&) override;
  Result SetFeeDestination(Transaction&, const std::string& destination) override;

  uint64_t GetBalance(Transaction&, const std::string& account) override;
  Result SetBalance(Transaction&, const std::string& account, uint64_t amount) override;
  uint64_t GetHolding(Transaction&, uint64_t product_id, const std::string& owner) override;
  Result SetHolding(Transaction&, uint64_t product_id, const std::string& owner, uint64_t amount) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::optional<std::string> GetSingleton(Transaction&, const char* name);
  Result SetSingleton(Transaction&, const char* name, const std::string& value);
  uint64_t AdvanceCounter(Transaction&, const char* name);
};

}
