#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/db/model/request_record.hpp"

namespace market::db {

/*
  Repository abstraction (product catalog store + ledger tables).

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - Counters advance atomically with the rest of the transaction
  - A transaction that is not committed leaves no trace

  Only the operator components (access guard, catalog, lifecycle,
  settlement, ledger) open transactions, so they are the only writers.

  The DB is the source of truth for:
    products and affiliate requests
    request membership
    admin / fee destination
    fund balances and asset holdings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Products
  // ---------------------------------------------------------------------

  virtual Result InsertProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual std::optional<model::ProductRecord> GetProduct(Transaction&, uint64_t product_id) = 0;

  // Last id handed out by the minting collaborator, then advanced by one.
  virtual uint64_t NextProductId(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Affiliate requests
  // ---------------------------------------------------------------------

  // Monotonic: returns last request id + 1 and records it. First id is 1.
  virtual uint64_t NextRequestId(Transaction&) = 0;

  virtual Result InsertRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual std::optional<model::RequestRecord> GetRequest(Transaction&, uint64_t request_id) = 0;

  virtual Result UpdateRequest(Transaction&, const model::RequestRecord&) = 0;

  virtual Result DeleteRequest(Transaction&, uint64_t request_id) = 0;

  // ---------------------------------------------------------------------
  // Request membership (one active request per product/publisher pair)
  // ---------------------------------------------------------------------

  // Id of the request currently holding the pair, if any.
  virtual std::optional<uint64_t> GetActiveRequest(Transaction&, uint64_t product_id, const std::string& publisher) = 0;

  // AlreadyExists when the pair is already held.
  virtual Result MarkRequested(Transaction&, uint64_t product_id, const std::string& publisher, uint64_t request_id) = 0;

  virtual Result ClearRequested(Transaction&, uint64_t product_id, const std::string& publisher) = 0;

  // ---------------------------------------------------------------------
  // Singletons
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetAdmin(Transaction&) = 0;

  virtual Result SetAdmin(Transaction&, const std::string& admin) = 0;

  virtual std::optional<std::string> GetFeeDestination(Transaction&) = 0;

  virtual Result SetFeeDestination(Transaction&, const std::string& destination) = 0;

  // ---------------------------------------------------------------------
  // Ledger tables
  // ---------------------------------------------------------------------

  // Missing accounts read as zero.
  virtual uint64_t GetBalance(Transaction&, const std::string& account) = 0;

  virtual Result SetBalance(Transaction&, const std::string& account, uint64_t amount) = 0;

  virtual uint64_t GetHolding(Transaction&, uint64_t product_id, const std::string& owner) = 0;

  virtual Result SetHolding(Transaction&, uint64_t product_id, const std::string& owner, uint64_t amount) = 0;
};

} // namespace market::db
