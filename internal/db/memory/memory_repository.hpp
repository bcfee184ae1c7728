#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace market::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using HoldingKey = std::pair<uint64_t, std::string>;

  struct State {
    std::unordered_map<uint64_t, model::ProductRecord> products;
    std::unordered_map<uint64_t, model::RequestRecord> requests;
    std::map<HoldingKey, uint64_t> requested;

    std::optional<std::string> admin;
    std::optional<std::string> fee_destination;

    std::unordered_map<std::string, uint64_t> balances;
    std::map<HoldingKey, uint64_t> holdings;

    uint64_t last_request_id = 0;
    uint64_t last_product_id = 0;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace market::db::memory
