#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "internal/model/principal.hpp"
#include "internal/service/service_context.hpp"
#include "market/protocol/v1.hpp"

namespace market::service {

/*
  Public operation surface.

  Every call runs under one operation mutex, so operations are totally
  ordered. Failures are logged and rethrown as util:: exceptions; map them
  with util::ToErrorCode.
*/

class MarketService {
 public:
  explicit MarketService(ServiceContext ctx);

  // Access control
  void             SetAdmin(const model::InvocationContext& ctx, const model::Principal& new_admin);
  void             SetFeeDestination(const model::InvocationContext& ctx, const model::Principal& new_destination);
  model::Principal GetAdmin();
  model::Principal GetFeeDestination();

  // Catalog
  uint64_t CreateProduct(const model::InvocationContext& ctx, const model::Principal& producer,
                         const market::protocol::v1::ProductMetadata& metadata);

  std::optional<market::protocol::v1::ProductDescriptor> GetProduct(uint64_t product_id);
  std::optional<model::Principal>                         GetProducer(uint64_t product_id);
  std::optional<uint64_t>                                 GetPrice(uint64_t product_id);
  std::optional<uint32_t>                                 GetCommission(uint64_t product_id);
  std::optional<market::protocol::v1::ProductType>        GetType(uint64_t product_id);
  std::optional<model::Principal>                         GetDestination(uint64_t product_id);

  // Affiliate requests
  uint64_t CreateRequest(const model::InvocationContext& ctx, uint64_t product_id, const model::Principal& publisher);
  uint64_t CancelRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& publisher);
  uint64_t AcceptRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer);
  uint64_t RejectRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer);

  std::optional<market::protocol::v1::AffiliateRequest> GetRequest(uint64_t request_id);

  // Settlement
  market::protocol::v1::PurchaseReceipt Purchase(const model::InvocationContext& ctx, const model::Principal& purchaser,
                                                 const std::string& shop, const market::protocol::v1::Cart& cart);

  // Ledger helpers. Deposit credits funds from outside the marketplace.
  uint64_t Deposit(const model::Principal& account, uint64_t amount);
  uint64_t BalanceOf(const model::Principal& account);
  uint64_t HoldingOf(uint64_t product_id, const model::Principal& owner);

 private:
  ServiceContext ctx_;
  std::mutex     operation_mutex_;
};

} // namespace market::service
