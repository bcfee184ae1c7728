#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/asset_ledger.hpp"
#include "internal/model/principal.hpp"
#include "market/protocol/v1.hpp"

namespace market::catalog {

/*
  Product listings.

  Products are immutable once created. Creation mints the product asset
  and stores its attributes in one transaction.
*/

class ProductCatalog {
 public:
  ProductCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::AssetLedger> ledger);

  uint64_t CreateProduct(const model::InvocationContext& ctx, const model::Principal& producer,
                         const market::protocol::v1::ProductMetadata& metadata);

  std::optional<market::protocol::v1::ProductDescriptor> GetProduct(uint64_t product_id);
  std::optional<model::Principal>                         GetProducer(uint64_t product_id);
  std::optional<uint64_t>                                 GetPrice(uint64_t product_id);
  std::optional<uint32_t>                                 GetCommission(uint64_t product_id);
  std::optional<market::protocol::v1::ProductType>        GetType(uint64_t product_id);
  std::optional<model::Principal>                         GetDestination(uint64_t product_id);

  static market::protocol::v1::ProductDescriptor ToDescriptor(const db::model::ProductRecord& record);

 private:
  std::optional<db::model::ProductRecord> Find(uint64_t product_id);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<ledger::AssetLedger> ledger_;
};

} // namespace market::catalog
