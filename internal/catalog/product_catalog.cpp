#include "product_catalog.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/db_error.hpp"
#include "internal/model/product_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/settlement/settlement_split.hpp"
#include "internal/util/errors.hpp"

namespace market::catalog {

using namespace market::protocol::v1;
using market::observability::StringField;
using market::observability::UIntField;

namespace {

constexpr uint32_t kMaxCommission = 100;

void ValidateMetadata(const ProductMetadata& metadata) {
  if (metadata.price() < 1) {
    throw util::ValidationError("price must be at least 1");
  }
  if (metadata.price() > settlement::kMaxPrice) {
    throw util::ValidationError("price " + std::to_string(metadata.price()) + " exceeds " + std::to_string(settlement::kMaxPrice));
  }
  if (metadata.commission() > kMaxCommission) {
    throw util::ValidationError("commission " + std::to_string(metadata.commission()) + " exceeds " + std::to_string(kMaxCommission));
  }
  if (!model::IsValidProductType(metadata.type())) {
    throw util::ValidationError("unknown product type " + std::to_string(static_cast<int>(metadata.type())));
  }
}

} // namespace

ProductCatalog::ProductCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<ledger::AssetLedger> ledger)
    : repository_(std::move(repository)), ledger_(std::move(ledger)) {
  if (!repository_ || !ledger_) {
    throw std::invalid_argument("ProductCatalog requires a repository and a ledger");
  }
}

uint64_t ProductCatalog::CreateProduct(const model::InvocationContext& ctx, const model::Principal& producer, const ProductMetadata& metadata) {
  if (ctx.caller != producer) {
    throw util::AuthorizationError("caller " + ctx.caller + " cannot create products for " + producer);
  }
  ValidateMetadata(metadata);

  const auto& recipient = metadata.recipient().empty() ? producer : metadata.recipient();

  auto tx = repository_->Begin();

  db::model::ProductRecord record;
  record.id          = ledger_->Mint(*tx, recipient, metadata.amount());
  record.producer    = producer;
  record.price       = metadata.price();
  record.commission  = metadata.commission();
  record.type        = metadata.type();
  record.destination = metadata.destination().empty() ? producer : metadata.destination();
  record.uri         = metadata.uri();

  db::ThrowIfDbError(repository_->InsertProduct(*tx, record), "insert product " + std::to_string(record.id));
  tx->Commit();

  MARKET_LOG_INFO("product created", {UIntField("product_id", record.id), StringField("producer", producer),
                                      UIntField("price", record.price), UIntField("commission", record.commission),
                                      StringField("type", model::ToString(record.type)), UIntField("minted", metadata.amount())});
  return record.id;
}

ProductDescriptor ProductCatalog::ToDescriptor(const db::model::ProductRecord& record) {
  ProductDescriptor descriptor;
  descriptor.set_product_id(record.id);
  descriptor.set_producer(record.producer);
  descriptor.set_price(record.price);
  descriptor.set_commission(record.commission);
  descriptor.set_type(record.type);
  descriptor.set_destination(record.destination);
  descriptor.set_uri(record.uri);
  return descriptor;
}

std::optional<db::model::ProductRecord> ProductCatalog::Find(uint64_t product_id) {
  auto tx = repository_->Begin();
  return repository_->GetProduct(*tx, product_id);
}

std::optional<ProductDescriptor> ProductCatalog::GetProduct(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return ToDescriptor(*record);
}

std::optional<model::Principal> ProductCatalog::GetProducer(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return record->producer;
}

std::optional<uint64_t> ProductCatalog::GetPrice(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return record->price;
}

std::optional<uint32_t> ProductCatalog::GetCommission(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return record->commission;
}

std::optional<ProductType> ProductCatalog::GetType(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return record->type;
}

std::optional<model::Principal> ProductCatalog::GetDestination(uint64_t product_id) {
  auto record = Find(product_id);
  if (!record) {
    return std::nullopt;
  }
  return record->destination;
}

} // namespace market::catalog
