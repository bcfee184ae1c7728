#include "market_service.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

#include "internal/access/access_guard.hpp"
#include "internal/catalog/product_catalog.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ledger/asset_ledger.hpp"
#include "internal/lifecycle/request_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/settlement/settlement_engine.hpp"
#include "internal/util/error_code.hpp"

namespace market::service {

using namespace market::protocol::v1;

namespace {

template <typename Fn>
auto ObserveOperation(std::string_view operation, const model::Principal* caller, Fn&& fn) {
  market::observability::SpanScope      span(operation);
  market::observability::OperationTimer timer(operation);
  if (caller) {
    span.SetAttribute("market.caller", *caller);
  }

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      timer.Succeed();
    } else {
      auto result = fn();
      timer.Succeed();
      return result;
    }
  } catch (const std::exception& ex) {
    const auto code = market::util::ToErrorCode(ex);
    span.RecordException(ex.what());
    span.SetAttribute("market.error_code", static_cast<std::int64_t>(code));
    MARKET_LOG_ERROR("operation failed", {market::observability::StringField("operation", operation),
                                          market::observability::StringField("error", ex.what()),
                                          market::observability::StringField("error_code", ErrorCode_Name(code)),
                                          market::observability::StringField("caller", caller ? *caller : "")});
    throw;
  }
}

} // namespace

MarketService::MarketService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository || !ctx_.ledger || !ctx_.access || !ctx_.catalog || !ctx_.lifecycle || !ctx_.settlement) {
    throw std::invalid_argument("MarketService requires a fully wired ServiceContext");
  }
}

void MarketService::SetAdmin(const model::InvocationContext& ctx, const model::Principal& new_admin) {
  std::lock_guard lock(operation_mutex_);
  ObserveOperation("MarketService.SetAdmin", &ctx.caller, [&] { ctx_.access->SetAdmin(ctx, new_admin); });
}

void MarketService::SetFeeDestination(const model::InvocationContext& ctx, const model::Principal& new_destination) {
  std::lock_guard lock(operation_mutex_);
  ObserveOperation("MarketService.SetFeeDestination", &ctx.caller, [&] { ctx_.access->SetFeeDestination(ctx, new_destination); });
}

model::Principal MarketService::GetAdmin() {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetAdmin", nullptr, [&] { return ctx_.access->GetAdmin(); });
}

model::Principal MarketService::GetFeeDestination() {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetFeeDestination", nullptr, [&] { return ctx_.access->GetFeeDestination(); });
}

uint64_t MarketService::CreateProduct(const model::InvocationContext& ctx, const model::Principal& producer, const ProductMetadata& metadata) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.CreateProduct", &ctx.caller, [&] { return ctx_.catalog->CreateProduct(ctx, producer, metadata); });
}

std::optional<ProductDescriptor> MarketService::GetProduct(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetProduct", nullptr, [&] { return ctx_.catalog->GetProduct(product_id); });
}

std::optional<model::Principal> MarketService::GetProducer(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetProducer", nullptr, [&] { return ctx_.catalog->GetProducer(product_id); });
}

std::optional<uint64_t> MarketService::GetPrice(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetPrice", nullptr, [&] { return ctx_.catalog->GetPrice(product_id); });
}

std::optional<uint32_t> MarketService::GetCommission(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetCommission", nullptr, [&] { return ctx_.catalog->GetCommission(product_id); });
}

std::optional<ProductType> MarketService::GetType(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetType", nullptr, [&] { return ctx_.catalog->GetType(product_id); });
}

std::optional<model::Principal> MarketService::GetDestination(uint64_t product_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetDestination", nullptr, [&] { return ctx_.catalog->GetDestination(product_id); });
}

uint64_t MarketService::CreateRequest(const model::InvocationContext& ctx, uint64_t product_id, const model::Principal& publisher) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.CreateRequest", &ctx.caller, [&] { return ctx_.lifecycle->CreateRequest(ctx, product_id, publisher); });
}

uint64_t MarketService::CancelRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& publisher) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.CancelRequest", &ctx.caller, [&] { return ctx_.lifecycle->CancelRequest(ctx, request_id, publisher); });
}

uint64_t MarketService::AcceptRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.AcceptRequest", &ctx.caller, [&] { return ctx_.lifecycle->AcceptRequest(ctx, request_id, producer); });
}

uint64_t MarketService::RejectRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.RejectRequest", &ctx.caller, [&] { return ctx_.lifecycle->RejectRequest(ctx, request_id, producer); });
}

std::optional<AffiliateRequest> MarketService::GetRequest(uint64_t request_id) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.GetRequest", nullptr, [&] { return ctx_.lifecycle->GetRequest(request_id); });
}

PurchaseReceipt MarketService::Purchase(const model::InvocationContext& ctx, const model::Principal& purchaser, const std::string& shop,
                                        const Cart& cart) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.Purchase", &ctx.caller, [&] { return ctx_.settlement->Purchase(ctx, purchaser, shop, cart); });
}

uint64_t MarketService::Deposit(const model::Principal& account, uint64_t amount) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.Deposit", nullptr, [&] {
    auto tx = ctx_.repository->Begin();
    ctx_.ledger->Deposit(*tx, account, amount);
    const auto balance = ctx_.ledger->BalanceOf(*tx, account);
    tx->Commit();
    return balance;
  });
}

uint64_t MarketService::BalanceOf(const model::Principal& account) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.BalanceOf", nullptr, [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.ledger->BalanceOf(*tx, account);
  });
}

uint64_t MarketService::HoldingOf(uint64_t product_id, const model::Principal& owner) {
  std::lock_guard lock(operation_mutex_);
  return ObserveOperation("MarketService.HoldingOf", nullptr, [&] {
    auto tx = ctx_.repository->Begin();
    return ctx_.ledger->HoldingOf(*tx, product_id, owner);
  });
}

} // namespace market::service
