#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace market::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.products.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "product " + std::to_string(r.id));
  s.products[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProductRecord> MemoryRepository::GetProduct(Transaction& t, uint64_t product_id) {
  const auto& s  = TX(t).View();
  auto        it = s.products.find(product_id);
  if (it == s.products.end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::NextProductId(Transaction& t) {
  return ++TX(t).Mutable().last_product_id;
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

uint64_t MemoryRepository::NextRequestId(Transaction& t) {
  return ++TX(t).Mutable().last_request_id;
}

Result MemoryRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.requests.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "request " + std::to_string(r.id));
  s.requests[r.id] = r;
  return Result::Ok();
}

std::optional<model::RequestRecord> MemoryRepository::GetRequest(Transaction& t, uint64_t request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.requests.find(request_id);
  if (it == s.requests.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.requests.contains(r.id)) return Result::Err(ErrorCode::NotFound, "request " + std::to_string(r.id));
  s.requests[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteRequest(Transaction& t, uint64_t request_id) {
  TX(t).Mutable().requests.erase(request_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Membership
// ------------------------------------------------------------------

std::optional<uint64_t> MemoryRepository::GetActiveRequest(Transaction& t, uint64_t product_id, const std::string& publisher) {
  const auto& requested = TX(t).View().requested;
  auto        it        = requested.find({product_id, publisher});
  if (it == requested.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryRepository::MarkRequested(Transaction& t, uint64_t product_id, const std::string& publisher, uint64_t request_id) {
  auto& s = TX(t).Mutable();
  if (!s.requested.emplace(HoldingKey{product_id, publisher}, request_id).second) {
    return Result::Err(ErrorCode::AlreadyExists, "membership already recorded");
  }
  return Result::Ok();
}

Result MemoryRepository::ClearRequested(Transaction& t, uint64_t product_id, const std::string& publisher) {
  TX(t).Mutable().requested.erase({product_id, publisher});
  return Result::Ok();
}

// ------------------------------------------------------------------
// Singletons
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetAdmin(Transaction& t) {
  return TX(t).View().admin;
}

Result MemoryRepository::SetAdmin(Transaction& t, const std::string& admin) {
  TX(t).Mutable().admin = admin;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetFeeDestination(Transaction& t) {
  return TX(t).View().fee_destination;
}

Result MemoryRepository::SetFeeDestination(Transaction& t, const std::string& destination) {
  TX(t).Mutable().fee_destination = destination;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

uint64_t MemoryRepository::GetBalance(Transaction& t, const std::string& account) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find(account);
  return it == s.balances.end() ? 0 : it->second;
}

Result MemoryRepository::SetBalance(Transaction& t, const std::string& account, uint64_t amount) {
  TX(t).Mutable().balances[account] = amount;
  return Result::Ok();
}

uint64_t MemoryRepository::GetHolding(Transaction& t, uint64_t product_id, const std::string& owner) {
  const auto& s  = TX(t).View();
  auto        it = s.holdings.find({product_id, owner});
  return it == s.holdings.end() ? 0 : it->second;
}

Result MemoryRepository::SetHolding(Transaction& t, uint64_t product_id, const std::string& owner, uint64_t amount) {
  TX(t).Mutable().holdings[{product_id, owner}] = amount;
  return Result::Ok();
}

} // namespace market::db::memory
