#include "pg_repository.hpp"

#include <cstdint>
#include <utility>

#include "market/protocol/v1/types.pb.h"

namespace market::db::postgres {

namespace {

constexpr const char* kAdminKey          = "admin";
constexpr const char* kFeeDestinationKey = "fee_destination";
constexpr const char* kRequestCounterKey = "last_request_id";
constexpr const char* kProductCounterKey = "last_product_id";

// BIGINT columns are signed; uint64 values round-trip through int64.
int64_t ToDb(uint64_t v) {
  return static_cast<int64_t>(v);
}

uint64_t FromDb(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

// Runs an insert in a savepoint so a unique violation leaves the outer
// transaction usable.
template <typename... Args>
void InsertInSavepoint(pqxx::work& work, const char* statement, Args&&... args) {
  pqxx::subtransaction savepoint(work, "insert");
  savepoint.exec_prepared(statement, std::forward<Args>(args)...);
  savepoint.commit();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  try {
    InsertInSavepoint(TX(t).Work(), "insert_product", ToDb(r.id), r.producer, ToDb(r.price), static_cast<int>(r.commission),
                      static_cast<int>(r.type), r.destination, r.uri);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProductRecord> PgRepository::GetProduct(Transaction& t, uint64_t product_id) {
  auto res = TX(t).Work().exec_prepared("get_product", ToDb(product_id));
  if (res.empty()) return std::nullopt;

  model::ProductRecord r;
  r.id          = FromDb(res[0][0]);
  r.producer    = res[0][1].c_str();
  r.price       = FromDb(res[0][2]);
  r.commission  = static_cast<uint32_t>(res[0][3].as<int>());
  r.type        = static_cast<market::protocol::v1::ProductType>(res[0][4].as<int>());
  r.destination = res[0][5].c_str();
  r.uri         = res[0][6].is_null() ? "" : res[0][6].c_str();
  return r;
}

uint64_t PgRepository::NextProductId(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("advance_counter", std::string(kProductCounterKey));
  return FromDb(res[0][0]);
}

uint64_t PgRepository::NextRequestId(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("advance_counter", std::string(kRequestCounterKey));
  return FromDb(res[0][0]);
}

Result PgRepository::InsertRequest(Transaction& t, const model::RequestRecord& r) {
  try {
    InsertInSavepoint(TX(t).Work(), "insert_request", ToDb(r.id), ToDb(r.product_id), r.publisher, static_cast<int>(r.status));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RequestRecord> PgRepository::GetRequest(Transaction& t, uint64_t request_id) {
  auto res = TX(t).Work().exec_prepared("get_request", ToDb(request_id));
  if (res.empty()) return std::nullopt;

  model::RequestRecord r;
  r.id         = FromDb(res[0][0]);
  r.product_id = FromDb(res[0][1]);
  r.publisher  = res[0][2].c_str();
  r.status     = static_cast<market::protocol::v1::RequestStatus>(res[0][3].as<int>());
  return r;
}

Result PgRepository::UpdateRequest(Transaction& t, const model::RequestRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_request", ToDb(r.id), ToDb(r.product_id), r.publisher, static_cast<int>(r.status));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "request " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRequest(Transaction& t, uint64_t request_id) {
  try {
    TX(t).Work().exec_prepared("delete_request", ToDb(request_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<uint64_t> PgRepository::GetActiveRequest(Transaction& t, uint64_t product_id, const std::string& publisher) {
  auto res = TX(t).Work().exec_prepared("get_membership", ToDb(product_id), publisher);
  if (res.empty()) {
    return std::nullopt;
  }
  return FromDb(res[0][0]);
}

Result PgRepository::MarkRequested(Transaction& t, uint64_t product_id, const std::string& publisher, uint64_t request_id) {
  try {
    InsertInSavepoint(TX(t).Work(), "insert_membership", ToDb(product_id), publisher, ToDb(request_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ClearRequested(Transaction& t, uint64_t product_id, const std::string& publisher) {
  try {
    TX(t).Work().exec_prepared("delete_membership", ToDb(product_id), publisher);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetAdmin(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_singleton", std::string(kAdminKey));
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::SetAdmin(Transaction& t, const std::string& admin) {
  try {
    TX(t).Work().exec_prepared("upsert_singleton", std::string(kAdminKey), admin);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::GetFeeDestination(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_singleton", std::string(kFeeDestinationKey));
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::SetFeeDestination(Transaction& t, const std::string& destination) {
  try {
    TX(t).Work().exec_prepared("upsert_singleton", std::string(kFeeDestinationKey), destination);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::GetBalance(Transaction& t, const std::string& account) {
  auto res = TX(t).Work().exec_prepared("get_balance", account);
  return res.empty() ? 0 : FromDb(res[0][0]);
}

Result PgRepository::SetBalance(Transaction& t, const std::string& account, uint64_t amount) {
  try {
    TX(t).Work().exec_prepared("upsert_balance", account, ToDb(amount));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::GetHolding(Transaction& t, uint64_t product_id, const std::string& owner) {
  auto res = TX(t).Work().exec_prepared("get_holding", ToDb(product_id), owner);
  return res.empty() ? 0 : FromDb(res[0][0]);
}

Result PgRepository::SetHolding(Transaction& t, uint64_t product_id, const std::string& owner, uint64_t amount) {
  try {
    TX(t).Work().exec_prepared("upsert_holding", ToDb(product_id), owner, ToDb(amount));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace market::db::postgres
