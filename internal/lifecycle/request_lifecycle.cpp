#include "request_lifecycle.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/db_error.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::lifecycle {

using namespace market::protocol::v1;
using market::observability::StringField;
using market::observability::UIntField;

RequestLifecycle::RequestLifecycle(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("RequestLifecycle requires a repository");
  }
}

uint64_t RequestLifecycle::CreateRequest(const model::InvocationContext& ctx, uint64_t product_id, const model::Principal& publisher) {
  if (ctx.caller != publisher) {
    throw util::AuthorizationError("caller " + ctx.caller + " cannot request on behalf of " + publisher);
  }

  auto tx = repository_->Begin();
  if (!repository_->GetProduct(*tx, product_id)) {
    throw util::NotFound("product " + std::to_string(product_id));
  }
  if (auto active = repository_->GetActiveRequest(*tx, product_id, publisher)) {
    throw util::StateConflict("publisher " + publisher + " already holds request " + std::to_string(*active) + " for product " +
                              std::to_string(product_id));
  }

  db::model::RequestRecord record;
  record.id         = repository_->NextRequestId(*tx);
  record.product_id = product_id;
  record.publisher  = publisher;
  record.status     = REQUEST_STATUS_PENDING;

  db::ThrowIfDbError(repository_->InsertRequest(*tx, record), "insert request " + std::to_string(record.id));
  db::ThrowIfDbError(repository_->MarkRequested(*tx, product_id, publisher, record.id), "mark requested");
  tx->Commit();

  MARKET_LOG_INFO("request created",
                  {UIntField("request_id", record.id), UIntField("product_id", product_id), StringField("publisher", publisher)});
  return record.id;
}

uint64_t RequestLifecycle::CancelRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& publisher) {
  auto tx     = repository_->Begin();
  auto record = LoadRequest(*tx, request_id);

  if (ctx.caller != publisher || record.publisher != publisher) {
    throw util::AuthorizationError("caller " + ctx.caller + " cannot cancel request " + std::to_string(request_id));
  }
  if (!model::IsCancellable(record.status)) {
    throw util::StateConflict("request " + std::to_string(request_id) + " is not pending");
  }
  RequireActive(*tx, record);

  db::ThrowIfDbError(repository_->ClearRequested(*tx, record.product_id, publisher), "clear requested");
  tx->Commit();

  MARKET_LOG_INFO("request cancelled", {UIntField("request_id", request_id), StringField("publisher", publisher)});
  return request_id;
}

uint64_t RequestLifecycle::AcceptRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer) {
  auto tx     = repository_->Begin();
  auto record = LoadForProducer(*tx, ctx, request_id, producer);

  if (!model::CanTransition(record.status, REQUEST_STATUS_ACCEPTED)) {
    throw util::StateConflict("request " + std::to_string(request_id) + " cannot be accepted");
  }

  if (!model::IsTerminal(record.status)) {
    // A cancelled request keeps its Pending record but no longer holds the pair.
    RequireActive(*tx, record);
    record.status = REQUEST_STATUS_ACCEPTED;
    db::ThrowIfDbError(repository_->UpdateRequest(*tx, record), "accept request " + std::to_string(request_id));
    tx->Commit();
  }

  MARKET_LOG_INFO("request accepted",
                  {UIntField("request_id", request_id), UIntField("product_id", record.product_id), StringField("publisher", record.publisher)});
  return request_id;
}

uint64_t RequestLifecycle::RejectRequest(const model::InvocationContext& ctx, uint64_t request_id, const model::Principal& producer) {
  auto tx     = repository_->Begin();
  auto record = LoadForProducer(*tx, ctx, request_id, producer);

  db::ThrowIfDbError(repository_->DeleteRequest(*tx, request_id), "delete request " + std::to_string(request_id));
  // Leave the pair alone if a newer request holds it.
  if (IsActive(*tx, record)) {
    db::ThrowIfDbError(repository_->ClearRequested(*tx, record.product_id, record.publisher), "clear requested");
  }
  tx->Commit();

  MARKET_LOG_INFO("request rejected",
                  {UIntField("request_id", request_id), UIntField("product_id", record.product_id), StringField("publisher", record.publisher)});
  return request_id;
}

std::optional<AffiliateRequest> RequestLifecycle::GetRequest(uint64_t request_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetRequest(*tx, request_id);
  if (!record) {
    return std::nullopt;
  }
  return ToMessage(*record);
}

AffiliateRequest RequestLifecycle::ToMessage(const db::model::RequestRecord& record) {
  AffiliateRequest message;
  message.set_request_id(record.id);
  message.set_product_id(record.product_id);
  message.set_publisher(record.publisher);
  message.set_status(record.status);
  return message;
}

db::model::RequestRecord RequestLifecycle::LoadRequest(db::Transaction& tx, uint64_t request_id) {
  auto record = repository_->GetRequest(tx, request_id);
  if (!record) {
    throw util::NotFound("request " + std::to_string(request_id));
  }
  return *record;
}

bool RequestLifecycle::IsActive(db::Transaction& tx, const db::model::RequestRecord& record) {
  auto holder = repository_->GetActiveRequest(tx, record.product_id, record.publisher);
  return holder && *holder == record.id;
}

void RequestLifecycle::RequireActive(db::Transaction& tx, const db::model::RequestRecord& record) {
  if (!IsActive(tx, record)) {
    throw util::StateConflict("request " + std::to_string(record.id) + " was cancelled");
  }
}

db::model::RequestRecord RequestLifecycle::LoadForProducer(db::Transaction& tx, const model::InvocationContext& ctx, uint64_t request_id,
                                                           const model::Principal& producer) {
  auto record  = LoadRequest(tx, request_id);
  auto product = repository_->GetProduct(tx, record.product_id);
  if (!product) {
    throw util::NotFound("product " + std::to_string(record.product_id));
  }
  if (ctx.caller != producer || product->producer != producer) {
    throw util::AuthorizationError("caller " + ctx.caller + " is not the producer of product " + std::to_string(record.product_id));
  }
  return record;
}

} // namespace market::lifecycle
