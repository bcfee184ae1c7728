#include "access_guard.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace market::access {

using market::observability::StringField;

AccessGuard::AccessGuard(std::shared_ptr<db::Repository> repository, model::Principal bootstrap_admin,
                         model::Principal bootstrap_fee_destination)
    : repository_(std::move(repository)), bootstrap_admin_(std::move(bootstrap_admin)),
      bootstrap_fee_destination_(std::move(bootstrap_fee_destination)) {
  if (!repository_) {
    throw std::invalid_argument("AccessGuard requires a repository");
  }
  if (bootstrap_admin_.empty() || bootstrap_fee_destination_.empty()) {
    throw util::ValidationError("bootstrap identity must not be empty");
  }
}

void AccessGuard::Bootstrap() {
  auto tx = repository_->Begin();
  if (!repository_->GetAdmin(*tx)) {
    db::ThrowIfDbError(repository_->SetAdmin(*tx, bootstrap_admin_), "bootstrap admin");
    MARKET_LOG_INFO("admin bootstrapped", {StringField("admin", bootstrap_admin_)});
  }
  if (!repository_->GetFeeDestination(*tx)) {
    db::ThrowIfDbError(repository_->SetFeeDestination(*tx, bootstrap_fee_destination_), "bootstrap fee destination");
    MARKET_LOG_INFO("fee destination bootstrapped", {StringField("fee_destination", bootstrap_fee_destination_)});
  }
  tx->Commit();
}

void AccessGuard::SetAdmin(const model::InvocationContext& ctx, const model::Principal& new_admin) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, ctx);
  if (new_admin.empty()) {
    throw util::ValidationError("admin must not be empty");
  }

  db::ThrowIfDbError(repository_->SetAdmin(*tx, new_admin), "set admin");
  tx->Commit();

  MARKET_LOG_INFO("admin replaced", {StringField("caller", ctx.caller), StringField("admin", new_admin)});
}

void AccessGuard::SetFeeDestination(const model::InvocationContext& ctx, const model::Principal& new_destination) {
  auto tx = repository_->Begin();
  RequireAdmin(*tx, ctx);
  if (new_destination.empty()) {
    throw util::ValidationError("fee destination must not be empty");
  }

  db::ThrowIfDbError(repository_->SetFeeDestination(*tx, new_destination), "set fee destination");
  tx->Commit();

  MARKET_LOG_INFO("fee destination replaced", {StringField("caller", ctx.caller), StringField("fee_destination", new_destination)});
}

model::Principal AccessGuard::GetAdmin() {
  auto tx = repository_->Begin();
  return Admin(*tx);
}

model::Principal AccessGuard::GetFeeDestination() {
  auto tx = repository_->Begin();
  return FeeDestination(*tx);
}

model::Principal AccessGuard::Admin(db::Transaction& tx) {
  return repository_->GetAdmin(tx).value_or(bootstrap_admin_);
}

model::Principal AccessGuard::FeeDestination(db::Transaction& tx) {
  return repository_->GetFeeDestination(tx).value_or(bootstrap_fee_destination_);
}

void AccessGuard::RequireAdmin(db::Transaction& tx, const model::InvocationContext& ctx) {
  if (ctx.caller != Admin(tx)) {
    throw util::AuthorizationError("caller " + ctx.caller + " is not the admin");
  }
}

} // namespace market::access
