#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/model/principal.hpp"

namespace market::access {

/*
  Admin and fee destination singletons.

  Both start as the bootstrap identity. Only the current admin may replace
  either of them; reads are unrestricted.
*/

class AccessGuard {
 public:
  AccessGuard(std::shared_ptr<db::Repository> repository, model::Principal bootstrap_admin, model::Principal bootstrap_fee_destination);

  // Writes the bootstrap identity into singletons that are not yet stored.
  void Bootstrap();

  void SetAdmin(const model::InvocationContext& ctx, const model::Principal& new_admin);
  void SetFeeDestination(const model::InvocationContext& ctx, const model::Principal& new_destination);

  model::Principal GetAdmin();
  model::Principal GetFeeDestination();

  // Reads within an operation's transaction.
  model::Principal Admin(db::Transaction& tx);
  model::Principal FeeDestination(db::Transaction& tx);

 private:
  void RequireAdmin(db::Transaction& tx, const model::InvocationContext& ctx);

  std::shared_ptr<db::Repository> repository_;
  model::Principal                bootstrap_admin_;
  model::Principal                bootstrap_fee_destination_;
};

} // namespace market::access
