#pragma once

#include <memory>

namespace market::db { class Repository; }
namespace market::ledger { class AssetLedger; }
namespace market::access { class AccessGuard; }
namespace market::catalog { class ProductCatalog; }
namespace market::lifecycle { class RequestLifecycle; }
namespace market::settlement { class SettlementEngine; }

namespace market::service {

/*
  Dependency container shared by the service facade.
*/
struct ServiceContext {
  std::shared_ptr<market::db::Repository> repository;
  std::shared_ptr<market::ledger::AssetLedger> ledger;
  std::shared_ptr<market::access::AccessGuard> access;
  std::shared_ptr<market::catalog::ProductCatalog> catalog;
  std::shared_ptr<market::lifecycle::RequestLifecycle> lifecycle;
  std::shared_ptr<market::settlement::SettlementEngine> settlement;
};

}
