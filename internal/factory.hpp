#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/market_service.hpp"
#include "internal/service/service_context.hpp"

namespace market::factory {

/*
  Runtime

  Owns all long-lived components of one marketplace instance.
*/
struct Runtime {
  service::ServiceContext                 components;
  std::shared_ptr<service::MarketService> service;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config, creates the
  schema and writes the bootstrap identities.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const market::runtime::config::RuntimeConfig& config);

// Backend selected by config.database(), schema already created.
std::shared_ptr<db::Repository> BuildRepository(const market::runtime::config::RuntimeConfig& config);

} // namespace market::factory
