#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/error_code.hpp"
#include "market/protocol/v1.hpp"

using market::model::CalledBy;
using namespace market::protocol::v1;

int main(int argc, char** argv) {
  // Optional YAML config; an in-memory store is used without one.
  market::runtime::config::RuntimeConfig config;
  try {
    config = argc > 1 ? market::config::ConfigLoader::LoadFromYaml(argv[1]) : market::config::ConfigLoader::Defaults();
  } catch (const std::exception& e) {
    std::cerr << "Failed to load config: " << e.what() << '\n';
    return 1;
  }

  market::observability::InitializeLogging(config);
  market::observability::InitializeTracing(config);
  market::observability::InitializeMetrics(config);

  const std::string producer  = "ST2PRODUCER";
  const std::string publisher = "ST2PUBLISHER";
  const std::string purchaser = "ST2PURCHASER";

  int exit_code = 0;
  try {
    auto  runtime = market::factory::BuildRuntime(config);
    auto& market  = *runtime.service;

    // List a digital product at 1000 with a 10% affiliate commission.
    ProductMetadata metadata;
    metadata.set_uri("ipfs://example-product");
    metadata.set_price(1000);
    metadata.set_amount(5);
    metadata.set_commission(10);
    metadata.set_type(PRODUCT_TYPE_DIGITAL);
    const auto product_id = market.CreateProduct(CalledBy(producer), producer, metadata);

    // The publisher asks to promote it and the producer approves.
    const auto request_id = market.CreateRequest(CalledBy(publisher), product_id, publisher);
    market.AcceptRequest(CalledBy(producer), request_id, producer);

    market.Deposit(purchaser, 2000);

    Cart cart;
    auto* affiliate_item = cart.add_items();
    affiliate_item->set_reference_id(request_id);
    affiliate_item->set_affiliate(true);
    affiliate_item->set_amount(1);

    auto* direct_item = cart.add_items();
    direct_item->set_reference_id(product_id);
    direct_item->set_affiliate(false);
    direct_item->set_amount(1);

    const auto receipt = market.Purchase(CalledBy(purchaser), purchaser, publisher, cart);

    std::cout << "Purchase settled for shop " << receipt.shop() << '\n';
    for (const auto& item : receipt.items()) {
      std::cout << "  product=" << item.product_id() << " fee=" << item.fee_share() << " publisher=" << item.publisher_share()
                << " producer=" << item.producer_share() << '\n';
    }
    std::cout << "Fee destination balance: " << market.BalanceOf(market.GetFeeDestination()) << '\n';
    std::cout << "Publisher balance:       " << market.BalanceOf(publisher) << '\n';
    std::cout << "Producer balance:        " << market.BalanceOf(producer) << '\n';
    std::cout << "Purchaser holding:       " << market.HoldingOf(product_id, purchaser) << '\n';
  } catch (const std::exception& e) {
    std::cerr << "Example failed (" << ErrorCode_Name(market::util::ToErrorCode(e)) << "): " << e.what() << '\n';
    exit_code = 1;
  }

  market::observability::ShutdownMetrics();
  market::observability::ShutdownTracing();
  market::observability::ShutdownLogging();
  return exit_code;
}
