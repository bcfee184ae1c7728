#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/settlement/settlement_split.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/market_fixture.hpp"

namespace {

using market::settlement::ComputeSplit;
using market::testing::Throws;
using market::util::ValidationError;

void TestAffiliateSplit() {
  const auto split = ComputeSplit(1000, 10, true);
  assert(split.fee_share == 10);
  assert(split.publisher_share == 1);
  assert(split.producer_share == 989);
}

void TestDirectSplitIgnoresCommission() {
  const auto split = ComputeSplit(1000, 10, false);
  assert(split.fee_share == 10);
  assert(split.publisher_share == 0);
  assert(split.producer_share == 990);
}

void TestSmallPricesRoundDown() {
  const auto split = ComputeSplit(99, 100, true);
  assert(split.fee_share == 0);
  assert(split.publisher_share == 0);
  assert(split.producer_share == 99);

  const auto one = ComputeSplit(1, 0, false);
  assert(one.fee_share == 0);
  assert(one.producer_share == 1);
}

void TestSharesAlwaysSumToPrice() {
  for (uint64_t price : {1ull, 7ull, 100ull, 12345ull, 1000000007ull}) {
    for (uint32_t commission : {0u, 1u, 50u, 100u}) {
      const auto split = ComputeSplit(price, commission, true);
      assert(split.fee_share + split.publisher_share + split.producer_share == price);
    }
  }
}

void TestArithmeticPreconditions() {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  assert(Throws<ValidationError>([] { (void)ComputeSplit(kMax, 10, true); }));
  assert(Throws<ValidationError>([] { (void)ComputeSplit(1000, 9950, true); }));
  assert(Throws<ValidationError>([] { (void)ComputeSplit(1000, 20000, true); }));

  const auto largest = ComputeSplit(kMax / 10000, 100, true);
  assert(largest.fee_share + largest.publisher_share + largest.producer_share == kMax / 10000);
}

} // namespace

int main() {
  TestAffiliateSplit();
  TestDirectSplitIgnoresCommission();
  TestSmallPricesRoundDown();
  TestSharesAlwaysSumToPrice();
  TestArithmeticPreconditions();

  std::cout << "affiliate_market_unit_settlement_split: pass\n";
  return 0;
}
