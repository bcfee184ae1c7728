#include "settlement_split.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace market::settlement {

Split ComputeSplit(uint64_t price, uint32_t commission, bool affiliate) {
  if (price > kMaxPrice) {
    throw util::ValidationError("price " + std::to_string(price) + " is too large to settle");
  }

  if (commission > kBasisPointDivisor) {
    throw util::ValidationError("commission " + std::to_string(commission) + " exceeds the price");
  }

  Split split;
  split.fee_share       = price * kPlatformFeeBasisPoints / kBasisPointDivisor;
  split.publisher_share = affiliate ? price * commission / kBasisPointDivisor : 0;

  if (split.fee_share + split.publisher_share > price) {
    throw util::ValidationError("shares exceed price " + std::to_string(price));
  }

  split.producer_share = price - split.publisher_share - split.fee_share;
  return split;
}

} // namespace market::settlement
