#pragma once

#include <cstdint>
#include <limits>

namespace market::settlement {

// Platform fee charged on every item, in basis points of the price.
inline constexpr uint64_t kPlatformFeeBasisPoints = 100;
inline constexpr uint64_t kBasisPointDivisor      = 10000;

// Largest price whose basis-point products fit in 64 bits. The catalog
// refuses to list anything above it.
inline constexpr uint64_t kMaxPrice = std::numeric_limits<uint64_t>::max() / kBasisPointDivisor;

struct Split {
  uint64_t fee_share       = 0;
  uint64_t publisher_share = 0;
  uint64_t producer_share  = 0;
};

/*
  Three-way split of one item's price.

    fee       = floor(price * 100 / 10000)
    publisher = floor(price * commission / 10000)   (affiliate only)
    producer  = price - publisher - fee

  Throws util::ValidationError when price * 10000 overflows or the shares
  would exceed the price.
*/
Split ComputeSplit(uint64_t price, uint32_t commission, bool affiliate);

} // namespace market::settlement
