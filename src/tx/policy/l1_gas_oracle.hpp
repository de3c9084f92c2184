#pragma once

#include <cstdint>
#include <mutex>

#include "derivation/l1_attributes.hpp"
#include "primitives/block.hpp"
#include "primitives/u256.hpp"

namespace tidelink::policy {

inline constexpr std::uint64_t kFeeScalarDenominator = 1'000'000;

struct L1GasOracleState {
  primitives::U256 l1_base_fee{};
  std::uint64_t overhead{0};
  std::uint64_t scalar{0};
  // L1 block number of the last refresh.
  std::uint64_t last_update{0};
};

// Process-wide view of L1 fee conditions. Written once per observed L1 block
// by the derivation loop and read by the pool on every cost calculation;
// readers may see a value one block stale.
class L1GasOracle {
 public:
  L1GasOracle(std::uint64_t overhead, std::uint64_t scalar);

  // Refreshes the base fee from |l1_block|. Blocks not newer than the last
  // refresh are ignored.
  void Update(const primitives::BlockView& l1_block);
  // Refreshes every field from the L1 attributes carried by a derived block.
  void UpdateFromAttributes(const derivation::L1Attributes& attributes);
  void SetFeeParameters(std::uint64_t overhead, std::uint64_t scalar);

  L1GasOracleState Snapshot() const;

  // (zero_bytes * 4 + nonzero_bytes * 16 + overhead) * l1_base_fee * scalar / 1e6
  primitives::U256 DataCost(std::uint64_t zero_bytes, std::uint64_t nonzero_bytes) const;

 private:
  mutable std::mutex mutex_;
  L1GasOracleState state_;
  bool initialized_{false};
};

}  // namespace tidelink::policy
