#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/u256.hpp"

namespace tidelink::withdrawal {

// L2 -> L1 withdrawal intent. Callers keep (sender, nonce) unique; two
// withdrawals that differ only in nonce hash differently.
struct WithdrawalTransaction {
  std::uint64_t nonce{0};
  primitives::Address sender{};
  primitives::Address target{};
  primitives::U256 value{};
  std::uint64_t gas_limit{0};
  std::vector<std::uint8_t> data{};

  bool operator==(const WithdrawalTransaction& other) const = default;
};

// SHA3-256 over the six fields in declaration order, data length-prefixed.
primitives::Hash256 ComputeWithdrawalHash(const WithdrawalTransaction& withdrawal);

}  // namespace tidelink::withdrawal
