#pragma once

#include <cstdint>
#include <string>

#include "primitives/transaction.hpp"

namespace tidelink::policy {

inline constexpr std::uint64_t kTxBaseGas = 21'000;
inline constexpr std::uint64_t kTxCreateGas = 32'000;
inline constexpr std::uint64_t kTxDataZeroGas = 4;
inline constexpr std::uint64_t kTxDataNonZeroGas = 16;
inline constexpr std::size_t kMaxStandardInputBytes = 128 * 1024;

enum class StandardnessRule {
  kOk,
  kWrongChainId,
  kMissingSignature,
  kInputTooLarge,
  kIntrinsicGasTooLow,
  kFeeCapBelowTip,
  kFeeCapBelowBaseFee,
};

// Gas charged before execution: base cost, calldata bytes and contract
// creation.
std::uint64_t IntrinsicGas(const primitives::SignedTransaction& tx);

// Stateless admission checks for regular transactions. Signature recovery is
// done upstream; only presence is checked here. On failure |rule| and
// |reason| are filled when non-null.
bool IsStandardTransaction(const primitives::SignedTransaction& tx, std::uint64_t chain_id,
                           std::uint64_t base_fee, StandardnessRule* rule, std::string* reason);

}  // namespace tidelink::policy
