#include "policy/standardness.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace tidelink::policy {

std::uint64_t IntrinsicGas(const primitives::SignedTransaction& tx) {
  const auto zero_bytes = static_cast<std::uint64_t>(
      std::count(tx.input.begin(), tx.input.end(), std::uint8_t{0}));
  const auto nonzero_bytes = static_cast<std::uint64_t>(tx.input.size()) - zero_bytes;
  std::uint64_t gas = kTxBaseGas + zero_bytes * kTxDataZeroGas + nonzero_bytes * kTxDataNonZeroGas;
  if (!tx.to) {
    gas += kTxCreateGas;
  }
  return gas;
}

bool IsStandardTransaction(const primitives::SignedTransaction& tx, std::uint64_t chain_id,
                           std::uint64_t base_fee, StandardnessRule* rule, std::string* reason) {
  auto reject = [&](StandardnessRule failed, std::string message) {
    if (rule) *rule = failed;
    if (reason) *reason = std::move(message);
    return false;
  };
  if (tx.chain_id != chain_id) {
    return reject(StandardnessRule::kWrongChainId,
                  "chain id " + std::to_string(tx.chain_id) + " does not match " +
                      std::to_string(chain_id));
  }
  if (tx.signature.empty()) {
    return reject(StandardnessRule::kMissingSignature, "transaction is not signed");
  }
  // Bounds the intrinsic gas arithmetic as well as relay size.
  if (tx.input.size() > kMaxStandardInputBytes) {
    return reject(StandardnessRule::kInputTooLarge, "input too large for standard relay");
  }
  const auto intrinsic = IntrinsicGas(tx);
  if (tx.gas_limit < intrinsic) {
    return reject(StandardnessRule::kIntrinsicGasTooLow,
                  "gas limit " + std::to_string(tx.gas_limit) + " below intrinsic gas " +
                      std::to_string(intrinsic));
  }
  if (tx.max_fee_per_gas < tx.max_priority_fee_per_gas) {
    return reject(StandardnessRule::kFeeCapBelowTip, "max fee per gas below priority fee");
  }
  if (tx.max_fee_per_gas < base_fee) {
    return reject(StandardnessRule::kFeeCapBelowBaseFee,
                  "max fee per gas " + std::to_string(tx.max_fee_per_gas) +
                      " below base fee " + std::to_string(base_fee));
  }
  if (rule) *rule = StandardnessRule::kOk;
  return true;
}

}  // namespace tidelink::policy
