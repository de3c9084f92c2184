#include "policy/l1_gas_oracle.hpp"

#include "policy/standardness.hpp"

namespace tidelink::policy {

L1GasOracle::L1GasOracle(std::uint64_t overhead, std::uint64_t scalar) {
  state_.overhead = overhead;
  state_.scalar = scalar;
}

void L1GasOracle::Update(const primitives::BlockView& l1_block) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_ && l1_block.number <= state_.last_update) {
    return;
  }
  state_.l1_base_fee = primitives::U256(l1_block.base_fee);
  state_.last_update = l1_block.number;
  initialized_ = true;
}

void L1GasOracle::UpdateFromAttributes(const derivation::L1Attributes& attributes) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_ && attributes.number <= state_.last_update) {
    return;
  }
  state_.l1_base_fee = attributes.base_fee;
  if (attributes.fee_overhead.FitsUint64()) {
    state_.overhead = attributes.fee_overhead.Low64();
  }
  if (attributes.fee_scalar.FitsUint64()) {
    state_.scalar = attributes.fee_scalar.Low64();
  }
  state_.last_update = attributes.number;
  initialized_ = true;
}

void L1GasOracle::SetFeeParameters(std::uint64_t overhead, std::uint64_t scalar) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.overhead = overhead;
  state_.scalar = scalar;
}

L1GasOracleState L1GasOracle::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

primitives::U256 L1GasOracle::DataCost(std::uint64_t zero_bytes,
                                       std::uint64_t nonzero_bytes) const {
  const auto state = Snapshot();
  const primitives::U256 data_gas(zero_bytes * kTxDataZeroGas + nonzero_bytes * kTxDataNonZeroGas);
  primitives::U256 gas;
  if (!primitives::CheckedAdd(data_gas, primitives::U256(state.overhead), &gas)) {
    return primitives::U256::Max();
  }
  primitives::U256 scaled;
  if (!primitives::CheckedMul(gas, state.scalar, &scaled)) {
    return primitives::U256::Max();
  }
  if (!state.l1_base_fee.FitsUint64()) {
    return primitives::U256::Max();
  }
  primitives::U256 product;
  if (!primitives::CheckedMul(scaled, state.l1_base_fee.Low64(), &product)) {
    return primitives::U256::Max();
  }
  return primitives::Divide(product, primitives::U256(kFeeScalarDenominator));
}

}  // namespace tidelink::policy
