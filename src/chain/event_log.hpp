#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "primitives/block.hpp"

namespace tidelink::chain {

// topic[0] of the bridge events:
//   TransactionDeposited(address,address,uint256,uint64,bytes)  (L1 portal)
//   MessagePassed(address,uint256,uint64,bytes)                 (L2 passer)
const primitives::Hash256& DepositEventTopic();
const primitives::Hash256& WithdrawalEventTopic();

// Addresses are right-aligned in 32-byte topics; a topic with non-zero
// padding is not an address.
primitives::Hash256 AddressToTopic(const primitives::Address& address);
bool AddressFromTopic(const primitives::Hash256& topic, primitives::Address* address);

// Event data shared by both directions:
//   [amount: 32][gas_limit: 32][data_length: 32][data: data_length]
// gas_limit and data_length are big-endian and must fit in 64 bits, and
// data_length must cover the rest of the buffer exactly.
struct BridgePayload {
  primitives::U256 amount{};
  std::uint64_t gas_limit{0};
  std::vector<std::uint8_t> data{};
};

std::vector<std::uint8_t> EncodeBridgePayload(const BridgePayload& payload);
bool DecodeBridgePayload(std::span<const std::uint8_t> bytes, BridgePayload* payload,
                         std::string* error);

struct DepositEvent {
  primitives::Address from{};
  std::optional<primitives::Address> to{};  // zero topic = contract creation.
  primitives::U256 value{};
  std::uint64_t gas_limit{0};
  std::vector<std::uint8_t> input{};

  bool operator==(const DepositEvent& other) const = default;
};

bool IsDepositEventLog(const primitives::Log& log, const primitives::Address& portal);
bool DecodeDepositEvent(const primitives::Log& log, DepositEvent* event, std::string* error);
primitives::Log EncodeDepositEvent(const primitives::Address& portal, const DepositEvent& event);

// The withdrawal sender is the transaction sender, not a log field.
struct WithdrawalEvent {
  primitives::Address target{};
  primitives::U256 value{};
  std::uint64_t gas_limit{0};
  std::vector<std::uint8_t> data{};
};

bool IsWithdrawalEventLog(const primitives::Log& log, const primitives::Address& passer);
bool DecodeWithdrawalEvent(const primitives::Log& log, WithdrawalEvent* event,
                           std::string* error);
primitives::Log EncodeWithdrawalEvent(const primitives::Address& passer,
                                      const WithdrawalEvent& event);

}  // namespace tidelink::chain
