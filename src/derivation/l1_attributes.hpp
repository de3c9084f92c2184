#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/u256.hpp"

namespace tidelink::derivation {

// L1 block metadata carried by the system deposit at index 0 of every derived
// L2 block.
struct L1Attributes {
  std::uint64_t number{0};
  std::uint64_t timestamp{0};
  primitives::U256 base_fee{};
  primitives::Hash256 block_hash{};
  std::uint64_t sequence_number{0};
  primitives::Hash256 batcher_hash{};
  primitives::U256 fee_overhead{};
  primitives::U256 fee_scalar{};

  bool operator==(const L1Attributes& other) const = default;
};

inline constexpr std::size_t kL1AttributesEncodedSize = 4 + 8 * 32;

// First four bytes of
// SHA3-256("setL1BlockValues(uint64,uint64,uint256,bytes32,uint64,bytes32,uint256,uint256)").
const std::array<std::uint8_t, 4>& L1AttributesSelector();

// selector || eight 32-byte big-endian words in field order.
std::vector<std::uint8_t> EncodeL1Attributes(const L1Attributes& attributes);
bool DecodeL1Attributes(std::span<const std::uint8_t> input, L1Attributes* attributes,
                        std::string* error);

}  // namespace tidelink::derivation
