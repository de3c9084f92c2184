#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "primitives/block.hpp"
#include "primitives/transaction.hpp"

namespace tidelink::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes);
void WriteU256(std::vector<std::uint8_t>* out, const U256& value);
void WriteOptionalAddress(std::vector<std::uint8_t>* out, const std::optional<Address>& address);

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes);
bool ReadU256(const std::vector<std::uint8_t>& data, std::size_t* offset, U256* value);
bool ReadOptionalAddress(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         std::optional<Address>* address);

// Canonical encoding: one type byte (kDepositTxType / kDynamicFeeTxType)
// followed by the fields in declaration order. Deterministic, so equal
// transactions always encode to identical bytes.
void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            Transaction* tx);

struct ByteCounts {
  std::size_t zero_bytes{0};
  std::size_t nonzero_bytes{0};
};

ByteCounts CountEncodedBytes(const std::vector<std::uint8_t>& encoded);

}  // namespace tidelink::primitives::serialize
