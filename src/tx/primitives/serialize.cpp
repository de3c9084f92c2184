#include "primitives/serialize.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <utility>

namespace tidelink::primitives::serialize {

namespace {

// Upper bound on a single length-prefixed field; protects decoders from
// absurd allocations driven by a corrupt length.
constexpr std::uint64_t kMaxFieldBytes = 16ULL * 1024ULL * 1024ULL;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

template <std::size_t N>
bool ReadFixed(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::array<std::uint8_t, N>* out) {
  if (!Require(data, *offset, N)) return false;
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), N, out->begin());
  *offset += N;
  return true;
}

void SerializeDeposit(const TxDeposit& deposit, std::vector<std::uint8_t>* out) {
  out->push_back(kDepositTxType);
  out->insert(out->end(), deposit.source_hash().begin(), deposit.source_hash().end());
  out->insert(out->end(), deposit.from().begin(), deposit.from().end());
  WriteOptionalAddress(out, deposit.to());
  WriteU256(out, deposit.mint());
  WriteU256(out, deposit.value());
  WriteUint64(out, deposit.gas_limit());
  out->push_back(deposit.is_system() ? 1 : 0);
  WriteBytes(out, deposit.input());
}

void SerializeSigned(const SignedTransaction& tx, std::vector<std::uint8_t>* out) {
  out->push_back(kDynamicFeeTxType);
  WriteUint64(out, tx.chain_id);
  WriteUint64(out, tx.nonce);
  out->insert(out->end(), tx.sender.begin(), tx.sender.end());
  WriteOptionalAddress(out, tx.to);
  WriteU256(out, tx.value);
  WriteUint64(out, tx.gas_limit);
  WriteUint64(out, tx.max_fee_per_gas);
  WriteUint64(out, tx.max_priority_fee_per_gas);
  WriteBytes(out, tx.input);
  WriteBytes(out, tx.signature);
}

bool DeserializeDeposit(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        Transaction* tx) {
  DepositFields fields;
  U256 mint;
  std::uint8_t system_flag = 0;
  if (!ReadFixed(data, offset, &fields.source_hash)) return false;
  if (!ReadFixed(data, offset, &fields.from)) return false;
  if (!ReadOptionalAddress(data, offset, &fields.to)) return false;
  if (!ReadU256(data, offset, &mint)) return false;
  if (!ReadU256(data, offset, &fields.value)) return false;
  if (!ReadUint64(data, offset, &fields.gas_limit)) return false;
  if (!Require(data, *offset, 1)) return false;
  system_flag = data[(*offset)++];
  if (system_flag > 1) return false;
  if (!ReadBytes(data, offset, &fields.input)) return false;
  // Deposits mint exactly their value; anything else is not a valid encoding.
  if (mint != fields.value) return false;
  *tx = ChainDataDecoder::RestoreDeposit(std::move(fields), system_flag == 1);
  return true;
}

bool DeserializeSigned(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       Transaction* tx) {
  SignedTransaction out;
  if (!ReadUint64(data, offset, &out.chain_id)) return false;
  if (!ReadUint64(data, offset, &out.nonce)) return false;
  if (!ReadFixed(data, offset, &out.sender)) return false;
  if (!ReadOptionalAddress(data, offset, &out.to)) return false;
  if (!ReadU256(data, offset, &out.value)) return false;
  if (!ReadUint64(data, offset, &out.gas_limit)) return false;
  if (!ReadUint64(data, offset, &out.max_fee_per_gas)) return false;
  if (!ReadUint64(data, offset, &out.max_priority_fee_per_gas)) return false;
  if (!ReadBytes(data, offset, &out.input)) return false;
  if (!ReadBytes(data, offset, &out.signature)) return false;
  *tx = std::move(out);
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    const std::uint16_t v16 = static_cast<std::uint16_t>(value);
    out->push_back(static_cast<std::uint8_t>(v16 & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((v16 >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteBytes(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  WriteVarInt(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void WriteU256(std::vector<std::uint8_t>* out, const U256& value) {
  const auto bytes = value.ToBigEndian();
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void WriteOptionalAddress(std::vector<std::uint8_t>* out, const std::optional<Address>& address) {
  if (!address) {
    out->push_back(0);
    return;
  }
  out->push_back(1);
  out->insert(out->end(), address->begin(), address->end());
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (v16 < 0xFD) {
      return false;
    }
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) {
      return false;
    }
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) {
    return false;
  }
  *value = tmp;
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::vector<std::uint8_t>* bytes) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size) || size > kMaxFieldBytes ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const auto begin = data.begin() + static_cast<std::ptrdiff_t>(*offset);
  bytes->assign(begin, begin + static_cast<std::ptrdiff_t>(size));
  *offset += static_cast<std::size_t>(size);
  return true;
}

bool ReadU256(const std::vector<std::uint8_t>& data, std::size_t* offset, U256* value) {
  std::array<std::uint8_t, 32> bytes{};
  if (!ReadFixed(data, offset, &bytes)) return false;
  *value = U256::FromBigEndian(bytes);
  return true;
}

bool ReadOptionalAddress(const std::vector<std::uint8_t>& data, std::size_t* offset,
                         std::optional<Address>* address) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t present = data[(*offset)++];
  if (present == 0) {
    address->reset();
    return true;
  }
  if (present != 1) return false;
  Address value{};
  if (!ReadFixed(data, offset, &value)) return false;
  *address = value;
  return true;
}

void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out) {
  if (const auto* deposit = std::get_if<TxDeposit>(&tx)) {
    SerializeDeposit(*deposit, out);
    return;
  }
  SerializeSigned(std::get<SignedTransaction>(tx), out);
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            Transaction* tx) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t type = data[(*offset)++];
  switch (type) {
    case kDepositTxType:
      return DeserializeDeposit(data, offset, tx);
    case kDynamicFeeTxType:
      return DeserializeSigned(data, offset, tx);
    default:
      return false;
  }
}

ByteCounts CountEncodedBytes(const std::vector<std::uint8_t>& encoded) {
  ByteCounts counts;
  for (auto byte : encoded) {
    if (byte == 0) {
      ++counts.zero_bytes;
    } else {
      ++counts.nonzero_bytes;
    }
  }
  return counts;
}

}  // namespace tidelink::primitives::serialize
