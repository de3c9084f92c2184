#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/u256.hpp"

namespace tidelink::derivation {
class StateDeriver;
}  // namespace tidelink::derivation

namespace tidelink::primitives {

inline constexpr std::uint8_t kDepositTxType = 0x7E;
inline constexpr std::uint8_t kDynamicFeeTxType = 0x02;

class ChainDataDecoder;

// Construction right for system-flagged deposits. Only the state deriver
// (which synthesizes the L1-attributes deposit) and the decoder for already
// committed chain data can create one.
class SystemDepositKey {
 private:
  SystemDepositKey() = default;
  friend class derivation::StateDeriver;
  friend class ChainDataDecoder;
};

struct DepositFields {
  Hash256 source_hash{};
  Address from{};
  std::optional<Address> to{};  // nullopt = contract creation.
  U256 value{};
  std::uint64_t gas_limit{0};
  std::vector<std::uint8_t> input{};

  bool operator==(const DepositFields& other) const = default;
};

// L1 -> L2 deposit. Immutable after construction; the minted L2 balance is
// always equal to value.
class TxDeposit {
 public:
  TxDeposit() = default;
  TxDeposit(const SystemDepositKey&, DepositFields fields)
      : fields_(std::move(fields)), is_system_(true) {}

  static TxDeposit User(DepositFields fields) { return TxDeposit(std::move(fields), false); }

  const Hash256& source_hash() const { return fields_.source_hash; }
  const Address& from() const { return fields_.from; }
  const std::optional<Address>& to() const { return fields_.to; }
  const U256& value() const { return fields_.value; }
  const U256& mint() const { return fields_.value; }
  std::uint64_t gas_limit() const { return fields_.gas_limit; }
  const std::vector<std::uint8_t>& input() const { return fields_.input; }
  bool is_system() const { return is_system_; }
  bool IsContractCreation() const { return !fields_.to.has_value(); }
  const DepositFields& fields() const { return fields_; }

  bool operator==(const TxDeposit& other) const = default;

 private:
  TxDeposit(DepositFields fields, bool is_system)
      : fields_(std::move(fields)), is_system_(is_system) {}

  DepositFields fields_{};
  bool is_system_{false};
};

// Rebuilds deposits read back from committed chain data (encoded blocks,
// chain snapshots). Only decoders of such data call RestoreDeposit; a
// system-flagged deposit it returns carries no deriver authority, and
// CrossChainPool::SubmitDeposit refuses it as kUnauthorizedSystemDeposit.
class ChainDataDecoder {
 public:
  static TxDeposit RestoreDeposit(DepositFields fields, bool is_system) {
    if (is_system) {
      return TxDeposit(SystemDepositKey{}, std::move(fields));
    }
    return TxDeposit::User(std::move(fields));
  }
};

// Regular (fee-paying) L2 transaction. Signature recovery is done by the
// caller; |sender| is the recovered account.
struct SignedTransaction {
  std::uint64_t chain_id{0};
  std::uint64_t nonce{0};
  Address sender{};
  std::optional<Address> to{};
  U256 value{};
  std::uint64_t gas_limit{0};
  std::uint64_t max_fee_per_gas{0};
  std::uint64_t max_priority_fee_per_gas{0};
  std::vector<std::uint8_t> input{};
  std::vector<std::uint8_t> signature{};

  bool operator==(const SignedTransaction& other) const = default;
};

using Transaction = std::variant<TxDeposit, SignedTransaction>;

inline bool IsDeposit(const Transaction& tx) {
  return std::holds_alternative<TxDeposit>(tx);
}

inline std::uint64_t GasLimitOf(const Transaction& tx) {
  if (const auto* deposit = std::get_if<TxDeposit>(&tx)) {
    return deposit->gas_limit();
  }
  return std::get<SignedTransaction>(tx).gas_limit;
}

}  // namespace tidelink::primitives
