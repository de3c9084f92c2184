#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "primitives/transaction.hpp"

namespace tidelink::deposit {

inline constexpr std::uint64_t kDefaultMaxDepositGasLimit = 10'000'000;
inline constexpr std::uint64_t kSystemDepositGasLimit = 1'000'000;
inline constexpr std::uint64_t kDefaultSourceRetentionBlocks = 256;

struct DepositPolicy {
  std::uint64_t max_gas_limit{kDefaultMaxDepositGasLimit};
};

// Who is handing the deposit to validation. Only the deriver may carry a
// system-flagged deposit; anything arriving from outside is kExternal.
enum class DepositOrigin {
  kDeriver,
  kExternal,
};

struct DepositError {
  enum class Code {
    kNone,
    kUnknownSource,
    kGasLimitExceeded,
    kUnauthorizedSystemDeposit,
  };
  Code code{Code::kNone};
  std::string message;
};

const char* DepositErrorCodeName(DepositError::Code code);

// Source hashes of deposits derived from observed L1 blocks, keyed by the L1
// block that produced them. Written by the deriver, read by the pool.
class KnownSourceIndex {
 public:
  void Insert(const primitives::Hash256& source_hash, std::uint64_t l1_block);
  bool Contains(const primitives::Hash256& source_hash) const;

  // Forgets sources whose L1 block is strictly below |l1_block|.
  void PruneBelow(std::uint64_t l1_block);
  // Forgets sources whose L1 block is strictly above |l1_block| (reorg).
  void RollbackAbove(std::uint64_t l1_block);

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<primitives::Hash256, std::uint64_t, primitives::Hash256Hasher> sources_;
  std::multimap<std::uint64_t, primitives::Hash256> by_block_;
};

// Pure admission check. Order: unknown source, gas ceiling, system-flag
// authorization.
bool ValidateDeposit(const primitives::TxDeposit& deposit, const KnownSourceIndex& known_sources,
                     const DepositPolicy& policy, DepositOrigin origin, DepositError* error);

primitives::Hash256 UserDepositSourceHash(const primitives::Hash256& l1_block_hash,
                                          std::uint64_t log_index);
primitives::Hash256 L1InfoSourceHash(const primitives::Hash256& l1_block_hash,
                                     std::uint64_t sequence_number);

}  // namespace tidelink::deposit
