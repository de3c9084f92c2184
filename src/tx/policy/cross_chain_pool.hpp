#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "deposit/deposit.hpp"
#include "derivation/state_deriver.hpp"
#include "policy/l1_gas_oracle.hpp"
#include "primitives/transaction.hpp"

namespace tidelink::policy {

struct PoolError {
  enum class Code {
    kNone,
    kUnknownSourceHash,
    kGasLimitExceeded,
    kUnauthorizedSystemDeposit,
    kInsufficientFunds,
    kWrongChainId,
    kMissingSignature,
    kInputTooLarge,
    kIntrinsicGasTooLow,
    kFeeCapBelowTip,
    kFeeCapBelowBaseFee,
    kNonceTooLow,
    kAlreadyKnown,
  };
  Code code{Code::kNone};
  std::string message;
  // Set for kInsufficientFunds.
  primitives::U256 available{};
  primitives::U256 required{};
};

const char* PoolErrorCodeName(PoolError::Code code);

// Account state of the L2 execution engine as seen by admission checks.
class AccountStateView {
 public:
  virtual ~AccountStateView() = default;
  virtual primitives::U256 Balance(const primitives::Address& account) const = 0;
  virtual std::uint64_t Nonce(const primitives::Address& account) const = 0;
};

struct ValidTransaction {
  primitives::SignedTransaction tx;
  primitives::Hash256 hash{};
  primitives::U256 l1_cost{};
  primitives::U256 required_funds{};
  std::uint64_t arrival{0};
};

// Chooses regular transactions for the gas left after deposits. Candidates
// are per-sender nonce-contiguous; the result must keep each sender's nonce
// order.
class RegularTransactionSelector {
 public:
  virtual ~RegularTransactionSelector() = default;
  virtual std::vector<ValidTransaction> Select(const std::vector<ValidTransaction>& candidates,
                                               std::uint64_t gas_budget,
                                               std::uint64_t base_fee) const = 0;
};

// Highest effective tip first, ties by arrival. A sender whose next
// transaction does not fit is skipped for the rest of the block.
class GreedyTipSelector final : public RegularTransactionSelector {
 public:
  std::vector<ValidTransaction> Select(const std::vector<ValidTransaction>& candidates,
                                       std::uint64_t gas_budget,
                                       std::uint64_t base_fee) const override;
};

struct PoolStats {
  std::uint64_t queued_deposits{0};
  std::uint64_t included_deposits{0};
  std::uint64_t dropped_stale_deposits{0};
  std::uint64_t rejected_deposits{0};
  std::uint64_t admitted_transactions{0};
  std::uint64_t rejected_transactions{0};
  std::uint64_t included_transactions{0};
};

struct CrossChainPoolOptions {
  std::uint64_t chain_id{0};
  deposit::DepositPolicy deposit_policy{};
};

// Block-building pool. Each built block takes the oldest derived block's
// deposits (system deposit first), then queued external deposits, then
// regular transactions chosen by the selector from whatever gas is left.
// A deposit source hash is queued or included at most once while the
// KnownSourceIndex still holds it.
class CrossChainPool {
 public:
  CrossChainPool(CrossChainPoolOptions options, const AccountStateView& accounts,
                 const L1GasOracle& oracle, const deposit::KnownSourceIndex& known_sources,
                 std::unique_ptr<RegularTransactionSelector> selector = nullptr);

  // External submission path; system-flagged deposits are refused here, and
  // a source already queued or included fails with kAlreadyKnown.
  bool SubmitDeposit(const primitives::TxDeposit& deposit, PoolError* error);
  // Deriver path: queues the deposits of |block| as one batch in block order.
  // Deposits whose source was already queued or included are skipped.
  std::size_t EnqueueDerivedBlock(const derivation::DerivedBlock& block);
  bool AddTransaction(const primitives::SignedTransaction& tx, std::uint64_t base_fee,
                      PoolError* error);

  // Takes the oldest derived batch, then the external deposits (both
  // revalidated, stale entries dropped), and appends selected regular
  // transactions. With no derived batch queued, external deposits wait and
  // the block holds regular transactions only. Included transactions leave
  // the pool.
  std::vector<primitives::Transaction> BuildBlock(std::uint64_t gas_limit, std::uint64_t base_fee);

  primitives::U256 CalculateL1GasCost(const primitives::Transaction& tx) const;

  // Deposits are checked as external submissions; regular transactions get
  // the standard checks plus value + gas_limit * max_fee + L1 cost against
  // the sender balance.
  bool ValidateTransaction(const primitives::Transaction& tx, std::uint64_t base_fee,
                           ValidTransaction* valid, PoolError* error) const;

  std::size_t PendingDeposits() const;
  std::size_t PendingTransactions() const;
  PoolStats Stats() const;

 private:
  struct QueuedDeposit {
    primitives::TxDeposit deposit;
    deposit::DepositOrigin origin{deposit::DepositOrigin::kExternal};
  };

  bool ValidateDepositFor(const primitives::TxDeposit& deposit, deposit::DepositOrigin origin,
                          PoolError* error) const;
  bool ValidateRegular(const primitives::SignedTransaction& tx, std::uint64_t base_fee,
                       ValidTransaction* valid, PoolError* error) const;
  std::vector<ValidTransaction> CollectCandidatesLocked(std::uint64_t base_fee);
  // Forgets seen sources the KnownSourceIndex no longer holds.
  void PruneSeenSourcesLocked();
  void IncludeDepositLocked(QueuedDeposit queued, std::uint64_t* deposit_gas,
                            std::vector<primitives::Transaction>* block);

  CrossChainPoolOptions options_;
  const AccountStateView& accounts_;
  const L1GasOracle& oracle_;
  const deposit::KnownSourceIndex& known_sources_;
  std::unique_ptr<RegularTransactionSelector> selector_;

  mutable std::mutex mutex_;
  std::deque<std::vector<QueuedDeposit>> derived_batches_;
  std::deque<QueuedDeposit> external_deposits_;
  // Source hashes queued or included.
  std::unordered_set<primitives::Hash256, primitives::Hash256Hasher> seen_sources_;
  std::unordered_map<primitives::Hash256, ValidTransaction, primitives::Hash256Hasher> pending_;
  // sender -> nonce -> tx hash
  std::unordered_map<primitives::Address, std::map<std::uint64_t, primitives::Hash256>,
                     primitives::AddressHasher>
      by_sender_;
  std::uint64_t next_arrival_{0};
  PoolStats stats_;
};

}  // namespace tidelink::policy
