#include "policy/cross_chain_pool.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <queue>
#include <utility>

#include "policy/standardness.hpp"
#include "primitives/serialize.hpp"
#include "primitives/tx_hash.hpp"
#include "util/hex.hpp"

namespace tidelink::policy {

namespace {

bool Reject(PoolError* error, PoolError::Code code, std::string message) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
  }
  return false;
}

PoolError::Code FromDepositCode(deposit::DepositError::Code code) {
  switch (code) {
    case deposit::DepositError::Code::kUnknownSource:
      return PoolError::Code::kUnknownSourceHash;
    case deposit::DepositError::Code::kGasLimitExceeded:
      return PoolError::Code::kGasLimitExceeded;
    case deposit::DepositError::Code::kUnauthorizedSystemDeposit:
      return PoolError::Code::kUnauthorizedSystemDeposit;
    case deposit::DepositError::Code::kNone:
      break;
  }
  return PoolError::Code::kNone;
}

PoolError::Code FromStandardnessRule(StandardnessRule rule) {
  switch (rule) {
    case StandardnessRule::kWrongChainId:
      return PoolError::Code::kWrongChainId;
    case StandardnessRule::kMissingSignature:
      return PoolError::Code::kMissingSignature;
    case StandardnessRule::kInputTooLarge:
      return PoolError::Code::kInputTooLarge;
    case StandardnessRule::kIntrinsicGasTooLow:
      return PoolError::Code::kIntrinsicGasTooLow;
    case StandardnessRule::kFeeCapBelowTip:
      return PoolError::Code::kFeeCapBelowTip;
    case StandardnessRule::kFeeCapBelowBaseFee:
      return PoolError::Code::kFeeCapBelowBaseFee;
    case StandardnessRule::kOk:
      break;
  }
  return PoolError::Code::kNone;
}

std::uint64_t EffectiveTip(const primitives::SignedTransaction& tx, std::uint64_t base_fee) {
  if (tx.max_fee_per_gas <= base_fee) {
    return 0;
  }
  return std::min(tx.max_priority_fee_per_gas, tx.max_fee_per_gas - base_fee);
}

}  // namespace

const char* PoolErrorCodeName(PoolError::Code code) {
  switch (code) {
    case PoolError::Code::kNone:
      return "none";
    case PoolError::Code::kUnknownSourceHash:
      return "unknown-source-hash";
    case PoolError::Code::kGasLimitExceeded:
      return "gas-limit-exceeded";
    case PoolError::Code::kUnauthorizedSystemDeposit:
      return "unauthorized-system-deposit";
    case PoolError::Code::kInsufficientFunds:
      return "insufficient-funds";
    case PoolError::Code::kWrongChainId:
      return "wrong-chain-id";
    case PoolError::Code::kMissingSignature:
      return "missing-signature";
    case PoolError::Code::kInputTooLarge:
      return "input-too-large";
    case PoolError::Code::kIntrinsicGasTooLow:
      return "intrinsic-gas-too-low";
    case PoolError::Code::kFeeCapBelowTip:
      return "fee-cap-below-tip";
    case PoolError::Code::kFeeCapBelowBaseFee:
      return "fee-cap-below-base-fee";
    case PoolError::Code::kNonceTooLow:
      return "nonce-too-low";
    case PoolError::Code::kAlreadyKnown:
      return "already-known";
  }
  return "unknown";
}

std::vector<ValidTransaction> GreedyTipSelector::Select(
    const std::vector<ValidTransaction>& candidates, std::uint64_t gas_budget,
    std::uint64_t base_fee) const {
  // Per-sender queues in nonce order.
  std::unordered_map<primitives::Address, std::vector<const ValidTransaction*>,
                     primitives::AddressHasher>
      by_sender;
  for (const auto& candidate : candidates) {
    by_sender[candidate.tx.sender].push_back(&candidate);
  }
  for (auto& [sender, queue] : by_sender) {
    std::sort(queue.begin(), queue.end(),
              [](const ValidTransaction* a, const ValidTransaction* b) {
                return a->tx.nonce < b->tx.nonce;
              });
  }

  struct Head {
    std::uint64_t tip;
    std::uint64_t arrival;
    const std::vector<const ValidTransaction*>* queue;
    std::size_t position;
  };
  auto worse = [](const Head& a, const Head& b) {
    if (a.tip != b.tip) {
      return a.tip < b.tip;
    }
    return a.arrival > b.arrival;
  };
  std::priority_queue<Head, std::vector<Head>, decltype(worse)> heads(worse);
  for (const auto& [sender, queue] : by_sender) {
    const auto* first = queue.front();
    heads.push(Head{EffectiveTip(first->tx, base_fee), first->arrival, &queue, 0});
  }

  std::vector<ValidTransaction> selected;
  std::uint64_t remaining = gas_budget;
  while (!heads.empty()) {
    const Head head = heads.top();
    heads.pop();
    const auto* entry = (*head.queue)[head.position];
    if (entry->tx.gas_limit > remaining) {
      continue;
    }
    remaining -= entry->tx.gas_limit;
    selected.push_back(*entry);
    const std::size_t next = head.position + 1;
    if (next < head.queue->size()) {
      const auto* following = (*head.queue)[next];
      heads.push(Head{EffectiveTip(following->tx, base_fee), following->arrival, head.queue, next});
    }
  }
  return selected;
}

CrossChainPool::CrossChainPool(CrossChainPoolOptions options, const AccountStateView& accounts,
                               const L1GasOracle& oracle,
                               const deposit::KnownSourceIndex& known_sources,
                               std::unique_ptr<RegularTransactionSelector> selector)
    : options_(options),
      accounts_(accounts),
      oracle_(oracle),
      known_sources_(known_sources),
      selector_(selector ? std::move(selector) : std::make_unique<GreedyTipSelector>()) {}

bool CrossChainPool::SubmitDeposit(const primitives::TxDeposit& deposit, PoolError* error) {
  if (!ValidateDepositFor(deposit, deposit::DepositOrigin::kExternal, error)) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.rejected_deposits;
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  PruneSeenSourcesLocked();
  if (!seen_sources_.insert(deposit.source_hash()).second) {
    ++stats_.rejected_deposits;
    return Reject(error, PoolError::Code::kAlreadyKnown,
                  "deposit " + util::ShortHex(deposit.source_hash()) + " already queued or included");
  }
  external_deposits_.push_back(QueuedDeposit{deposit, deposit::DepositOrigin::kExternal});
  ++stats_.queued_deposits;
  return true;
}

std::size_t CrossChainPool::EnqueueDerivedBlock(const derivation::DerivedBlock& block) {
  std::lock_guard<std::mutex> lock(mutex_);
  PruneSeenSourcesLocked();
  std::vector<QueuedDeposit> batch;
  for (const auto& tx : block.transactions) {
    const auto* deposit = std::get_if<primitives::TxDeposit>(&tx);
    if (!deposit) {
      continue;
    }
    if (!seen_sources_.insert(deposit->source_hash()).second) {
      ++stats_.rejected_deposits;
      std::cerr << "[pool] skipping derived deposit " << util::ShortHex(deposit->source_hash())
                << ": already queued or included\n";
      continue;
    }
    batch.push_back(QueuedDeposit{*deposit, deposit::DepositOrigin::kDeriver});
  }
  const std::size_t queued = batch.size();
  if (queued != 0) {
    derived_batches_.push_back(std::move(batch));
  }
  stats_.queued_deposits += queued;
  return queued;
}

bool CrossChainPool::AddTransaction(const primitives::SignedTransaction& tx,
                                    std::uint64_t base_fee, PoolError* error) {
  ValidTransaction valid;
  if (!ValidateRegular(tx, base_fee, &valid, error)) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.rejected_transactions;
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto& nonces = by_sender_[tx.sender];
  if (pending_.count(valid.hash) != 0 || nonces.count(tx.nonce) != 0) {
    if (nonces.empty()) {
      by_sender_.erase(tx.sender);
    }
    ++stats_.rejected_transactions;
    return Reject(error, PoolError::Code::kAlreadyKnown,
                  "transaction with nonce " + std::to_string(tx.nonce) + " already pending");
  }
  valid.arrival = next_arrival_++;
  nonces.emplace(tx.nonce, valid.hash);
  pending_.emplace(valid.hash, std::move(valid));
  ++stats_.admitted_transactions;
  return true;
}

std::vector<primitives::Transaction> CrossChainPool::BuildBlock(std::uint64_t gas_limit,
                                                                std::uint64_t base_fee) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<primitives::Transaction> block;
  std::uint64_t deposit_gas = 0;
  // External deposits only ride behind a derived batch, so a system deposit
  // stays at index 0.
  if (!derived_batches_.empty()) {
    auto batch = std::move(derived_batches_.front());
    derived_batches_.pop_front();
    for (auto& queued : batch) {
      IncludeDepositLocked(std::move(queued), &deposit_gas, &block);
    }
    while (!external_deposits_.empty()) {
      QueuedDeposit queued = std::move(external_deposits_.front());
      external_deposits_.pop_front();
      IncludeDepositLocked(std::move(queued), &deposit_gas, &block);
    }
  }

  // Deposits are never limited by the block gas limit; regular transactions
  // only get what is left, if anything.
  const std::uint64_t remaining = gas_limit > deposit_gas ? gas_limit - deposit_gas : 0;
  if (remaining == 0 || pending_.empty()) {
    return block;
  }

  auto candidates = CollectCandidatesLocked(base_fee);
  auto selected = selector_->Select(candidates, remaining, base_fee);
  std::uint64_t used = 0;
  for (auto& entry : selected) {
    if (entry.tx.gas_limit > remaining - used) {
      break;
    }
    used += entry.tx.gas_limit;
    auto sender_it = by_sender_.find(entry.tx.sender);
    if (sender_it != by_sender_.end()) {
      sender_it->second.erase(entry.tx.nonce);
      if (sender_it->second.empty()) {
        by_sender_.erase(sender_it);
      }
    }
    pending_.erase(entry.hash);
    block.emplace_back(std::move(entry.tx));
    ++stats_.included_transactions;
  }
  return block;
}

primitives::U256 CrossChainPool::CalculateL1GasCost(const primitives::Transaction& tx) const {
  if (primitives::IsDeposit(tx)) {
    return primitives::U256::Zero();
  }
  std::vector<std::uint8_t> encoded;
  primitives::serialize::SerializeTransaction(tx, &encoded);
  const auto counts = primitives::serialize::CountEncodedBytes(encoded);
  return oracle_.DataCost(counts.zero_bytes, counts.nonzero_bytes);
}

bool CrossChainPool::ValidateTransaction(const primitives::Transaction& tx,
                                         std::uint64_t base_fee, ValidTransaction* valid,
                                         PoolError* error) const {
  if (const auto* deposit = std::get_if<primitives::TxDeposit>(&tx)) {
    return ValidateDepositFor(*deposit, deposit::DepositOrigin::kExternal, error);
  }
  return ValidateRegular(std::get<primitives::SignedTransaction>(tx), base_fee, valid, error);
}

std::size_t CrossChainPool::PendingDeposits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t pending = external_deposits_.size();
  for (const auto& batch : derived_batches_) {
    pending += batch.size();
  }
  return pending;
}

std::size_t CrossChainPool::PendingTransactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

PoolStats CrossChainPool::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

bool CrossChainPool::ValidateDepositFor(const primitives::TxDeposit& deposit,
                                        deposit::DepositOrigin origin, PoolError* error) const {
  deposit::DepositError deposit_error;
  if (deposit::ValidateDeposit(deposit, known_sources_, options_.deposit_policy, origin,
                               &deposit_error)) {
    return true;
  }
  return Reject(error, FromDepositCode(deposit_error.code), std::move(deposit_error.message));
}

bool CrossChainPool::ValidateRegular(const primitives::SignedTransaction& tx,
                                     std::uint64_t base_fee, ValidTransaction* valid,
                                     PoolError* error) const {
  StandardnessRule rule = StandardnessRule::kOk;
  std::string reason;
  if (!IsStandardTransaction(tx, options_.chain_id, base_fee, &rule, &reason)) {
    return Reject(error, FromStandardnessRule(rule), std::move(reason));
  }
  const auto account_nonce = accounts_.Nonce(tx.sender);
  if (tx.nonce < account_nonce) {
    return Reject(error, PoolError::Code::kNonceTooLow,
                  "nonce " + std::to_string(tx.nonce) + " below account nonce " +
                      std::to_string(account_nonce));
  }

  const primitives::Transaction wrapped{tx};
  const auto l1_cost = CalculateL1GasCost(wrapped);
  primitives::U256 gas_cost;
  primitives::U256 required;
  if (!primitives::CheckedMul(primitives::U256(tx.gas_limit), tx.max_fee_per_gas, &gas_cost) ||
      !primitives::CheckedAdd(tx.value, gas_cost, &required) ||
      !primitives::CheckedAdd(required, l1_cost, &required)) {
    required = primitives::U256::Max();
  }
  const auto available = accounts_.Balance(tx.sender);
  if (available < required) {
    if (error) {
      error->available = available;
      error->required = required;
    }
    return Reject(error, PoolError::Code::kInsufficientFunds,
                  "balance " + available.ToString() + " below required " + required.ToString());
  }
  if (valid) {
    valid->tx = tx;
    valid->hash = primitives::ComputeTxHash(wrapped);
    valid->l1_cost = l1_cost;
    valid->required_funds = required;
  }
  return true;
}

void CrossChainPool::PruneSeenSourcesLocked() {
  for (auto it = seen_sources_.begin(); it != seen_sources_.end();) {
    if (known_sources_.Contains(*it)) {
      ++it;
    } else {
      it = seen_sources_.erase(it);
    }
  }
}

void CrossChainPool::IncludeDepositLocked(QueuedDeposit queued, std::uint64_t* deposit_gas,
                                          std::vector<primitives::Transaction>* block) {
  PoolError error;
  if (!ValidateDepositFor(queued.deposit, queued.origin, &error)) {
    ++stats_.dropped_stale_deposits;
    std::cerr << "[pool] dropping deposit " << util::ShortHex(queued.deposit.source_hash())
              << ": " << error.message << "\n";
    return;
  }
  const auto gas = queued.deposit.gas_limit();
  constexpr auto kMaxGas = std::numeric_limits<std::uint64_t>::max();
  *deposit_gas = (gas > kMaxGas - *deposit_gas) ? kMaxGas : *deposit_gas + gas;
  block->emplace_back(std::move(queued.deposit));
  ++stats_.included_deposits;
}

std::vector<ValidTransaction> CrossChainPool::CollectCandidatesLocked(std::uint64_t base_fee) {
  std::vector<ValidTransaction> candidates;
  for (auto sender_it = by_sender_.begin(); sender_it != by_sender_.end();) {
    auto& nonces = sender_it->second;
    const auto account_nonce = accounts_.Nonce(sender_it->first);
    // Already executed: evict.
    for (auto it = nonces.begin(); it != nonces.end() && it->first < account_nonce;) {
      pending_.erase(it->second);
      it = nonces.erase(it);
    }
    std::uint64_t expected = account_nonce;
    for (const auto& [nonce, hash] : nonces) {
      if (nonce != expected) {
        break;
      }
      auto entry = pending_.find(hash);
      if (entry == pending_.end()) {
        break;
      }
      ValidTransaction refreshed;
      if (!ValidateRegular(entry->second.tx, base_fee, &refreshed, nullptr)) {
        break;
      }
      refreshed.arrival = entry->second.arrival;
      candidates.push_back(std::move(refreshed));
      ++expected;
    }
    if (nonces.empty()) {
      sender_it = by_sender_.erase(sender_it);
    } else {
      ++sender_it;
    }
  }
  return candidates;
}

}  // namespace tidelink::policy
