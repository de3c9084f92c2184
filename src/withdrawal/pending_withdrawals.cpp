#include "withdrawal/pending_withdrawals.hpp"

#include <algorithm>
#include <iostream>

#include "util/hex.hpp"

namespace tidelink::withdrawal {

WithdrawalTransaction PendingWithdrawals::Observe(const primitives::Address& sender,
                                                  const chain::WithdrawalEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& next = next_nonce_[sender];
  while (used_nonces_.count(SenderNonce{sender, next}) != 0) {
    ++next;
  }
  WithdrawalTransaction withdrawal;
  withdrawal.nonce = next++;
  withdrawal.sender = sender;
  withdrawal.target = event.target;
  withdrawal.value = event.value;
  withdrawal.gas_limit = event.gas_limit;
  withdrawal.data = event.data;
  AppendLocked(withdrawal);
  return withdrawal;
}

bool PendingWithdrawals::Add(const WithdrawalTransaction& withdrawal, std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (used_nonces_.count(SenderNonce{withdrawal.sender, withdrawal.nonce}) != 0) {
    if (error) {
      *error = "withdrawal nonce " + std::to_string(withdrawal.nonce) + " already used by " +
               util::HexEncodePrefixed(withdrawal.sender);
    }
    return false;
  }
  auto& next = next_nonce_[withdrawal.sender];
  next = std::max(next, withdrawal.nonce + 1);
  AppendLocked(withdrawal);
  return true;
}

WithdrawalCommitment PendingWithdrawals::Commitment() const {
  return WithdrawalCommitment(Pending());
}

std::size_t PendingWithdrawals::MarkFinalized(
    const std::vector<primitives::Hash256>& withdrawal_hashes) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (const auto& hash : withdrawal_hashes) {
    auto it = by_hash_.find(hash);
    if (it == by_hash_.end()) {
      continue;
    }
    pending_.erase(it->second);
    by_hash_.erase(it);
    ++removed;
  }
  if (removed > 0) {
    std::cerr << "[withdraw] " << removed << " withdrawal(s) finalized on L1, "
              << pending_.size() << " pending\n";
  }
  return removed;
}

std::vector<WithdrawalTransaction> PendingWithdrawals::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WithdrawalTransaction> out;
  out.reserve(pending_.size());
  for (const auto& [sequence, withdrawal] : pending_) {
    out.push_back(withdrawal);
  }
  return out;
}

std::size_t PendingWithdrawals::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::uint64_t PendingWithdrawals::NextNonce(const primitives::Address& sender) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = next_nonce_.find(sender);
  return it == next_nonce_.end() ? 0 : it->second;
}

void PendingWithdrawals::AppendLocked(WithdrawalTransaction withdrawal) {
  used_nonces_.insert(SenderNonce{withdrawal.sender, withdrawal.nonce});
  const auto sequence = next_sequence_++;
  by_hash_[ComputeWithdrawalHash(withdrawal)] = sequence;
  pending_.emplace(sequence, std::move(withdrawal));
}

}  // namespace tidelink::withdrawal
