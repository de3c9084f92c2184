#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "chain/event_log.hpp"
#include "withdrawal/commitment.hpp"

namespace tidelink::withdrawal {

// Withdrawals observed on L2 and not yet finalized on L1, in observation
// order. Fed by the bridge monitor; proof submission is somebody else's job.
class PendingWithdrawals {
 public:
  // Assigns the sender's next nonce and appends the withdrawal.
  WithdrawalTransaction Observe(const primitives::Address& sender,
                                const chain::WithdrawalEvent& event);
  // Appends a withdrawal with a caller-chosen nonce. Rejects a (sender, nonce)
  // pair that is already pending or was finalized.
  bool Add(const WithdrawalTransaction& withdrawal, std::string* error);

  // Snapshot of the current set; proofs from it go stale on the next change.
  WithdrawalCommitment Commitment() const;
  // Removes withdrawals reported as finalized on L1. Returns how many were
  // pending.
  std::size_t MarkFinalized(const std::vector<primitives::Hash256>& withdrawal_hashes);

  std::vector<WithdrawalTransaction> Pending() const;
  std::size_t Size() const;
  std::uint64_t NextNonce(const primitives::Address& sender) const;

 private:
  struct SenderNonce {
    primitives::Address sender{};
    std::uint64_t nonce{0};
    bool operator==(const SenderNonce& other) const = default;
  };
  struct SenderNonceHasher {
    std::size_t operator()(const SenderNonce& key) const noexcept {
      return primitives::AddressHasher{}(key.sender) ^ static_cast<std::size_t>(key.nonce * 131);
    }
  };

  void AppendLocked(WithdrawalTransaction withdrawal);

  mutable std::mutex mutex_;
  // Observation sequence -> withdrawal; iteration order is commitment order.
  std::map<std::uint64_t, WithdrawalTransaction> pending_;
  std::unordered_map<primitives::Hash256, std::uint64_t, primitives::Hash256Hasher> by_hash_;
  std::unordered_set<SenderNonce, SenderNonceHasher> used_nonces_;
  std::unordered_map<primitives::Address, std::uint64_t, primitives::AddressHasher> next_nonce_;
  std::uint64_t next_sequence_{0};
};

}  // namespace tidelink::withdrawal
