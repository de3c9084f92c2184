#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "withdrawal/withdrawal.hpp"

namespace tidelink::withdrawal {

struct ProofError {
  enum class Code {
    kNone,
    kInvalidIndex,
  };
  Code code{Code::kNone};
  std::string message;
};

// Membership proof for one withdrawal. Verification folds the leaf up the
// sibling path, binds the result to |leaf_count| and never consults the tree
// it came from.
struct WithdrawalProof {
  WithdrawalTransaction withdrawal;
  std::vector<primitives::Hash256> sibling_path;
  primitives::Hash256 root{};
  std::uint64_t index{0};
  std::uint64_t leaf_count{0};

  bool Verify() const;
  bool VerifyAgainst(const primitives::Hash256& expected_root) const;
};

primitives::Hash256 WithdrawalLeafHash(const primitives::Hash256& withdrawal_hash);
primitives::Hash256 WithdrawalNodeHash(const primitives::Hash256& left,
                                       const primitives::Hash256& right);
// Root over a non-empty tree: the top node bound to the number of leaves.
primitives::Hash256 WithdrawalRootHash(std::uint64_t leaf_count, const primitives::Hash256& top);

// Binary Merkle tree over withdrawal hashes in finalization order. An odd
// node at any level is paired with itself, and the root commits to the leaf
// count. Immutable once built: a changed withdrawal set means a new
// commitment.
class WithdrawalCommitment {
 public:
  WithdrawalCommitment();
  explicit WithdrawalCommitment(std::vector<WithdrawalTransaction> withdrawals);

  const primitives::Hash256& root() const { return root_; }
  std::size_t size() const { return withdrawals_.size(); }
  const std::vector<WithdrawalTransaction>& withdrawals() const { return withdrawals_; }

  bool GenerateProof(std::size_t index, WithdrawalProof* proof, ProofError* error) const;
  // True when |proof| was generated from a tree with this commitment's root.
  bool IsCurrent(const WithdrawalProof& proof) const;
  std::optional<std::size_t> IndexOf(const primitives::Hash256& withdrawal_hash) const;

 private:
  std::vector<WithdrawalTransaction> withdrawals_;
  // levels_[0] holds the leaves, levels_.back() the single root.
  std::vector<std::vector<primitives::Hash256>> levels_;
  std::vector<primitives::Hash256> withdrawal_hashes_;
  primitives::Hash256 root_{};
};

}  // namespace tidelink::withdrawal
