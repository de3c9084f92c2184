#include "withdrawal/commitment.hpp"

#include <utility>

#include "crypto/hash.hpp"

namespace tidelink::withdrawal {

namespace {

constexpr char kLeafTag[] = "tidelink/withdrawal/leaf";
constexpr char kNodeTag[] = "tidelink/withdrawal/node";
constexpr char kEmptyTag[] = "tidelink/withdrawal/empty";
constexpr char kRootTag[] = "tidelink/withdrawal/root";

std::size_t TreeDepth(std::uint64_t leaf_count) {
  std::size_t depth = 0;
  for (std::uint64_t width = leaf_count; width > 1; width = (width + 1) / 2) {
    ++depth;
  }
  return depth;
}

primitives::Hash256 FoldPath(const WithdrawalProof& proof) {
  auto node = WithdrawalLeafHash(ComputeWithdrawalHash(proof.withdrawal));
  std::uint64_t position = proof.index;
  for (const auto& sibling : proof.sibling_path) {
    node = (position % 2 == 0) ? WithdrawalNodeHash(node, sibling)
                               : WithdrawalNodeHash(sibling, node);
    position /= 2;
  }
  return node;
}

}  // namespace

bool WithdrawalProof::Verify() const { return VerifyAgainst(root); }

bool WithdrawalProof::VerifyAgainst(const primitives::Hash256& expected_root) const {
  if (index >= leaf_count || sibling_path.size() != TreeDepth(leaf_count)) {
    return false;
  }
  return WithdrawalRootHash(leaf_count, FoldPath(*this)) == expected_root;
}

primitives::Hash256 WithdrawalLeafHash(const primitives::Hash256& withdrawal_hash) {
  return crypto::TaggedHash(kLeafTag, withdrawal_hash);
}

primitives::Hash256 WithdrawalNodeHash(const primitives::Hash256& left,
                                       const primitives::Hash256& right) {
  return crypto::TaggedHash(kNodeTag, left, right);
}

primitives::Hash256 WithdrawalRootHash(std::uint64_t leaf_count, const primitives::Hash256& top) {
  crypto::Sha3Writer writer;
  writer.Write(kRootTag).WriteUint64BE(leaf_count).Write(top);
  return writer.Finalize();
}

WithdrawalCommitment::WithdrawalCommitment() : root_(crypto::TaggedHash(kEmptyTag)) {}

WithdrawalCommitment::WithdrawalCommitment(std::vector<WithdrawalTransaction> withdrawals)
    : withdrawals_(std::move(withdrawals)) {
  if (withdrawals_.empty()) {
    root_ = crypto::TaggedHash(kEmptyTag);
    return;
  }
  withdrawal_hashes_.reserve(withdrawals_.size());
  std::vector<primitives::Hash256> level;
  level.reserve(withdrawals_.size());
  for (const auto& withdrawal : withdrawals_) {
    withdrawal_hashes_.push_back(ComputeWithdrawalHash(withdrawal));
    level.push_back(WithdrawalLeafHash(withdrawal_hashes_.back()));
  }
  levels_.push_back(std::move(level));
  while (levels_.back().size() > 1) {
    const auto& below = levels_.back();
    std::vector<primitives::Hash256> above;
    above.reserve((below.size() + 1) / 2);
    for (std::size_t i = 0; i < below.size(); i += 2) {
      const auto& left = below[i];
      const auto& right = (i + 1 < below.size()) ? below[i + 1] : below[i];
      above.push_back(WithdrawalNodeHash(left, right));
    }
    levels_.push_back(std::move(above));
  }
  root_ = WithdrawalRootHash(withdrawals_.size(), levels_.back().front());
}

bool WithdrawalCommitment::GenerateProof(std::size_t index, WithdrawalProof* proof,
                                         ProofError* error) const {
  if (index >= withdrawals_.size()) {
    if (error) {
      error->code = ProofError::Code::kInvalidIndex;
      error->message = "index " + std::to_string(index) + " out of range for " +
                       std::to_string(withdrawals_.size()) + " withdrawals";
    }
    return false;
  }
  WithdrawalProof out;
  out.withdrawal = withdrawals_[index];
  out.root = root_;
  out.index = index;
  out.leaf_count = withdrawals_.size();
  std::size_t position = index;
  for (std::size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
    const auto& level = levels_[depth];
    const std::size_t sibling = (position % 2 == 0) ? position + 1 : position - 1;
    out.sibling_path.push_back(sibling < level.size() ? level[sibling] : level[position]);
    position /= 2;
  }
  if (proof) *proof = std::move(out);
  return true;
}

bool WithdrawalCommitment::IsCurrent(const WithdrawalProof& proof) const {
  return proof.root == root_ && proof.VerifyAgainst(root_);
}

std::optional<std::size_t> WithdrawalCommitment::IndexOf(
    const primitives::Hash256& withdrawal_hash) const {
  for (std::size_t i = 0; i < withdrawal_hashes_.size(); ++i) {
    if (withdrawal_hashes_[i] == withdrawal_hash) {
      return i;
    }
  }
  return std::nullopt;
}

}  // namespace tidelink::withdrawal
