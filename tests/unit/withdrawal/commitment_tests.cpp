#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

#include "withdrawal/commitment.hpp"

using namespace tidelink;

namespace {

withdrawal::WithdrawalTransaction MakeWithdrawal(std::uint64_t nonce) {
  withdrawal::WithdrawalTransaction w;
  w.nonce = nonce;
  w.sender.fill(0x11);
  w.target.fill(0x22);
  w.value = primitives::U256(1'000 + nonce);
  w.gas_limit = 80'000;
  w.data = {0x01, static_cast<std::uint8_t>(nonce)};
  return w;
}

std::vector<withdrawal::WithdrawalTransaction> MakeWithdrawals(std::size_t count) {
  std::vector<withdrawal::WithdrawalTransaction> out;
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(MakeWithdrawal(i));
  }
  return out;
}

bool TestProofInvalidatedByAppend() {
  const withdrawal::WithdrawalCommitment four(MakeWithdrawals(4));
  withdrawal::WithdrawalProof proof;
  withdrawal::ProofError error;
  if (!four.GenerateProof(2, &proof, &error) || !proof.Verify() || !four.IsCurrent(proof)) {
    std::cerr << "proof for index 2 of 4 does not verify\n";
    return false;
  }
  const withdrawal::WithdrawalCommitment five(MakeWithdrawals(5));
  if (five.root() == four.root()) {
    std::cerr << "appending a withdrawal did not change the root\n";
    return false;
  }
  if (proof.VerifyAgainst(five.root()) || five.IsCurrent(proof)) {
    std::cerr << "stale proof verified against the rebuilt root\n";
    return false;
  }
  return true;
}

bool TestEveryLeafProvable() {
  for (std::size_t count = 1; count <= 9; ++count) {
    const withdrawal::WithdrawalCommitment commitment(MakeWithdrawals(count));
    for (std::size_t index = 0; index < count; ++index) {
      withdrawal::WithdrawalProof proof;
      withdrawal::ProofError error;
      if (!commitment.GenerateProof(index, &proof, &error) || !proof.Verify()) {
        std::cerr << "proof " << index << " of " << count << " failed: " << error.message << "\n";
        return false;
      }
      if (commitment.IndexOf(withdrawal::ComputeWithdrawalHash(proof.withdrawal)) != index) {
        std::cerr << "IndexOf disagrees with proof index\n";
        return false;
      }
    }
  }
  return true;
}

bool TestTamperedProofs() {
  const withdrawal::WithdrawalCommitment commitment(MakeWithdrawals(6));
  withdrawal::WithdrawalProof proof;
  withdrawal::ProofError error;
  if (!commitment.GenerateProof(3, &proof, &error)) {
    std::cerr << "proof generation failed\n";
    return false;
  }

  auto changed_value = proof;
  changed_value.withdrawal.value = primitives::U256(1);
  auto changed_nonce = proof;
  changed_nonce.withdrawal.nonce += 1;
  auto changed_sibling = proof;
  changed_sibling.sibling_path[0][0] ^= 0x01;
  auto changed_index = proof;
  changed_index.index = 2;
  auto oversized_index = proof;
  oversized_index.index = 3 + (1ULL << proof.sibling_path.size());
  for (const auto* tampered :
       {&changed_value, &changed_nonce, &changed_sibling, &changed_index, &oversized_index}) {
    if (tampered->Verify()) {
      std::cerr << "tampered proof verified\n";
      return false;
    }
  }
  return true;
}

bool TestFieldChangeInvalidatesEveryProof() {
  const auto original = MakeWithdrawals(7);
  const withdrawal::WithdrawalCommitment before(original);
  std::vector<withdrawal::WithdrawalProof> proofs;
  for (std::size_t index = 0; index < original.size(); ++index) {
    withdrawal::WithdrawalProof proof;
    withdrawal::ProofError error;
    if (!before.GenerateProof(index, &proof, &error)) {
      std::cerr << "proof generation failed: " << error.message << "\n";
      return false;
    }
    proofs.push_back(std::move(proof));
  }
  for (std::size_t changed = 0; changed < original.size(); ++changed) {
    auto mutated = original;
    mutated[changed].gas_limit += 1;
    const withdrawal::WithdrawalCommitment after(std::move(mutated));
    for (const auto& proof : proofs) {
      if (proof.VerifyAgainst(after.root()) || after.IsCurrent(proof)) {
        std::cerr << "proof " << proof.index << " survived a change to withdrawal " << changed
                  << "\n";
        return false;
      }
    }
  }
  return true;
}

bool TestRootCommitsToLeafCount() {
  auto withdrawals = MakeWithdrawals(3);
  const withdrawal::WithdrawalCommitment three(withdrawals);
  withdrawals.push_back(withdrawals.back());
  const withdrawal::WithdrawalCommitment padded(withdrawals);
  if (three.root() == padded.root()) {
    std::cerr << "duplicating the last withdrawal kept the root\n";
    return false;
  }

  withdrawal::WithdrawalProof proof;
  withdrawal::ProofError error;
  if (!three.GenerateProof(2, &proof, &error) || !proof.Verify() || proof.leaf_count != 3) {
    std::cerr << "proof for the last leaf failed\n";
    return false;
  }
  // Index 3 folds to the same top node as index 2 in a three-leaf tree.
  auto past_end = proof;
  past_end.index = 3;
  auto widened = past_end;
  widened.leaf_count = 4;
  auto shortened = proof;
  shortened.sibling_path.pop_back();
  for (const auto* forged : {&past_end, &widened, &shortened}) {
    if (forged->Verify() || three.IsCurrent(*forged)) {
      std::cerr << "proof for a missing leaf verified\n";
      return false;
    }
  }
  return true;
}

bool TestInvalidIndexAndEmpty() {
  const withdrawal::WithdrawalCommitment commitment(MakeWithdrawals(3));
  withdrawal::WithdrawalProof proof;
  withdrawal::ProofError error;
  if (commitment.GenerateProof(3, &proof, &error) ||
      error.code != withdrawal::ProofError::Code::kInvalidIndex) {
    std::cerr << "out-of-range index not rejected with InvalidIndex\n";
    return false;
  }
  const withdrawal::WithdrawalCommitment empty;
  const withdrawal::WithdrawalCommitment also_empty(std::vector<withdrawal::WithdrawalTransaction>{});
  if (empty.size() != 0 || empty.root() != also_empty.root() ||
      empty.GenerateProof(0, &proof, &error)) {
    std::cerr << "empty commitment handling wrong\n";
    return false;
  }
  if (withdrawal::ComputeWithdrawalHash(MakeWithdrawal(0)) ==
      withdrawal::ComputeWithdrawalHash(MakeWithdrawal(1))) {
    std::cerr << "withdrawal hash ignores the nonce\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    if (!TestProofInvalidatedByAppend() || !TestEveryLeafProvable() || !TestTamperedProofs() ||
        !TestFieldChangeInvalidatesEveryProof() || !TestRootCommitsToLeafCount() ||
        !TestInvalidIndexAndEmpty()) {
      return EXIT_FAILURE;
    }
    std::cout << "commitment_tests: OK\n";
  } catch (const std::exception& ex) {
    std::cerr << "commitment_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
