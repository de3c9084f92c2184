#include "deposit/deposit.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "crypto/hash.hpp"

namespace tidelink::deposit {

namespace {

constexpr char kUserDepositTag[] = "tidelink/deposit/user";
constexpr char kL1InfoTag[] = "tidelink/deposit/l1info";

primitives::Hash256 SourceHash(std::string_view tag, const primitives::Hash256& l1_block_hash,
                               std::uint64_t index) {
  crypto::Sha3Writer writer;
  writer.Write(tag).Write(l1_block_hash).WriteUint64BE(index);
  return writer.Finalize();
}

bool Fail(DepositError* error, DepositError::Code code, std::string message) {
  if (error) {
    error->code = code;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace

const char* DepositErrorCodeName(DepositError::Code code) {
  switch (code) {
    case DepositError::Code::kNone:
      return "none";
    case DepositError::Code::kUnknownSource:
      return "unknown-source";
    case DepositError::Code::kGasLimitExceeded:
      return "gas-limit-exceeded";
    case DepositError::Code::kUnauthorizedSystemDeposit:
      return "unauthorized-system-deposit";
  }
  return "unknown";
}

void KnownSourceIndex::Insert(const primitives::Hash256& source_hash, std::uint64_t l1_block) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sources_.emplace(source_hash, l1_block).second) {
    by_block_.emplace(l1_block, source_hash);
  }
}

bool KnownSourceIndex::Contains(const primitives::Hash256& source_hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.find(source_hash) != sources_.end();
}

void KnownSourceIndex::PruneBelow(std::uint64_t l1_block) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto end = by_block_.lower_bound(l1_block);
  for (auto it = by_block_.begin(); it != end; ++it) {
    sources_.erase(it->second);
  }
  by_block_.erase(by_block_.begin(), end);
}

void KnownSourceIndex::RollbackAbove(std::uint64_t l1_block) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto begin = by_block_.upper_bound(l1_block);
  for (auto it = begin; it != by_block_.end(); ++it) {
    sources_.erase(it->second);
  }
  by_block_.erase(begin, by_block_.end());
}

std::size_t KnownSourceIndex::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.size();
}

bool ValidateDeposit(const primitives::TxDeposit& deposit, const KnownSourceIndex& known_sources,
                     const DepositPolicy& policy, DepositOrigin origin, DepositError* error) {
  if (!known_sources.Contains(deposit.source_hash())) {
    return Fail(error, DepositError::Code::kUnknownSource,
                "deposit source hash does not match an observed L1 block");
  }
  if (deposit.gas_limit() > policy.max_gas_limit) {
    return Fail(error, DepositError::Code::kGasLimitExceeded,
                "deposit gas limit " + std::to_string(deposit.gas_limit()) + " exceeds ceiling " +
                    std::to_string(policy.max_gas_limit));
  }
  if (deposit.is_system() && origin != DepositOrigin::kDeriver) {
    return Fail(error, DepositError::Code::kUnauthorizedSystemDeposit,
                "system deposits are only accepted from the deriver");
  }
  if (error) {
    error->code = DepositError::Code::kNone;
    error->message.clear();
  }
  return true;
}

primitives::Hash256 UserDepositSourceHash(const primitives::Hash256& l1_block_hash,
                                          std::uint64_t log_index) {
  return SourceHash(kUserDepositTag, l1_block_hash, log_index);
}

primitives::Hash256 L1InfoSourceHash(const primitives::Hash256& l1_block_hash,
                                     std::uint64_t sequence_number) {
  return SourceHash(kL1InfoTag, l1_block_hash, sequence_number);
}

}  // namespace tidelink::deposit
