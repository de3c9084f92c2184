#include "chain/memory_provider.hpp"

#include <utility>

#include "primitives/tx_hash.hpp"

namespace tidelink::chain {

std::optional<primitives::BlockView> InMemoryChainProvider::BlockByNumber(
    std::uint64_t number) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.find(number);
  if (it == blocks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryChainProvider::ReceiptByHash(const primitives::Hash256& tx_hash,
                                          primitives::Receipt* receipt) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = receipts_.find(tx_hash);
  if (it == receipts_.end()) {
    return false;
  }
  if (receipt) *receipt = it->second;
  return true;
}

std::uint64_t InMemoryChainProvider::LatestBlockNumber() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (latest_override_) {
    return *latest_override_;
  }
  if (blocks_.empty()) {
    return 0;
  }
  return blocks_.rbegin()->first;
}

std::uint64_t InMemoryChainProvider::FinalizedBlockNumber() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finalized_;
}

void InMemoryChainProvider::PutBlock(primitives::BlockView block,
                                     std::vector<primitives::Receipt> receipts) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = blocks_.find(block.number);
  if (existing != blocks_.end()) {
    EraseReceiptsLocked(existing->second);
  }
  for (auto& receipt : receipts) {
    const auto hash = receipt.tx_hash;
    receipts_[hash] = std::move(receipt);
  }
  const auto number = block.number;
  blocks_[number] = std::move(block);
}

void InMemoryChainProvider::TruncateFrom(std::uint64_t number) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.lower_bound(number);
  while (it != blocks_.end()) {
    EraseReceiptsLocked(it->second);
    it = blocks_.erase(it);
  }
}

void InMemoryChainProvider::SetFinalized(std::uint64_t number) {
  std::lock_guard<std::mutex> lock(mutex_);
  finalized_ = number;
}

void InMemoryChainProvider::SetLatestOverride(std::optional<std::uint64_t> number) {
  std::lock_guard<std::mutex> lock(mutex_);
  latest_override_ = number;
}

void InMemoryChainProvider::ReplaceAll(
    std::vector<std::pair<primitives::BlockView, std::vector<primitives::Receipt>>> blocks,
    std::uint64_t finalized) {
  std::lock_guard<std::mutex> lock(mutex_);
  blocks_.clear();
  receipts_.clear();
  for (auto& [block, receipts] : blocks) {
    for (auto& receipt : receipts) {
      const auto hash = receipt.tx_hash;
      receipts_[hash] = std::move(receipt);
    }
    const auto number = block.number;
    blocks_[number] = std::move(block);
  }
  finalized_ = finalized;
  latest_override_.reset();
}

std::size_t InMemoryChainProvider::BlockCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

void InMemoryChainProvider::EraseReceiptsLocked(const primitives::BlockView& block) {
  for (const auto& tx : block.transactions) {
    receipts_.erase(primitives::ComputeTxHash(tx));
  }
}

}  // namespace tidelink::chain
