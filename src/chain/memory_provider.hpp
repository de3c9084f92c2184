#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "chain/provider.hpp"

namespace tidelink::chain {

// Thread-safe in-memory chain. Blocks are keyed by number and may be
// replaced, which is how tests and the snapshot loader model reorgs.
class InMemoryChainProvider final : public ChainProvider {
 public:
  InMemoryChainProvider() = default;

  std::optional<primitives::BlockView> BlockByNumber(std::uint64_t number) const override;
  bool ReceiptByHash(const primitives::Hash256& tx_hash,
                     primitives::Receipt* receipt) const override;
  std::uint64_t LatestBlockNumber() const override;
  std::uint64_t FinalizedBlockNumber() const override;

  // Inserts or replaces block |block.number| together with its receipts.
  void PutBlock(primitives::BlockView block, std::vector<primitives::Receipt> receipts = {});
  // Drops |number| and every later block (and their receipts).
  void TruncateFrom(std::uint64_t number);
  void SetFinalized(std::uint64_t number);
  // Reports a head beyond the stored blocks, simulating a provider that has
  // announced blocks it cannot serve yet.
  void SetLatestOverride(std::optional<std::uint64_t> number);
  // Swaps the whole chain under one lock so readers never see a partial view.
  void ReplaceAll(std::vector<std::pair<primitives::BlockView, std::vector<primitives::Receipt>>> blocks,
                  std::uint64_t finalized);

  std::size_t BlockCount() const;

 private:
  void EraseReceiptsLocked(const primitives::BlockView& block);

  mutable std::mutex mutex_;
  std::map<std::uint64_t, primitives::BlockView> blocks_;
  std::unordered_map<primitives::Hash256, primitives::Receipt, primitives::Hash256Hasher>
      receipts_;
  std::uint64_t finalized_{0};
  std::optional<std::uint64_t> latest_override_;
};

}  // namespace tidelink::chain
