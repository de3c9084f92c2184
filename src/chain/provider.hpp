#pragma once

#include <cstdint>
#include <optional>

#include "primitives/block.hpp"

namespace tidelink::chain {

// Read-only access to one chain (L1 or L2). Implementations are supplied by
// the node integration; tests use InMemoryChainProvider. Calls may block on
// I/O and are the only suspension points of the derivation and bridge code.
class ChainProvider {
 public:
  virtual ~ChainProvider() = default;

  virtual std::optional<primitives::BlockView> BlockByNumber(std::uint64_t number) const = 0;
  virtual bool ReceiptByHash(const primitives::Hash256& tx_hash,
                             primitives::Receipt* receipt) const = 0;
  virtual std::uint64_t LatestBlockNumber() const = 0;
  // Highest block the chain considers irreversible.
  virtual std::uint64_t FinalizedBlockNumber() const = 0;
};

}  // namespace tidelink::chain
