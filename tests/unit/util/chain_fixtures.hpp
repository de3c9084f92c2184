#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "chain/event_log.hpp"
#include "chain/memory_provider.hpp"
#include "config/rollup_config.hpp"
#include "primitives/block.hpp"
#include "primitives/transaction.hpp"
#include "primitives/tx_hash.hpp"

namespace tidelink::test {

inline primitives::Address MakeAddress(std::uint8_t fill) {
  primitives::Address address{};
  address.fill(fill);
  return address;
}

inline primitives::Hash256 MakeHash(std::uint8_t fill) {
  primitives::Hash256 hash{};
  hash.fill(fill);
  return hash;
}

// Distinct, stable hash for L1 block |number| on fork |fork|.
inline primitives::Hash256 ChainHash(std::uint64_t number, std::uint8_t fork = 0) {
  primitives::Hash256 hash{};
  hash[0] = 0xB1;
  hash[1] = fork;
  for (std::size_t i = 0; i < 8; ++i) {
    hash[31 - i] = static_cast<std::uint8_t>((number >> (i * 8)) & 0xFF);
  }
  return hash;
}

inline config::RollupConfig TestRollupConfig() {
  auto cfg = config::PresetFor(config::NetworkType::kDevnet);
  cfg.genesis_l1_block = 0;
  cfg.empty_block_interval = 0;
  cfg.source_retention_blocks = 16;
  return cfg;
}

inline chain::DepositEvent MakeDepositEvent(std::uint8_t from, std::uint64_t value,
                                            std::uint64_t gas_limit = 100'000) {
  chain::DepositEvent event;
  event.from = MakeAddress(from);
  event.to = MakeAddress(static_cast<std::uint8_t>(from + 1));
  event.value = primitives::U256(value);
  event.gas_limit = gas_limit;
  event.input = {0xCA, 0xFE, from};
  return event;
}

// L1 call into the portal. |nonce| keeps otherwise identical calls distinct.
inline primitives::SignedTransaction PortalCall(const primitives::Address& portal,
                                                const primitives::Address& sender,
                                                std::uint64_t nonce) {
  primitives::SignedTransaction tx;
  tx.chain_id = 900;
  tx.nonce = nonce;
  tx.sender = sender;
  tx.to = portal;
  tx.gas_limit = 200'000;
  tx.max_fee_per_gas = 30;
  tx.max_priority_fee_per_gas = 2;
  tx.signature = {0x01};
  return tx;
}

// Builds an L1 chain on an InMemoryChainProvider. Every deposit is its own
// portal call carrying exactly one deposit log.
class L1ChainBuilder {
 public:
  L1ChainBuilder(chain::InMemoryChainProvider* provider, primitives::Address portal)
      : provider_(provider), portal_(portal) {}

  // Block |number| on |fork|, child of block number - 1 on |parent_fork|.
  primitives::BlockView AddBlock(std::uint64_t number,
                                 const std::vector<chain::DepositEvent>& deposits = {},
                                 std::uint8_t fork = 0, std::uint8_t parent_fork = 0) {
    primitives::BlockView block;
    block.number = number;
    block.hash = ChainHash(number, fork);
    block.parent_hash = ChainHash(number - 1, parent_fork);
    block.timestamp = 1'700'000'000 + number * 12;
    block.base_fee = 7 + number;
    std::vector<primitives::Receipt> receipts;
    for (const auto& event : deposits) {
      const auto tx = PortalCall(portal_, event.from, next_nonce_++);
      primitives::Receipt receipt;
      receipt.tx_hash = primitives::ComputeTxHash(tx);
      receipt.gas_used = 50'000;
      receipt.logs.push_back(chain::EncodeDepositEvent(portal_, event));
      block.transactions.emplace_back(tx);
      receipts.push_back(std::move(receipt));
    }
    provider_->PutBlock(block, receipts);
    return block;
  }

  // Blocks first..last with deposits taken from |deposits_by_block|.
  void AddRange(std::uint64_t first, std::uint64_t last,
                const std::map<std::uint64_t, std::vector<chain::DepositEvent>>& deposits_by_block =
                    {},
                std::uint8_t fork = 0) {
    for (std::uint64_t number = first; number <= last; ++number) {
      auto it = deposits_by_block.find(number);
      const std::uint8_t parent_fork = number == first ? 0 : fork;
      AddBlock(number, it == deposits_by_block.end() ? std::vector<chain::DepositEvent>{}
                                                      : it->second,
               fork, parent_fork);
    }
  }

  const primitives::Address& portal() const { return portal_; }

 private:
  chain::InMemoryChainProvider* provider_;
  primitives::Address portal_;
  std::uint64_t next_nonce_{0};
};

}  // namespace tidelink::test
