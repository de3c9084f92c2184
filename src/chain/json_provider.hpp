#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chain/memory_provider.hpp"
#include "nlohmann/json.hpp"

namespace tidelink::chain {

// Block and receipt conversions for the snapshot format:
//   {"finalized": n, "blocks": [{"number", "hash", "parent_hash", "timestamp",
//     "base_fee", "transactions": [...], "receipts": [...]}]}
// Hashes, addresses and byte strings are 0x-hex; U256 values are decimal or
// 0x-hex strings.
nlohmann::json TransactionToJson(const primitives::Transaction& tx);
nlohmann::json ReceiptToJson(const primitives::Receipt& receipt);
nlohmann::json BlockToJson(const primitives::BlockView& block,
                           const std::vector<primitives::Receipt>& receipts);

bool TransactionFromJson(const nlohmann::json& value, primitives::Transaction* tx,
                         std::string* error);
bool ReceiptFromJson(const nlohmann::json& value, primitives::Receipt* receipt,
                     std::string* error);
bool BlockFromJson(const nlohmann::json& value, primitives::BlockView* block,
                   std::vector<primitives::Receipt>* receipts, std::string* error);

// Chain provider backed by a snapshot file written by an external follower.
// Reload() replaces the whole view atomically from the reader's perspective;
// a failed reload keeps the previous view.
class JsonChainProvider final : public ChainProvider {
 public:
  explicit JsonChainProvider(std::filesystem::path path);

  bool Reload(std::string* error);
  const std::filesystem::path& path() const { return path_; }

  std::optional<primitives::BlockView> BlockByNumber(std::uint64_t number) const override;
  bool ReceiptByHash(const primitives::Hash256& tx_hash,
                     primitives::Receipt* receipt) const override;
  std::uint64_t LatestBlockNumber() const override;
  std::uint64_t FinalizedBlockNumber() const override;

 private:
  std::filesystem::path path_;
  InMemoryChainProvider blocks_;
};

}  // namespace tidelink::chain
