#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives/hash.hpp"

namespace tidelink::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kDevnet,
};

// Protocol parameters shared by every honest deriver of one L2 network. Two
// nodes with different values here derive different chains.
struct RollupConfig {
  NetworkType type{NetworkType::kMainnet};
  std::string network_id{"mainnet"};
  std::uint64_t l1_chain_id{1};
  std::uint64_t l2_chain_id{4217};

  // L1 contract that emits deposit events.
  primitives::Address deposit_portal{};
  // L2 predeploy that emits withdrawal events.
  primitives::Address message_passer{};
  // Sender and target of the per-block system deposit.
  primitives::Address system_depositor{};
  primitives::Address l1_block_info{};

  // Derivation starts after this L1 block.
  std::uint64_t genesis_l1_block{0};
  std::uint64_t max_deposit_gas_limit{10'000'000};
  // Fee parameters carried in every L1-attributes deposit and used by the L1
  // gas oracle.
  std::uint64_t fee_overhead{188};
  std::uint64_t fee_scalar{684'000};
  primitives::Hash256 batcher_hash{};
  // Zero derives an L2 block for every L1 block. N > 0 skips L1 blocks that
  // carry no deposits unless their number is a multiple of N.
  std::uint64_t empty_block_interval{0};
  // Known deposit sources are kept this many L1 blocks behind the safe head.
  std::uint64_t source_retention_blocks{256};

  std::uint64_t l1_block_time_seconds{12};
  std::uint64_t l2_block_time_seconds{2};
  std::uint64_t l1_scan_batch_size{100};
  std::uint64_t deposit_confirmation_timeout_seconds{600};
};

const RollupConfig& GetRollupConfig();
RollupConfig& GetMutableRollupConfig();
void SelectNetwork(NetworkType type);
// Preset values for |type| without touching the process-wide selection.
RollupConfig PresetFor(NetworkType type);
std::optional<NetworkType> NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

// Rejects parameter combinations the deriver cannot honor.
bool ValidateRollupConfig(const RollupConfig& config, std::string* error);

}  // namespace tidelink::config
