#include "config/rollup_config.hpp"

#include <utility>

namespace tidelink::config {

namespace {

// 0x4200...00<suffix>, the predeploy address range on L2.
primitives::Address Predeploy(std::uint8_t suffix) {
  primitives::Address address{};
  address[0] = 0x42;
  address[19] = suffix;
  return address;
}

primitives::Address SystemDepositor() {
  primitives::Address address{};
  for (std::size_t i = 0; i < address.size(); ++i) {
    address[i] = (i % 2 == 0) ? 0xDE : 0xAD;
  }
  address[18] = 0x00;
  address[19] = 0x01;
  return address;
}

primitives::Address Portal(std::uint8_t network_byte) {
  primitives::Address address{};
  address[0] = 0x7D;
  address[1] = 0x1E;
  address[18] = network_byte;
  address[19] = 0x01;
  return address;
}

RollupConfig BuildConfig(NetworkType type, std::string id, std::uint64_t l1_chain_id,
                         std::uint64_t l2_chain_id, std::uint8_t portal_byte,
                         std::uint64_t genesis_l1_block, std::uint64_t l1_block_time,
                         std::uint64_t confirmation_timeout) {
  RollupConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.l1_chain_id = l1_chain_id;
  cfg.l2_chain_id = l2_chain_id;
  cfg.deposit_portal = Portal(portal_byte);
  cfg.message_passer = Predeploy(0x16);
  cfg.system_depositor = SystemDepositor();
  cfg.l1_block_info = Predeploy(0x15);
  cfg.genesis_l1_block = genesis_l1_block;
  cfg.l1_block_time_seconds = l1_block_time;
  cfg.deposit_confirmation_timeout_seconds = confirmation_timeout;
  return cfg;
}

RollupConfig g_rollup_config = PresetFor(NetworkType::kMainnet);

}  // namespace

RollupConfig PresetFor(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return BuildConfig(NetworkType::kMainnet, "mainnet", 1, 4217, 0x01, 0, 12, 600);
    case NetworkType::kTestnet:
      return BuildConfig(NetworkType::kTestnet, "testnet", 11155111, 42170, 0x02, 0, 12, 600);
    case NetworkType::kDevnet: {
      auto cfg = BuildConfig(NetworkType::kDevnet, "devnet", 900, 901, 0x03, 0, 2, 30);
      cfg.l2_block_time_seconds = 1;
      cfg.source_retention_blocks = 16;
      return cfg;
    }
  }
  return BuildConfig(NetworkType::kMainnet, "mainnet", 1, 4217, 0x01, 0, 12, 600);
}

const RollupConfig& GetRollupConfig() { return g_rollup_config; }

RollupConfig& GetMutableRollupConfig() { return g_rollup_config; }

void SelectNetwork(NetworkType type) { g_rollup_config = PresetFor(type); }

std::optional<NetworkType> NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "devnet" || name == "dev") return NetworkType::kDevnet;
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kDevnet:
      return "devnet";
  }
  return "mainnet";
}

bool ValidateRollupConfig(const RollupConfig& config, std::string* error) {
  auto fail = [&](std::string message) {
    if (error) *error = std::move(message);
    return false;
  };
  if (config.max_deposit_gas_limit == 0) {
    return fail("max_deposit_gas_limit must be positive");
  }
  if (config.fee_scalar == 0) {
    return fail("fee_scalar must be positive");
  }
  if (config.l1_scan_batch_size == 0) {
    return fail("l1_scan_batch_size must be positive");
  }
  if (config.l1_block_time_seconds == 0 || config.l2_block_time_seconds == 0) {
    return fail("block times must be positive");
  }
  if (config.deposit_portal == primitives::Address{}) {
    return fail("deposit_portal must be set");
  }
  if (config.system_depositor == config.l1_block_info) {
    return fail("system_depositor and l1_block_info must differ");
  }
  return true;
}

}  // namespace tidelink::config
