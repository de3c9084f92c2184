#include <cstdlib>
#include <iostream>
#include <string>

#include "config/rollup_config.hpp"

using namespace tidelink::config;

int main() {
  try {
    if (NetworkFromString("dev") != NetworkType::kDevnet ||
        NetworkFromString("testnet") != NetworkType::kTestnet ||
        NetworkFromString("regtest").has_value()) {
      std::cerr << "network name parsing wrong\n";
      return EXIT_FAILURE;
    }
    for (auto type : {NetworkType::kMainnet, NetworkType::kTestnet, NetworkType::kDevnet}) {
      const auto preset = PresetFor(type);
      std::string error;
      if (!ValidateRollupConfig(preset, &error)) {
        std::cerr << NetworkName(type) << " preset invalid: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (NetworkFromString(NetworkName(type)) != type || preset.network_id != NetworkName(type)) {
        std::cerr << "network name does not round trip\n";
        return EXIT_FAILURE;
      }
    }
    if (PresetFor(NetworkType::kMainnet).deposit_portal ==
        PresetFor(NetworkType::kTestnet).deposit_portal) {
      std::cerr << "networks share a deposit portal\n";
      return EXIT_FAILURE;
    }

    SelectNetwork(NetworkType::kDevnet);
    if (GetRollupConfig().l2_chain_id != 901) {
      std::cerr << "devnet selection not applied\n";
      return EXIT_FAILURE;
    }
    GetMutableRollupConfig().empty_block_interval = 4;
    SelectNetwork(NetworkType::kDevnet);
    if (GetRollupConfig().empty_block_interval != 0) {
      std::cerr << "reselecting a network should reset overrides\n";
      return EXIT_FAILURE;
    }

    std::string error;
    auto bad = PresetFor(NetworkType::kDevnet);
    bad.max_deposit_gas_limit = 0;
    if (ValidateRollupConfig(bad, &error)) {
      std::cerr << "zero deposit gas ceiling accepted\n";
      return EXIT_FAILURE;
    }
    bad = PresetFor(NetworkType::kDevnet);
    bad.deposit_portal = {};
    if (ValidateRollupConfig(bad, &error)) {
      std::cerr << "unset deposit portal accepted\n";
      return EXIT_FAILURE;
    }
    bad = PresetFor(NetworkType::kDevnet);
    bad.l1_block_info = bad.system_depositor;
    if (ValidateRollupConfig(bad, &error)) {
      std::cerr << "system depositor equal to the L1 info target accepted\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "rollup_config_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
