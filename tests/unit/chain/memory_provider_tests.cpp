#include <cstdlib>
#include <iostream>

#include "../util/chain_fixtures.hpp"
#include "chain/memory_provider.hpp"
#include "primitives/tx_hash.hpp"

using namespace tidelink;
using tidelink::test::ChainHash;
using tidelink::test::MakeAddress;
using tidelink::test::MakeDepositEvent;

int main() {
  try {
    chain::InMemoryChainProvider provider;
    if (provider.LatestBlockNumber() != 0 || provider.BlockByNumber(0)) {
      std::cerr << "empty provider should report nothing\n";
      return EXIT_FAILURE;
    }
    tidelink::test::L1ChainBuilder builder(&provider, MakeAddress(0x7D));
    builder.AddRange(1, 4, {{3, {MakeDepositEvent(0x0A, 1)}}});
    provider.SetFinalized(2);
    if (provider.LatestBlockNumber() != 4 || provider.FinalizedBlockNumber() != 2 ||
        provider.BlockCount() != 4) {
      std::cerr << "heads wrong after AddRange\n";
      return EXIT_FAILURE;
    }
    const auto block3 = provider.BlockByNumber(3);
    const auto deposit_tx_hash = primitives::ComputeTxHash(block3->transactions.at(0));
    if (!provider.ReceiptByHash(deposit_tx_hash, nullptr)) {
      std::cerr << "receipt for block 3 missing\n";
      return EXIT_FAILURE;
    }

    // Replacing block 3 on another fork drops the old receipts.
    builder.AddBlock(3, {}, 1);
    if (provider.ReceiptByHash(deposit_tx_hash, nullptr) ||
        provider.BlockByNumber(3)->hash != ChainHash(3, 1)) {
      std::cerr << "replaced block kept stale receipts\n";
      return EXIT_FAILURE;
    }

    provider.TruncateFrom(3);
    if (provider.LatestBlockNumber() != 2 || provider.BlockByNumber(4)) {
      std::cerr << "TruncateFrom left later blocks behind\n";
      return EXIT_FAILURE;
    }

    provider.SetLatestOverride(9);
    if (provider.LatestBlockNumber() != 9 || provider.BlockByNumber(9)) {
      std::cerr << "latest override not honored\n";
      return EXIT_FAILURE;
    }
    provider.ReplaceAll({}, 0);
    if (provider.LatestBlockNumber() != 0 || provider.BlockCount() != 0) {
      std::cerr << "ReplaceAll with nothing should empty the chain\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "memory_provider_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
