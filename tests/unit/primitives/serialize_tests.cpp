#include <cstdlib>
#include <iostream>
#include <variant>
#include <vector>

#include "primitives/serialize.hpp"
#include "primitives/transaction.hpp"
#include "primitives/tx_hash.hpp"

using namespace tidelink::primitives;

namespace {

SignedTransaction SampleSigned() {
  SignedTransaction tx;
  tx.chain_id = 901;
  tx.nonce = 5;
  tx.sender.fill(0x11);
  tx.to = Address{};
  tx.to->fill(0x22);
  tx.value = U256(1'000);
  tx.gas_limit = 21'000;
  tx.max_fee_per_gas = 10;
  tx.max_priority_fee_per_gas = 1;
  tx.input = {0x00, 0x00, 0x01};
  tx.signature = {0xAA, 0xBB};
  return tx;
}

TxDeposit SampleDeposit() {
  DepositFields fields;
  fields.source_hash.fill(0x33);
  fields.from.fill(0x44);
  fields.value = U256(77);
  fields.gas_limit = 90'000;
  fields.input = {0x01, 0x02};
  return TxDeposit::User(fields);
}

}  // namespace

int main() {
  try {
    {
      std::vector<std::uint8_t> encoded;
      serialize::SerializeTransaction(Transaction{SampleSigned()}, &encoded);
      if (encoded.empty() || encoded[0] != kDynamicFeeTxType) {
        std::cerr << "signed transaction missing type byte\n";
        return EXIT_FAILURE;
      }
      std::size_t offset = 0;
      Transaction decoded;
      if (!serialize::DeserializeTransaction(encoded, &offset, &decoded) ||
          offset != encoded.size() || std::get<SignedTransaction>(decoded) != SampleSigned()) {
        std::cerr << "signed transaction did not survive encoding\n";
        return EXIT_FAILURE;
      }
      for (std::size_t cut = 0; cut < encoded.size(); ++cut) {
        std::vector<std::uint8_t> truncated(encoded.begin(),
                                            encoded.begin() + static_cast<std::ptrdiff_t>(cut));
        std::size_t truncated_offset = 0;
        Transaction ignored;
        if (serialize::DeserializeTransaction(truncated, &truncated_offset, &ignored)) {
          std::cerr << "truncated encoding of " << cut << " bytes decoded\n";
          return EXIT_FAILURE;
        }
      }
    }

    {
      // Contract-creation deposit with the system flag restored from chain data.
      DepositFields fields = SampleDeposit().fields();
      fields.to.reset();
      const auto system = ChainDataDecoder::RestoreDeposit(fields, true);
      std::vector<std::uint8_t> encoded;
      serialize::SerializeTransaction(Transaction{system}, &encoded);
      std::size_t offset = 0;
      Transaction decoded;
      if (!serialize::DeserializeTransaction(encoded, &offset, &decoded)) {
        std::cerr << "deposit failed to decode\n";
        return EXIT_FAILURE;
      }
      const auto& deposit = std::get<TxDeposit>(decoded);
      if (!deposit.is_system() || !deposit.IsContractCreation() || deposit.mint() != U256(77) ||
          deposit != system) {
        std::cerr << "deposit fields changed across encoding\n";
        return EXIT_FAILURE;
      }

      // A mint that differs from value is not a valid deposit encoding. The
      // mint word starts after type, source hash, from and the to marker.
      auto tampered = encoded;
      tampered[1 + 32 + 20 + 1 + 31] ^= 0x01;
      offset = 0;
      if (serialize::DeserializeTransaction(tampered, &offset, &decoded)) {
        std::cerr << "deposit with mint != value decoded\n";
        return EXIT_FAILURE;
      }

      auto unknown_type = encoded;
      unknown_type[0] = 0x05;
      offset = 0;
      if (serialize::DeserializeTransaction(unknown_type, &offset, &decoded)) {
        std::cerr << "unknown transaction type decoded\n";
        return EXIT_FAILURE;
      }
    }

    {
      const std::vector<std::uint8_t> bytes{0x00, 0x01, 0x00, 0xFF, 0x00};
      const auto counts = serialize::CountEncodedBytes(bytes);
      if (counts.zero_bytes != 3 || counts.nonzero_bytes != 2) {
        std::cerr << "CountEncodedBytes mismatch\n";
        return EXIT_FAILURE;
      }
    }

    {
      const Transaction a{SampleSigned()};
      auto changed = SampleSigned();
      changed.nonce += 1;
      if (ComputeTxHash(a) != ComputeTxHash(Transaction{SampleSigned()}) ||
          ComputeTxHash(a) == ComputeTxHash(Transaction{changed})) {
        std::cerr << "transaction hash is not a function of the encoding\n";
        return EXIT_FAILURE;
      }
      const auto user = SampleDeposit();
      const auto system = ChainDataDecoder::RestoreDeposit(user.fields(), true);
      if (ComputeTxHash(Transaction{user}) == ComputeTxHash(Transaction{system})) {
        std::cerr << "system flag does not affect the transaction hash\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "serialize_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
