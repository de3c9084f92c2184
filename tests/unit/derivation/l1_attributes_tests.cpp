#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include "derivation/l1_attributes.hpp"

using namespace tidelink;

int main() {
  try {
    derivation::L1Attributes attributes;
    attributes.number = 100;
    attributes.timestamp = 1'700'001'200;
    attributes.base_fee = primitives::U256(25'000'000'000ULL);
    attributes.block_hash.fill(0xAB);
    attributes.sequence_number = 0;
    attributes.batcher_hash.fill(0x01);
    attributes.fee_overhead = primitives::U256(188);
    attributes.fee_scalar = primitives::U256(684'000);

    const auto encoded = derivation::EncodeL1Attributes(attributes);
    if (encoded.size() != derivation::kL1AttributesEncodedSize) {
      std::cerr << "unexpected encoded size " << encoded.size() << "\n";
      return EXIT_FAILURE;
    }
    const auto& selector = derivation::L1AttributesSelector();
    if (!std::equal(selector.begin(), selector.end(), encoded.begin())) {
      std::cerr << "encoding does not start with the selector\n";
      return EXIT_FAILURE;
    }
    // number is the first word, right-aligned.
    if (encoded[4 + 31] != 100 || encoded[4] != 0) {
      std::cerr << "number word is not big-endian\n";
      return EXIT_FAILURE;
    }

    derivation::L1Attributes decoded;
    std::string error;
    if (!derivation::DecodeL1Attributes(encoded, &decoded, &error) || decoded != attributes) {
      std::cerr << "L1 attributes did not decode to themselves: " << error << "\n";
      return EXIT_FAILURE;
    }

    auto bad_selector = encoded;
    bad_selector[0] ^= 0xFF;
    if (derivation::DecodeL1Attributes(bad_selector, &decoded, &error)) {
      std::cerr << "wrong selector accepted\n";
      return EXIT_FAILURE;
    }

    auto truncated = encoded;
    truncated.pop_back();
    if (derivation::DecodeL1Attributes(truncated, &decoded, &error)) {
      std::cerr << "truncated attributes accepted\n";
      return EXIT_FAILURE;
    }

    // A timestamp word wider than 64 bits is not a valid L1 timestamp.
    auto wide_timestamp = encoded;
    wide_timestamp[4 + 32] = 0x01;
    if (derivation::DecodeL1Attributes(wide_timestamp, &decoded, &error)) {
      std::cerr << "oversized timestamp accepted\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "l1_attributes_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
