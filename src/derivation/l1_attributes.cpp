#include "derivation/l1_attributes.hpp"

#include <algorithm>
#include <utility>

#include "crypto/hash.hpp"

namespace tidelink::derivation {

namespace {

void AppendWord(std::vector<std::uint8_t>* out, const primitives::U256& value) {
  const auto bytes = value.ToBigEndian();
  out->insert(out->end(), bytes.begin(), bytes.end());
}

void AppendHash(std::vector<std::uint8_t>* out, const primitives::Hash256& hash) {
  out->insert(out->end(), hash.begin(), hash.end());
}

std::array<std::uint8_t, 32> ReadWord(std::span<const std::uint8_t> input, std::size_t index) {
  std::array<std::uint8_t, 32> word{};
  const auto offset = static_cast<std::ptrdiff_t>(4 + index * 32);
  std::copy_n(input.begin() + offset, word.size(), word.begin());
  return word;
}

bool ReadUint64Word(std::span<const std::uint8_t> input, std::size_t index, std::uint64_t* out) {
  const auto value = primitives::U256::FromBigEndian(ReadWord(input, index));
  if (!value.FitsUint64()) {
    return false;
  }
  *out = value.Low64();
  return true;
}

}  // namespace

const std::array<std::uint8_t, 4>& L1AttributesSelector() {
  static const std::array<std::uint8_t, 4> selector = [] {
    const auto digest = crypto::Sha3_256(
        "setL1BlockValues(uint64,uint64,uint256,bytes32,uint64,bytes32,uint256,uint256)");
    std::array<std::uint8_t, 4> out{};
    std::copy_n(digest.begin(), out.size(), out.begin());
    return out;
  }();
  return selector;
}

std::vector<std::uint8_t> EncodeL1Attributes(const L1Attributes& attributes) {
  std::vector<std::uint8_t> out;
  out.reserve(kL1AttributesEncodedSize);
  const auto& selector = L1AttributesSelector();
  out.insert(out.end(), selector.begin(), selector.end());
  AppendWord(&out, primitives::U256(attributes.number));
  AppendWord(&out, primitives::U256(attributes.timestamp));
  AppendWord(&out, attributes.base_fee);
  AppendHash(&out, attributes.block_hash);
  AppendWord(&out, primitives::U256(attributes.sequence_number));
  AppendHash(&out, attributes.batcher_hash);
  AppendWord(&out, attributes.fee_overhead);
  AppendWord(&out, attributes.fee_scalar);
  return out;
}

bool DecodeL1Attributes(std::span<const std::uint8_t> input, L1Attributes* attributes,
                        std::string* error) {
  auto fail = [&](const char* message) {
    if (error) *error = message;
    return false;
  };
  if (input.size() != kL1AttributesEncodedSize) {
    return fail("L1 attributes input has the wrong length");
  }
  if (!std::equal(L1AttributesSelector().begin(), L1AttributesSelector().end(), input.begin())) {
    return fail("L1 attributes selector mismatch");
  }
  L1Attributes out;
  if (!ReadUint64Word(input, 0, &out.number) || !ReadUint64Word(input, 1, &out.timestamp) ||
      !ReadUint64Word(input, 4, &out.sequence_number)) {
    return fail("L1 attributes integer field does not fit in 64 bits");
  }
  out.base_fee = primitives::U256::FromBigEndian(ReadWord(input, 2));
  out.block_hash = ReadWord(input, 3);
  out.batcher_hash = ReadWord(input, 5);
  out.fee_overhead = primitives::U256::FromBigEndian(ReadWord(input, 6));
  out.fee_scalar = primitives::U256::FromBigEndian(ReadWord(input, 7));
  *attributes = std::move(out);
  return true;
}

}  // namespace tidelink::derivation
