#include "crypto/hash.hpp"

#include <oqs/sha3.h>

namespace tidelink::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha3_256Hash Sha3_256(std::string_view text) {
  return Sha3_256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Sha3Writer::Sha3Writer() { OQS_SHA3_sha3_256_inc_init(&ctx_); }

Sha3Writer::~Sha3Writer() { OQS_SHA3_sha3_256_inc_ctx_release(&ctx_); }

Sha3Writer& Sha3Writer::Write(std::span<const std::uint8_t> data) {
  if (!finalized_ && !data.empty()) {
    OQS_SHA3_sha3_256_inc_absorb(&ctx_, data.data(), data.size());
  }
  return *this;
}

Sha3Writer& Sha3Writer::Write(std::string_view text) {
  return Write(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Sha3Writer& Sha3Writer::WriteUint64BE(std::uint64_t value) {
  std::array<std::uint8_t, 8> bytes{};
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[bytes.size() - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
  }
  return Write(bytes);
}

Sha3_256Hash Sha3Writer::Finalize() {
  Sha3_256Hash out{};
  if (finalized_) {
    return out;
  }
  OQS_SHA3_sha3_256_inc_finalize(out.data(), &ctx_);
  finalized_ = true;
  return out;
}

Sha3_256Hash TaggedHash(std::string_view tag, std::span<const std::uint8_t> a,
                        std::span<const std::uint8_t> b) {
  Sha3Writer writer;
  writer.Write(tag).Write(a).Write(b);
  return writer.Finalize();
}

}  // namespace tidelink::crypto
