#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

#include <oqs/sha3_ops.h>

namespace tidelink::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);
Sha3_256Hash Sha3_256(std::string_view text);

// Incremental SHA3-256 over several fields without building a contiguous
// preimage first. Finalize() may be called once.
class Sha3Writer {
 public:
  Sha3Writer();
  ~Sha3Writer();

  Sha3Writer(const Sha3Writer&) = delete;
  Sha3Writer& operator=(const Sha3Writer&) = delete;

  Sha3Writer& Write(std::span<const std::uint8_t> data);
  Sha3Writer& Write(std::string_view text);
  Sha3Writer& WriteUint64BE(std::uint64_t value);
  Sha3_256Hash Finalize();

 private:
  OQS_SHA3_sha3_256_inc_ctx ctx_{};
  bool finalized_{false};
};

// Domain-separated hash: SHA3-256(tag || a || b).
Sha3_256Hash TaggedHash(std::string_view tag, std::span<const std::uint8_t> a = {},
                        std::span<const std::uint8_t> b = {});

}  // namespace tidelink::crypto
