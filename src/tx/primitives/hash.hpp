#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace tidelink::primitives {

using Hash256 = std::array<std::uint8_t, 32>;
using Address = std::array<std::uint8_t, 20>;

struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::size_t result = 0;
    for (auto byte : hash) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

struct AddressHasher {
  std::size_t operator()(const Address& address) const noexcept {
    std::size_t result = 0;
    for (auto byte : address) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

}  // namespace tidelink::primitives
