#pragma once

#include <cstdint>
#include <vector>

#include "primitives/hash.hpp"
#include "primitives/transaction.hpp"

namespace tidelink::primitives {

struct Log {
  Address address{};
  std::vector<Hash256> topics{};
  std::vector<std::uint8_t> data{};

  bool operator==(const Log& other) const = default;
};

struct Receipt {
  Hash256 tx_hash{};
  bool success{true};
  std::uint64_t gas_used{0};
  std::vector<Log> logs{};
};

// Read-only view of a block as served by a chain provider. The same shape is
// used for L1 and L2; L1 blocks carry regular transactions only.
struct BlockView {
  std::uint64_t number{0};
  Hash256 hash{};
  Hash256 parent_hash{};
  std::uint64_t timestamp{0};
  std::uint64_t base_fee{0};
  std::vector<Transaction> transactions{};
};

}  // namespace tidelink::primitives
