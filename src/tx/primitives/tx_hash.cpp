#include "primitives/tx_hash.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace tidelink::primitives {

Hash256 ComputeTxHash(const Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer);
  return crypto::Sha3_256(buffer);
}

}  // namespace tidelink::primitives
