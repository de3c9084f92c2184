#include "withdrawal/withdrawal.hpp"

#include "crypto/hash.hpp"

namespace tidelink::withdrawal {

primitives::Hash256 ComputeWithdrawalHash(const WithdrawalTransaction& withdrawal) {
  const auto value = withdrawal.value.ToBigEndian();
  crypto::Sha3Writer writer;
  writer.Write("tidelink/withdrawal")
      .WriteUint64BE(withdrawal.nonce)
      .Write(withdrawal.sender)
      .Write(withdrawal.target)
      .Write(value)
      .WriteUint64BE(withdrawal.gas_limit)
      .WriteUint64BE(static_cast<std::uint64_t>(withdrawal.data.size()))
      .Write(withdrawal.data);
  return writer.Finalize();
}

}  // namespace tidelink::withdrawal
