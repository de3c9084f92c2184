#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "chain/event_log.hpp"

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, std::size_t size) {
  using tidelink::chain::DecodeDepositEvent;
  using tidelink::chain::DecodeWithdrawalEvent;
  using tidelink::chain::DepositEvent;
  using tidelink::chain::WithdrawalEvent;

  if (data == nullptr || size == 0) return 0;
  constexpr std::size_t kMaxInputBytes = 1u << 16;
  if (size > kMaxInputBytes) return 0;

  // First byte: topic count (low two bits) and which decoder to run.
  const std::uint8_t mode = data[0];
  const std::size_t topic_count = mode & 0x03u;
  const bool withdrawal = (mode & 0x04u) != 0;

  tidelink::primitives::Log log;
  std::size_t offset = 1;
  for (std::size_t i = 0; i < topic_count; ++i) {
    tidelink::primitives::Hash256 topic{};
    for (std::size_t j = 0; j < topic.size() && offset < size; ++j) {
      topic[j] = data[offset++];
    }
    log.topics.push_back(topic);
  }
  log.data.assign(data + offset, data + size);

  try {
    std::string error;
    if (withdrawal) {
      WithdrawalEvent event;
      (void)DecodeWithdrawalEvent(log, &event, &error);
    } else {
      DepositEvent event;
      (void)DecodeDepositEvent(log, &event, &error);
    }
  } catch (const std::exception&) {
  }
  return 0;
}
