#include "chain/event_log.hpp"

#include <algorithm>
#include <utility>

#include "crypto/hash.hpp"

namespace tidelink::chain {

namespace {

constexpr std::size_t kWordSize = 32;
constexpr std::size_t kPayloadHeaderSize = 3 * kWordSize;

bool Fail(std::string* error, std::string message) {
  if (error) *error = std::move(message);
  return false;
}

std::array<std::uint8_t, kWordSize> Word(std::span<const std::uint8_t> bytes,
                                         std::size_t index) {
  std::array<std::uint8_t, kWordSize> word{};
  std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(index * kWordSize), kWordSize,
              word.begin());
  return word;
}

void AppendWord(std::vector<std::uint8_t>* out, const primitives::U256& value) {
  const auto bytes = value.ToBigEndian();
  out->insert(out->end(), bytes.begin(), bytes.end());
}

}  // namespace

const primitives::Hash256& DepositEventTopic() {
  static const primitives::Hash256 topic =
      crypto::Sha3_256("TransactionDeposited(address,address,uint256,uint64,bytes)");
  return topic;
}

const primitives::Hash256& WithdrawalEventTopic() {
  static const primitives::Hash256 topic =
      crypto::Sha3_256("MessagePassed(address,uint256,uint64,bytes)");
  return topic;
}

primitives::Hash256 AddressToTopic(const primitives::Address& address) {
  primitives::Hash256 topic{};
  std::copy(address.begin(), address.end(), topic.begin() + (topic.size() - address.size()));
  return topic;
}

bool AddressFromTopic(const primitives::Hash256& topic, primitives::Address* address) {
  const std::size_t padding = topic.size() - address->size();
  if (!std::all_of(topic.begin(), topic.begin() + padding,
                   [](std::uint8_t byte) { return byte == 0; })) {
    return false;
  }
  std::copy(topic.begin() + padding, topic.end(), address->begin());
  return true;
}

std::vector<std::uint8_t> EncodeBridgePayload(const BridgePayload& payload) {
  std::vector<std::uint8_t> out;
  out.reserve(kPayloadHeaderSize + payload.data.size());
  AppendWord(&out, payload.amount);
  AppendWord(&out, primitives::U256(payload.gas_limit));
  AppendWord(&out, primitives::U256(static_cast<std::uint64_t>(payload.data.size())));
  out.insert(out.end(), payload.data.begin(), payload.data.end());
  return out;
}

bool DecodeBridgePayload(std::span<const std::uint8_t> bytes, BridgePayload* payload,
                         std::string* error) {
  if (bytes.size() < kPayloadHeaderSize) {
    return Fail(error, "event data shorter than the fixed header");
  }
  const auto amount = primitives::U256::FromBigEndian(Word(bytes, 0));
  const auto gas_limit = primitives::U256::FromBigEndian(Word(bytes, 1));
  const auto data_length = primitives::U256::FromBigEndian(Word(bytes, 2));
  if (!gas_limit.FitsUint64()) {
    return Fail(error, "gas_limit does not fit in 64 bits");
  }
  if (!data_length.FitsUint64()) {
    return Fail(error, "data_length does not fit in 64 bits");
  }
  const std::size_t remaining = bytes.size() - kPayloadHeaderSize;
  if (data_length.Low64() != remaining) {
    return Fail(error, "data_length " + data_length.ToString() + " does not match " +
                           std::to_string(remaining) + " trailing bytes");
  }
  payload->amount = amount;
  payload->gas_limit = gas_limit.Low64();
  payload->data.assign(bytes.begin() + kPayloadHeaderSize, bytes.end());
  return true;
}

bool IsDepositEventLog(const primitives::Log& log, const primitives::Address& portal) {
  return log.address == portal && !log.topics.empty() && log.topics[0] == DepositEventTopic();
}

bool DecodeDepositEvent(const primitives::Log& log, DepositEvent* event, std::string* error) {
  if (log.topics.size() != 3 || log.topics[0] != DepositEventTopic()) {
    return Fail(error, "deposit log needs exactly three topics");
  }
  DepositEvent out;
  if (!AddressFromTopic(log.topics[1], &out.from)) {
    return Fail(error, "deposit 'from' topic has non-zero padding");
  }
  primitives::Address to{};
  if (!AddressFromTopic(log.topics[2], &to)) {
    return Fail(error, "deposit 'to' topic has non-zero padding");
  }
  if (to != primitives::Address{}) {
    out.to = to;
  }
  BridgePayload payload;
  if (!DecodeBridgePayload(log.data, &payload, error)) {
    return false;
  }
  out.value = payload.amount;
  out.gas_limit = payload.gas_limit;
  out.input = std::move(payload.data);
  *event = std::move(out);
  return true;
}

primitives::Log EncodeDepositEvent(const primitives::Address& portal, const DepositEvent& event) {
  primitives::Log log;
  log.address = portal;
  log.topics.push_back(DepositEventTopic());
  log.topics.push_back(AddressToTopic(event.from));
  log.topics.push_back(AddressToTopic(event.to.value_or(primitives::Address{})));
  log.data = EncodeBridgePayload(BridgePayload{event.value, event.gas_limit, event.input});
  return log;
}

bool IsWithdrawalEventLog(const primitives::Log& log, const primitives::Address& passer) {
  return log.address == passer && !log.topics.empty() && log.topics[0] == WithdrawalEventTopic();
}

bool DecodeWithdrawalEvent(const primitives::Log& log, WithdrawalEvent* event,
                           std::string* error) {
  if (log.topics.size() != 2 || log.topics[0] != WithdrawalEventTopic()) {
    return Fail(error, "withdrawal log needs exactly two topics");
  }
  WithdrawalEvent out;
  if (!AddressFromTopic(log.topics[1], &out.target)) {
    return Fail(error, "withdrawal 'to' topic has non-zero padding");
  }
  BridgePayload payload;
  if (!DecodeBridgePayload(log.data, &payload, error)) {
    return false;
  }
  out.value = payload.amount;
  out.gas_limit = payload.gas_limit;
  out.data = std::move(payload.data);
  *event = std::move(out);
  return true;
}

primitives::Log EncodeWithdrawalEvent(const primitives::Address& passer,
                                      const WithdrawalEvent& event) {
  primitives::Log log;
  log.address = passer;
  log.topics.push_back(WithdrawalEventTopic());
  log.topics.push_back(AddressToTopic(event.target));
  log.data = EncodeBridgePayload(BridgePayload{event.value, event.gas_limit, event.data});
  return log;
}

}  // namespace tidelink::chain
