#include <cstdlib>
#include <iostream>
#include <string>

#include "chain/event_log.hpp"
#include "primitives/u256.hpp"

using namespace tidelink;

namespace {

primitives::Address Fill(std::uint8_t value) {
  primitives::Address address{};
  address.fill(value);
  return address;
}

}  // namespace

int main() {
  try {
    const auto portal = Fill(0x7D);

    {
      chain::DepositEvent event;
      event.from = Fill(0x01);
      event.to = Fill(0x02);
      event.value = primitives::U256(5'000);
      event.gas_limit = 120'000;
      event.input = {0xDE, 0xAD};
      const auto log = chain::EncodeDepositEvent(portal, event);
      if (!chain::IsDepositEventLog(log, portal) || chain::IsDepositEventLog(log, Fill(0x7E))) {
        std::cerr << "deposit log recognition is wrong\n";
        return EXIT_FAILURE;
      }
      if (log.data.size() != 96 + event.input.size()) {
        std::cerr << "deposit payload size mismatch\n";
        return EXIT_FAILURE;
      }
      chain::DepositEvent decoded;
      std::string error;
      if (!chain::DecodeDepositEvent(log, &decoded, &error) || decoded != event) {
        std::cerr << "deposit event did not decode to itself: " << error << "\n";
        return EXIT_FAILURE;
      }

      // Zero 'to' topic means contract creation.
      event.to.reset();
      const auto creation = chain::EncodeDepositEvent(portal, event);
      if (!chain::DecodeDepositEvent(creation, &decoded, &error) || decoded.to.has_value()) {
        std::cerr << "contract-creation deposit decoded with a target\n";
        return EXIT_FAILURE;
      }

      auto missing_topic = log;
      missing_topic.topics.pop_back();
      if (chain::DecodeDepositEvent(missing_topic, &decoded, &error)) {
        std::cerr << "deposit log with two topics decoded\n";
        return EXIT_FAILURE;
      }

      auto dirty_padding = log;
      dirty_padding.topics[1][0] = 0x01;
      if (chain::DecodeDepositEvent(dirty_padding, &decoded, &error)) {
        std::cerr << "address topic with non-zero padding decoded\n";
        return EXIT_FAILURE;
      }

      auto short_data = log;
      short_data.data.resize(64);
      if (chain::DecodeDepositEvent(short_data, &decoded, &error)) {
        std::cerr << "deposit payload shorter than the header decoded\n";
        return EXIT_FAILURE;
      }

      auto trailing = log;
      trailing.data.push_back(0x00);
      if (chain::DecodeDepositEvent(trailing, &decoded, &error)) {
        std::cerr << "payload with bytes past data_length decoded\n";
        return EXIT_FAILURE;
      }

      auto wide_gas = log;
      wide_gas.data[32 + 23] = 0x01;  // bit 64 of the gas_limit word
      if (chain::DecodeDepositEvent(wide_gas, &decoded, &error)) {
        std::cerr << "gas_limit above 64 bits decoded\n";
        return EXIT_FAILURE;
      }
    }

    {
      const auto passer = Fill(0x42);
      chain::WithdrawalEvent event;
      event.target = Fill(0x09);
      event.value = primitives::U256(77);
      event.gas_limit = 60'000;
      event.data = {0x01};
      const auto log = chain::EncodeWithdrawalEvent(passer, event);
      if (!chain::IsWithdrawalEventLog(log, passer) || chain::IsDepositEventLog(log, passer)) {
        std::cerr << "withdrawal log recognition is wrong\n";
        return EXIT_FAILURE;
      }
      chain::WithdrawalEvent decoded;
      std::string error;
      if (!chain::DecodeWithdrawalEvent(log, &decoded, &error) || decoded.target != event.target ||
          decoded.value != event.value || decoded.gas_limit != event.gas_limit ||
          decoded.data != event.data) {
        std::cerr << "withdrawal event did not decode to itself: " << error << "\n";
        return EXIT_FAILURE;
      }
      if (chain::DepositEventTopic() == chain::WithdrawalEventTopic()) {
        std::cerr << "event topics collide\n";
        return EXIT_FAILURE;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "event_log_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
