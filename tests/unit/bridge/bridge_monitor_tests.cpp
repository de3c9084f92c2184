#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stop_token>
#include <thread>
#include <vector>

#include "../util/chain_fixtures.hpp"
#include "bridge/bridge_monitor.hpp"
#include "chain/memory_provider.hpp"
#include "deposit/deposit.hpp"
#include "primitives/tx_hash.hpp"

using namespace tidelink;
using tidelink::test::L1ChainBuilder;
using tidelink::test::MakeAddress;
using tidelink::test::MakeDepositEvent;
using tidelink::test::MakeHash;

namespace {

struct FakeClock {
  bridge::Clock::time_point now{bridge::Clock::time_point{} + std::chrono::hours(1)};
  bridge::ClockFn Fn() {
    return [this] { return now; };
  }
};

struct MonitorHarness {
  chain::InMemoryChainProvider l1;
  chain::InMemoryChainProvider l2;
  L1ChainBuilder builder{&l1, MakeAddress(0x7D)};
  withdrawal::PendingWithdrawals withdrawals;
  FakeClock clock;
  std::vector<bridge::MonitorError> alerts;
  bridge::BridgeMonitor monitor;

  explicit MonitorHarness(bridge::BridgeMonitorOptions options = Options())
      : monitor(l1, l2, options, &withdrawals, clock.Fn()) {
    monitor.SetAlertHandler([this](const bridge::MonitorError& alert, const bridge::TrackedDeposit&) {
      alerts.push_back(alert);
    });
  }

  static bridge::BridgeMonitorOptions Options() {
    bridge::BridgeMonitorOptions options;
    options.deposit_portal = MakeAddress(0x7D);
    options.message_passer = MakeAddress(0x42);
    options.batch_size = 10;
    options.confirmation_timeout = std::chrono::seconds(60);
    options.deposit_poll_interval = std::chrono::milliseconds(5);
    options.withdrawal_poll_interval = std::chrono::milliseconds(5);
    return options;
  }

  // L2 block |number| carrying user deposits mirroring |events|.
  void AddL2Deposits(std::uint64_t number, const std::vector<chain::DepositEvent>& events) {
    primitives::BlockView block;
    block.number = number;
    block.hash = MakeHash(static_cast<std::uint8_t>(0x20 + number));
    for (std::size_t i = 0; i < events.size(); ++i) {
      primitives::DepositFields fields;
      fields.source_hash = deposit::UserDepositSourceHash(block.hash, i);
      fields.from = events[i].from;
      fields.to = events[i].to;
      fields.value = events[i].value;
      fields.gas_limit = events[i].gas_limit;
      fields.input = events[i].input;
      block.transactions.emplace_back(primitives::TxDeposit::User(std::move(fields)));
    }
    l2.PutBlock(std::move(block));
  }
};

bool TestUnmatchedDepositAlertsOnce() {
  MonitorHarness h;
  h.builder.AddBlock(1, {MakeDepositEvent(0x0A, 5)});
  bridge::MonitorError error;
  if (!h.monitor.PollDepositsOnce(&error) || h.monitor.cursors().l1_deposit_cursor.Load() != 1) {
    std::cerr << "deposit poll failed: " << error.message << "\n";
    return false;
  }
  if (!h.monitor.ScanL2ForConfirmations(&error)) {
    std::cerr << "L2 scan failed on an empty chain\n";
    return false;
  }
  h.clock.now += std::chrono::seconds(30);
  if (h.monitor.ExpireOverdueDeposits() != 0 || !h.alerts.empty()) {
    std::cerr << "deposit timed out before its deadline\n";
    return false;
  }
  h.clock.now += std::chrono::seconds(31);
  if (h.monitor.ExpireOverdueDeposits() != 1 || h.alerts.size() != 1 ||
      h.alerts[0].code != bridge::MonitorError::Code::kDepositNotFoundOnL2 ||
      h.alerts[0].block != 1) {
    std::cerr << "overdue deposit did not raise exactly one DepositNotFoundOnL2\n";
    return false;
  }
  // Later polls do not re-alert.
  h.monitor.PollDepositsOnce(&error);
  h.monitor.ScanL2ForConfirmations(&error);
  h.clock.now += std::chrono::minutes(5);
  if (h.monitor.ExpireOverdueDeposits() != 0 || h.alerts.size() != 1) {
    std::cerr << "timed-out deposit alerted again\n";
    return false;
  }
  const auto deposits = h.monitor.Deposits();
  if (deposits.size() != 1 || deposits[0].status != bridge::DepositStatus::kTimedOut ||
      h.monitor.Stats().deposits_timed_out != 1) {
    std::cerr << "timed-out status not recorded\n";
    return false;
  }
  return true;
}

bool TestLateL2DepositClaimedByTimedOutDeposit() {
  MonitorHarness h;
  const auto event = MakeDepositEvent(0x0D, 3);
  h.builder.AddBlock(1, {event});
  bridge::MonitorError error;
  h.monitor.PollDepositsOnce(&error);
  h.clock.now += std::chrono::seconds(61);
  if (h.monitor.ExpireOverdueDeposits() != 1 || h.alerts.size() != 1) {
    std::cerr << "first deposit did not time out\n";
    return false;
  }
  // The deposit lands after its alert.
  h.AddL2Deposits(1, {event});
  if (!h.monitor.ScanL2ForConfirmations(&error)) {
    std::cerr << "L2 scan failed: " << error.message << "\n";
    return false;
  }
  auto deposits = h.monitor.Deposits();
  if (deposits.size() != 1 || deposits[0].status != bridge::DepositStatus::kTimedOut ||
      deposits[0].l2_block != 1u || h.monitor.Stats().deposits_landed_late != 1 ||
      h.alerts.size() != 1) {
    std::cerr << "late L2 deposit not recorded on the timed-out deposit\n";
    return false;
  }

  // The same user repeats the deposit; it never reaches L2.
  h.builder.AddBlock(2, {event});
  if (!h.monitor.PollDepositsOnce(&error)) {
    std::cerr << "second poll failed: " << error.message << "\n";
    return false;
  }
  deposits = h.monitor.Deposits();
  if (deposits.size() != 2 || deposits[1].status != bridge::DepositStatus::kPending) {
    std::cerr << "repeated deposit confirmed by the earlier L2 deposit\n";
    return false;
  }
  h.clock.now += std::chrono::seconds(61);
  if (h.monitor.ExpireOverdueDeposits() != 1 || h.alerts.size() != 2 || h.alerts[1].block != 2) {
    std::cerr << "repeated deposit did not raise its own alert\n";
    return false;
  }
  return true;
}

bool TestDepositConfirmedOnL2() {
  MonitorHarness h;
  const auto event = MakeDepositEvent(0x0B, 9);
  h.builder.AddBlock(1, {event, MakeDepositEvent(0x0C, 1)});
  h.AddL2Deposits(1, {});
  h.AddL2Deposits(2, {event});
  bridge::MonitorError error;
  if (!h.monitor.PollDepositsOnce(&error) || !h.monitor.ScanL2ForConfirmations(&error)) {
    std::cerr << "poll failed: " << error.message << "\n";
    return false;
  }
  const auto deposits = h.monitor.Deposits();
  if (deposits.size() != 2 || deposits[0].status != bridge::DepositStatus::kConfirmed ||
      deposits[0].l2_block != 2u || deposits[1].status != bridge::DepositStatus::kPending ||
      deposits[1].log_index != 1) {
    std::cerr << "L2 deposit not matched to its L1 origin\n";
    return false;
  }
  h.clock.now += std::chrono::minutes(2);
  if (h.monitor.ExpireOverdueDeposits() != 1 || h.alerts.size() != 1) {
    std::cerr << "only the unmatched deposit should time out\n";
    return false;
  }
  return true;
}

bool TestL2AheadOfL1Scan() {
  MonitorHarness h;
  const auto event = MakeDepositEvent(0x0D, 3);
  h.AddL2Deposits(1, {event});
  bridge::MonitorError error;
  if (!h.monitor.ScanL2ForConfirmations(&error)) {
    std::cerr << "L2 scan failed\n";
    return false;
  }
  h.builder.AddBlock(1, {event});
  if (!h.monitor.PollDepositsOnce(&error)) {
    std::cerr << "deposit poll failed\n";
    return false;
  }
  const auto deposits = h.monitor.Deposits();
  if (deposits.size() != 1 || deposits[0].status != bridge::DepositStatus::kConfirmed ||
      h.monitor.Stats().deposits_confirmed != 1) {
    std::cerr << "deposit seen on L2 first was not matched\n";
    return false;
  }
  return true;
}

bool TestInvalidLogSkipped() {
  MonitorHarness h;
  const auto portal = MakeAddress(0x7D);
  primitives::BlockView block;
  block.number = 1;
  block.hash = tidelink::test::ChainHash(1);
  std::vector<primitives::Receipt> receipts;
  for (std::uint64_t nonce = 0; nonce < 2; ++nonce) {
    const auto tx = tidelink::test::PortalCall(portal, MakeAddress(0x01), nonce);
    primitives::Receipt receipt;
    receipt.tx_hash = primitives::ComputeTxHash(primitives::Transaction{tx});
    auto log = chain::EncodeDepositEvent(portal, MakeDepositEvent(0x01, 10 + nonce));
    if (nonce == 0) {
      log.data.resize(40);
    }
    receipt.logs.push_back(std::move(log));
    block.transactions.emplace_back(tx);
    receipts.push_back(std::move(receipt));
  }
  h.l1.PutBlock(block, receipts);
  bridge::MonitorError error;
  if (!h.monitor.PollDepositsOnce(&error)) {
    std::cerr << "malformed log stalled the deposit poll\n";
    return false;
  }
  const auto deposits = h.monitor.Deposits();
  if (h.monitor.Stats().invalid_event_logs != 1 || deposits.size() != 1 ||
      deposits[0].event.value != primitives::U256(11) ||
      h.monitor.cursors().l1_deposit_cursor.Load() != 1) {
    std::cerr << "invalid log not skipped cleanly\n";
    return false;
  }
  return true;
}

bool TestMissingBlockHoldsCursor() {
  MonitorHarness h;
  h.builder.AddRange(1, 2);
  h.l1.SetLatestOverride(5);
  bridge::MonitorError error;
  if (h.monitor.PollDepositsOnce(&error) ||
      error.code != bridge::MonitorError::Code::kBlockNotFound || error.block != 3) {
    std::cerr << "missing L1 block not reported\n";
    return false;
  }
  if (h.monitor.cursors().l1_deposit_cursor.Load() != 0) {
    std::cerr << "cursor advanced past an unreadable batch\n";
    return false;
  }
  h.l1.SetLatestOverride(std::nullopt);
  if (!h.monitor.PollDepositsOnce(&error) || h.monitor.cursors().l1_deposit_cursor.Load() != 2) {
    std::cerr << "cursor did not recover once blocks were served\n";
    return false;
  }
  return true;
}

bool TestAwaitDepositConfirmation() {
  MonitorHarness h;
  const auto event = MakeDepositEvent(0x0E, 4);
  h.AddL2Deposits(1, {});
  h.AddL2Deposits(2, {event});

  std::stop_source never;
  std::uint64_t found_in = 0;
  if (h.monitor.AwaitDepositConfirmation(event, 1, h.clock.now + std::chrono::seconds(1),
                                         never.get_token(), &found_in) !=
          bridge::ConfirmationResult::kConfirmed ||
      found_in != 2) {
    std::cerr << "await did not confirm the deposit in L2 block 2\n";
    return false;
  }

  const auto missing = MakeDepositEvent(0x0F, 4);
  if (h.monitor.AwaitDepositConfirmation(missing, 1, h.clock.now, never.get_token()) !=
      bridge::ConfirmationResult::kTimedOut) {
    std::cerr << "await past its deadline did not time out\n";
    return false;
  }

  std::stop_source cancelled;
  cancelled.request_stop();
  if (h.monitor.AwaitDepositConfirmation(missing, 1, h.clock.now + std::chrono::hours(1),
                                         cancelled.get_token()) !=
      bridge::ConfirmationResult::kCancelled) {
    std::cerr << "cancelled await did not report cancellation\n";
    return false;
  }
  return true;
}

bool TestWithdrawalsFedToPendingSet() {
  MonitorHarness h;
  const auto passer = MakeAddress(0x42);
  const auto sender = MakeAddress(0x51);
  primitives::BlockView block;
  block.number = 1;
  std::vector<primitives::Receipt> receipts;
  for (std::uint64_t nonce = 0; nonce < 2; ++nonce) {
    primitives::SignedTransaction tx;
    tx.chain_id = 901;
    tx.nonce = nonce;
    tx.sender = sender;
    tx.to = passer;
    tx.gas_limit = 100'000;
    tx.signature = {0x01};
    chain::WithdrawalEvent event;
    event.target = MakeAddress(0x61);
    event.value = primitives::U256(500 + nonce);
    event.gas_limit = 70'000;
    primitives::Receipt receipt;
    receipt.tx_hash = primitives::ComputeTxHash(primitives::Transaction{tx});
    receipt.success = nonce == 0;
    receipt.logs.push_back(chain::EncodeWithdrawalEvent(passer, event));
    block.transactions.emplace_back(tx);
    receipts.push_back(std::move(receipt));
  }
  h.l2.PutBlock(block, receipts);

  bridge::MonitorError error;
  if (!h.monitor.PollWithdrawalsOnce(&error)) {
    std::cerr << "withdrawal poll failed: " << error.message << "\n";
    return false;
  }
  const auto pending = h.withdrawals.Pending();
  if (pending.size() != 1 || pending[0].sender != sender || pending[0].nonce != 0 ||
      pending[0].value != primitives::U256(500)) {
    std::cerr << "withdrawal from the successful transaction not recorded\n";
    return false;
  }
  if (h.monitor.cursors().l2_withdrawal_cursor.Load() != 1 ||
      h.monitor.Stats().withdrawals_observed != 1) {
    std::cerr << "withdrawal cursor or counter wrong\n";
    return false;
  }
  return true;
}

bool TestBackgroundLoops() {
  MonitorHarness h;
  h.builder.AddBlock(1, {MakeDepositEvent(0x0A, 1)});
  h.monitor.Start();
  h.monitor.Start();
  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.monitor.Stats().deposits_observed == 0 && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  h.monitor.Stop();
  if (h.monitor.IsRunning() || h.monitor.Stats().deposits_observed != 1) {
    std::cerr << "background deposit loop did not observe the deposit\n";
    return false;
  }
  h.monitor.Stop();
  return true;
}

}  // namespace

int main() {
  try {
    const bool ok = TestUnmatchedDepositAlertsOnce() &&
                    TestLateL2DepositClaimedByTimedOutDeposit() && TestDepositConfirmedOnL2() &&
                    TestL2AheadOfL1Scan() && TestInvalidLogSkipped() &&
                    TestMissingBlockHoldsCursor() && TestAwaitDepositConfirmation() &&
                    TestWithdrawalsFedToPendingSet() && TestBackgroundLoops();
    if (!ok) {
      return EXIT_FAILURE;
    }
    std::cout << "bridge_monitor_tests: OK\n";
  } catch (const std::exception& ex) {
    std::cerr << "bridge_monitor_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
