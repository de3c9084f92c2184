#include "bridge/bridge_monitor.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "primitives/tx_hash.hpp"
#include "util/hex.hpp"

namespace tidelink::bridge {

namespace {

constexpr std::size_t kMaxSettledDeposits = 4096;

bool Fail(MonitorError* error, MonitorError::Code code, std::uint64_t block,
          std::string message) {
  if (error) {
    error->code = code;
    error->block = block;
    error->message = std::move(message);
  }
  return false;
}

std::optional<chain::DepositEvent> UserDepositEvent(const primitives::Transaction& tx) {
  const auto* deposit = std::get_if<primitives::TxDeposit>(&tx);
  if (!deposit || deposit->is_system()) {
    return std::nullopt;
  }
  return chain::DepositEvent{deposit->from(), deposit->to(), deposit->value(),
                             deposit->gas_limit(), deposit->input()};
}

primitives::Address SenderOf(const primitives::Transaction& tx) {
  if (const auto* deposit = std::get_if<primitives::TxDeposit>(&tx)) {
    return deposit->from();
  }
  return std::get<primitives::SignedTransaction>(tx).sender;
}

}  // namespace

const char* MonitorErrorCodeName(MonitorError::Code code) {
  switch (code) {
    case MonitorError::Code::kNone:
      return "none";
    case MonitorError::Code::kBlockNotFound:
      return "block-not-found";
    case MonitorError::Code::kInvalidEventLog:
      return "invalid-event-log";
    case MonitorError::Code::kDepositNotFoundOnL2:
      return "deposit-not-found-on-l2";
  }
  return "unknown";
}

const char* DepositStatusName(DepositStatus status) {
  switch (status) {
    case DepositStatus::kPending:
      return "pending";
    case DepositStatus::kConfirmed:
      return "confirmed";
    case DepositStatus::kTimedOut:
      return "timed-out";
  }
  return "unknown";
}

BridgeMonitorOptions BridgeMonitorOptions::FromConfig(const config::RollupConfig& config) {
  BridgeMonitorOptions options;
  options.deposit_portal = config.deposit_portal;
  options.message_passer = config.message_passer;
  options.batch_size = config.l1_scan_batch_size;
  options.deposit_poll_interval = std::chrono::seconds(config.l1_block_time_seconds);
  options.withdrawal_poll_interval = std::chrono::seconds(config.l2_block_time_seconds);
  options.confirmation_timeout = std::chrono::seconds(config.deposit_confirmation_timeout_seconds);
  options.l1_start = config.genesis_l1_block;
  return options;
}

BridgeMonitor::BridgeMonitor(const chain::ChainProvider& l1, const chain::ChainProvider& l2,
                             BridgeMonitorOptions options,
                             withdrawal::PendingWithdrawals* withdrawals, ClockFn clock)
    : l1_(l1),
      l2_(l2),
      options_(std::move(options)),
      withdrawals_(withdrawals),
      clock_(std::move(clock)) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
  cursors_.l1_deposit_cursor.Store(options_.l1_start);
  cursors_.l2_deposit_scan_cursor.Store(options_.l2_start);
  cursors_.l2_withdrawal_cursor.Store(options_.l2_start);
}

BridgeMonitor::~BridgeMonitor() { Stop(); }

void BridgeMonitor::SetAlertHandler(AlertHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  alert_handler_ = std::move(handler);
}

void BridgeMonitor::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.exchange(true)) {
    return;
  }
  deposit_thread_ = std::jthread([this](std::stop_token stop) { DepositLoop(stop); });
  withdrawal_thread_ = std::jthread([this](std::stop_token stop) { WithdrawalLoop(stop); });
}

void BridgeMonitor::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!running_.exchange(false)) {
    return;
  }
  deposit_thread_.request_stop();
  withdrawal_thread_.request_stop();
  if (deposit_thread_.joinable()) {
    deposit_thread_.join();
  }
  if (withdrawal_thread_.joinable()) {
    withdrawal_thread_.join();
  }
}

bool BridgeMonitor::PollDepositsOnce(MonitorError* error) {
  const auto cursor = cursors_.l1_deposit_cursor.Load();
  const auto latest = l1_.LatestBlockNumber();
  if (latest <= cursor) {
    return true;
  }
  const auto end = std::min(latest, cursor + options_.batch_size);
  const auto now = Now();

  std::vector<TrackedDeposit> found;
  std::uint64_t invalid_logs = 0;
  for (std::uint64_t number = cursor + 1; number <= end; ++number) {
    auto block = l1_.BlockByNumber(number);
    if (!block) {
      return Fail(error, MonitorError::Code::kBlockNotFound, number,
                  "L1 block " + std::to_string(number) + " not available");
    }
    std::vector<primitives::Receipt> receipts;
    if (!ReadReceipts(l1_, *block, &receipts, error)) {
      return false;
    }
    std::uint64_t log_index = 0;
    for (std::size_t i = 0; i < block->transactions.size(); ++i) {
      const auto* signed_tx = std::get_if<primitives::SignedTransaction>(&block->transactions[i]);
      const bool to_portal =
          signed_tx && signed_tx->to && *signed_tx->to == options_.deposit_portal;
      for (const auto& log : receipts[i].logs) {
        const auto index = log_index++;
        if (!to_portal || !receipts[i].success ||
            !chain::IsDepositEventLog(log, options_.deposit_portal)) {
          continue;
        }
        TrackedDeposit tracked;
        std::string decode_error;
        if (!chain::DecodeDepositEvent(log, &tracked.event, &decode_error)) {
          ++invalid_logs;
          std::cerr << "[bridge] skipping invalid deposit log " << index << " in L1 block "
                    << number << ": " << decode_error << "\n";
          continue;
        }
        tracked.l1_block = number;
        tracked.l1_block_hash = block->hash;
        tracked.log_index = index;
        tracked.observed_at = now;
        tracked.deadline = now + options_.confirmation_timeout;
        found.push_back(std::move(tracked));
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.invalid_event_logs += invalid_logs;
    for (auto& tracked : found) {
      ++stats_.deposits_observed;
      auto match = std::find_if(unmatched_l2_.begin(), unmatched_l2_.end(),
                                [&](const UnmatchedL2Deposit& candidate) {
                                  return candidate.event == tracked.event;
                                });
      if (match != unmatched_l2_.end()) {
        tracked.status = DepositStatus::kConfirmed;
        tracked.l2_block = match->l2_block;
        ++stats_.deposits_confirmed;
        unmatched_l2_.erase(match);
      }
      deposits_.push_back(std::move(tracked));
    }
  }
  cursors_.l1_deposit_cursor.Store(end);
  return true;
}

bool BridgeMonitor::ScanL2ForConfirmations(MonitorError* error) {
  const auto cursor = cursors_.l2_deposit_scan_cursor.Load();
  const auto latest = l2_.LatestBlockNumber();
  if (latest <= cursor) {
    return true;
  }
  const auto end = std::min(latest, cursor + options_.batch_size);

  std::vector<UnmatchedL2Deposit> seen;
  for (std::uint64_t number = cursor + 1; number <= end; ++number) {
    auto block = l2_.BlockByNumber(number);
    if (!block) {
      return Fail(error, MonitorError::Code::kBlockNotFound, number,
                  "L2 block " + std::to_string(number) + " not available");
    }
    for (const auto& tx : block->transactions) {
      if (auto event = UserDepositEvent(tx)) {
        seen.push_back(UnmatchedL2Deposit{number, std::move(*event)});
      }
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : seen) {
      if (!MatchTrackedLocked(entry.event, entry.l2_block)) {
        unmatched_l2_.push_back(std::move(entry));
      }
    }
    while (!unmatched_l2_.empty() &&
           unmatched_l2_.front().l2_block + options_.l2_match_window_blocks < end) {
      unmatched_l2_.pop_front();
    }
    while (deposits_.size() > kMaxSettledDeposits &&
           deposits_.front().status != DepositStatus::kPending) {
      deposits_.pop_front();
    }
  }
  cursors_.l2_deposit_scan_cursor.Store(end);
  return true;
}

std::size_t BridgeMonitor::ExpireOverdueDeposits() {
  const auto now = Now();
  std::vector<TrackedDeposit> expired;
  AlertHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& tracked : deposits_) {
      if (tracked.status != DepositStatus::kPending || now < tracked.deadline) {
        continue;
      }
      tracked.status = DepositStatus::kTimedOut;
      ++stats_.deposits_timed_out;
      expired.push_back(tracked);
    }
    handler = alert_handler_;
  }
  for (const auto& tracked : expired) {
    MonitorError alert;
    alert.code = MonitorError::Code::kDepositNotFoundOnL2;
    alert.block = tracked.l1_block;
    alert.message = "deposit from " + util::HexEncodePrefixed(tracked.event.from) +
                    " (L1 block " + std::to_string(tracked.l1_block) + ", log " +
                    std::to_string(tracked.log_index) + ") not found on L2 in time";
    std::cerr << "[bridge] ALERT " << alert.message << "\n";
    if (handler) {
      handler(alert, tracked);
    }
  }
  return expired.size();
}

bool BridgeMonitor::PollWithdrawalsOnce(MonitorError* error) {
  const auto cursor = cursors_.l2_withdrawal_cursor.Load();
  const auto latest = l2_.LatestBlockNumber();
  if (latest <= cursor) {
    return true;
  }
  const auto end = std::min(latest, cursor + options_.batch_size);

  std::vector<std::pair<primitives::Address, chain::WithdrawalEvent>> found;
  std::uint64_t invalid_logs = 0;
  for (std::uint64_t number = cursor + 1; number <= end; ++number) {
    auto block = l2_.BlockByNumber(number);
    if (!block) {
      return Fail(error, MonitorError::Code::kBlockNotFound, number,
                  "L2 block " + std::to_string(number) + " not available");
    }
    std::vector<primitives::Receipt> receipts;
    if (!ReadReceipts(l2_, *block, &receipts, error)) {
      return false;
    }
    for (std::size_t i = 0; i < block->transactions.size(); ++i) {
      if (!receipts[i].success) {
        continue;
      }
      for (const auto& log : receipts[i].logs) {
        if (!chain::IsWithdrawalEventLog(log, options_.message_passer)) {
          continue;
        }
        chain::WithdrawalEvent event;
        std::string decode_error;
        if (!chain::DecodeWithdrawalEvent(log, &event, &decode_error)) {
          ++invalid_logs;
          std::cerr << "[bridge] skipping invalid withdrawal log in L2 block " << number << ": "
                    << decode_error << "\n";
          continue;
        }
        found.emplace_back(SenderOf(block->transactions[i]), std::move(event));
      }
    }
  }

  if (withdrawals_) {
    for (const auto& [sender, event] : found) {
      withdrawals_->Observe(sender, event);
    }
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.invalid_event_logs += invalid_logs;
    stats_.withdrawals_observed += found.size();
  }
  cursors_.l2_withdrawal_cursor.Store(end);
  return true;
}

ConfirmationResult BridgeMonitor::AwaitDepositConfirmation(const chain::DepositEvent& event,
                                                           std::uint64_t from_l2_block,
                                                           Clock::time_point deadline,
                                                           std::stop_token stop,
                                                           std::uint64_t* l2_block) {
  std::uint64_t next = from_l2_block;
  while (true) {
    if (stop.stop_requested()) {
      return ConfirmationResult::kCancelled;
    }
    const auto latest = l2_.LatestBlockNumber();
    for (; next <= latest; ++next) {
      auto block = l2_.BlockByNumber(next);
      if (!block) {
        break;
      }
      for (const auto& tx : block->transactions) {
        auto candidate = UserDepositEvent(tx);
        if (candidate && *candidate == event) {
          if (l2_block) *l2_block = next;
          return ConfirmationResult::kConfirmed;
        }
      }
    }
    const auto now = Now();
    if (now >= deadline) {
      return ConfirmationResult::kTimedOut;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (!WaitFor(stop, std::min(remaining, options_.withdrawal_poll_interval))) {
      return ConfirmationResult::kCancelled;
    }
  }
}

std::vector<TrackedDeposit> BridgeMonitor::Deposits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {deposits_.begin(), deposits_.end()};
}

MonitorStats BridgeMonitor::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void BridgeMonitor::DepositLoop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    MonitorError error;
    if (!PollDepositsOnce(&error)) {
      RecordProviderError(error, "deposit");
    }
    error = MonitorError{};
    if (!ScanL2ForConfirmations(&error)) {
      RecordProviderError(error, "confirmation");
    }
    ExpireOverdueDeposits();
    if (!WaitFor(stop, options_.deposit_poll_interval)) {
      break;
    }
  }
}

void BridgeMonitor::WithdrawalLoop(std::stop_token stop) {
  while (!stop.stop_requested()) {
    MonitorError error;
    if (!PollWithdrawalsOnce(&error)) {
      RecordProviderError(error, "withdrawal");
    }
    if (!WaitFor(stop, options_.withdrawal_poll_interval)) {
      break;
    }
  }
}

bool BridgeMonitor::WaitFor(std::stop_token stop, std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, stop, interval, [&stop] { return stop.stop_requested(); });
  return !stop.stop_requested();
}

Clock::time_point BridgeMonitor::Now() const { return clock_ ? clock_() : Clock::now(); }

bool BridgeMonitor::ReadReceipts(const chain::ChainProvider& provider,
                                 const primitives::BlockView& block,
                                 std::vector<primitives::Receipt>* receipts,
                                 MonitorError* error) const {
  receipts->clear();
  receipts->reserve(block.transactions.size());
  for (const auto& tx : block.transactions) {
    const auto tx_hash = primitives::ComputeTxHash(tx);
    primitives::Receipt receipt;
    if (!provider.ReceiptByHash(tx_hash, &receipt)) {
      return Fail(error, MonitorError::Code::kBlockNotFound, block.number,
                  "receipt " + util::ShortHex(tx_hash) + " of block " +
                      std::to_string(block.number) + " not available");
    }
    receipts->push_back(std::move(receipt));
  }
  return true;
}

bool BridgeMonitor::MatchTrackedLocked(const chain::DepositEvent& event, std::uint64_t l2_block) {
  for (auto& tracked : deposits_) {
    if (tracked.status == DepositStatus::kPending && tracked.event == event) {
      tracked.status = DepositStatus::kConfirmed;
      tracked.l2_block = l2_block;
      ++stats_.deposits_confirmed;
      return true;
    }
  }
  // Already alerted: keep the status, record where it finally landed.
  for (auto& tracked : deposits_) {
    if (tracked.status == DepositStatus::kTimedOut && !tracked.l2_block &&
        tracked.event == event) {
      tracked.l2_block = l2_block;
      ++stats_.deposits_landed_late;
      std::cerr << "[bridge] timed-out deposit from " << util::HexEncodePrefixed(event.from)
                << " (L1 block " << tracked.l1_block << ") landed late in L2 block " << l2_block
                << "\n";
      return true;
    }
  }
  return false;
}

void BridgeMonitor::RecordProviderError(const MonitorError& error, const char* loop) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.provider_errors;
  }
  std::cerr << "[bridge] " << loop << " poll stalled at block " << error.block << ": "
            << error.message << "\n";
}

}  // namespace tidelink::bridge
