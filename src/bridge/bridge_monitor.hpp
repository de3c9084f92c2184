#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "chain/event_log.hpp"
#include "chain/provider.hpp"
#include "config/rollup_config.hpp"
#include "withdrawal/pending_withdrawals.hpp"

namespace tidelink::bridge {

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;

// Last processed block number with a single writer (its owning loop) and
// any number of readers.
class WatermarkCursor {
 public:
  explicit WatermarkCursor(std::uint64_t value = 0) : value_(value) {}

  std::uint64_t Load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }
  void Store(std::uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = value;
  }

 private:
  mutable std::mutex mutex_;
  std::uint64_t value_;
};

struct MonitorCursors {
  WatermarkCursor l1_deposit_cursor;
  WatermarkCursor l2_deposit_scan_cursor;
  WatermarkCursor l2_withdrawal_cursor;
};

struct MonitorError {
  enum class Code {
    kNone,
    kBlockNotFound,
    kInvalidEventLog,
    kDepositNotFoundOnL2,
  };
  Code code{Code::kNone};
  std::uint64_t block{0};
  std::string message;
};

const char* MonitorErrorCodeName(MonitorError::Code code);

enum class DepositStatus {
  kPending,
  kConfirmed,
  kTimedOut,
};

const char* DepositStatusName(DepositStatus status);

struct TrackedDeposit {
  chain::DepositEvent event;
  std::uint64_t l1_block{0};
  primitives::Hash256 l1_block_hash{};
  std::uint64_t log_index{0};
  DepositStatus status{DepositStatus::kPending};
  Clock::time_point observed_at{};
  Clock::time_point deadline{};
  std::optional<std::uint64_t> l2_block;
};

enum class ConfirmationResult {
  kConfirmed,
  kTimedOut,
  kCancelled,
};

using AlertHandler = std::function<void(const MonitorError&, const TrackedDeposit&)>;

struct BridgeMonitorOptions {
  primitives::Address deposit_portal{};
  primitives::Address message_passer{};
  std::uint64_t batch_size{100};
  std::chrono::milliseconds deposit_poll_interval{std::chrono::seconds(12)};
  std::chrono::milliseconds withdrawal_poll_interval{std::chrono::seconds(2)};
  std::chrono::milliseconds confirmation_timeout{std::chrono::minutes(10)};
  // Unmatched L2 deposits stay matchable for this many L2 blocks, covering
  // an L2 that runs ahead of the L1 scan.
  std::uint64_t l2_match_window_blocks{1024};
  // Cursors start after these blocks.
  std::uint64_t l1_start{0};
  std::uint64_t l2_start{0};

  static BridgeMonitorOptions FromConfig(const config::RollupConfig& config);
};

struct MonitorStats {
  std::uint64_t deposits_observed{0};
  std::uint64_t deposits_confirmed{0};
  std::uint64_t deposits_timed_out{0};
  // Timed-out deposits that later showed up on L2.
  std::uint64_t deposits_landed_late{0};
  std::uint64_t invalid_event_logs{0};
  std::uint64_t withdrawals_observed{0};
  std::uint64_t provider_errors{0};
};

// Reconciles deposits observed on L1 against deposits that show up on L2,
// and feeds L2 withdrawal events to the pending set. The deposit loop owns
// l1_deposit_cursor and l2_deposit_scan_cursor, the withdrawal loop owns
// l2_withdrawal_cursor.
class BridgeMonitor {
 public:
  BridgeMonitor(const chain::ChainProvider& l1, const chain::ChainProvider& l2,
                BridgeMonitorOptions options, withdrawal::PendingWithdrawals* withdrawals,
                ClockFn clock = nullptr);
  ~BridgeMonitor();

  BridgeMonitor(const BridgeMonitor&) = delete;
  BridgeMonitor& operator=(const BridgeMonitor&) = delete;

  void SetAlertHandler(AlertHandler handler);

  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // One batch of L1 blocks past the deposit cursor. The cursor moves only
  // if every block in the batch was read; malformed logs are skipped.
  bool PollDepositsOnce(MonitorError* error);
  // Matches deposits in new L2 blocks against pending L1 deposits.
  bool ScanL2ForConfirmations(MonitorError* error);
  // Times out pending deposits past their deadline and alerts once for
  // each. Returns the number newly timed out.
  std::size_t ExpireOverdueDeposits();
  bool PollWithdrawalsOnce(MonitorError* error);

  // Polls L2 from |from_l2_block| for a deposit matching |event| until it is
  // found, |deadline| passes or |stop| is requested.
  ConfirmationResult AwaitDepositConfirmation(const chain::DepositEvent& event,
                                              std::uint64_t from_l2_block,
                                              Clock::time_point deadline, std::stop_token stop,
                                              std::uint64_t* l2_block = nullptr);

  std::vector<TrackedDeposit> Deposits() const;
  MonitorStats Stats() const;
  const MonitorCursors& cursors() const { return cursors_; }

 private:
  struct UnmatchedL2Deposit {
    std::uint64_t l2_block{0};
    chain::DepositEvent event;
  };

  void DepositLoop(std::stop_token stop);
  void WithdrawalLoop(std::stop_token stop);
  // Returns false if |stop| was requested while waiting.
  bool WaitFor(std::stop_token stop, std::chrono::milliseconds interval);
  Clock::time_point Now() const;
  bool ReadReceipts(const chain::ChainProvider& provider, const primitives::BlockView& block,
                    std::vector<primitives::Receipt>* receipts, MonitorError* error) const;
  // Pairs an L2 deposit with the oldest pending L1 deposit of the same
  // event, else with a timed-out one still missing its L2 block.
  bool MatchTrackedLocked(const chain::DepositEvent& event, std::uint64_t l2_block);
  void RecordProviderError(const MonitorError& error, const char* loop);

  const chain::ChainProvider& l1_;
  const chain::ChainProvider& l2_;
  BridgeMonitorOptions options_;
  withdrawal::PendingWithdrawals* withdrawals_;
  ClockFn clock_;

  MonitorCursors cursors_;

  mutable std::mutex mutex_;
  std::deque<TrackedDeposit> deposits_;
  std::deque<UnmatchedL2Deposit> unmatched_l2_;
  MonitorStats stats_;
  AlertHandler alert_handler_;

  std::mutex wait_mutex_;
  std::condition_variable_any wait_cv_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
  std::jthread deposit_thread_;
  std::jthread withdrawal_thread_;
};

}  // namespace tidelink::bridge
