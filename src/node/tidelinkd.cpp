#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <variant>
#include <vector>

#include "bridge/bridge_monitor.hpp"
#include "chain/json_provider.hpp"
#include "config/rollup_config.hpp"
#include "deposit/deposit.hpp"
#include "derivation/l1_attributes.hpp"
#include "derivation/state_deriver.hpp"
#include "nlohmann/json.hpp"
#include "policy/cross_chain_pool.hpp"
#include "policy/l1_gas_oracle.hpp"
#include "util/hex.hpp"
#include "withdrawal/pending_withdrawals.hpp"

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevelString(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + value);
}

class DebugLogger {
 public:
  void Enable(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
      stream_.close();
    }
    path_ = path;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
    }
    stream_.open(path, std::ios::app);
    if (!stream_) {
      throw std::runtime_error("failed to open debug log: " + path);
    }
    current_size_ = 0;
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
      current_size_ = size;
    }
    const std::string header =
        "---- tidelinkd debug log started " + FormatTimestamp() + " ----\n";
    stream_ << header;
    stream_.flush();
    current_size_ += static_cast<std::uintmax_t>(header.size());
  }

  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_threshold_ = level;
    max_bytes_ = max_bytes;
    max_files_ = max_files;
  }

  void Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open()) {
      return;
    }
    if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
      return;
    }
    if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
      RotateLocked();
    }
    std::ostringstream line;
    line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] " << message
         << '\n';
    const std::string text = line.str();
    stream_ << text;
    stream_.flush();
    current_size_ += static_cast<std::uintmax_t>(text.size());
  }

 private:
  void RotateLocked() {
    if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
      return;
    }
    stream_.close();
    // debug.log.(n-1) -> debug.log.n
    for (std::size_t i = max_files_; i > 0; --i) {
      std::filesystem::path rotated =
          std::filesystem::path(path_).concat("." + std::to_string(i));
      std::filesystem::path previous =
          (i == 1) ? std::filesystem::path(path_)
                   : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
      std::error_code ec;
      if (std::filesystem::exists(previous, ec)) {
        std::filesystem::rename(previous, rotated, ec);
      }
    }
    stream_.open(path_, std::ios::trunc);
    current_size_ = 0;
  }

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kDebug};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

DebugLogger g_debug_logger;

void LogDebug(const std::string& message) { g_debug_logger.Log(LogLevel::kDebug, message); }
void LogInfo(const std::string& message) { g_debug_logger.Log(LogLevel::kInfo, message); }
void LogWarn(const std::string& message) {
  std::cerr << "[tidelinkd] warn: " << message << "\n";
  g_debug_logger.Log(LogLevel::kWarn, message);
}

std::atomic<bool> g_shutdown_requested{false};

bool ShutdownRequested() { return g_shutdown_requested.load(); }

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

struct Options {
  std::string network{"mainnet"};
  std::string l1_snapshot;
  std::string l2_snapshot;
  std::string pending_txs_path;
  std::string status_json_path;
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
  std::uint64_t l2_block_gas_limit{30'000'000};
  std::uint64_t l2_base_fee{1'000'000'000};
  std::uint64_t derive_interval_ms{1000};
  bool run_monitor{true};
  // Rollup parameter overrides, applied on top of the network preset.
  std::optional<std::uint64_t> genesis_l1_block;
  std::optional<std::uint64_t> max_deposit_gas_limit;
  std::optional<std::uint64_t> fee_overhead;
  std::optional<std::uint64_t> fee_scalar;
  std::optional<std::string> batcher_hash;
  std::optional<std::uint64_t> empty_block_interval;
  std::optional<std::uint64_t> source_retention_blocks;
  std::optional<std::string> deposit_portal;
  std::optional<std::string> message_passer;
  std::optional<std::uint64_t> l1_scan_batch_size;
  std::optional<std::uint64_t> confirmation_timeout_seconds;
  std::optional<std::uint64_t> l1_block_time_seconds;
  std::optional<std::uint64_t> l2_block_time_seconds;
};

void PrintUsage() {
  std::cout << "tidelinkd options:\n"
            << "  --network <net>            mainnet, testnet, devnet (default: mainnet)\n"
            << "  --l1-snapshot <path>       L1 chain snapshot JSON (required)\n"
            << "  --l2-snapshot <path>       L2 chain snapshot JSON for the bridge monitor\n"
            << "  --pending-txs <path>       JSON array of regular L2 transactions to admit at startup\n"
            << "  --status-json <path>       Write cursors and counters here on shutdown\n"
            << "  --l2-block-gas-limit <n>   Gas limit of produced L2 blocks (default: 30000000)\n"
            << "  --l2-base-fee <wei>        L2 base fee used for admission (default: 1000000000)\n"
            << "  --derive-interval-ms <ms>  Delay between derivation passes (default: 1000)\n"
            << "  --no-monitor               Do not start the bridge monitor\n"
            << "  --genesis-l1-block <n>     Derivation starts after this L1 block\n"
            << "  --max-deposit-gas-limit <n> Per-deposit gas ceiling\n"
            << "  --fee-overhead <n>         L1 data fee overhead\n"
            << "  --fee-scalar <n>           L1 data fee scalar (1e6 = 1.0)\n"
            << "  --batcher-hash <hex>       32-byte batcher hash carried in L1 attributes\n"
            << "  --empty-block-interval <n> Derive deposit-free L1 blocks only every n blocks (0=all)\n"
            << "  --source-retention-blocks <n> Keep deposit sources n blocks behind the safe head\n"
            << "  --deposit-portal <addr>    L1 deposit portal address\n"
            << "  --message-passer <addr>    L2 message passer address\n"
            << "  --l1-scan-batch-size <n>   Blocks per monitor poll\n"
            << "  --confirmation-timeout <s> Seconds before an unconfirmed deposit alerts\n"
            << "  --l1-block-time <s>        L1 poll interval for the monitor\n"
            << "  --l2-block-time <s>        L2 poll interval for the monitor\n"
            << "  --debug-log <path>         Append structured logs to the given file\n"
            << "  --log-level <lvl>          Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>     Rotate debug log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>        Number of rotated debug log files to keep (default: 0)\n"
            << "  --conf <path>              Load options from tidelink.conf (default: ./tidelink.conf)\n"
            << "  --no-conf                  Disable config file loading\n";
}

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::uint64_t ParseUint64(const std::string& value) {
  if (value.empty() || value.front() == '-') {
    throw std::runtime_error("invalid unsigned value: " + value);
  }
  std::size_t consumed = 0;
  const auto parsed = std::stoull(value, &consumed);
  if (consumed != value.size()) {
    throw std::runtime_error("invalid unsigned value: " + value);
  }
  return static_cast<std::uint64_t>(parsed);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// Shared by the config file, TIDELINK_* environment variables and flags.
// Returns false for an unknown key.
bool ApplyOption(const std::string& key, const std::string& value, Options* opts) {
  if (key == "network") {
    opts->network = value;
  } else if (key == "l1snapshot") {
    opts->l1_snapshot = value;
  } else if (key == "l2snapshot") {
    opts->l2_snapshot = value;
  } else if (key == "pendingtxs") {
    opts->pending_txs_path = value;
  } else if (key == "statusjson") {
    opts->status_json_path = value;
  } else if (key == "l2blockgaslimit") {
    opts->l2_block_gas_limit = ParseUint64(value);
  } else if (key == "l2basefee") {
    opts->l2_base_fee = ParseUint64(value);
  } else if (key == "deriveintervalms") {
    opts->derive_interval_ms = ParseUint64(value);
  } else if (key == "nomonitor") {
    opts->run_monitor = !ParseBool(value);
  } else if (key == "monitor") {
    opts->run_monitor = ParseBool(value);
  } else if (key == "genesisl1block") {
    opts->genesis_l1_block = ParseUint64(value);
  } else if (key == "maxdepositgaslimit") {
    opts->max_deposit_gas_limit = ParseUint64(value);
  } else if (key == "feeoverhead") {
    opts->fee_overhead = ParseUint64(value);
  } else if (key == "feescalar") {
    opts->fee_scalar = ParseUint64(value);
  } else if (key == "batcherhash") {
    opts->batcher_hash = value;
  } else if (key == "emptyblockinterval") {
    opts->empty_block_interval = ParseUint64(value);
  } else if (key == "sourceretentionblocks") {
    opts->source_retention_blocks = ParseUint64(value);
  } else if (key == "depositportal") {
    opts->deposit_portal = value;
  } else if (key == "messagepasser") {
    opts->message_passer = value;
  } else if (key == "l1scanbatchsize") {
    opts->l1_scan_batch_size = ParseUint64(value);
  } else if (key == "confirmationtimeout" || key == "depositconfirmationtimeout") {
    opts->confirmation_timeout_seconds = ParseUint64(value);
  } else if (key == "l1blocktime") {
    opts->l1_block_time_seconds = ParseUint64(value);
  } else if (key == "l2blocktime") {
    opts->l2_block_time_seconds = ParseUint64(value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(ParseUint64(value));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(ParseUint64(value));
  } else {
    return false;
  }
  return true;
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, Options* opts) {
  if (!ApplyOption(NormalizeKey(raw_key), value, opts)) {
    std::cerr << "[config] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, Options* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(Options* opts) {
  static constexpr std::string_view kNames[] = {
      "NETWORK",
      "L1_SNAPSHOT",
      "L2_SNAPSHOT",
      "PENDING_TXS",
      "STATUS_JSON",
      "L2_BLOCK_GAS_LIMIT",
      "L2_BASE_FEE",
      "DERIVE_INTERVAL_MS",
      "GENESIS_L1_BLOCK",
      "MAX_DEPOSIT_GAS_LIMIT",
      "FEE_OVERHEAD",
      "FEE_SCALAR",
      "BATCHER_HASH",
      "EMPTY_BLOCK_INTERVAL",
      "SOURCE_RETENTION_BLOCKS",
      "DEPOSIT_PORTAL",
      "MESSAGE_PASSER",
      "L1_SCAN_BATCH_SIZE",
      "CONFIRMATION_TIMEOUT",
      "DEBUG_LOG",
      "LOG_LEVEL",
  };
  for (const auto name : kNames) {
    const std::string env_name = "TIDELINK_" + std::string(name);
    if (auto value = GetEnvValue(env_name)) {
      try {
        ApplyOption(NormalizeKey(std::string(name)), *value, opts);
      } catch (const std::exception& ex) {
        throw std::runtime_error(env_name + ": " + ex.what());
      }
    }
  }
}

Options ParseOptions(int argc, char** argv) {
  Options opts;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }

  if (!opts.disable_config_file) {
    std::filesystem::path config_path =
        opts.config_path.empty() ? std::filesystem::path("tidelink.conf")
                                 : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else if (arg == "--no-monitor") {
      opts.run_monitor = false;
    } else if (arg.rfind("--", 0) == 0) {
      const std::string key = NormalizeKey(arg.substr(2));
      const std::string value = ensure_value(i);
      if (!ApplyOption(key, value, &opts)) {
        throw std::runtime_error("unknown argument: " + arg);
      }
    } else {
      throw std::runtime_error("unexpected argument: " + arg);
    }
  }
  return opts;
}

template <std::size_t N>
std::array<std::uint8_t, N> ParseFixedHex(const std::string& text, const char* what) {
  std::array<std::uint8_t, N> out{};
  if (!tidelink::util::HexDecodeFixed(text, &out)) {
    throw std::runtime_error(std::string("invalid ") + what + ": " + text);
  }
  return out;
}

tidelink::config::RollupConfig BuildRollupConfig(const Options& opts) {
  const auto network = tidelink::config::NetworkFromString(opts.network);
  if (!network) {
    throw std::runtime_error("unknown network: " + opts.network);
  }
  tidelink::config::SelectNetwork(*network);
  auto& cfg = tidelink::config::GetMutableRollupConfig();
  if (opts.genesis_l1_block) cfg.genesis_l1_block = *opts.genesis_l1_block;
  if (opts.max_deposit_gas_limit) cfg.max_deposit_gas_limit = *opts.max_deposit_gas_limit;
  if (opts.fee_overhead) cfg.fee_overhead = *opts.fee_overhead;
  if (opts.fee_scalar) cfg.fee_scalar = *opts.fee_scalar;
  if (opts.batcher_hash) {
    cfg.batcher_hash = ParseFixedHex<32>(*opts.batcher_hash, "batcher hash");
  }
  if (opts.empty_block_interval) cfg.empty_block_interval = *opts.empty_block_interval;
  if (opts.source_retention_blocks) cfg.source_retention_blocks = *opts.source_retention_blocks;
  if (opts.deposit_portal) {
    cfg.deposit_portal = ParseFixedHex<20>(*opts.deposit_portal, "deposit portal");
  }
  if (opts.message_passer) {
    cfg.message_passer = ParseFixedHex<20>(*opts.message_passer, "message passer");
  }
  if (opts.l1_scan_batch_size) cfg.l1_scan_batch_size = *opts.l1_scan_batch_size;
  if (opts.confirmation_timeout_seconds) {
    cfg.deposit_confirmation_timeout_seconds = *opts.confirmation_timeout_seconds;
  }
  if (opts.l1_block_time_seconds) cfg.l1_block_time_seconds = *opts.l1_block_time_seconds;
  if (opts.l2_block_time_seconds) cfg.l2_block_time_seconds = *opts.l2_block_time_seconds;

  std::string error;
  if (!tidelink::config::ValidateRollupConfig(cfg, &error)) {
    throw std::runtime_error("invalid rollup config: " + error);
  }
  return cfg;
}

// Balances and nonces implied by the blocks this daemon built: deposits mint
// to their sender, included regular transactions bump the sender nonce.
// Execution itself happens elsewhere; this only feeds pool admission.
class BuiltBlockLedger final : public tidelink::policy::AccountStateView {
 public:
  tidelink::primitives::U256 Balance(const tidelink::primitives::Address& account) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? tidelink::primitives::U256{} : it->second.balance;
  }

  std::uint64_t Nonce(const tidelink::primitives::Address& account) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.nonce;
  }

  void Apply(const std::vector<tidelink::primitives::Transaction>& block) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& tx : block) {
      if (const auto* deposit = std::get_if<tidelink::primitives::TxDeposit>(&tx)) {
        auto& account = accounts_[deposit->from()];
        tidelink::primitives::U256 credited;
        account.balance = tidelink::primitives::CheckedAdd(account.balance, deposit->mint(),
                                                           &credited)
                              ? credited
                              : tidelink::primitives::U256::Max();
        continue;
      }
      const auto& signed_tx = std::get<tidelink::primitives::SignedTransaction>(tx);
      auto& account = accounts_[signed_tx.sender];
      account.nonce = signed_tx.nonce + 1;
      tidelink::primitives::U256 remaining;
      account.balance = tidelink::primitives::CheckedSub(account.balance, signed_tx.value,
                                                         &remaining)
                            ? remaining
                            : tidelink::primitives::U256{};
    }
  }

 private:
  struct Account {
    tidelink::primitives::U256 balance{};
    std::uint64_t nonce{0};
  };

  mutable std::mutex mutex_;
  std::unordered_map<tidelink::primitives::Address, Account, tidelink::primitives::AddressHasher>
      accounts_;
};

std::size_t LoadPendingTransactions(const std::string& path, std::uint64_t base_fee,
                                    tidelink::policy::CrossChainPool* pool) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open pending transactions: " + path);
  }
  nlohmann::json root;
  try {
    in >> root;
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error(path + ": " + ex.what());
  }
  if (!root.is_array()) {
    throw std::runtime_error(path + ": expected an array of transactions");
  }
  std::size_t admitted = 0;
  for (std::size_t i = 0; i < root.size(); ++i) {
    tidelink::primitives::Transaction tx;
    std::string error;
    if (!tidelink::chain::TransactionFromJson(root[i], &tx, &error)) {
      LogWarn(path + "[" + std::to_string(i) + "]: " + error);
      continue;
    }
    tidelink::policy::PoolError pool_error;
    const bool ok =
        std::holds_alternative<tidelink::primitives::TxDeposit>(tx)
            ? pool->SubmitDeposit(std::get<tidelink::primitives::TxDeposit>(tx), &pool_error)
            : pool->AddTransaction(std::get<tidelink::primitives::SignedTransaction>(tx),
                                   base_fee, &pool_error);
    if (!ok) {
      LogWarn(path + "[" + std::to_string(i) + "] rejected (" +
              tidelink::policy::PoolErrorCodeName(pool_error.code) + "): " + pool_error.message);
      continue;
    }
    ++admitted;
  }
  return admitted;
}

// One derivation pass: reload the L1 view, derive up to its head and hand
// every derived block to the pool.
void RunDerivationPass(tidelink::chain::JsonChainProvider* l1,
                       tidelink::chain::JsonChainProvider* l2,
                       tidelink::derivation::StateDeriver* deriver,
                       tidelink::policy::CrossChainPool* pool,
                       tidelink::policy::L1GasOracle* oracle, BuiltBlockLedger* ledger,
                       const Options& opts) {
  std::string error;
  if (!l1->Reload(&error)) {
    LogWarn("L1 snapshot reload failed: " + error);
    return;
  }
  if (l2 && !l2->Reload(&error)) {
    LogWarn("L2 snapshot reload failed: " + error);
  }

  const auto target = l1->LatestBlockNumber();
  if (target <= deriver->Cursor().l1_head) {
    deriver->UpdateSafeHead(l1->FinalizedBlockNumber());
    return;
  }

  std::vector<tidelink::derivation::DerivedBlock> blocks;
  tidelink::derivation::DeriveError derive_error;
  if (!deriver->Derive(target, &blocks, &derive_error)) {
    if (derive_error.code == tidelink::derivation::DeriveError::Code::kL1ReorgDetected) {
      // Step back one block per pass until the parent hashes line up again.
      const auto cursor = deriver->Cursor();
      const auto ancestor = cursor.l1_head > 0 ? cursor.l1_head - 1 : 0;
      LogInfo("L1 reorg at block " + std::to_string(derive_error.l1_block) +
              ", rewinding to " + std::to_string(std::max(ancestor, cursor.safe_head)));
      deriver->HandleL1Reorg(ancestor);
    } else {
      LogWarn(std::string("derivation stopped (") +
              tidelink::derivation::DeriveErrorCodeName(derive_error.code) + ") at L1 block " +
              std::to_string(derive_error.l1_block) + ": " + derive_error.message);
    }
    return;
  }
  deriver->UpdateSafeHead(l1->FinalizedBlockNumber());

  for (const auto& block : blocks) {
    const auto& system = std::get<tidelink::primitives::TxDeposit>(block.transactions.front());
    tidelink::derivation::L1Attributes attributes;
    if (tidelink::derivation::DecodeL1Attributes(system.input(), &attributes, &error)) {
      oracle->UpdateFromAttributes(attributes);
    } else {
      LogWarn("L2 block " + std::to_string(block.l2_number) + ": " + error);
    }
    pool->EnqueueDerivedBlock(block);
    const auto built = pool->BuildBlock(opts.l2_block_gas_limit, opts.l2_base_fee);
    ledger->Apply(built);
    LogDebug("built L2 block " + std::to_string(block.l2_number) + " from L1 " +
             std::to_string(block.l1_origin) + " " +
             tidelink::util::ShortHex(block.l1_origin_hash) + " with " +
             std::to_string(built.size()) + " transactions");
  }
  const auto cursor = deriver->Cursor();
  LogInfo("derived " + std::to_string(blocks.size()) + " L2 blocks; l1_head=" +
          std::to_string(cursor.l1_head) + " safe_head=" + std::to_string(cursor.safe_head) +
          " l2_head=" + std::to_string(cursor.l2_head));
}

void WriteStatusJson(const std::string& path, const tidelink::derivation::StateDeriver& deriver,
                     const tidelink::policy::CrossChainPool& pool,
                     const tidelink::withdrawal::PendingWithdrawals& withdrawals,
                     const tidelink::bridge::BridgeMonitor* monitor) {
  const auto cursor = deriver.Cursor();
  const auto pool_stats = pool.Stats();
  nlohmann::json status;
  status["network"] = std::string(tidelink::config::NetworkName(deriver.config().type));
  status["cursor"] = {
      {"l1_head", cursor.l1_head},
      {"safe_head", cursor.safe_head},
      {"l2_head", cursor.l2_head},
  };
  status["pool"] = {
      {"pending_deposits", pool.PendingDeposits()},
      {"pending_transactions", pool.PendingTransactions()},
      {"queued_deposits", pool_stats.queued_deposits},
      {"included_deposits", pool_stats.included_deposits},
      {"dropped_stale_deposits", pool_stats.dropped_stale_deposits},
      {"rejected_deposits", pool_stats.rejected_deposits},
      {"admitted_transactions", pool_stats.admitted_transactions},
      {"rejected_transactions", pool_stats.rejected_transactions},
      {"included_transactions", pool_stats.included_transactions},
  };
  const auto commitment = withdrawals.Commitment();
  status["withdrawals"] = {
      {"pending", commitment.size()},
      {"root", tidelink::util::HexEncodePrefixed(commitment.root())},
  };
  if (monitor) {
    const auto stats = monitor->Stats();
    const auto& cursors = monitor->cursors();
    status["monitor"] = {
        {"l1_deposit_cursor", cursors.l1_deposit_cursor.Load()},
        {"l2_deposit_scan_cursor", cursors.l2_deposit_scan_cursor.Load()},
        {"l2_withdrawal_cursor", cursors.l2_withdrawal_cursor.Load()},
        {"deposits_observed", stats.deposits_observed},
        {"deposits_confirmed", stats.deposits_confirmed},
        {"deposits_timed_out", stats.deposits_timed_out},
        {"deposits_landed_late", stats.deposits_landed_late},
        {"invalid_event_logs", stats.invalid_event_logs},
        {"withdrawals_observed", stats.withdrawals_observed},
        {"provider_errors", stats.provider_errors},
    };
    nlohmann::json deposits = nlohmann::json::array();
    for (const auto& tracked : monitor->Deposits()) {
      nlohmann::json entry = {
          {"l1_block", tracked.l1_block},
          {"log_index", tracked.log_index},
          {"from", tidelink::util::HexEncodePrefixed(tracked.event.from)},
          {"value", tracked.event.value.ToString()},
          {"status", tidelink::bridge::DepositStatusName(tracked.status)},
      };
      if (tracked.l2_block) {
        entry["l2_block"] = *tracked.l2_block;
      }
      deposits.push_back(std::move(entry));
    }
    status["monitor"]["deposits"] = std::move(deposits);
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to open status file: " + path);
  }
  out << status.dump(2) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (!opts.debug_log_path.empty()) {
      try {
        LogLevel level = LogLevel::kInfo;
        try {
          level = ParseLogLevelString(opts.log_level);
        } catch (const std::exception& ex) {
          std::cerr << "[tidelinkd] warn: " << ex.what() << " (falling back to info level)\n";
        }
        std::uintmax_t max_bytes = 0;
        if (opts.log_max_size_mb > 0) {
          max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
        }
        g_debug_logger.Configure(level, max_bytes, opts.log_max_files);
        g_debug_logger.Enable(opts.debug_log_path);
        LogDebug("Debug log enabled at " + opts.debug_log_path);
      } catch (const std::exception& ex) {
        std::cerr << "[tidelinkd] fatal: " << ex.what() << "\n";
        return 1;
      }
    }
    if (opts.l1_snapshot.empty()) {
      std::cerr << "[tidelinkd] fatal: --l1-snapshot is required\n";
      PrintUsage();
      return 1;
    }

    const auto rollup = BuildRollupConfig(opts);
    InstallSignalHandlers();

    LogInfo("tidelinkd starting on network=" + rollup.network_id +
            ", l1_chain_id=" + std::to_string(rollup.l1_chain_id) +
            ", l2_chain_id=" + std::to_string(rollup.l2_chain_id) +
            ", portal=" + tidelink::util::HexEncodePrefixed(rollup.deposit_portal) +
            ", genesis_l1_block=" + std::to_string(rollup.genesis_l1_block));

    tidelink::chain::JsonChainProvider l1(opts.l1_snapshot);
    std::string error;
    if (!l1.Reload(&error)) {
      std::cerr << "[tidelinkd] fatal: " << error << "\n";
      return 1;
    }
    std::unique_ptr<tidelink::chain::JsonChainProvider> l2;
    if (!opts.l2_snapshot.empty()) {
      l2 = std::make_unique<tidelink::chain::JsonChainProvider>(opts.l2_snapshot);
      if (!l2->Reload(&error)) {
        std::cerr << "[tidelinkd] fatal: " << error << "\n";
        return 1;
      }
    }

    tidelink::deposit::KnownSourceIndex known_sources;
    tidelink::derivation::BridgeCursor start;
    start.l1_head = rollup.genesis_l1_block;
    start.safe_head = rollup.genesis_l1_block;
    std::optional<tidelink::primitives::Hash256> start_hash;
    if (auto genesis = l1.BlockByNumber(rollup.genesis_l1_block)) {
      start_hash = genesis->hash;
    }
    tidelink::derivation::StateDeriver deriver(l1, rollup, start, start_hash, &known_sources);
    deriver.SetEmptyBlockPolicy(
        tidelink::derivation::SkipEmptyUnlessInterval(rollup.empty_block_interval));

    tidelink::policy::L1GasOracle oracle(rollup.fee_overhead, rollup.fee_scalar);
    BuiltBlockLedger ledger;
    tidelink::policy::CrossChainPoolOptions pool_options;
    pool_options.chain_id = rollup.l2_chain_id;
    pool_options.deposit_policy.max_gas_limit = rollup.max_deposit_gas_limit;
    tidelink::policy::CrossChainPool pool(pool_options, ledger, oracle, known_sources);
    if (!opts.pending_txs_path.empty()) {
      const auto admitted = LoadPendingTransactions(opts.pending_txs_path, opts.l2_base_fee, &pool);
      LogInfo("admitted " + std::to_string(admitted) + " pending transactions from " +
              opts.pending_txs_path);
    }

    tidelink::withdrawal::PendingWithdrawals withdrawals;
    std::unique_ptr<tidelink::bridge::BridgeMonitor> monitor;
    if (opts.run_monitor && l2) {
      auto monitor_options = tidelink::bridge::BridgeMonitorOptions::FromConfig(rollup);
      monitor = std::make_unique<tidelink::bridge::BridgeMonitor>(l1, *l2, monitor_options,
                                                                  &withdrawals);
      monitor->SetAlertHandler([](const tidelink::bridge::MonitorError& alert,
                                  const tidelink::bridge::TrackedDeposit& deposit) {
        LogWarn(std::string("deposit alert (") +
                tidelink::bridge::MonitorErrorCodeName(alert.code) + ") L1 block " +
                std::to_string(deposit.l1_block) + " log " + std::to_string(deposit.log_index) +
                ": " + alert.message);
      });
      monitor->Start();
    } else if (opts.run_monitor) {
      LogWarn("no --l2-snapshot given; bridge monitor disabled");
    }

    const auto interval = std::chrono::milliseconds(opts.derive_interval_ms);
    while (!ShutdownRequested()) {
      RunDerivationPass(&l1, l2.get(), &deriver, &pool, &oracle, &ledger, opts);
      const auto wake = std::chrono::steady_clock::now() + interval;
      while (!ShutdownRequested() && std::chrono::steady_clock::now() < wake) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    }

    LogInfo("Shutdown requested");
    if (monitor) {
      monitor->Stop();
    }
    if (!opts.status_json_path.empty()) {
      WriteStatusJson(opts.status_json_path, deriver, pool, withdrawals, monitor.get());
    }
  } catch (const std::exception& ex) {
    LogDebug(std::string("fatal exception: ") + ex.what());
    std::cerr << "[tidelinkd] fatal: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
