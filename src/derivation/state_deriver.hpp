#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chain/provider.hpp"
#include "config/rollup_config.hpp"
#include "deposit/deposit.hpp"
#include "derivation/l1_attributes.hpp"
#include "primitives/block.hpp"

namespace tidelink::derivation {

// Monotone watermarks: safe_head <= l1_head at all times.
struct BridgeCursor {
  std::uint64_t l1_head{0};
  std::uint64_t safe_head{0};
  std::uint64_t l2_head{0};

  bool operator==(const BridgeCursor& other) const = default;
};

// One L2 block derived from one L1 origin. transactions[0] is always the
// system L1-attributes deposit, followed by user deposits in L1 log order.
struct DerivedBlock {
  std::uint64_t l2_number{0};
  std::uint64_t l1_origin{0};
  primitives::Hash256 l1_origin_hash{};
  std::uint64_t timestamp{0};
  std::vector<primitives::Transaction> transactions{};

  bool operator==(const DerivedBlock& other) const = default;
};

struct DeriveError {
  enum class Code {
    kNone,
    kL1BlockNotFound,
    kMalformedDepositLog,
    kL1ReorgDetected,
  };
  Code code{Code::kNone};
  std::uint64_t l1_block{0};
  std::string message;
};

const char* DeriveErrorCodeName(DeriveError::Code code);

// Returns true when no L2 block should be produced for an L1 block that
// carries |user_deposits| deposits. The L1 head advances either way.
using EmptyBlockPolicy = std::function<bool(std::uint64_t l1_number, std::size_t user_deposits)>;

// Skips deposit-free L1 blocks unless their number is a multiple of
// |interval|. An interval of zero never skips.
EmptyBlockPolicy SkipEmptyUnlessInterval(std::uint64_t interval);

class StateDeriver;

// Lazy view over one derive() range. Each Next() processes L1 blocks until
// one L2 block is produced and commits the watermark for exactly the blocks
// it consumed. After kError the stream stays failed.
class DerivationStream {
 public:
  enum class Status {
    kBlock,
    kDone,
    kError,
  };

  Status Next(DerivedBlock* block, DeriveError* error);
  std::uint64_t target() const { return target_; }

 private:
  friend class StateDeriver;
  DerivationStream(StateDeriver* deriver, std::uint64_t target)
      : deriver_(deriver), target_(target) {}

  StateDeriver* deriver_;
  std::uint64_t target_;
  bool failed_{false};
};

// Deterministic L1 -> L2 derivation. Stream, Derive, UpdateSafeHead and
// HandleL1Reorg must be driven from a single thread; Cursor and
// RetainedBlocks may be read concurrently.
class StateDeriver {
 public:
  StateDeriver(const chain::ChainProvider& l1, config::RollupConfig config, BridgeCursor start,
               std::optional<primitives::Hash256> start_l1_hash = std::nullopt,
               deposit::KnownSourceIndex* known_sources = nullptr);

  void SetEmptyBlockPolicy(EmptyBlockPolicy policy);

  DerivationStream Stream(std::uint64_t target_l1_block);

  // All-or-nothing: on failure no watermark moves and |out| is untouched.
  bool Derive(std::uint64_t target_l1_block, std::vector<DerivedBlock>* out, DeriveError* error);

  // Records L1 finality. The safe head follows the highest value ever passed,
  // clamped to the L1 head; retained blocks at or below it are released.
  void UpdateSafeHead(std::uint64_t finalized_l1_block);

  // Rewinds to max(common_ancestor, safe_head) after an L1 reorg.
  void HandleL1Reorg(std::uint64_t common_ancestor);

  BridgeCursor Cursor() const;
  std::vector<DerivedBlock> RetainedBlocks() const;
  const config::RollupConfig& config() const { return config_; }

 private:
  friend class DerivationStream;

  struct L1Checkpoint {
    std::optional<primitives::Hash256> l1_hash;
    std::uint64_t l2_head{0};
  };

  struct State {
    BridgeCursor cursor;
    std::uint64_t finalized_hint{0};
    std::map<std::uint64_t, L1Checkpoint> checkpoints;
    std::deque<DerivedBlock> retained;
  };

  // What the next step needs to know about the committed chain.
  struct Tip {
    std::uint64_t l1_head{0};
    std::optional<primitives::Hash256> l1_hash;
    std::uint64_t l2_head{0};
  };

  struct Step {
    std::uint64_t l1_number{0};
    primitives::Hash256 l1_hash{};
    std::optional<DerivedBlock> block;
    std::vector<std::pair<primitives::Hash256, std::uint64_t>> sources;
  };

  static Tip TipOf(const State& state);
  Tip CurrentTip() const;
  bool ComputeStep(const Tip& tip, Step* step, DeriveError* error) const;
  bool ExtractUserDeposits(const primitives::BlockView& block,
                           std::vector<primitives::TxDeposit>* deposits,
                           DeriveError* error) const;
  primitives::TxDeposit BuildSystemDeposit(const primitives::BlockView& block,
                                           std::uint64_t sequence_number) const;
  static void ApplyStep(State* state, const Step& step);
  static void ApplySafeHead(State* state);
  void RecordSources(const std::vector<std::pair<primitives::Hash256, std::uint64_t>>& sources,
                     std::uint64_t safe_head) const;

  const chain::ChainProvider& l1_;
  const config::RollupConfig config_;
  deposit::KnownSourceIndex* known_sources_;
  EmptyBlockPolicy empty_block_policy_;

  mutable std::mutex mutex_;
  State state_;
};

}  // namespace tidelink::derivation
