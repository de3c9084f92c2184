#include "derivation/state_deriver.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

#include "chain/event_log.hpp"
#include "primitives/tx_hash.hpp"
#include "util/hex.hpp"

namespace tidelink::derivation {

namespace {

bool Fail(DeriveError* error, DeriveError::Code code, std::uint64_t l1_block,
          std::string message) {
  if (error) {
    error->code = code;
    error->l1_block = l1_block;
    error->message = std::move(message);
  }
  return false;
}

}  // namespace

const char* DeriveErrorCodeName(DeriveError::Code code) {
  switch (code) {
    case DeriveError::Code::kNone:
      return "none";
    case DeriveError::Code::kL1BlockNotFound:
      return "l1-block-not-found";
    case DeriveError::Code::kMalformedDepositLog:
      return "malformed-deposit-log";
    case DeriveError::Code::kL1ReorgDetected:
      return "l1-reorg-detected";
  }
  return "unknown";
}

EmptyBlockPolicy SkipEmptyUnlessInterval(std::uint64_t interval) {
  return [interval](std::uint64_t l1_number, std::size_t user_deposits) {
    if (interval == 0 || user_deposits > 0) {
      return false;
    }
    return l1_number % interval != 0;
  };
}

DerivationStream::Status DerivationStream::Next(DerivedBlock* block, DeriveError* error) {
  if (failed_) {
    return Status::kError;
  }
  while (true) {
    const auto tip = deriver_->CurrentTip();
    if (tip.l1_head >= target_) {
      return Status::kDone;
    }
    StateDeriver::Step step;
    if (!deriver_->ComputeStep(tip, &step, error)) {
      failed_ = true;
      return Status::kError;
    }
    std::uint64_t safe_head = 0;
    {
      std::lock_guard<std::mutex> lock(deriver_->mutex_);
      StateDeriver::ApplyStep(&deriver_->state_, step);
      safe_head = deriver_->state_.cursor.safe_head;
    }
    deriver_->RecordSources(step.sources, safe_head);
    if (step.block) {
      if (block) *block = std::move(*step.block);
      return Status::kBlock;
    }
  }
}

StateDeriver::StateDeriver(const chain::ChainProvider& l1, config::RollupConfig config,
                           BridgeCursor start, std::optional<primitives::Hash256> start_l1_hash,
                           deposit::KnownSourceIndex* known_sources)
    : l1_(l1),
      config_(std::move(config)),
      known_sources_(known_sources),
      empty_block_policy_(SkipEmptyUnlessInterval(config_.empty_block_interval)) {
  state_.cursor = start;
  state_.cursor.safe_head = std::min(start.safe_head, start.l1_head);
  state_.finalized_hint = state_.cursor.safe_head;
  state_.checkpoints[start.l1_head] = L1Checkpoint{start_l1_hash, start.l2_head};
}

void StateDeriver::SetEmptyBlockPolicy(EmptyBlockPolicy policy) {
  empty_block_policy_ = std::move(policy);
}

DerivationStream StateDeriver::Stream(std::uint64_t target_l1_block) {
  return DerivationStream(this, target_l1_block);
}

bool StateDeriver::Derive(std::uint64_t target_l1_block, std::vector<DerivedBlock>* out,
                          DeriveError* error) {
  State scratch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scratch = state_;
  }
  std::vector<DerivedBlock> produced;
  std::vector<std::pair<primitives::Hash256, std::uint64_t>> sources;
  while (scratch.cursor.l1_head < target_l1_block) {
    Step step;
    if (!ComputeStep(TipOf(scratch), &step, error)) {
      return false;
    }
    ApplyStep(&scratch, step);
    sources.insert(sources.end(), step.sources.begin(), step.sources.end());
    if (step.block) {
      produced.push_back(std::move(*step.block));
    }
  }
  std::uint64_t safe_head = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(scratch);
    safe_head = state_.cursor.safe_head;
  }
  RecordSources(sources, safe_head);
  if (out) *out = std::move(produced);
  return true;
}

void StateDeriver::UpdateSafeHead(std::uint64_t finalized_l1_block) {
  std::uint64_t safe_head = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_l1_block <= state_.finalized_hint) {
      return;
    }
    state_.finalized_hint = finalized_l1_block;
    ApplySafeHead(&state_);
    safe_head = state_.cursor.safe_head;
  }
  RecordSources({}, safe_head);
}

void StateDeriver::HandleL1Reorg(std::uint64_t common_ancestor) {
  std::uint64_t rewound_to = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto target = std::max(common_ancestor, state_.cursor.safe_head);
    if (target >= state_.cursor.l1_head) {
      return;
    }
    auto checkpoint = state_.checkpoints.lower_bound(target);
    if (checkpoint == state_.checkpoints.end() || checkpoint->first >= state_.cursor.l1_head) {
      return;
    }
    if (checkpoint->first != target) {
      std::cerr << "[derive] no checkpoint at L1 block " << target << ", rewinding to "
                << checkpoint->first << " instead\n";
      target = checkpoint->first;
    }
    state_.cursor.l1_head = target;
    state_.cursor.l2_head = checkpoint->second.l2_head;
    state_.checkpoints.erase(std::next(checkpoint), state_.checkpoints.end());
    while (!state_.retained.empty() && state_.retained.back().l1_origin > target) {
      state_.retained.pop_back();
    }
    rewound_to = target;
  }
  if (known_sources_) {
    known_sources_->RollbackAbove(rewound_to);
  }
  std::cerr << "[derive] L1 reorg, rewound to L1 block " << rewound_to << "\n";
}

BridgeCursor StateDeriver::Cursor() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.cursor;
}

std::vector<DerivedBlock> StateDeriver::RetainedBlocks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {state_.retained.begin(), state_.retained.end()};
}

StateDeriver::Tip StateDeriver::TipOf(const State& state) {
  Tip tip;
  tip.l1_head = state.cursor.l1_head;
  tip.l2_head = state.cursor.l2_head;
  auto it = state.checkpoints.find(state.cursor.l1_head);
  if (it != state.checkpoints.end()) {
    tip.l1_hash = it->second.l1_hash;
  }
  return tip;
}

StateDeriver::Tip StateDeriver::CurrentTip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return TipOf(state_);
}

bool StateDeriver::ComputeStep(const Tip& tip, Step* step, DeriveError* error) const {
  const std::uint64_t number = tip.l1_head + 1;
  auto block = l1_.BlockByNumber(number);
  if (!block) {
    return Fail(error, DeriveError::Code::kL1BlockNotFound, number,
                "L1 block " + std::to_string(number) + " not available");
  }
  if (block->number != number) {
    return Fail(error, DeriveError::Code::kL1BlockNotFound, number,
                "provider returned block " + std::to_string(block->number) + " for " +
                    std::to_string(number));
  }
  if (tip.l1_hash && block->parent_hash != *tip.l1_hash) {
    std::cerr << "[derive] L1 block " << number << " parent "
              << util::ShortHex(block->parent_hash) << " does not extend "
              << util::ShortHex(*tip.l1_hash) << "\n";
    return Fail(error, DeriveError::Code::kL1ReorgDetected, number,
                "L1 block " + std::to_string(number) + " does not extend the derived chain");
  }

  std::vector<primitives::TxDeposit> user_deposits;
  if (!ExtractUserDeposits(*block, &user_deposits, error)) {
    return false;
  }

  step->l1_number = number;
  step->l1_hash = block->hash;
  step->block.reset();
  step->sources.clear();
  if (user_deposits.empty() && empty_block_policy_ && empty_block_policy_(number, 0)) {
    return true;
  }

  // One L2 block per L1 origin, so the sequence number is always 0.
  DerivedBlock derived;
  derived.l2_number = tip.l2_head + 1;
  derived.l1_origin = number;
  derived.l1_origin_hash = block->hash;
  derived.timestamp = block->timestamp;
  derived.transactions.reserve(user_deposits.size() + 1);
  auto system_deposit = BuildSystemDeposit(*block, 0);
  step->sources.emplace_back(system_deposit.source_hash(), number);
  derived.transactions.emplace_back(std::move(system_deposit));
  for (auto& deposit : user_deposits) {
    step->sources.emplace_back(deposit.source_hash(), number);
    derived.transactions.emplace_back(std::move(deposit));
  }
  step->block = std::move(derived);
  return true;
}

bool StateDeriver::ExtractUserDeposits(const primitives::BlockView& block,
                                       std::vector<primitives::TxDeposit>* deposits,
                                       DeriveError* error) const {
  // log_index counts every log in the block, so every receipt is read, not
  // only portal calls; a missing unrelated receipt stalls the block too.
  std::uint64_t log_index = 0;
  for (const auto& tx : block.transactions) {
    const auto tx_hash = primitives::ComputeTxHash(tx);
    primitives::Receipt receipt;
    if (!l1_.ReceiptByHash(tx_hash, &receipt)) {
      return Fail(error, DeriveError::Code::kL1BlockNotFound, block.number,
                  "receipt " + util::ShortHex(tx_hash) + " of L1 block " +
                      std::to_string(block.number) + " not available");
    }
    const auto* signed_tx = std::get_if<primitives::SignedTransaction>(&tx);
    const bool to_portal = signed_tx && signed_tx->to && *signed_tx->to == config_.deposit_portal;
    for (const auto& log : receipt.logs) {
      const std::uint64_t index = log_index++;
      if (!to_portal || !receipt.success ||
          !chain::IsDepositEventLog(log, config_.deposit_portal)) {
        continue;
      }
      chain::DepositEvent event;
      std::string decode_error;
      if (!chain::DecodeDepositEvent(log, &event, &decode_error)) {
        std::cerr << "[derive] malformed deposit log " << index << " in L1 block "
                  << block.number << ": " << decode_error << "\n";
        return Fail(error, DeriveError::Code::kMalformedDepositLog, block.number,
                    "log " + std::to_string(index) + ": " + decode_error);
      }
      primitives::DepositFields fields;
      fields.source_hash = deposit::UserDepositSourceHash(block.hash, index);
      fields.from = event.from;
      fields.to = event.to;
      fields.value = event.value;
      fields.gas_limit = event.gas_limit;
      fields.input = std::move(event.input);
      deposits->push_back(primitives::TxDeposit::User(std::move(fields)));
    }
  }
  return true;
}

primitives::TxDeposit StateDeriver::BuildSystemDeposit(const primitives::BlockView& block,
                                                       std::uint64_t sequence_number) const {
  L1Attributes attributes;
  attributes.number = block.number;
  attributes.timestamp = block.timestamp;
  attributes.base_fee = primitives::U256(block.base_fee);
  attributes.block_hash = block.hash;
  attributes.sequence_number = sequence_number;
  attributes.batcher_hash = config_.batcher_hash;
  attributes.fee_overhead = primitives::U256(config_.fee_overhead);
  attributes.fee_scalar = primitives::U256(config_.fee_scalar);

  primitives::DepositFields fields;
  fields.source_hash = deposit::L1InfoSourceHash(block.hash, sequence_number);
  fields.from = config_.system_depositor;
  fields.to = config_.l1_block_info;
  fields.value = primitives::U256::Zero();
  fields.gas_limit = deposit::kSystemDepositGasLimit;
  fields.input = EncodeL1Attributes(attributes);
  return primitives::TxDeposit(primitives::SystemDepositKey{}, std::move(fields));
}

void StateDeriver::ApplyStep(State* state, const Step& step) {
  state->cursor.l1_head = step.l1_number;
  if (step.block) {
    state->cursor.l2_head = step.block->l2_number;
    state->retained.push_back(*step.block);
  }
  state->checkpoints[step.l1_number] = L1Checkpoint{step.l1_hash, state->cursor.l2_head};
  ApplySafeHead(state);
}

void StateDeriver::ApplySafeHead(State* state) {
  const auto target = std::min(state->finalized_hint, state->cursor.l1_head);
  if (target <= state->cursor.safe_head) {
    return;
  }
  state->cursor.safe_head = target;
  while (!state->retained.empty() && state->retained.front().l1_origin <= target) {
    state->retained.pop_front();
  }
  state->checkpoints.erase(state->checkpoints.begin(), state->checkpoints.lower_bound(target));
}

void StateDeriver::RecordSources(
    const std::vector<std::pair<primitives::Hash256, std::uint64_t>>& sources,
    std::uint64_t safe_head) const {
  if (!known_sources_) {
    return;
  }
  for (const auto& [source_hash, l1_block] : sources) {
    known_sources_->Insert(source_hash, l1_block);
  }
  if (safe_head > config_.source_retention_blocks) {
    known_sources_->PruneBelow(safe_head - config_.source_retention_blocks);
  }
}

}  // namespace tidelink::derivation
