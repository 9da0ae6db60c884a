// Repository: Cadence
// Component: Sequence Controller
// Purpose: Run/pause/stop state machine over RuntimeState and the single
//          TickScheduler timer.
// Copyright (c) 2025 Cadence

#include "cadence/runtime/SequenceController.h"

#include <sstream>
#include <stdexcept>

#include "cadence/util/Logger.hpp"

namespace cadence::runtime {

using cadence::util::Logger;

namespace {

std::string FormatSeed(const sequence::SeedPair& seed) {
  return "(" + seed.a.get_str() + ", " + seed.b.get_str() + ")";
}

}  // namespace

const char* ToString(CommandStatus status) {
  switch (status) {
    case CommandStatus::kOk:
      return "Ok";
    case CommandStatus::kNoChange:
      return "NoChange";
    case CommandStatus::kInvalidSeed:
      return "InvalidSeed";
    case CommandStatus::kInvalidLength:
      return "InvalidLength";
    case CommandStatus::kSyntaxError:
      return "SyntaxError";
    case CommandStatus::kIllegalTransition:
      return "IllegalTransition";
    case CommandStatus::kUnknownCommand:
      return "UnknownCommand";
  }
  return "Unknown";
}

SequenceController::SequenceController(std::shared_ptr<timing::ITimeSource> clock,
                                       SequenceConfig config,
                                       BlockSink sink)
    : sink_(std::move(sink)) {
  const std::string error = config.Validate();
  if (!error.empty()) {
    throw std::invalid_argument("SequenceController: " + error);
  }
  state_.config = std::move(config);
  scheduler_ = std::make_unique<timing::TickScheduler>(
      std::move(clock), [this](uint64_t ticket) { OnTick(ticket); });
}

SequenceController::~SequenceController() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_->Cancel();
  }
  scheduler_->Shutdown();
}

// ============================================================================
// Commands
// ============================================================================

CommandResult SequenceController::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t batch = state_.config.batch_size;

  switch (state_.phase) {
    case Phase::kRunning:
      return RejectLocked(CommandStatus::kIllegalTransition,
                          "Sequence is already running.");
    case Phase::kExited:
      return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
    case Phase::kStopped: {
      const sequence::SeedPair seed = sequence::DefaultSeed();
      try {
        BeginRunLocked(sequence::SeedBlock(batch, seed.a, seed.b), seed, seed);
      } catch (const sequence::SequenceError& e) {
        return FromSequenceErrorLocked(e);
      }
      return OkLocked("Starting sequence from " + FormatSeed(seed) + ".");
    }
    case Phase::kPaused: {
      const sequence::SeedPair resume_from = state_.current;
      try {
        BeginRunLocked(sequence::ContinuationBlock(batch, resume_from.a, resume_from.b),
                       resume_from, resume_from);
      } catch (const sequence::SequenceError& e) {
        return FromSequenceErrorLocked(e);
      }
      return OkLocked("Resuming sequence after " + FormatSeed(resume_from) + ".");
    }
  }
  return RejectLocked(CommandStatus::kIllegalTransition, "Unknown phase.");
}

CommandResult SequenceController::Start(const sequence::Term& a, const sequence::Term& b) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }

  const int64_t batch = state_.config.batch_size;
  const sequence::SeedPair seed{a, b};
  const bool resuming = state_.phase == Phase::kPaused;

  // Compute before touching any state: a rejected seed leaves everything as is.
  sequence::Block primed;
  try {
    primed = resuming ? sequence::ContinuationBlock(batch, a, b)
                      : sequence::SeedBlock(batch, a, b);
  } catch (const sequence::SequenceError& e) {
    return FromSequenceErrorLocked(e);
  }

  const bool restarting = state_.phase == Phase::kRunning;
  BeginRunLocked(std::move(primed), seed, seed);
  if (resuming) {
    return OkLocked("Resuming sequence after " + FormatSeed(seed) + ".");
  }
  return OkLocked(std::string(restarting ? "Restarting" : "Starting") +
                  " sequence from " + FormatSeed(seed) + ".");
}

CommandResult SequenceController::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_.phase) {
    case Phase::kRunning:
      HaltLocked(Phase::kPaused);
      return OkLocked("Sequence paused.");
    case Phase::kPaused:
      return RejectLocked(CommandStatus::kIllegalTransition, "Sequence is already paused.");
    case Phase::kStopped:
      return RejectLocked(CommandStatus::kIllegalTransition, "No sequence is running.");
    case Phase::kExited:
      return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }
  return RejectLocked(CommandStatus::kIllegalTransition, "Unknown phase.");
}

CommandResult SequenceController::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_.phase) {
    case Phase::kRunning:
    case Phase::kPaused:
      HaltLocked(Phase::kStopped);
      return OkLocked("Sequence stopped.");
    case Phase::kStopped:
      return CommandResult(CommandStatus::kNoChange, "Sequence is already stopped.",
                           state_.phase);
    case Phase::kExited:
      return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }
  return RejectLocked(CommandStatus::kIllegalTransition, "Unknown phase.");
}

CommandResult SequenceController::Restart() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kStopped) {
    return RejectLocked(CommandStatus::kIllegalTransition, "No active sequence to restart.");
  }
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }

  const sequence::SeedPair seed = state_.start;
  try {
    BeginRunLocked(sequence::SeedBlock(state_.config.batch_size, seed.a, seed.b),
                   seed, seed);
  } catch (const sequence::SequenceError& e) {
    return FromSequenceErrorLocked(e);
  }
  return OkLocked("Restarting sequence from " + FormatSeed(seed) + ".");
}

CommandResult SequenceController::SetPeriodMs(int64_t period_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }

  state_.config.period_ms = ClampPeriodMs(period_ms, state_.config.min_period_ms);
  if (state_.phase == Phase::kRunning) {
    const auto delay_ms = scheduler_->Reschedule(state_.config.period_ms);
    if (delay_ms) {
      Logger::Debug("[SequenceController] Period now " + std::to_string(state_.config.period_ms) +
                    "ms, next tick in " + std::to_string(*delay_ms) + "ms");
    }
  }
  return OkLocked("Speed set to one block every " + FormatPeriod(state_.config.period_ms) +
                  ".");
}

CommandResult SequenceController::SetCeiling(std::optional<sequence::Term> ceiling) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }
  if (ceiling && sgn(*ceiling) < 0) {
    return RejectLocked(CommandStatus::kSyntaxError,
                        "Max value must be non-negative: " + ceiling->get_str());
  }

  state_.config.ceiling = std::move(ceiling);
  if (!state_.config.ceiling) {
    return OkLocked("Max value cleared.");
  }
  return OkLocked("Max value set to " + state_.config.ceiling->get_str() + ".");
}

CommandResult SequenceController::ResetConfig() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }

  state_.config.period_ms = ClampPeriodMs(kDefaultPeriodMs, state_.config.min_period_ms);
  state_.config.ceiling.reset();
  if (state_.phase == Phase::kRunning) {
    scheduler_->Reschedule(state_.config.period_ms);
  }
  return OkLocked("Speed reset to one block every " + FormatPeriod(state_.config.period_ms) +
                  "; max value cleared.");
}

CommandResult SequenceController::Help() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase == Phase::kExited) {
    return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
  }
  return CommandResult(CommandStatus::kNoChange, HelpText(state_.phase), state_.phase);
}

CommandResult SequenceController::Exit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.phase == Phase::kExited) {
      return RejectLocked(CommandStatus::kIllegalTransition, "Console has exited.");
    }
    HaltLocked(Phase::kExited);
  }
  // Outside the lock: a tick blocked on mutex_ must be able to finish (and
  // see kExited) before the worker can join.
  scheduler_->Shutdown();
  return CommandResult(CommandStatus::kOk, "Goodbye.", Phase::kExited);
}

Phase SequenceController::phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.phase;
}

SequenceController::Snapshot SequenceController::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snapshot;
  snapshot.phase = state_.phase;
  snapshot.start = state_.start;
  snapshot.current = state_.current;
  snapshot.config = state_.config;
  snapshot.pending_tick = scheduler_->Pending();
  snapshot.transitions = transitions_;
  snapshot.illegal_transition_total = illegal_transition_total_;
  snapshot.blocks_emitted_total = blocks_emitted_total_;
  snapshot.stale_tick_total = stale_tick_total_;
  snapshot.ceiling_stop_total = ceiling_stop_total_;
  return snapshot;
}

// ============================================================================
// Tick
// ============================================================================

void SequenceController::OnTick(uint64_t ticket) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.phase != Phase::kRunning || !scheduler_->IsCurrent(ticket)) {
    ++stale_tick_total_;
    Logger::Debug("[SequenceController] Dropped stale tick ticket=" + std::to_string(ticket));
    return;
  }

  sequence::Block block;
  try {
    if (primed_block_) {
      block = std::move(*primed_block_);
      primed_block_.reset();
    } else {
      block = sequence::ContinuationBlock(state_.config.batch_size,
                                          state_.current.a, state_.current.b);
    }
    state_.current = sequence::NextSeed(block);
  } catch (const sequence::SequenceError& e) {
    Logger::Error(std::string("[SequenceController] Tick failed (") +
                  sequence::ToString(e.kind()) + "): " + e.what());
    HaltLocked(Phase::kStopped);
    return;
  }

  const bool truncated = TruncateAtCeiling(block, state_.config.ceiling);
  if (!block.empty()) {
    ++blocks_emitted_total_;
    if (sink_) {
      sink_(block);
    }
  }

  if (truncated) {
    ++ceiling_stop_total_;
    HaltLocked(Phase::kStopped);
    Logger::Info("Max value " + state_.config.ceiling->get_str() +
                 " reached; sequence stopped.");
  }
}

// ============================================================================
// Helpers (mutex_ held)
// ============================================================================

void SequenceController::BeginRunLocked(sequence::Block primed,
                                        const sequence::SeedPair& start,
                                        const sequence::SeedPair& current) {
  scheduler_->Cancel();
  state_.start = start;
  state_.current = current;
  primed_block_ = std::move(primed);
  TransitionLocked(Phase::kRunning);
  scheduler_->Arm(0, state_.config.period_ms);
}

void SequenceController::HaltLocked(Phase to) {
  scheduler_->Cancel();
  primed_block_.reset();
  if (to == Phase::kStopped) {
    state_.current = state_.start;
  }
  TransitionLocked(to);
}

void SequenceController::TransitionLocked(Phase to) {
  const Phase from = state_.phase;
  ++transitions_[{from, to}];
  state_.phase = to;
  std::ostringstream oss;
  oss << "[SequenceController] " << ToString(from) << " -> " << ToString(to)
      << " start=" << FormatSeed(state_.start) << " current=" << FormatSeed(state_.current);
  Logger::Debug(oss.str());
}

CommandResult SequenceController::RejectLocked(CommandStatus status,
                                               const std::string& message) {
  if (status == CommandStatus::kIllegalTransition) {
    ++illegal_transition_total_;
  }
  Logger::Debug(std::string("[SequenceController] Rejected (") + ToString(status) +
                ") in " + ToString(state_.phase) + ": " + message);
  return CommandResult(status, message, state_.phase);
}

CommandResult SequenceController::FromSequenceErrorLocked(const sequence::SequenceError& e) {
  const CommandStatus status = e.kind() == sequence::ErrorKind::kInvalidSeed
                                   ? CommandStatus::kInvalidSeed
                                   : CommandStatus::kInvalidLength;
  return RejectLocked(status, e.what());
}

CommandResult SequenceController::OkLocked(std::string message) const {
  return CommandResult(CommandStatus::kOk, std::move(message), state_.phase);
}

}  // namespace cadence::runtime
