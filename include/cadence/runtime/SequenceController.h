// Repository: Cadence
// Component: Sequence Controller
// Purpose: Run/pause/stop state machine over RuntimeState and the single
//          TickScheduler timer; runs the tick handler and the emission hook.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_RUNTIME_SEQUENCE_CONTROLLER_H_
#define CADENCE_RUNTIME_SEQUENCE_CONTROLLER_H_

// SequenceController
//
// Owns the RuntimeState and the TickScheduler and is the only code that
// mutates either. One mutex guards both: every command transition, every
// tick, and every arm/cancel/reschedule happens under it.
//
// The tick callback re-checks Phase and the scheduler ticket under that
// mutex, so a tick that raced pause/stop/restart/exit does nothing.
//
// SequenceController does NOT:
// - parse command strings (CommandRouter)
// - format or print blocks (the BlockSink owner)

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "cadence/runtime/RuntimeState.h"
#include "cadence/sequence/SequenceEngine.hpp"
#include "cadence/timing/ITimeSource.hpp"
#include "cadence/timing/TickScheduler.hpp"

namespace cadence::runtime {

enum class CommandStatus {
  kOk,                 // Transition applied
  kNoChange,           // Accepted, nothing to do (stop while stopped, help)
  kInvalidSeed,        // Negative or out-of-order seed terms
  kInvalidLength,      // Non-positive batch/term count
  kSyntaxError,        // Wrong argument count or non-numeric argument
  kIllegalTransition,  // Command not valid in the current phase
  kUnknownCommand      // Verb not recognized
};

const char* ToString(CommandStatus status);

struct CommandResult {
  bool success;
  CommandStatus status;
  std::string message;
  Phase phase;

  CommandResult(CommandStatus s, std::string msg, Phase p)
      : success(s == CommandStatus::kOk || s == CommandStatus::kNoChange),
        status(s),
        message(std::move(msg)),
        phase(p) {}
};

class SequenceController {
 public:
  // Called on the scheduler thread with the controller mutex held. Must not
  // call back into the controller.
  using BlockSink = std::function<void(const sequence::Block&)>;

  struct Snapshot {
    Phase phase = Phase::kStopped;
    sequence::SeedPair start;
    sequence::SeedPair current;
    SequenceConfig config;
    std::optional<timing::TickScheduler::PendingTick> pending_tick;
    std::map<std::pair<Phase, Phase>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
    uint64_t blocks_emitted_total = 0;
    uint64_t stale_tick_total = 0;
    uint64_t ceiling_stop_total = 0;
  };

  SequenceController(std::shared_ptr<timing::ITimeSource> clock,
                     SequenceConfig config,
                     BlockSink sink);
  ~SequenceController();

  SequenceController(const SequenceController&) = delete;
  SequenceController& operator=(const SequenceController&) = delete;

  // start: from Stopped begins at (0,1); from Paused resumes from current;
  // rejected while Running.
  CommandResult Start();
  // start a b: from Stopped/Running begins (or restarts) at (a,b) with a
  // seed block; from Paused continues after (a,b).
  CommandResult Start(const sequence::Term& a, const sequence::Term& b);
  CommandResult Pause();
  CommandResult Stop();
  CommandResult Restart();
  // Clamped to the configured floor. Reschedules in place while Running.
  CommandResult SetPeriodMs(int64_t period_ms);
  CommandResult SetCeiling(std::optional<sequence::Term> ceiling);
  // Default period, no ceiling.
  CommandResult ResetConfig();
  CommandResult Help();
  // Cancels the timer and blocks until the scheduler thread has joined.
  CommandResult Exit();

  [[nodiscard]] Phase phase() const;
  [[nodiscard]] Snapshot GetSnapshot() const;

 private:
  void OnTick(uint64_t ticket);

  // Cancels any tick and arms a fresh run that emits `primed` first.
  void BeginRunLocked(sequence::Block primed, const sequence::SeedPair& start,
                      const sequence::SeedPair& current);
  void HaltLocked(Phase to);
  void TransitionLocked(Phase to);
  CommandResult RejectLocked(CommandStatus status, const std::string& message);
  CommandResult FromSequenceErrorLocked(const sequence::SequenceError& e);
  CommandResult OkLocked(std::string message) const;

  mutable std::mutex mutex_;

  RuntimeState state_;
  // Block computed by start/restart, emitted by the first tick of the run.
  std::optional<sequence::Block> primed_block_;
  BlockSink sink_;

  std::map<std::pair<Phase, Phase>, uint64_t> transitions_;
  uint64_t illegal_transition_total_ = 0;
  uint64_t blocks_emitted_total_ = 0;
  uint64_t stale_tick_total_ = 0;
  uint64_t ceiling_stop_total_ = 0;

  // Declared last: destroyed (and joined) first.
  std::unique_ptr<timing::TickScheduler> scheduler_;
};

}  // namespace cadence::runtime

#endif  // CADENCE_RUNTIME_SEQUENCE_CONTROLLER_H_
