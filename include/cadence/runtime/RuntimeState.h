// Repository: Cadence
// Component: Runtime State
// Purpose: Phase, seed pairs and tick configuration owned by the
//          SequenceController, plus the pure helpers that read them.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_RUNTIME_RUNTIME_STATE_H_
#define CADENCE_RUNTIME_RUNTIME_STATE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cadence/sequence/SequenceEngine.hpp"

namespace cadence::runtime {

// Phase is the sole source of truth for which commands are legal.
enum class Phase {
  kStopped,  // No active sequence; current == start
  kPaused,   // Run suspended, current retained
  kRunning,  // Ticking; exactly one pending tick armed
  kExited    // Terminal; scheduler released
};

const char* ToString(Phase phase);

// Console prompt for the phase ("running> ").
std::string PromptFor(Phase phase);

// Verbs that are accepted (not rejected as illegal) in the given phase.
std::vector<std::string> AllowedVerbs(Phase phase);

// Help listing with the verbs legal in `phase` marked.
std::string HelpText(Phase phase);

inline constexpr int64_t kMinPeriodMs = 200;
inline constexpr int64_t kDefaultPeriodMs = 1'000;
inline constexpr int64_t kMaxPeriodMs = 86'400'000;
inline constexpr int64_t kMinBatchSize = 2;
inline constexpr int64_t kDefaultBatchSize = 10;

struct SequenceConfig {
  int64_t period_ms = kDefaultPeriodMs;
  int64_t min_period_ms = kMinPeriodMs;
  // Terms produced per tick. Two or more so every block can seed the next.
  int64_t batch_size = kDefaultBatchSize;
  // Absent = unbounded.
  std::optional<sequence::Term> ceiling;

  // Empty string when valid.
  std::string Validate() const;
};

// Clamps into [floor_ms, kMaxPeriodMs]; never rejects.
int64_t ClampPeriodMs(int64_t requested_ms, int64_t floor_ms);

// Seconds → whole milliseconds (truncating), then clamped. `seconds` must be
// finite.
int64_t SecondsToPeriodMs(double seconds, int64_t floor_ms);

std::string FormatPeriod(int64_t period_ms);

// Drops every term from the first one above `ceiling` onward. Returns true if
// anything was dropped.
bool TruncateAtCeiling(sequence::Block& block,
                       const std::optional<sequence::Term>& ceiling);

struct RuntimeState {
  Phase phase = Phase::kStopped;
  sequence::SeedPair start = sequence::DefaultSeed();
  sequence::SeedPair current = sequence::DefaultSeed();
  SequenceConfig config;
};

}  // namespace cadence::runtime

#endif  // CADENCE_RUNTIME_RUNTIME_STATE_H_
