// Repository: Cadence
// Component: Runtime State
// Purpose: Pure helpers over Phase and SequenceConfig.
// Copyright (c) 2025 Cadence

#include "cadence/runtime/RuntimeState.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace cadence::runtime {

namespace {

struct VerbHelp {
  const char* verb;
  const char* usage;
  const char* summary;
};

constexpr VerbHelp kVerbHelp[] = {
    {"help", "help", "Show this list"},
    {"max", "max [integer]", "Stop once a term would exceed the value; no value clears it"},
    {"pause", "pause", "Pause the running sequence"},
    {"reset", "reset", "Restore the default speed and clear the max value"},
    {"restart", "restart", "Restart the sequence from its starting terms"},
    {"speed", "speed [seconds]", "Seconds between blocks; no value uses the fastest speed"},
    {"start", "start [term1 term2]", "Start, resume, or start from two given terms"},
    {"stop", "stop", "Stop the sequence and rewind to its starting terms"},
    {"exit", "exit", "Quit"},
};

}  // namespace

const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::kStopped:
      return "stopped";
    case Phase::kPaused:
      return "paused";
    case Phase::kRunning:
      return "running";
    case Phase::kExited:
      return "exited";
  }
  return "unknown";
}

std::string PromptFor(Phase phase) {
  return std::string(ToString(phase)) + "> ";
}

std::vector<std::string> AllowedVerbs(Phase phase) {
  switch (phase) {
    case Phase::kStopped:
      return {"help", "max", "reset", "speed", "start", "stop", "exit"};
    case Phase::kPaused:
      return {"help", "max", "reset", "restart", "speed", "start", "stop", "exit"};
    case Phase::kRunning:
      // Bare "start" is rejected while running; "start a b" restarts.
      return {"help", "max", "pause", "reset", "restart", "speed", "start", "stop", "exit"};
    case Phase::kExited:
      return {};
  }
  return {};
}

std::string HelpText(Phase phase) {
  const std::vector<std::string> allowed = AllowedVerbs(phase);
  std::ostringstream oss;
  oss << "Commands (" << ToString(phase) << "):";
  for (const auto& entry : kVerbHelp) {
    const bool legal =
        std::find(allowed.begin(), allowed.end(), entry.verb) != allowed.end();
    oss << "\n  " << (legal ? ' ' : '-') << ' ' << std::left << std::setw(22)
        << entry.usage << entry.summary;
  }
  return oss.str();
}

std::string SequenceConfig::Validate() const {
  if (min_period_ms <= 0) {
    return "min_period_ms must be positive: " + std::to_string(min_period_ms);
  }
  if (period_ms < min_period_ms) {
    return "period_ms below floor: " + std::to_string(period_ms) + " < " +
           std::to_string(min_period_ms);
  }
  if (batch_size < kMinBatchSize) {
    return "batch_size must be at least " + std::to_string(kMinBatchSize) + ": " +
           std::to_string(batch_size);
  }
  if (ceiling && sgn(*ceiling) < 0) {
    return "ceiling must be non-negative: " + ceiling->get_str();
  }
  return "";
}

int64_t ClampPeriodMs(int64_t requested_ms, int64_t floor_ms) {
  return std::clamp(requested_ms, floor_ms, std::max(floor_ms, kMaxPeriodMs));
}

int64_t SecondsToPeriodMs(double seconds, int64_t floor_ms) {
  const double ms = std::trunc(seconds * 1'000.0);
  if (ms <= static_cast<double>(floor_ms)) return floor_ms;
  if (ms >= static_cast<double>(kMaxPeriodMs)) return ClampPeriodMs(kMaxPeriodMs, floor_ms);
  return ClampPeriodMs(static_cast<int64_t>(ms), floor_ms);
}

std::string FormatPeriod(int64_t period_ms) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3)
      << static_cast<double>(period_ms) / 1'000.0 << "s";
  return oss.str();
}

bool TruncateAtCeiling(sequence::Block& block,
                       const std::optional<sequence::Term>& ceiling) {
  if (!ceiling) return false;
  auto it = std::find_if(block.begin(), block.end(),
                         [&ceiling](const sequence::Term& t) { return t > *ceiling; });
  if (it == block.end()) return false;
  block.erase(it, block.end());
  return true;
}

}  // namespace cadence::runtime
