// Repository: Cadence
// Component: Runtime State unit tests

#include <gtest/gtest.h>

#include <algorithm>

#include "cadence/runtime/RuntimeState.h"

namespace cadence::runtime {
namespace {

using sequence::Block;
using sequence::Term;

bool Allows(Phase phase, const std::string& verb) {
  const auto verbs = AllowedVerbs(phase);
  return std::find(verbs.begin(), verbs.end(), verb) != verbs.end();
}

TEST(RuntimeStateTest, InitialStateIsStoppedAtDefaultSeed) {
  RuntimeState state;
  EXPECT_EQ(state.phase, Phase::kStopped);
  EXPECT_EQ(state.start, sequence::DefaultSeed());
  EXPECT_EQ(state.current, sequence::DefaultSeed());
  EXPECT_EQ(state.config.period_ms, kDefaultPeriodMs);
  EXPECT_EQ(state.config.batch_size, kDefaultBatchSize);
  EXPECT_FALSE(state.config.ceiling.has_value());
  EXPECT_TRUE(state.config.Validate().empty());
}

TEST(RuntimeStateTest, PromptAndVerbsFollowPhase) {
  EXPECT_EQ(PromptFor(Phase::kStopped), "stopped> ");
  EXPECT_EQ(PromptFor(Phase::kRunning), "running> ");
  EXPECT_EQ(PromptFor(Phase::kPaused), "paused> ");

  EXPECT_FALSE(Allows(Phase::kStopped, "pause"));
  EXPECT_FALSE(Allows(Phase::kStopped, "restart"));
  EXPECT_TRUE(Allows(Phase::kRunning, "pause"));
  EXPECT_FALSE(Allows(Phase::kPaused, "pause"));
  EXPECT_TRUE(Allows(Phase::kPaused, "restart"));
  EXPECT_TRUE(AllowedVerbs(Phase::kExited).empty());
}

TEST(RuntimeStateTest, HelpTextListsEveryVerb) {
  const std::string help = HelpText(Phase::kStopped);
  for (const char* verb : {"help", "max", "pause", "reset", "restart", "speed", "start",
                           "stop", "exit"}) {
    EXPECT_NE(help.find(verb), std::string::npos) << verb;
  }
}

TEST(RuntimeStateTest, ConfigValidationRejectsShortBatch) {
  SequenceConfig config;
  config.batch_size = 1;
  EXPECT_FALSE(config.Validate().empty());
  config.batch_size = 0;
  EXPECT_FALSE(config.Validate().empty());
  config.batch_size = kMinBatchSize;
  EXPECT_TRUE(config.Validate().empty());
}

TEST(RuntimeStateTest, ConfigValidationRejectsPeriodBelowFloor) {
  SequenceConfig config;
  config.period_ms = kMinPeriodMs - 1;
  EXPECT_FALSE(config.Validate().empty());
}

TEST(RuntimeStateTest, PeriodClampsToFloorNeverRejects) {
  EXPECT_EQ(ClampPeriodMs(0, kMinPeriodMs), kMinPeriodMs);
  EXPECT_EQ(ClampPeriodMs(-500, kMinPeriodMs), kMinPeriodMs);
  EXPECT_EQ(ClampPeriodMs(750, kMinPeriodMs), 750);
  EXPECT_EQ(ClampPeriodMs(kMaxPeriodMs + 1, kMinPeriodMs), kMaxPeriodMs);
}

TEST(RuntimeStateTest, SecondsConvertToWholeMilliseconds) {
  EXPECT_EQ(SecondsToPeriodMs(2.0, kMinPeriodMs), 2'000);
  EXPECT_EQ(SecondsToPeriodMs(0.5, kMinPeriodMs), 500);
  EXPECT_EQ(SecondsToPeriodMs(1.2345, kMinPeriodMs), 1'234);
  EXPECT_EQ(SecondsToPeriodMs(0.1, kMinPeriodMs), kMinPeriodMs);
  EXPECT_EQ(SecondsToPeriodMs(-3.0, kMinPeriodMs), kMinPeriodMs);
  EXPECT_EQ(SecondsToPeriodMs(1e300, kMinPeriodMs), kMaxPeriodMs);
}

TEST(RuntimeStateTest, TruncateAtCeilingKeepsTermsUpToBoundary) {
  Block block{Term(21), Term(34), Term(55), Term(89)};
  EXPECT_TRUE(TruncateAtCeiling(block, Term(50)));
  EXPECT_EQ(block, (Block{Term(21), Term(34)}));

  Block equal{Term(34), Term(50), Term(84)};
  EXPECT_TRUE(TruncateAtCeiling(equal, Term(50)));
  EXPECT_EQ(equal, (Block{Term(34), Term(50)}));
}

TEST(RuntimeStateTest, TruncateAtCeilingLeavesBlockWithoutCeiling) {
  Block block{Term(1), Term(2), Term(3)};
  EXPECT_FALSE(TruncateAtCeiling(block, std::nullopt));
  EXPECT_EQ(block.size(), 3u);
  EXPECT_FALSE(TruncateAtCeiling(block, Term(3)));
  EXPECT_EQ(block.size(), 3u);
}

TEST(RuntimeStateTest, TruncateAtCeilingCanEmptyBlock) {
  Block block{Term(60), Term(97)};
  EXPECT_TRUE(TruncateAtCeiling(block, Term(50)));
  EXPECT_TRUE(block.empty());
}

}  // namespace
}  // namespace cadence::runtime
