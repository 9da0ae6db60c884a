// Repository: Cadence
// Component: Sequence Engine unit tests

#include <gtest/gtest.h>

#include "cadence/sequence/SequenceEngine.hpp"

namespace cadence::sequence {
namespace {

Block Terms(std::initializer_list<long> values) {
  Block block;
  for (long v : values) block.emplace_back(v);
  return block;
}

TEST(SequenceEngineTest, ValueAtMatchesClassicSequence) {
  EXPECT_EQ(ValueAt(0), 0);
  EXPECT_EQ(ValueAt(1), 1);
  EXPECT_EQ(ValueAt(2), 1);
  EXPECT_EQ(ValueAt(10), 55);
  EXPECT_EQ(ValueAt(20), 6765);
}

TEST(SequenceEngineTest, ValueAtWithCustomSeed) {
  EXPECT_EQ(ValueAt(0, Term(2), Term(5)), 2);
  EXPECT_EQ(ValueAt(1, Term(2), Term(5)), 5);
  EXPECT_EQ(ValueAt(4, Term(2), Term(5)), 17);  // 2 5 7 12 17
}

TEST(SequenceEngineTest, ValueAtAllZeroSeed) {
  EXPECT_EQ(ValueAt(50, Term(0), Term(0)), 0);
}

TEST(SequenceEngineTest, ValueAtRejectsInvalidInput) {
  try {
    ValueAt(-1);
    FAIL() << "negative index accepted";
  } catch (const SequenceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidSeed);
  }
  EXPECT_THROW(ValueAt(3, Term(-1), Term(2)), SequenceError);
  EXPECT_THROW(ValueAt(3, Term(5), Term(3)), SequenceError);
}

TEST(SequenceEngineTest, ArbitraryPrecisionBeyond64Bits) {
  // F(100) does not fit in 64 bits.
  EXPECT_EQ(ValueAt(100).get_str(), "354224848179261915075");
}

TEST(SequenceEngineTest, SeedBlockStartsWithSeedTerms) {
  EXPECT_EQ(SeedBlock(6, Term(0), Term(1)), Terms({0, 1, 1, 2, 3, 5}));
  EXPECT_EQ(SeedBlock(1, Term(3), Term(4)), Terms({3}));
  EXPECT_EQ(SeedBlock(2, Term(3), Term(4)), Terms({3, 4}));
  EXPECT_EQ(SeedBlock(5, Term(3), Term(4)), Terms({3, 4, 7, 11, 18}));
}

TEST(SequenceEngineTest, SeedBlockEveryLaterTermIsSumOfPreviousTwo) {
  const Block block = SeedBlock(40, Term(7), Term(9));
  ASSERT_EQ(block.size(), 40u);
  for (std::size_t i = 2; i < block.size(); ++i) {
    EXPECT_EQ(block[i], block[i - 1] + block[i - 2]) << "index " << i;
  }
}

TEST(SequenceEngineTest, ContinuationBlockStartsAfterSeed) {
  EXPECT_EQ(ContinuationBlock(4, Term(0), Term(1)), Terms({1, 2, 3, 5}));
  EXPECT_EQ(ContinuationBlock(3, Term(3), Term(4)), Terms({7, 11, 18}));
  EXPECT_EQ(ContinuationBlock(1, Term(3), Term(4)), Terms({7}));
}

TEST(SequenceEngineTest, ChainedContinuationBlocksReproduceUnbrokenSequence) {
  // Seed block from (0,1), then three continuation blocks chained through
  // NextSeed: terms after the leading 0 are 1 1 2 3 5 8 13 21 34 55.
  Block emitted = SeedBlock(4, Term(0), Term(1));
  SeedPair seed = NextSeed(emitted);
  for (int i = 0; i < 3; ++i) {
    const Block next = ContinuationBlock(3, seed.a, seed.b);
    EXPECT_EQ(next.front(), seed.a + seed.b);
    emitted.insert(emitted.end(), next.begin(), next.end());
    seed = NextSeed(next);
  }
  ASSERT_GE(emitted.size(), 11u);
  EXPECT_EQ(Block(emitted.begin() + 1, emitted.begin() + 11),
            Terms({1, 1, 2, 3, 5, 8, 13, 21, 34, 55}));
}

TEST(SequenceEngineTest, SeedThenContinuationMatchesValueAt) {
  Block all = SeedBlock(5, Term(0), Term(1));
  SeedPair seed = NextSeed(all);
  for (int i = 0; i < 20; ++i) {
    const Block next = ContinuationBlock(5, seed.a, seed.b);
    all.insert(all.end(), next.begin(), next.end());
    seed = NextSeed(next);
  }
  ASSERT_EQ(all.size(), 105u);
  for (std::size_t n = 0; n < all.size(); ++n) {
    EXPECT_EQ(all[n], ValueAt(static_cast<int64_t>(n))) << "term " << n;
  }
}

TEST(SequenceEngineTest, BlocksRejectInvalidLengthAndSeed) {
  try {
    SeedBlock(0, Term(0), Term(1));
    FAIL() << "zero length accepted";
  } catch (const SequenceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidLength);
  }
  try {
    ContinuationBlock(-3, Term(0), Term(1));
    FAIL() << "negative length accepted";
  } catch (const SequenceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidLength);
  }
  try {
    ContinuationBlock(3, Term(5), Term(3));
    FAIL() << "out-of-order seed accepted";
  } catch (const SequenceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::kInvalidSeed);
  }
  EXPECT_THROW(SeedBlock(3, Term(-2), Term(0)), SequenceError);
}

TEST(SequenceEngineTest, NextSeedNeedsTwoTerms) {
  EXPECT_EQ(NextSeed(Terms({3, 5, 8})), (SeedPair{Term(5), Term(8)}));
  EXPECT_THROW(NextSeed(Terms({3})), SequenceError);
}

TEST(SequenceEngineTest, FormatBlockJoinsWithCommas) {
  EXPECT_EQ(FormatBlock(Terms({1, 2, 3})), "1, 2, 3");
  EXPECT_EQ(FormatBlock(Block{}), "");
}

}  // namespace
}  // namespace cadence::sequence
