// Repository: Cadence
// Component: Sequence Engine
// Purpose: Stateless generalized-Fibonacci term and block generation over
//          arbitrary-precision integers.
// Copyright (c) 2025 Cadence

#include "cadence/sequence/SequenceEngine.hpp"

#include <sstream>
#include <utility>

namespace cadence::sequence {

namespace {

void ValidateLength(int64_t length) {
  if (length <= 0) {
    throw SequenceError(ErrorKind::kInvalidLength,
                        "Length must be positive: " + std::to_string(length));
  }
}

}  // namespace

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidSeed:
      return "InvalidSeed";
    case ErrorKind::kInvalidLength:
      return "InvalidLength";
  }
  return "Unknown";
}

bool IsValidSeed(const Term& a, const Term& b) {
  return sgn(a) >= 0 && b >= a;
}

void ValidateSeed(const Term& a, const Term& b) {
  if (!IsValidSeed(a, b)) {
    throw SequenceError(ErrorKind::kInvalidSeed,
                        "term1 and term2 must be non-negative, and term2 must not be "
                        "less than term1: term1=" + a.get_str() +
                            " term2=" + b.get_str());
  }
}

Term ValueAt(int64_t n, Term a, Term b) {
  if (n < 0) {
    throw SequenceError(ErrorKind::kInvalidSeed,
                        "Term must be non-negative: " + std::to_string(n));
  }
  ValidateSeed(a, b);

  if (n == 0) return a;
  if (n == 1) return b;
  if (b == 0) {
    // a <= b, so the whole sequence is zero.
    return Term(0);
  }

  for (int64_t i = 2; i <= n; ++i) {
    Term next = a + b;
    a = std::move(b);
    b = std::move(next);
  }
  return b;
}

Term ValueAt(int64_t n) {
  return ValueAt(n, Term(0), Term(1));
}

Block SeedBlock(int64_t length, Term a, Term b) {
  ValidateLength(length);
  ValidateSeed(a, b);

  Block block;
  block.reserve(static_cast<std::size_t>(length));
  block.push_back(a);
  if (length >= 2) {
    block.push_back(b);
  }
  for (int64_t i = 2; i < length; ++i) {
    Term next = a + b;
    a = std::move(b);
    b = next;
    block.push_back(std::move(next));
  }
  return block;
}

Block ContinuationBlock(int64_t length, Term a, Term b) {
  ValidateLength(length);
  ValidateSeed(a, b);

  Block block;
  block.reserve(static_cast<std::size_t>(length));
  for (int64_t i = 0; i < length; ++i) {
    Term next = a + b;
    a = std::move(b);
    b = next;
    block.push_back(std::move(next));
  }
  return block;
}

SeedPair NextSeed(const Block& block) {
  if (block.size() < 2) {
    throw SequenceError(ErrorKind::kInvalidLength,
                        "Block must hold at least two terms to chain: " +
                            std::to_string(block.size()));
  }
  return SeedPair{block[block.size() - 2], block[block.size() - 1]};
}

std::string FormatBlock(const Block& block) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < block.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << block[i].get_str();
  }
  return oss.str();
}

}  // namespace cadence::sequence
