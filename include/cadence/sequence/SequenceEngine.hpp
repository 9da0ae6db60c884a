// Repository: Cadence
// Component: Sequence Engine
// Purpose: Stateless generalized-Fibonacci term and block generation over
//          arbitrary-precision integers.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_SEQUENCE_SEQUENCE_ENGINE_HPP_
#define CADENCE_SEQUENCE_SEQUENCE_ENGINE_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

namespace cadence::sequence {

using Term = mpz_class;
using Block = std::vector<Term>;

enum class ErrorKind {
  kInvalidSeed,    // negative term, out-of-order pair, or negative index
  kInvalidLength,  // non-positive block length
};

const char* ToString(ErrorKind kind);

class SequenceError : public std::invalid_argument {
 public:
  SequenceError(ErrorKind kind, const std::string& what)
      : std::invalid_argument(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

// The two terms immediately preceding the next generated value.
// Valid iff a >= 0 && b >= a.
struct SeedPair {
  Term a{0};
  Term b{1};

  bool operator==(const SeedPair& other) const {
    return a == other.a && b == other.b;
  }
  bool operator!=(const SeedPair& other) const { return !(*this == other); }
};

inline SeedPair DefaultSeed() { return SeedPair{Term(0), Term(1)}; }

bool IsValidSeed(const Term& a, const Term& b);

// Throws SequenceError(kInvalidSeed) unless a >= 0 && b >= a.
void ValidateSeed(const Term& a, const Term& b);

// n-th term (0-based) of the sequence seeded by (a, b). Term 0 is a, term 1
// is b. Walks from the seed; intended for spot checks, not the tick path.
Term ValueAt(int64_t n, Term a, Term b);
Term ValueAt(int64_t n);

// [a, b, a+b, ...] truncated to `length` terms.
Block SeedBlock(int64_t length, Term a, Term b);

// `length` terms continuing after (a, b): [a+b, a+2b, ...].
Block ContinuationBlock(int64_t length, Term a, Term b);

// Last two terms of `block` as the seed for the following call. Blocks must
// hold at least two terms.
SeedPair NextSeed(const Block& block);

std::string FormatBlock(const Block& block);

}  // namespace cadence::sequence

#endif  // CADENCE_SEQUENCE_SEQUENCE_ENGINE_HPP_
