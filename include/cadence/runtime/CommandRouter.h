// Repository: Cadence
// Component: Command Router
// Purpose: Maps console verbs and argument strings onto SequenceController
//          transitions. Parses and validates; holds no state.
// Copyright (c) 2025 Cadence

#ifndef CADENCE_RUNTIME_COMMAND_ROUTER_H_
#define CADENCE_RUNTIME_COMMAND_ROUTER_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cadence/runtime/SequenceController.h"
#include "cadence/sequence/SequenceEngine.hpp"

namespace cadence::runtime {

class CommandRouter {
 public:
  explicit CommandRouter(SequenceController& controller);

  // Invokes exactly one transition or rejects with a message. Verbs are
  // case-insensitive; `args` is whitespace separated.
  CommandResult Submit(const std::string& verb, const std::string& args);

  // Splits "verb rest of line" and submits. An empty line is a no-op.
  CommandResult SubmitLine(const std::string& line);

  // Returns {lower-cased verb, trimmed remainder}.
  static std::pair<std::string, std::string> SplitLine(const std::string& line);
  static std::vector<std::string> Tokenize(const std::string& args);

  // Optional sign followed by decimal digits.
  static std::optional<sequence::Term> ParseInteger(const std::string& token);
  // Decimal digits only.
  static std::optional<sequence::Term> ParseNonNegativeInteger(const std::string& token);
  // Whole-token finite floating-point value.
  static std::optional<double> ParseSeconds(const std::string& token);

 private:
  CommandResult HandleStart(const std::vector<std::string>& args);
  CommandResult HandleSpeed(const std::vector<std::string>& args);
  CommandResult HandleMax(const std::vector<std::string>& args);
  CommandResult SyntaxError(const std::string& message) const;

  SequenceController& controller_;
};

}  // namespace cadence::runtime

#endif  // CADENCE_RUNTIME_COMMAND_ROUTER_H_
