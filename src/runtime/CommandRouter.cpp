// Repository: Cadence
// Component: Command Router
// Purpose: Maps console verbs and argument strings onto SequenceController
//          transitions.
// Copyright (c) 2025 Cadence

#include "cadence/runtime/CommandRouter.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace cadence::runtime {

namespace {

bool AllDigits(const std::string& s, std::size_t from) {
  if (from >= s.size()) return false;
  return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(from), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "";
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

}  // namespace

CommandRouter::CommandRouter(SequenceController& controller) : controller_(controller) {}

std::pair<std::string, std::string> CommandRouter::SplitLine(const std::string& line) {
  const std::string trimmed = Trim(line);
  const auto split = trimmed.find_first_of(" \t");
  std::string verb = trimmed.substr(0, split);
  std::string rest = split == std::string::npos ? "" : Trim(trimmed.substr(split));
  std::transform(verb.begin(), verb.end(), verb.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return {verb, rest};
}

std::vector<std::string> CommandRouter::Tokenize(const std::string& args) {
  std::istringstream iss(args);
  std::vector<std::string> tokens;
  std::string token;
  while (iss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::optional<sequence::Term> CommandRouter::ParseInteger(const std::string& token) {
  const std::size_t digits_from = (!token.empty() && (token[0] == '-' || token[0] == '+')) ? 1 : 0;
  if (!AllDigits(token, digits_from)) return std::nullopt;
  // mpz_class rejects a leading '+'.
  const std::string text = token[0] == '+' ? token.substr(1) : token;
  return sequence::Term(text, 10);
}

std::optional<sequence::Term> CommandRouter::ParseNonNegativeInteger(const std::string& token) {
  if (!AllDigits(token, 0)) return std::nullopt;
  return sequence::Term(token, 10);
}

std::optional<double> CommandRouter::ParseSeconds(const std::string& token) {
  if (token.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size() || errno == ERANGE || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

CommandResult CommandRouter::SubmitLine(const std::string& line) {
  const auto [verb, args] = SplitLine(line);
  if (verb.empty()) {
    return CommandResult(CommandStatus::kNoChange, "", controller_.phase());
  }
  return Submit(verb, args);
}

CommandResult CommandRouter::Submit(const std::string& raw_verb, const std::string& raw_args) {
  std::string verb = Trim(raw_verb);
  std::transform(verb.begin(), verb.end(), verb.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const std::vector<std::string> args = Tokenize(raw_args);

  if (verb == "start") return HandleStart(args);
  if (verb == "speed") return HandleSpeed(args);
  if (verb == "max") return HandleMax(args);

  const bool known = verb == "help" || verb == "pause" || verb == "reset" ||
                     verb == "restart" || verb == "stop" || verb == "exit";
  if (!known) {
    return CommandResult(CommandStatus::kUnknownCommand,
                         "Unknown command '" + verb + "'. Type 'help' for a list of commands.",
                         controller_.phase());
  }
  if (!args.empty()) {
    return SyntaxError("'" + verb + "' takes no arguments.");
  }

  if (verb == "help") return controller_.Help();
  if (verb == "pause") return controller_.Pause();
  if (verb == "reset") return controller_.ResetConfig();
  if (verb == "restart") return controller_.Restart();
  if (verb == "stop") return controller_.Stop();
  return controller_.Exit();
}

CommandResult CommandRouter::HandleStart(const std::vector<std::string>& args) {
  if (args.empty()) {
    return controller_.Start();
  }
  if (args.size() != 2) {
    return SyntaxError("Usage: start [term1 term2]");
  }
  const auto a = ParseInteger(args[0]);
  const auto b = ParseInteger(args[1]);
  if (!a || !b) {
    return SyntaxError("Terms must be integers: " + args[0] + " " + args[1]);
  }
  return controller_.Start(*a, *b);
}

CommandResult CommandRouter::HandleSpeed(const std::vector<std::string>& args) {
  if (args.empty()) {
    // No value means fastest speed: the controller clamps up to its floor,
    // not to the compiled-in default.
    return controller_.SetPeriodMs(0);
  }
  if (args.size() != 1) {
    return SyntaxError("Usage: speed [seconds]");
  }
  const auto seconds = ParseSeconds(args[0]);
  if (!seconds) {
    return SyntaxError("Speed must be a number of seconds: " + args[0]);
  }
  return controller_.SetPeriodMs(SecondsToPeriodMs(*seconds, 0));
}

CommandResult CommandRouter::HandleMax(const std::vector<std::string>& args) {
  if (args.empty()) {
    return controller_.SetCeiling(std::nullopt);
  }
  if (args.size() != 1) {
    return SyntaxError("Usage: max [integer]");
  }
  const auto ceiling = ParseNonNegativeInteger(args[0]);
  if (!ceiling) {
    return SyntaxError("Max value must be a non-negative integer: " + args[0]);
  }
  return controller_.SetCeiling(*ceiling);
}

CommandResult CommandRouter::SyntaxError(const std::string& message) const {
  return CommandResult(CommandStatus::kSyntaxError, message, controller_.phase());
}

}  // namespace cadence::runtime
