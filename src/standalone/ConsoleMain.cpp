// Repository: Cadence
// Component: Console Front End
// Purpose: Line-reading console over SequenceController: reads commands from
//          stdin, prints status lines and emitted blocks.
// Copyright (c) 2025 Cadence
//
// This is thin glue: every command goes through CommandRouter::SubmitLine and
// every block comes back through the controller's BlockSink.

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "cadence/runtime/CommandRouter.h"
#include "cadence/runtime/RuntimeState.h"
#include "cadence/runtime/SequenceController.h"
#include "cadence/sequence/SequenceEngine.hpp"
#include "cadence/timing/ITimeSource.hpp"
#include "cadence/util/Logger.hpp"

namespace {

using cadence::runtime::CommandRouter;
using cadence::util::Logger;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::optional<double> period_s;
  std::optional<int64_t> batch_size;
  std::optional<cadence::sequence::Term> ceiling;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Prints a Fibonacci-style sequence in timed blocks while accepting\n"
            << "commands (start, pause, speed, max, ...) on stdin.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --period SECONDS     Seconds between blocks (default: 1, minimum: 0.2)\n"
            << "  --batch N            Terms per block, at least 2 (default: 10)\n"
            << "  --max N              Stop once a term would exceed N\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  CADENCE_DEBUG        Log state transitions and scheduler activity\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--period" && i + 1 < argc) {
      args.period_s = CommandRouter::ParseSeconds(argv[++i]);
      if (!args.period_s) {
        args.error = std::string("--period expects a number of seconds: ") + argv[i];
        return args;
      }
    } else if (arg == "--batch" && i + 1 < argc) {
      const auto batch = CommandRouter::ParseInteger(argv[++i]);
      if (!batch || !batch->fits_slong_p()) {
        args.error = std::string("--batch expects an integer: ") + argv[i];
        return args;
      }
      args.batch_size = batch->get_si();
    } else if (arg == "--max" && i + 1 < argc) {
      args.ceiling = CommandRouter::ParseNonNegativeInteger(argv[++i]);
      if (!args.ceiling) {
        args.error = std::string("--max expects a non-negative integer: ") + argv[i];
        return args;
      }
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  namespace runtime = cadence::runtime;

  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  runtime::SequenceConfig config;
  if (args.period_s) {
    config.period_ms = runtime::SecondsToPeriodMs(*args.period_s, config.min_period_ms);
  }
  if (args.batch_size) {
    config.batch_size = *args.batch_size;
  }
  config.ceiling = args.ceiling;

  const std::string config_error = config.Validate();
  if (!config_error.empty()) {
    std::cerr << "Error: " << runtime::ToString(runtime::CommandStatus::kInvalidLength)
              << ": " << config_error << "\n";
    return 2;
  }

  runtime::SequenceController controller(
      std::make_shared<cadence::timing::SteadyTimeSource>(), config,
      [](const cadence::sequence::Block& block) {
        Logger::Info(cadence::sequence::FormatBlock(block));
      });
  CommandRouter router(controller);

  Logger::Info("Cadence sequence console. Type 'help' for commands.");
  Logger::Info(runtime::HelpText(controller.phase()));

  std::string line;
  while (true) {
    Logger::Prompt(runtime::PromptFor(controller.phase()));
    if (!std::getline(std::cin, line)) {
      // EOF behaves like exit.
      const auto result = router.Submit("exit", "");
      Logger::Info("");
      Logger::Info(result.message);
      break;
    }

    const auto result = router.SubmitLine(line);
    if (!result.message.empty()) {
      Logger::Info(result.message);
    }
    if (result.phase == runtime::Phase::kExited) {
      break;
    }
  }
  return 0;
}
