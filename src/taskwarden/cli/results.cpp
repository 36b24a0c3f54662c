#include "taskwarden/cli/commands.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_results(Orchestrator& app, const ResultsOptions& opts) -> int {
  auto outcome = app.results(opts.task);
  if (!outcome) {
    if (outcome.error() == Error::NotTerminal) {
      std::println(stderr, "Task {} has not finished yet", opts.task);
      return kExitPending;
    }
    if (outcome.error() == Error::NotFound) {
      std::println(stderr, "Error: Task not found: {}", opts.task);
    } else {
      std::println(stderr, "Error: {}", outcome.error().message());
    }
    return 1;
  }
  if (opts.json) {
    print_json(to_json(*outcome));
  } else {
    print_outcome(*outcome);
  }
  return exit_code_for(outcome->status);
}

}  // namespace taskwarden::cli
