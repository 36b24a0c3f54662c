#include "taskwarden/cli/commands.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_stats(Orchestrator& app) -> int {
  auto stats = app.stats();
  if (!stats) {
    std::println(stderr, "Error: {}", stats.error().message());
    return 1;
  }
  print_json(to_json(*stats));
  return 0;
}

}  // namespace taskwarden::cli
