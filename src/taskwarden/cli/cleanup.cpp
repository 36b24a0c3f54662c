#include "taskwarden/cli/commands.hpp"

#include <print>

namespace taskwarden::cli {

auto cmd_cleanup(Orchestrator& app, const CleanupCommandOptions& opts) -> int {
  auto report = app.cleanup(opts.cleanup);
  if (!report) {
    std::println(stderr, "Error: Cleanup failed: {}",
                 report.error().message());
    return 1;
  }
  if (opts.json) {
    print_json(to_json(*report));
    return 0;
  }
  if (report->dry_run) {
    std::println("Would reclaim {} stuck task(s) and prune {} old task(s)",
                 report->reclaimed, report->pruned);
  } else {
    std::println("Reclaimed {} stuck task(s), pruned {} old task(s)",
                 report->reclaimed, report->pruned);
  }
  return 0;
}

}  // namespace taskwarden::cli
