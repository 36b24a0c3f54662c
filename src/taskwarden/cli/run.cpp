#include "taskwarden/cli/commands.hpp"
#include "taskwarden/util/log.hpp"

#include <chrono>
#include <print>

namespace taskwarden::cli {

namespace {

inline constexpr auto kWaitSlice = std::chrono::milliseconds(200);

}  // namespace

auto cmd_run(Orchestrator& app, const RunOptions& opts) -> int {
  if (auto v = Orchestrator::validate(opts.request); !v) {
    std::println(stderr, "Error: {}: {}", v.error().field, v.error().message);
    return 1;
  }

  auto id = app.start_task(opts.request);
  if (!id) {
    std::println(stderr, "Error: Failed to start task: {}",
                 id.error().message());
    return 1;
  }
  if (!opts.json) {
    std::println("Task {} started", *id);
  }

  bool canceled = false;
  for (;;) {
    auto done = app.wait(id->str(), kWaitSlice);
    if (done) {
      break;
    }
    if (done.error() != Error::Timeout) {
      std::println(stderr, "Error: {}", done.error().message());
      return 1;
    }
    if (!canceled && opts.interrupted &&
        opts.interrupted->load(std::memory_order_acquire)) {
      log::info("Interrupted, canceling task {}", *id);
      if (auto r = app.cancel(id->str(), "Interrupted by user"); !r) {
        std::println(stderr, "Error: Failed to cancel task: {}",
                     r.error().message());
        return 1;
      }
      canceled = true;
    }
  }

  auto outcome = app.results(id->str());
  if (!outcome) {
    std::println(stderr, "Error: {}", outcome.error().message());
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
