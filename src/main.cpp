#include "taskwarden/app/orchestrator.hpp"
#include "taskwarden/cli/commands.hpp"
#include "taskwarden/config/config.hpp"
#include "taskwarden/storage/recovery.hpp"
#include "taskwarden/storage/state_strings.hpp"
#include "taskwarden/storage/task_registry.hpp"
#include "taskwarden/util/log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
  g_interrupted.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("taskwarden - run AI worker tasks under supervision");
  std::println("Usage: {} [OPTIONS] <command> [ARGS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run <instruction>      Start a task and wait for its outcome");
  std::println("    --mode <mode>          read-only | workspace-write | "
               "danger-full-access");
  std::println("    --model <model>        Worker model");
  std::println("    --dir <path>           Working directory (default: cwd)");
  std::println("    --env-policy <p>       inherit_none | inherit_all | "
               "allow_list");
  std::println("    --allow-env <VAR>      Variable passed under allow_list "
               "(repeatable)");
  std::println("    --idle-timeout-ms <n>  Inactivity limit");
  std::println("    --hard-timeout-ms <n>  Wall-clock limit");
  std::println("    --alias <name>         Name to look the task up by");
  std::println("  status <task>          Show status and progress");
  std::println("  results <task>         Show the final outcome");
  std::println("  wait <task>            Block until the task finishes");
  std::println("    --timeout-sec <n>      Give up after n seconds "
               "(default: 300)");
  std::println("  cancel <task>          Cancel a pending or running task");
  std::println("    --reason <text>        Recorded with the cancellation");
  std::println("  list                   List tasks, newest first");
  std::println("    --status <s> --origin <o> --dir <d> --limit <n> "
               "--offset <n>");
  std::println("  cleanup                Reclaim stuck tasks, prune old ones");
  std::println("    --stuck-age-sec <n> --max-age-hours <n> --dry-run");
  std::println("  stats                  Registry and executor counters");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>    Config file (YAML)");
  std::println("  --db <file>            Database file (default: "
               "taskwarden.db)");
  std::println("  --log-level <level>    trace | debug | info | warn | error");
  std::println("  --concurrency <n>      Maximum concurrent workers");
  std::println("  --worker <path>        Worker executable");
  std::println("  --json                 Machine-readable output");
  std::println("  -v, --version          Show version and exit");
  std::println("  -h, --help             Show this help message");
  std::println("");
  std::println("Exit status: 0 completed, 1 failed or error, 2 not finished");
}

void print_version() {
  std::println("taskwarden v0.1.0");
}

struct Options {
  std::string config_file;
  std::optional<std::string> db_file;
  std::optional<std::string> log_level;
  std::optional<int> concurrency;
  std::optional<std::string> worker;
  bool json{false};

  std::string command;
  std::vector<std::string_view> args;
};

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::println(stderr, "Run '{} --help' for usage.", prog);
  std::exit(1);
}

auto parse_int(std::string_view flag, std::string_view text) -> std::int64_t {
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
    std::println(stderr, "Error: {} expects a non-negative integer, got '{}'",
                 flag, text);
    std::exit(1);
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  auto value_of = [&](int& i, std::string_view flag) -> std::string_view {
    if (++i >= argc) {
      usage_error(argv[0], std::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (!opts.command.empty()) {
      if (arg == "--json") {
        opts.json = true;
      } else {
        opts.args.push_back(arg);
      }
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = value_of(i, arg);
    } else if (arg == "--db") {
      opts.db_file = std::string{value_of(i, arg)};
    } else if (arg == "--log-level") {
      opts.log_level = std::string{value_of(i, arg)};
    } else if (arg == "--concurrency") {
      opts.concurrency = static_cast<int>(parse_int(arg, value_of(i, arg)));
    } else if (arg == "--worker") {
      opts.worker = std::string{value_of(i, arg)};
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg.starts_with("-")) {
      usage_error(argv[0], std::format("Unknown option: {}", arg));
    } else {
      opts.command = arg;
    }
  }

  if (opts.command.empty()) {
    print_usage(argv[0]);
    std::exit(1);
  }
  return opts;
}

// Walks a command's arguments: flags with values via `on_flag`, bare
// arguments via `on_positional`.
template <typename FlagFn, typename PosFn>
void walk_args(const char* prog, const Options& opts, FlagFn&& on_flag,
               PosFn&& on_positional) {
  const auto& args = opts.args;
  for (std::size_t i = 0; i < args.size(); ++i) {
    auto arg = args[i];
    if (arg.starts_with("--")) {
      auto next = [&]() -> std::string_view {
        if (i + 1 >= args.size()) {
          usage_error(prog, std::format("{} requires an argument", arg));
        }
        return args[++i];
      };
      if (!on_flag(arg, next)) {
        usage_error(prog, std::format("Unknown option for {}: {}",
                                      opts.command, arg));
      }
    } else {
      on_positional(arg);
    }
  }
}

auto single_task_arg(const char* prog, const Options& opts,
                     std::vector<std::string_view>& positional)
    -> std::string {
  if (positional.size() != 1) {
    usage_error(prog, std::format("{} takes exactly one task id or alias",
                                  opts.command));
  }
  return std::string{positional.front()};
}

auto absolute_dir(std::string_view dir) -> std::string {
  if (dir.empty()) {
    return {};
  }
  std::error_code ec;
  auto path = std::filesystem::absolute(std::filesystem::path{dir}, ec);
  return ec ? std::string{dir} : path.string();
}

auto load_config(const char* prog, const Options& opts)
    -> taskwarden::SystemConfig {
  taskwarden::SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = taskwarden::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config {}: {}",
                   opts.config_file, loaded.error().message());
      std::exit(1);
    }
    config = std::move(*loaded);
  }

  if (opts.db_file) {
    config.storage.db_file = *opts.db_file;
  }
  if (opts.log_level) {
    config.logging.level = *opts.log_level;
  }
  if (opts.concurrency) {
    config.executor.max_concurrency = *opts.concurrency;
  }
  if (opts.worker) {
    config.executor.worker = *opts.worker;
  }
  if (auto r = taskwarden::ConfigLoader::validate(config); !r) {
    usage_error(prog, std::format("Invalid configuration: {}",
                                  r.error().message()));
  }
  return config;
}

auto setup_logging(const taskwarden::LoggingConfig& logging) -> void {
  taskwarden::log::set_level(logging.level);
  if (!logging.file.empty() && !taskwarden::log::set_file(logging.file)) {
    std::println(stderr, "Warning: Cannot open log file {}, logging to stderr",
                 logging.file);
  }
  taskwarden::log::start();
}

auto dispatch(const char* prog, const Options& opts,
              taskwarden::TaskRegistry& registry,
              taskwarden::Orchestrator& app) -> int {
  using namespace taskwarden;
  std::vector<std::string_view> positional;
  auto collect = [&](std::string_view arg) { positional.push_back(arg); };

  if (opts.command == "run") {
    cli::RunOptions run;
    run.json = opts.json;
    run.interrupted = &g_interrupted;
    auto& req = run.request;
    walk_args(
        prog, opts,
        [&](std::string_view flag, auto next) {
          if (flag == "--mode") {
            req.mode = next();
          } else if (flag == "--model") {
            req.model = next();
          } else if (flag == "--dir") {
            req.working_dir = absolute_dir(next());
          } else if (flag == "--env-policy") {
            auto value = next();
            auto policy = parse_env_policy(value);
            if (!policy) {
              usage_error(prog, std::format("Unknown env policy: {}", value));
            }
            req.env_policy = *policy;
          } else if (flag == "--allow-env") {
            req.env_allow_list.emplace_back(next());
          } else if (flag == "--idle-timeout-ms") {
            req.idle_timeout = std::chrono::milliseconds(parse_int(flag, next()));
          } else if (flag == "--hard-timeout-ms") {
            req.hard_timeout = std::chrono::milliseconds(parse_int(flag, next()));
          } else if (flag == "--alias") {
            req.alias = std::string{next()};
          } else {
            return false;
          }
          return true;
        },
        collect);
    if (positional.empty()) {
      usage_error(prog, "run requires an instruction");
    }
    for (std::size_t i = 0; i < positional.size(); ++i) {
      if (i > 0) {
        req.instruction += ' ';
      }
      req.instruction += positional[i];
    }
    return cli::cmd_run(app, run);
  }

  if (opts.command == "status" || opts.command == "results") {
    walk_args(prog, opts, [](std::string_view, auto) { return false; },
              collect);
    auto task = single_task_arg(prog, opts, positional);
    if (opts.command == "status") {
      return cli::cmd_status(app, {task, opts.json});
    }
    return cli::cmd_results(app, {task, opts.json});
  }

  if (opts.command == "wait") {
    cli::WaitOptions wait;
    wait.json = opts.json;
    walk_args(
        prog, opts,
        [&](std::string_view flag, auto next) {
          if (flag != "--timeout-sec") {
            return false;
          }
          wait.timeout_sec = parse_int(flag, next());
          return true;
        },
        collect);
    wait.task = single_task_arg(prog, opts, positional);
    return cli::cmd_wait(app, wait);
  }

  if (opts.command == "cancel") {
    cli::CancelOptions cancel;
    cancel.json = opts.json;
    walk_args(
        prog, opts,
        [&](std::string_view flag, auto next) {
          if (flag != "--reason") {
            return false;
          }
          cancel.reason = next();
          return true;
        },
        collect);
    cancel.task = single_task_arg(prog, opts, positional);
    return cli::cmd_cancel(app, cancel);
  }

  if (opts.command == "list") {
    cli::ListOptions list;
    list.json = opts.json;
    list.filter.limit = 20;
    walk_args(
        prog, opts,
        [&](std::string_view flag, auto next) {
          if (flag == "--status") {
            auto value = next();
            auto status = parse_task_status(value);
            if (!status) {
              usage_error(prog, std::format("Unknown status: {}", value));
            }
            list.filter.status = *status;
          } else if (flag == "--origin") {
            auto value = next();
            auto origin = parse_task_origin(value);
            if (!origin) {
              usage_error(prog, std::format("Unknown origin: {}", value));
            }
            list.filter.origin = *origin;
          } else if (flag == "--dir") {
            list.filter.working_dir = absolute_dir(next());
          } else if (flag == "--limit") {
            list.filter.limit =
                static_cast<std::size_t>(parse_int(flag, next()));
          } else if (flag == "--offset") {
            list.filter.offset =
                static_cast<std::size_t>(parse_int(flag, next()));
          } else {
            return false;
          }
          return true;
        },
        collect);
    if (!positional.empty()) {
      usage_error(prog, "list takes no positional arguments");
    }
    return cli::cmd_list(registry, list);
  }

  if (opts.command == "cleanup") {
    cli::CleanupCommandOptions cleanup;
    cleanup.json = opts.json;
    cleanup.cleanup.stuck_age_sec =
        app.config().registry.stuck_task_max_age_sec;
    cleanup.cleanup.prune_max_age =
        std::chrono::milliseconds(app.config().registry.prune_max_age_ms);
    walk_args(
        prog, opts,
        [&](std::string_view flag, auto next) {
          if (flag == "--stuck-age-sec") {
            cleanup.cleanup.stuck_age_sec = parse_int(flag, next());
          } else if (flag == "--max-age-hours") {
            cleanup.cleanup.prune_max_age =
                std::chrono::hours(parse_int(flag, next()));
          } else if (flag == "--dry-run") {
            cleanup.cleanup.dry_run = true;
          } else {
            return false;
          }
          return true;
        },
        collect);
    if (!positional.empty()) {
      usage_error(prog, "cleanup takes no positional arguments");
    }
    return cli::cmd_cleanup(app, cleanup);
  }

  if (opts.command == "stats") {
    if (!opts.args.empty()) {
      usage_error(prog, "stats takes no arguments");
    }
    return cli::cmd_stats(app);
  }

  usage_error(prog, std::format("Unknown command: {}", opts.command));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  auto config = load_config(argv[0], opts);
  setup_logging(config.logging);

  taskwarden::TaskRegistry registry(taskwarden::RegistryOptions{
      config.storage.db_file, config.storage.busy_timeout_ms,
      std::chrono::milliseconds(config.storage.write_retry_delay_ms)});
  if (auto r = registry.open(); !r) {
    std::println(stderr, "Error: Failed to open database {}: {}",
                 config.storage.db_file, r.error().message());
    taskwarden::log::stop();
    return 1;
  }

  taskwarden::Recovery recovery(registry);
  auto recovered = recovery.recover(taskwarden::RecoveryOptions{
      config.registry.stuck_task_max_age_sec,
      std::chrono::milliseconds(config.registry.prune_max_age_ms)});
  if (!recovered) {
    taskwarden::log::warn("Recovery failed: {}",
                          recovered.error().message());
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int rc = 0;
  {
    taskwarden::Orchestrator app(config, registry);
    rc = dispatch(argv[0], opts, registry, app);
    app.shutdown();
  }
  registry.close();
  taskwarden::log::stop();
  return rc;
}
