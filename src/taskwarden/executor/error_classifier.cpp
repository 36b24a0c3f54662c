#include "taskwarden/executor/error_classifier.hpp"

#include "taskwarden/util/log.hpp"
#include "taskwarden/util/tail_buffer.hpp"

#include <algorithm>
#include <csignal>
#include <format>
#include <regex>

namespace taskwarden {

namespace {

using json = nlohmann::json;

struct DiagnosticPattern {
  std::regex pattern;
  DiagnosticMatch match;
};

auto icase(const char* expr) -> std::regex {
  return std::regex{expr, std::regex::icase | std::regex::ECMAScript};
}

auto diagnostic_patterns() -> const std::vector<DiagnosticPattern>& {
  static const std::vector<DiagnosticPattern> patterns = {
      {icase(R"(unauthori[sz]ed|authentication|invalid api key|incorrect api key|not logged in|login required|\b401\b)"),
       {ErrorCode::AuthError, "Worker authentication failed",
        "Log in with the worker CLI or pass its API key through the "
        "environment allow-list",
        false}},
      {icase(R"(not (a )?trusted|untrusted|trusted director|skip-git-repo-check|not inside a git repo)"),
       {ErrorCode::UntrustedDirectory,
        "Working directory is not trusted by the worker",
        "Run the task inside a git repository or mark the directory as "
        "trusted in the worker configuration",
        false}},
      {icase(R"(enotfound|econnrefused|econnreset|network is unreachable|network unreachable|could not resolve host|connection (refused|reset)|failed to connect)"),
       {ErrorCode::NetworkError, "Worker could not reach its upstream service",
        "Check network connectivity and proxy settings, then retry", true}},
      {icase(R"(rate.?limit|too many requests|\b429\b|quota exceeded)"),
       {ErrorCode::RateLimited, "Worker was rate limited upstream",
        "Wait before retrying or lower executor.max_concurrency", true}},
      {icase(R"(permission denied|eacces|operation not permitted|eperm|read-only file system)"),
       {ErrorCode::PermissionDenied, "Worker was denied permission",
        "Check file permissions or choose a sandbox mode that allows the "
        "required writes",
        false}},
      {icase(R"(timed out|timeout|deadline exceeded|etimedout)"),
       {ErrorCode::UpstreamTimeout, "Worker reported an upstream timeout",
        "Retry later; the upstream service may be overloaded", true}},
  };
  return patterns;
}

auto tail(std::string_view s) -> std::string {
  return tail_of(s, ErrorClassifier::kMaxDetailChars);
}

auto last_events(const std::vector<Event>& events) -> json {
  json out = json::array();
  auto start = events.size() > ErrorClassifier::kMaxDetailEvents
                   ? events.size() - ErrorClassifier::kMaxDetailEvents
                   : 0;
  for (auto i = start; i < events.size(); ++i) {
    out.push_back(events[i].raw);
  }
  return out;
}

auto has_event(const ProcessResult& r, EventType type) -> bool {
  return std::ranges::any_of(
      r.events, [type](const Event& e) { return e.type() == type; });
}

auto has_work_evidence(const ProcessResult& r) -> bool {
  return std::ranges::any_of(r.events, [](const Event& e) {
    const auto* item = e.item();
    if (!item) {
      return false;
    }
    return item->kind == item_kind::FileChange ||
           item->kind == item_kind::CommandExecution ||
           item->kind == item_kind::AgentMessage;
  });
}

auto rule_timeout(const ProcessResult& r) -> std::optional<ClassifiedError> {
  if (!r.timeout) {
    return std::nullopt;
  }
  const auto& t = *r.timeout;
  ClassifiedError err;
  err.code = ErrorCode::Timeout;
  err.message = t.message.empty()
                    ? std::format("Worker timed out ({})",
                                  timeout_kind_name(t.kind))
                    : t.message;
  err.retryable = false;
  err.suggestion =
      t.kind == TimeoutKind::Hard
          ? "Split the task into smaller steps or raise "
            "watchdog.hard_timeout_ms"
          : "The worker went silent; raise watchdog.idle_timeout_ms if it "
            "needs long pauses";

  json events = json::array();
  std::string out_tail;
  std::string err_tail;
  if (r.partial) {
    auto start = r.partial->events.size() > ErrorClassifier::kMaxDetailEvents
                     ? r.partial->events.size() -
                           ErrorClassifier::kMaxDetailEvents
                     : 0;
    for (auto i = start; i < r.partial->events.size(); ++i) {
      events.push_back(r.partial->events[i]);
    }
    out_tail = tail(r.partial->stdout_tail);
    err_tail = tail(r.partial->stderr_tail);
  } else {
    events = last_events(r.events);
    out_tail = tail(r.stdout_output);
    err_tail = tail(r.stderr_output);
  }

  err.details = {
      {"kind", timeout_kind_name(t.kind)},
      {"elapsed_seconds", t.elapsed_ms / 1000},
      {"idle_seconds", t.idle_ms / 1000},
      {"limit_seconds", t.limit_ms / 1000},
      {"pid", t.pid},
      {"partial",
       {{"events", std::move(events)},
        {"event_count", r.partial ? r.partial->event_count : r.events.size()},
        {"stdout_tail", std::move(out_tail)},
        {"stderr_tail", std::move(err_tail)}}},
  };
  return err;
}

auto rule_spawn_error(const ProcessResult& r)
    -> std::optional<ClassifiedError> {
  if (!r.spawn_error) {
    return std::nullopt;
  }
  const auto& spawn = *r.spawn_error;
  ClassifiedError err;
  err.code = ErrorCode::SpawnError;
  err.retryable = false;
  err.details = {{"error", spawn.message},
                 {"errno", spawn.code.value()},
                 {"stderr", tail(r.stderr_output)}};

  if (spawn.code == std::errc::no_such_file_or_directory) {
    err.message = "Worker executable not found";
    err.suggestion =
        "Install the worker CLI or set executor.worker to its full path";
  } else if (spawn.code == std::errc::permission_denied) {
    err.message = "Worker executable is not executable";
    err.suggestion = "Check the permissions of the worker binary";
  } else if (spawn.code == std::errc::not_a_directory) {
    err.message = "Working directory does not exist";
    err.suggestion = "Pass an existing absolute working directory";
  } else if (auto m = match_diagnostic(r.stderr_output + "\n" + spawn.message)) {
    err.message = std::string{m->message};
    err.suggestion = std::string{m->suggestion};
  } else {
    err.message = std::format("Failed to spawn worker: {}", spawn.message);
  }
  return err;
}

auto rule_signal(const ProcessResult& r) -> std::optional<ClassifiedError> {
  if (!r.signal) {
    return std::nullopt;
  }
  auto sig = *r.signal;
  ClassifiedError err;
  err.code = ErrorCode::ProcessKilled;
  err.message = std::format("Worker terminated by signal {}", signal_name(sig));
  if (sig == SIGTERM) {
    err.suggestion =
        "SIGTERM usually comes from this orchestrator's own timeout or a "
        "cancel request";
    err.retryable = false;
  } else {
    err.suggestion =
        "The worker was killed from outside the orchestrator, possibly by "
        "the OOM killer or resource limits";
    err.retryable = true;
  }
  err.details = {{"signal", sig},
                 {"signal_name", signal_name(sig)},
                 {"cancelled", r.cancelled},
                 {"stderr", tail(r.stderr_output)}};
  return err;
}

auto rule_silent_failure(const ProcessResult& r)
    -> std::optional<ClassifiedError> {
  if (r.exit_code != 0) {
    return std::nullopt;
  }
  ClassifiedError err;
  err.code = ErrorCode::SilentFailure;
  err.retryable = true;

  if (r.events.empty()) {
    err.message = "Worker exited successfully but emitted no events";
    err.suggestion =
        "The worker may have refused the task or swallowed an error; check "
        "its stderr and retry";
    err.details = {{"reason", "no_events"},
                   {"event_count", 0},
                   {"stdout", tail(r.stdout_output)},
                   {"stderr", tail(r.stderr_output)}};
    return err;
  }

  if (has_event(r, EventType::TurnCompleted) && !has_work_evidence(r)) {
    json types = json::array();
    for (const auto& e : r.events) {
      types.push_back(e.type_name());
    }
    err.message =
        "Worker reported completion without any observable work (no file "
        "changes, commands or messages)";
    err.suggestion =
        "Rephrase the instruction more concretely or inspect the worker's "
        "stderr for suppressed errors";
    err.details = {{"reason", "no_observable_work"},
                   {"event_count", r.events.size()},
                   {"event_types", std::move(types)},
                   {"stderr", tail(r.stderr_output)}};
    return err;
  }
  return std::nullopt;
}

auto rule_turn_failed(const ProcessResult& r)
    -> std::optional<ClassifiedError> {
  if (!r.exit_code || *r.exit_code == 0) {
    return std::nullopt;
  }
  auto it = std::ranges::find_if(r.events, [](const Event& e) {
    return e.type() == EventType::TurnFailed;
  });
  if (it == r.events.end()) {
    return std::nullopt;
  }
  const auto* failed = it->get<TurnFailed>();
  ClassifiedError err;
  err.code = ErrorCode::TurnFailed;
  err.message = failed->message.empty() ? std::string{"Worker turn failed"}
                                        : failed->message;
  err.retryable = false;
  err.details = {{"exit_code", *r.exit_code},
                 {"error", failed->error},
                 {"stderr", tail(r.stderr_output)}};
  return err;
}

auto rule_diagnostic(const ProcessResult& r)
    -> std::optional<ClassifiedError> {
  if (!r.exit_code || *r.exit_code == 0) {
    return std::nullopt;
  }
  auto m = match_diagnostic(r.stderr_output);
  if (!m) {
    return std::nullopt;
  }
  ClassifiedError err;
  err.code = m->code;
  err.message = std::string{m->message};
  err.suggestion = std::string{m->suggestion};
  err.retryable = m->retryable;
  err.details = {{"exit_code", *r.exit_code},
                 {"stderr", tail(r.stderr_output)}};
  return err;
}

auto rule_exit_error(const ProcessResult& r)
    -> std::optional<ClassifiedError> {
  if (!r.exit_code || *r.exit_code == 0) {
    return std::nullopt;
  }
  ClassifiedError err;
  err.code = ErrorCode::ExitError;
  err.message = std::format("Worker exited with code {}", *r.exit_code);
  err.retryable = false;
  err.details = {{"exit_code", *r.exit_code},
                 {"stderr", tail(r.stderr_output)},
                 {"stdout", tail(r.stdout_output)}};
  return err;
}

}  // namespace

auto error_code_name(ErrorCode code) noexcept -> std::string_view {
  return kErrorCodeNames[static_cast<std::size_t>(code)];
}

auto parse_error_code(std::string_view name) noexcept
    -> std::optional<ErrorCode> {
  auto it = std::ranges::find(kErrorCodeNames, name);
  if (it == kErrorCodeNames.end()) {
    return std::nullopt;
  }
  return static_cast<ErrorCode>(std::distance(kErrorCodeNames.begin(), it));
}

auto to_json(const ClassifiedError& error) -> nlohmann::json {
  json j = {{"code", error_code_name(error.code)},
            {"message", error.message},
            {"retryable", error.retryable},
            {"details", error.details}};
  if (!error.suggestion.empty()) {
    j["suggestion"] = error.suggestion;
  }
  return j;
}

auto match_diagnostic(std::string_view text) -> std::optional<DiagnosticMatch> {
  if (text.empty()) {
    return std::nullopt;
  }
  for (const auto& p : diagnostic_patterns()) {
    if (std::regex_search(text.begin(), text.end(), p.pattern)) {
      return p.match;
    }
  }
  return std::nullopt;
}

auto signal_name(int sig) -> std::string {
  switch (sig) {
    case SIGTERM:
      return "SIGTERM";
    case SIGKILL:
      return "SIGKILL";
    case SIGINT:
      return "SIGINT";
    case SIGHUP:
      return "SIGHUP";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGABRT:
      return "SIGABRT";
    case SIGPIPE:
      return "SIGPIPE";
    case SIGBUS:
      return "SIGBUS";
    default:
      return std::format("signal {}", sig);
  }
}

ErrorClassifier::ErrorClassifier()
    : rules_{{"timeout", rule_timeout},
             {"spawn_error", rule_spawn_error},
             {"signal", rule_signal},
             {"silent_failure", rule_silent_failure},
             {"turn_failed", rule_turn_failed},
             {"diagnostic_pattern", rule_diagnostic},
             {"exit_error", rule_exit_error}} {
}

auto ErrorClassifier::add_rule(Rule rule, std::string_view before) -> void {
  auto it = std::ranges::find_if(
      rules_, [before](const Rule& r) { return r.name == before; });
  rules_.insert(it, std::move(rule));
}

auto ErrorClassifier::classify(const ProcessResult& result) const
    -> std::optional<ClassifiedError> {
  for (const auto& rule : rules_) {
    if (auto err = rule.apply(result)) {
      log::debug("Classified {} as {} ({})", result.process_id,
                 error_code_name(err->code), rule.name);
      return err;
    }
  }
  if (result.exit_code == 0) {
    return std::nullopt;
  }

  ClassifiedError err;
  err.code = ErrorCode::UnknownError;
  err.message = result.cancelled ? "Worker was cancelled before it started"
                                 : "Worker failed for an unknown reason";
  err.retryable = false;
  err.details = {{"cancelled", result.cancelled},
                 {"stderr", tail(result.stderr_output)}};
  return err;
}

}  // namespace taskwarden
