#pragma once

#include "taskwarden/executor/process_manager.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

enum class ErrorCode : std::uint8_t {
  Timeout,
  SpawnError,
  ProcessKilled,
  SilentFailure,
  TurnFailed,
  AuthError,
  UntrustedDirectory,
  NetworkError,
  RateLimited,
  PermissionDenied,
  UpstreamTimeout,
  ExitError,
  UnknownError,
};

inline constexpr std::array<std::string_view, 13> kErrorCodeNames = {
    "TIMEOUT",         "SPAWN_ERROR",         "PROCESS_KILLED",
    "SILENT_FAILURE",  "TURN_FAILED",         "AUTH_ERROR",
    "UNTRUSTED_DIRECTORY", "NETWORK_ERROR",   "RATE_LIMITED",
    "PERMISSION_DENIED", "UPSTREAM_TIMEOUT",  "EXIT_ERROR",
    "UNKNOWN_ERROR",
};

[[nodiscard]] auto error_code_name(ErrorCode code) noexcept -> std::string_view;
[[nodiscard]] auto parse_error_code(std::string_view name) noexcept
    -> std::optional<ErrorCode>;

struct ClassifiedError {
  ErrorCode code{ErrorCode::UnknownError};
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  bool retryable{false};
  std::string suggestion;
};

[[nodiscard]] auto to_json(const ClassifiedError& error) -> nlohmann::json;

// A known failure signature in worker diagnostic text.
struct DiagnosticMatch {
  ErrorCode code;
  std::string_view message;
  std::string_view suggestion;
  bool retryable;
};

// First diagnostic pattern matching `text`, in table order.
[[nodiscard]] auto match_diagnostic(std::string_view text)
    -> std::optional<DiagnosticMatch>;

// Turns a raw ProcessResult into at most one ClassifiedError using an ordered
// list of rules; the first rule that matches wins. A clean exit with evidence
// of work yields no error.
class ErrorClassifier {
public:
  static constexpr std::size_t kMaxDetailEvents = 50;
  static constexpr std::size_t kMaxDetailChars = 2000;

  using RuleFn =
      std::function<std::optional<ClassifiedError>(const ProcessResult&)>;

  struct Rule {
    std::string name;
    RuleFn apply;
  };

  ErrorClassifier();

  [[nodiscard]] auto classify(const ProcessResult& result) const
      -> std::optional<ClassifiedError>;

  // Inserts a rule before the one named `before`, or appends when no rule has
  // that name.
  auto add_rule(Rule rule, std::string_view before = {}) -> void;

  [[nodiscard]] auto rules() const noexcept -> const std::vector<Rule>& {
    return rules_;
  }

private:
  std::vector<Rule> rules_;
};

[[nodiscard]] auto signal_name(int sig) -> std::string;

}  // namespace taskwarden
