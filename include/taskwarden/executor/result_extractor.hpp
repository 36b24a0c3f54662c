#pragma once

#include "taskwarden/protocol/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

struct FileChange {
  std::string path;
  std::string operation;
};

struct CommandRun {
  std::string command;
  int exit_code{-1};
};

inline constexpr std::string_view kDefaultSummary =
    "Task completed successfully";

// turn.completed summary, else the text of the last agent message, else a
// fixed default.
[[nodiscard]] auto extract_summary(const std::vector<Event>& events)
    -> std::string;

[[nodiscard]] auto extract_file_changes(const std::vector<Event>& events)
    -> std::vector<FileChange>;

[[nodiscard]] auto extract_commands(const std::vector<Event>& events)
    -> std::vector<CommandRun>;

// stderr lines that start with a warning marker.
[[nodiscard]] auto extract_warnings(std::string_view stderr_output)
    -> std::vector<std::string>;

// Final structured output of the worker, taken from the last agent message
// when it parses as JSON.
[[nodiscard]] auto extract_structured_output(const std::vector<Event>& events)
    -> std::optional<nlohmann::json>;

[[nodiscard]] auto to_json(const FileChange& change) -> nlohmann::json;
[[nodiscard]] auto to_json(const CommandRun& command) -> nlohmann::json;

}  // namespace taskwarden
