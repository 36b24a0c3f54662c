#include "taskwarden/executor/result_extractor.hpp"

#include "taskwarden/util/utf8.hpp"

#include <algorithm>
#include <ranges>
#include <regex>

namespace taskwarden {

namespace {

auto completed_item(const Event& e, std::string_view kind) -> const ItemInfo* {
  if (e.type() != EventType::ItemCompleted) {
    return nullptr;
  }
  const auto* item = e.item();
  return item && item->kind == kind ? item : nullptr;
}

auto last_agent_message(const std::vector<Event>& events) -> const ItemInfo* {
  for (const auto& e : std::views::reverse(events)) {
    if (const auto* item = completed_item(e, item_kind::AgentMessage)) {
      return item;
    }
  }
  return nullptr;
}

}  // namespace

auto extract_summary(const std::vector<Event>& events) -> std::string {
  auto completed = std::ranges::find_if(events, [](const Event& e) {
    return e.type() == EventType::TurnCompleted;
  });
  if (completed != events.end()) {
    if (const auto* tc = completed->get<TurnCompleted>();
        tc && !tc->summary.empty()) {
      return tc->summary;
    }
  }
  if (const auto* msg = last_agent_message(events)) {
    return msg->text.empty() ? std::string{"Task completed"} : msg->text;
  }
  return std::string{kDefaultSummary};
}

auto extract_file_changes(const std::vector<Event>& events)
    -> std::vector<FileChange> {
  std::vector<FileChange> out;
  for (const auto& e : events) {
    if (const auto* item = completed_item(e, item_kind::FileChange)) {
      out.push_back({item->path.empty() ? "unknown" : item->path,
                     item->operation.empty() ? "modified" : item->operation});
    }
  }
  return out;
}

auto extract_commands(const std::vector<Event>& events)
    -> std::vector<CommandRun> {
  std::vector<CommandRun> out;
  for (const auto& e : events) {
    if (const auto* item = completed_item(e, item_kind::CommandExecution)) {
      out.push_back({item->command.empty() ? "unknown" : item->command,
                     item->exit_code.value_or(-1)});
    }
  }
  return out;
}

auto extract_warnings(std::string_view stderr_output)
    -> std::vector<std::string> {
  static const std::regex warning{R"(^\s*(\[?warn(ing)?\]?)[:\s])",
                                  std::regex::ECMAScript | std::regex::icase};
  std::vector<std::string> out;
  for (auto line : std::views::split(stderr_output, '\n')) {
    std::string_view sv{line.begin(), line.end()};
    if (std::regex_search(sv.begin(), sv.end(), warning)) {
      out.push_back(utf8::sanitize(sv));
    }
  }
  return out;
}

auto extract_structured_output(const std::vector<Event>& events)
    -> std::optional<nlohmann::json> {
  const auto* msg = last_agent_message(events);
  if (!msg || msg->text.empty()) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(msg->text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_structured()) {
    return std::nullopt;
  }
  return parsed;
}

auto to_json(const FileChange& change) -> nlohmann::json {
  return {{"path", change.path}, {"operation", change.operation}};
}

auto to_json(const CommandRun& command) -> nlohmann::json {
  return {{"command", command.command}, {"exit_code", command.exit_code}};
}

}  // namespace taskwarden
