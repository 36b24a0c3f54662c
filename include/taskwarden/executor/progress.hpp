#pragma once

#include "taskwarden/core/error.hpp"
#include "taskwarden/protocol/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskwarden {

enum class StepStatus : std::uint8_t {
  Started,
  Completed,
  Failed,
};

enum class StepKind : std::uint8_t {
  Turn,
  Item,
};

[[nodiscard]] auto step_status_name(StepStatus status) noexcept
    -> std::string_view;

struct ProgressStep {
  std::string id;
  StepKind kind{StepKind::Item};
  std::string item_kind;
  std::string description;
  StepStatus status{StepStatus::Started};
  nlohmann::json details = nlohmann::json::object();
};

struct ProgressSummary {
  std::optional<std::string> current_action;
  std::size_t completed_steps{0};
  std::size_t total_steps{0};
  int percent{0};
  std::vector<ProgressStep> steps;
  std::size_t files_changed{0};
  std::size_t commands_executed{0};
  bool is_complete{false};
  bool has_failed{false};
};

[[nodiscard]] auto progress_to_json(const ProgressSummary& summary)
    -> nlohmann::json;
[[nodiscard]] auto progress_from_json(const nlohmann::json& j)
    -> std::optional<ProgressSummary>;

// Folds a task's event stream into a step model. One engine per task;
// reset() before reuse.
class ProgressEngine {
public:
  auto process_event(const Event& event) -> void;
  [[nodiscard]] auto progress() const -> ProgressSummary;
  auto reset() -> void;

  [[nodiscard]] auto events_seen() const noexcept -> std::uint64_t {
    return events_seen_;
  }

private:
  struct StepRecord {
    ProgressStep step;
    std::uint64_t started_order{0};
  };

  auto on_turn_started(const TurnStarted& e) -> void;
  auto on_turn_finished(const std::string& turn_id, StepStatus status,
                        const std::string& error) -> void;
  auto on_item(const std::string& item_id, const ItemInfo& item,
               const nlohmann::json& data, EventType type) -> void;

  auto find_step(const std::unordered_map<std::string, std::size_t,
                                          StringHash, StringEqual>& index,
                 const std::string& id) -> StepRecord*;
  auto add_step(ProgressStep step) -> StepRecord&;
  [[nodiscard]] auto raw_percent() const -> int;

  std::vector<StepRecord> records_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual>
      turn_index_;
  std::unordered_map<std::string, std::size_t, StringHash, StringEqual>
      item_index_;
  std::string current_turn_;
  std::uint64_t order_{0};
  std::uint64_t events_seen_{0};
  std::size_t turn_count_{0};
  std::size_t anonymous_items_{0};
  std::size_t files_changed_{0};
  std::size_t commands_executed_{0};
  bool complete_{false};
  bool failed_{false};
  int high_water_{0};
};

}  // namespace taskwarden
