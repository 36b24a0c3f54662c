#include "taskwarden/executor/progress.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <ranges>
#include <type_traits>
#include <variant>

namespace taskwarden {

namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 3> kStepStatusNames = {
    "started", "completed", "failed"};

auto describe(const ItemInfo& item) -> std::string {
  if (item.kind == item_kind::FileChange) {
    return item.path.empty() ? std::string{"Editing files"}
                             : std::format("Editing {}", item.path);
  }
  if (item.kind == item_kind::CommandExecution) {
    return item.command.empty()
               ? std::string{"Running command"}
               : std::format("Running command: {}", item.command);
  }
  if (!item.description.empty()) {
    return item.description;
  }
  return std::format("Started {}", item.kind.empty() ? "item" : item.kind);
}

auto is_finished(StepStatus s) -> bool {
  return s == StepStatus::Completed || s == StepStatus::Failed;
}

auto merge_details(json& details, const json& data) -> void {
  if (data.is_object()) {
    details.update(data);
  }
}

}  // namespace

auto step_status_name(StepStatus status) noexcept -> std::string_view {
  return kStepStatusNames[static_cast<std::size_t>(status)];
}

auto ProgressEngine::find_step(
    const std::unordered_map<std::string, std::size_t, StringHash,
                             StringEqual>& index,
    const std::string& id) -> StepRecord* {
  auto it = index.find(id);
  return it == index.end() ? nullptr : &records_[it->second];
}

auto ProgressEngine::add_step(ProgressStep step) -> StepRecord& {
  auto& index = step.kind == StepKind::Turn ? turn_index_ : item_index_;
  index[step.id] = records_.size();
  records_.push_back(StepRecord{std::move(step), ++order_});
  return records_.back();
}

auto ProgressEngine::on_turn_started(const TurnStarted& e) -> void {
  ++turn_count_;
  auto id = e.turn_id.empty() ? std::format("turn-{}", turn_count_)
                              : e.turn_id;
  current_turn_ = id;

  if (auto* rec = find_step(turn_index_, id)) {
    rec->step.status = StepStatus::Started;
    rec->started_order = ++order_;
    return;
  }
  add_step(ProgressStep{.id = id,
                        .kind = StepKind::Turn,
                        .item_kind = {},
                        .description = std::format("Processing turn {}", id),
                        .status = StepStatus::Started});
}

auto ProgressEngine::on_turn_finished(const std::string& turn_id,
                                      StepStatus status,
                                      const std::string& error) -> void {
  auto id = turn_id.empty() ? current_turn_ : turn_id;
  if (id.empty()) {
    id = std::format("turn-{}", ++turn_count_);
  }

  auto* rec = find_step(turn_index_, id);
  if (!rec) {
    rec = &add_step(ProgressStep{
        .id = id,
        .kind = StepKind::Turn,
        .item_kind = {},
        .description = std::format("Processing turn {}", id),
        .status = StepStatus::Started});
  }
  rec->step.status = status;
  if (status == StepStatus::Failed) {
    rec->step.details["error"] = error;
    failed_ = true;
  }
  complete_ = true;
}

auto ProgressEngine::on_item(const std::string& item_id, const ItemInfo& item,
                             const json& data, EventType type) -> void {
  StepRecord* rec = nullptr;
  std::string id = item_id;

  if (!id.empty()) {
    rec = find_step(item_index_, id);
  } else if (type != EventType::ItemStarted) {
    // No id: attach to the newest in-flight item of the same kind.
    for (auto& r : records_ | std::views::reverse) {
      if (r.step.kind == StepKind::Item &&
          r.step.status == StepStatus::Started &&
          r.step.item_kind == item.kind) {
        rec = &r;
        break;
      }
    }
  }
  if (!rec && id.empty()) {
    id = std::format("item-{}", ++anonymous_items_);
  }

  switch (type) {
    case EventType::ItemStarted:
      if (rec) {
        rec->step.status = StepStatus::Started;
        rec->started_order = ++order_;
        merge_details(rec->step.details, data);
      } else {
        auto& added = add_step(ProgressStep{.id = id,
                                            .kind = StepKind::Item,
                                            .item_kind = item.kind,
                                            .description = describe(item),
                                            .status = StepStatus::Started});
        merge_details(added.step.details, data);
      }
      break;

    case EventType::ItemUpdated:
      if (rec) {
        merge_details(rec->step.details, data);
      } else {
        auto& added = add_step(ProgressStep{.id = id,
                                            .kind = StepKind::Item,
                                            .item_kind = item.kind,
                                            .description = describe(item),
                                            .status = StepStatus::Started});
        merge_details(added.step.details, data);
      }
      break;

    case EventType::ItemCompleted: {
      if (!rec) {
        rec = &add_step(ProgressStep{.id = id,
                                     .kind = StepKind::Item,
                                     .item_kind = item.kind,
                                     .description = describe(item),
                                     .status = StepStatus::Started});
      }
      merge_details(rec->step.details, data);
      if (rec->step.status == StepStatus::Completed) {
        break;
      }
      rec->step.status = StepStatus::Completed;
      if (rec->step.item_kind.empty()) {
        rec->step.item_kind = item.kind;
      }
      if (rec->step.item_kind == item_kind::FileChange) {
        ++files_changed_;
      } else if (rec->step.item_kind == item_kind::CommandExecution) {
        ++commands_executed_;
      }
      break;
    }

    default:
      break;
  }
}

auto ProgressEngine::process_event(const Event& event) -> void {
  ++events_seen_;

  std::visit(
      [&](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TurnStarted>) {
          on_turn_started(e);
        } else if constexpr (std::is_same_v<T, TurnCompleted>) {
          on_turn_finished(e.turn_id, StepStatus::Completed, {});
        } else if constexpr (std::is_same_v<T, TurnFailed>) {
          on_turn_finished(e.turn_id, StepStatus::Failed,
                           e.message.empty() ? std::string{"turn failed"}
                                             : e.message);
        } else if constexpr (std::is_same_v<T, ItemStarted> ||
                             std::is_same_v<T, ItemUpdated> ||
                             std::is_same_v<T, ItemCompleted>) {
          on_item(e.item_id, e.item, event.data(), event.type());
        }
      },
      event.payload);

  high_water_ = std::max(high_water_, raw_percent());
}

auto ProgressEngine::raw_percent() const -> int {
  if (complete_) {
    return 100;
  }
  std::size_t finished = 0;
  std::size_t in_flight = 0;
  for (const auto& r : records_) {
    if (is_finished(r.step.status)) {
      ++finished;
    } else {
      ++in_flight;
    }
  }
  auto total = std::max<std::size_t>(records_.size(), 1);
  auto ratio = (static_cast<double>(finished) +
                0.5 * static_cast<double>(in_flight)) /
               static_cast<double>(total);
  return static_cast<int>(std::lround(ratio * 100.0));
}

auto ProgressEngine::progress() const -> ProgressSummary {
  ProgressSummary summary;
  summary.total_steps = records_.size();
  summary.files_changed = files_changed_;
  summary.commands_executed = commands_executed_;
  summary.is_complete = complete_;
  summary.has_failed = failed_;
  summary.steps.reserve(records_.size());

  const StepRecord* newest = nullptr;
  for (const auto& r : records_) {
    summary.steps.push_back(r.step);
    if (is_finished(r.step.status)) {
      ++summary.completed_steps;
    } else if (!newest || r.started_order > newest->started_order) {
      newest = &r;
    }
  }
  if (newest) {
    summary.current_action = newest->step.description;
  }

  summary.percent = high_water_;
  if (complete_) {
    summary.percent = 100;
    summary.completed_steps = summary.total_steps;
  }
  return summary;
}

auto ProgressEngine::reset() -> void {
  records_.clear();
  turn_index_.clear();
  item_index_.clear();
  current_turn_.clear();
  order_ = 0;
  events_seen_ = 0;
  turn_count_ = 0;
  anonymous_items_ = 0;
  files_changed_ = 0;
  commands_executed_ = 0;
  complete_ = false;
  failed_ = false;
  high_water_ = 0;
}

auto progress_to_json(const ProgressSummary& summary) -> nlohmann::json {
  json steps = json::array();
  for (const auto& s : summary.steps) {
    steps.push_back({{"id", s.id},
                     {"kind", s.kind == StepKind::Turn ? "turn" : "item"},
                     {"item_kind", s.item_kind},
                     {"description", s.description},
                     {"status", step_status_name(s.status)},
                     {"details", s.details}});
  }
  json j = {{"completed_steps", summary.completed_steps},
            {"total_steps", summary.total_steps},
            {"percent", summary.percent},
            {"files_changed", summary.files_changed},
            {"commands_executed", summary.commands_executed},
            {"is_complete", summary.is_complete},
            {"has_failed", summary.has_failed},
            {"steps", std::move(steps)}};
  if (summary.current_action) {
    j["current_action"] = *summary.current_action;
  } else {
    j["current_action"] = nullptr;
  }
  return j;
}

auto progress_from_json(const nlohmann::json& j)
    -> std::optional<ProgressSummary> {
  if (!j.is_object()) {
    return std::nullopt;
  }
  ProgressSummary s;
  s.completed_steps = j.value("completed_steps", std::size_t{0});
  s.total_steps = j.value("total_steps", std::size_t{0});
  s.percent = j.value("percent", 0);
  s.files_changed = j.value("files_changed", std::size_t{0});
  s.commands_executed = j.value("commands_executed", std::size_t{0});
  s.is_complete = j.value("is_complete", false);
  s.has_failed = j.value("has_failed", false);
  if (auto it = j.find("current_action"); it != j.end() && it->is_string()) {
    s.current_action = it->get<std::string>();
  }
  if (auto it = j.find("steps"); it != j.end() && it->is_array()) {
    for (const auto& js : *it) {
      if (!js.is_object()) {
        continue;
      }
      ProgressStep step;
      step.id = js.value("id", "");
      step.kind = js.value("kind", "item") == "turn" ? StepKind::Turn
                                                     : StepKind::Item;
      step.item_kind = js.value("item_kind", "");
      step.description = js.value("description", "");
      auto status = js.value("status", "started");
      auto sit = std::ranges::find(kStepStatusNames, status);
      if (sit != kStepStatusNames.end()) {
        step.status = static_cast<StepStatus>(
            std::distance(kStepStatusNames.begin(), sit));
      }
      if (auto dit = js.find("details"); dit != js.end()) {
        step.details = *dit;
      }
      s.steps.push_back(std::move(step));
    }
  }
  return s;
}

}  // namespace taskwarden
