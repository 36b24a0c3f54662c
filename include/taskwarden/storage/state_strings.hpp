#pragma once

#include "taskwarden/storage/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace taskwarden {

namespace detail {

constexpr std::array<std::string_view, 8> kTaskStatusNames = {
    "pending",
    "working",
    "completed",
    "completed_with_warnings",
    "completed_with_errors",
    "failed",
    "canceled",
    "unknown",
};

constexpr std::array<std::string_view, 2> kTaskOriginNames = {
    "local",
    "cloud",
};

}  // namespace detail

[[nodiscard]] inline auto task_status_name(TaskStatus status) noexcept
    -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kTaskStatusNames.size()
             ? detail::kTaskStatusNames[idx].data()
             : "unknown";
}

[[nodiscard]] inline auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  auto it = std::ranges::find(detail::kTaskStatusNames, name);
  if (it != detail::kTaskStatusNames.end()) {
    return static_cast<TaskStatus>(
        std::ranges::distance(detail::kTaskStatusNames.begin(), it));
  }
  return std::nullopt;
}

[[nodiscard]] inline auto task_origin_name(TaskOrigin origin) noexcept
    -> const char* {
  auto idx = std::to_underlying(origin);
  return idx < detail::kTaskOriginNames.size()
             ? detail::kTaskOriginNames[idx].data()
             : "local";
}

[[nodiscard]] inline auto parse_task_origin(std::string_view name) noexcept
    -> std::optional<TaskOrigin> {
  auto it = std::ranges::find(detail::kTaskOriginNames, name);
  if (it != detail::kTaskOriginNames.end()) {
    return static_cast<TaskOrigin>(
        std::ranges::distance(detail::kTaskOriginNames.begin(), it));
  }
  return std::nullopt;
}

}  // namespace taskwarden
