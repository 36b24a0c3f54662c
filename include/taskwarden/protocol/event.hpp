#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace taskwarden {

enum class EventType : std::uint8_t {
  TurnStarted,
  TurnCompleted,
  TurnFailed,
  ItemStarted,
  ItemUpdated,
  ItemCompleted,
  Unknown,
};

inline constexpr std::array<std::string_view, 6> kEventTypeNames = {
    "turn.started",  "turn.completed", "turn.failed",
    "item.started",  "item.updated",   "item.completed",
};

[[nodiscard]] auto event_type_name(EventType type) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_event_type(std::string_view name) noexcept
    -> EventType;

// Item kinds the worker reports inside the data payload.
namespace item_kind {
inline constexpr std::string_view FileChange = "file_change";
inline constexpr std::string_view CommandExecution = "command_execution";
inline constexpr std::string_view AgentMessage = "agent_message";
inline constexpr std::string_view Reasoning = "reasoning";
}  // namespace item_kind

// Fields extracted from an item payload. Absent fields stay empty.
struct ItemInfo {
  std::string kind;
  std::string path;
  std::string operation;
  std::string command;
  std::optional<int> exit_code;
  std::string text;
  std::string description;
};

struct TurnStarted {
  std::string turn_id;
};

struct TurnCompleted {
  std::string turn_id;
  std::string summary;
};

struct TurnFailed {
  std::string turn_id;
  std::string message;
  nlohmann::json error;
};

struct ItemStarted {
  std::string item_id;
  ItemInfo item;
};

struct ItemUpdated {
  std::string item_id;
  ItemInfo item;
};

struct ItemCompleted {
  std::string item_id;
  ItemInfo item;
};

struct UnknownEvent {
  std::string type;
};

using EventPayload = std::variant<TurnStarted, TurnCompleted, TurnFailed,
                                  ItemStarted, ItemUpdated, ItemCompleted,
                                  UnknownEvent>;

struct Event {
  EventPayload payload;
  nlohmann::json raw;
  std::optional<std::int64_t> timestamp;
  std::uint64_t sequence{0};

  [[nodiscard]] auto type() const noexcept -> EventType;

  // Wire name; for unknown events this is the type string as received.
  [[nodiscard]] auto type_name() const -> std::string_view;

  // Item payload for item.* events, nullptr otherwise.
  [[nodiscard]] auto item() const noexcept -> const ItemInfo*;

  // The payload object: "data", falling back to "item", else null.
  [[nodiscard]] auto data() const -> const nlohmann::json&;

  template <typename T>
  [[nodiscard]] auto get() const noexcept -> const T* {
    return std::get_if<T>(&payload);
  }
};

// Builds an Event from a decoded JSON object. Returns nullopt when the value
// is not an object or has no string "type".
[[nodiscard]] auto event_from_json(nlohmann::json value)
    -> std::optional<Event>;

}  // namespace taskwarden
