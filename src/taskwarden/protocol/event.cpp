#include "taskwarden/protocol/event.hpp"

#include <algorithm>

namespace taskwarden {

namespace {

using json = nlohmann::json;

const json kNullJson = nullptr;

auto string_field(const json& obj, std::initializer_list<const char*> keys)
    -> std::string {
  if (!obj.is_object()) {
    return {};
  }
  for (auto key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

auto int_field(const json& obj, std::initializer_list<const char*> keys)
    -> std::optional<int> {
  if (!obj.is_object()) {
    return std::nullopt;
  }
  for (auto key : keys) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_number_integer()) {
      return it->get<int>();
    }
  }
  return std::nullopt;
}

auto payload_of(const json& event) -> const json& {
  for (auto key : {"data", "item"}) {
    auto it = event.find(key);
    if (it != event.end() && it->is_object()) {
      return *it;
    }
  }
  return kNullJson;
}

auto read_item(const json& data) -> ItemInfo {
  ItemInfo info;
  info.kind = string_field(data, {"type", "item_type"});
  info.path = string_field(data, {"path", "file"});
  info.operation = string_field(data, {"operation", "kind"});
  info.command = string_field(data, {"command"});
  info.exit_code = int_field(data, {"exit_code", "exitCode"});
  info.text = string_field(data, {"content", "text"});
  info.description = string_field(data, {"description"});

  // Batched file changes: take the first entry when no single path is set.
  if (info.path.empty() && data.is_object()) {
    auto it = data.find("changes");
    if (it != data.end() && it->is_array() && !it->empty()) {
      const auto& first = it->front();
      info.path = string_field(first, {"path"});
      if (info.operation.empty()) {
        info.operation = string_field(first, {"kind", "operation"});
      }
    }
  }
  return info;
}

auto id_field(const json& event, const json& data,
              std::initializer_list<const char*> keys) -> std::string {
  auto id = string_field(event, keys);
  if (id.empty()) {
    id = string_field(data, keys);
  }
  return id;
}

auto read_timestamp(const json& event) -> std::optional<std::int64_t> {
  auto it = event.find("timestamp");
  if (it != event.end() && it->is_number()) {
    return it->get<std::int64_t>();
  }
  return std::nullopt;
}

}  // namespace

auto event_type_name(EventType type) noexcept -> std::string_view {
  auto idx = static_cast<std::size_t>(type);
  if (idx >= kEventTypeNames.size()) {
    return "unknown";
  }
  return kEventTypeNames[idx];
}

auto parse_event_type(std::string_view name) noexcept -> EventType {
  auto it = std::ranges::find(kEventTypeNames, name);
  if (it == kEventTypeNames.end()) {
    return EventType::Unknown;
  }
  return static_cast<EventType>(std::distance(kEventTypeNames.begin(), it));
}

auto Event::type() const noexcept -> EventType {
  return static_cast<EventType>(payload.index());
}

auto Event::type_name() const -> std::string_view {
  if (const auto* u = get<UnknownEvent>()) {
    return u->type;
  }
  return event_type_name(type());
}

auto Event::item() const noexcept -> const ItemInfo* {
  if (const auto* e = get<ItemStarted>()) {
    return &e->item;
  }
  if (const auto* e = get<ItemUpdated>()) {
    return &e->item;
  }
  if (const auto* e = get<ItemCompleted>()) {
    return &e->item;
  }
  return nullptr;
}

auto Event::data() const -> const nlohmann::json& {
  if (!raw.is_object()) {
    return kNullJson;
  }
  return payload_of(raw);
}

auto event_from_json(nlohmann::json value) -> std::optional<Event> {
  if (!value.is_object()) {
    return std::nullopt;
  }
  auto type_it = value.find("type");
  if (type_it == value.end() || !type_it->is_string()) {
    return std::nullopt;
  }

  auto type_str = type_it->get<std::string>();
  const auto& data = payload_of(value);
  auto turn_id = id_field(value, data, {"turnId", "turn_id"});
  auto item_id = id_field(value, data, {"itemId", "item_id", "id"});

  Event event;
  event.timestamp = read_timestamp(value);

  switch (parse_event_type(type_str)) {
    case EventType::TurnStarted:
      event.payload = TurnStarted{std::move(turn_id)};
      break;
    case EventType::TurnCompleted:
      event.payload =
          TurnCompleted{std::move(turn_id), string_field(data, {"summary"})};
      break;
    case EventType::TurnFailed: {
      TurnFailed failed{std::move(turn_id), {}, nullptr};
      const json* err = nullptr;
      if (data.is_object() && data.contains("error")) {
        err = &data.at("error");
      } else if (value.contains("error")) {
        err = &value.at("error");
      }
      if (err) {
        failed.error = *err;
        failed.message = err->is_string() ? err->get<std::string>()
                                          : string_field(*err, {"message"});
      }
      event.payload = std::move(failed);
      break;
    }
    case EventType::ItemStarted:
      event.payload = ItemStarted{std::move(item_id), read_item(data)};
      break;
    case EventType::ItemUpdated:
      event.payload = ItemUpdated{std::move(item_id), read_item(data)};
      break;
    case EventType::ItemCompleted:
      event.payload = ItemCompleted{std::move(item_id), read_item(data)};
      break;
    case EventType::Unknown:
      event.payload = UnknownEvent{std::move(type_str)};
      break;
  }

  event.raw = std::move(value);
  return event;
}

}  // namespace taskwarden
