#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace taskwarden {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct ProcessTag {};

template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using ProcessId = TypedId<ProcessTag>;

namespace detail {

inline auto to_base36(std::uint64_t v) -> std::string {
  constexpr std::string_view digits = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (v == 0) {
    return "0";
  }
  std::string out;
  while (v > 0) {
    out.insert(out.begin(), digits[v % 36]);
    v /= 36;
  }
  return out;
}

inline auto random_base36(std::size_t len) -> std::string {
  constexpr std::string_view digits = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::size_t> dis(0, 35);
  std::string out(len, '0');
  for (auto& c : out) {
    c = digits[dis(gen)];
  }
  return out;
}

inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}

}  // namespace detail

// T-<origin>-<base36 millis><6 random base36 chars>
inline auto generate_task_id(std::string_view origin) -> TaskId {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return TaskId{std::format("T-{}-{}{}", origin,
                            detail::to_base36(static_cast<std::uint64_t>(ms)),
                            detail::random_base36(6))};
}

inline auto generate_process_id() -> ProcessId {
  return ProcessId{std::format("proc-{}", detail::generate_short_uuid())};
}

// Returns the origin segment of a generated task id, or empty when the id
// does not follow the generated format.
inline auto task_id_origin(const TaskId& id) -> std::string_view {
  auto sv = id.value();
  if (!sv.starts_with("T-")) {
    return {};
  }
  sv.remove_prefix(2);
  auto pos = sv.find('-');
  if (pos == std::string_view::npos) {
    return {};
  }
  return sv.substr(0, pos);
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace taskwarden

template <typename Tag>
struct std::hash<taskwarden::TypedId<Tag>> {
  auto operator()(const taskwarden::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<taskwarden::TypedId<Tag>> : std::formatter<std::string> {
  auto format(const taskwarden::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string>::format(std::string(id.value()), ctx);
  }
};
