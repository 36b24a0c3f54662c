#pragma once

#include <chrono>
#include <cstdint>

namespace taskwarden {

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// Epoch milliseconds, the unit every persisted timestamp uses.
[[nodiscard]] inline auto now_ms() -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             WallClock::now().time_since_epoch())
      .count();
}

[[nodiscard]] inline auto to_timestamp(WallClock::time_point tp)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_timestamp(std::int64_t ts)
    -> WallClock::time_point {
  return WallClock::time_point{std::chrono::milliseconds{ts}};
}

[[nodiscard]] inline auto elapsed_ms(Clock::time_point since,
                                     Clock::time_point now = Clock::now())
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - since)
      .count();
}

}  // namespace taskwarden
