#pragma once

#include "taskwarden/protocol/event.hpp"
#include "taskwarden/util/tail_buffer.hpp"
#include "taskwarden/util/time.hpp"

#include <nlohmann/json.hpp>

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskwarden {

enum class TimeoutKind : std::uint8_t {
  Inactivity,
  Hard,
};

[[nodiscard]] constexpr auto timeout_kind_name(TimeoutKind kind) noexcept
    -> std::string_view {
  return kind == TimeoutKind::Hard ? "hard" : "inactivity";
}

struct TimeoutInfo {
  TimeoutKind kind{TimeoutKind::Inactivity};
  std::int64_t elapsed_ms{0};
  std::int64_t idle_ms{0};
  std::int64_t limit_ms{0};
  pid_t pid{-1};
  bool terminating{false};
  std::string message;
};

struct PartialResults {
  std::vector<nlohmann::json> events;
  std::string stdout_tail;
  std::string stderr_tail;
  std::int64_t last_activity_at{0};
  std::uint64_t event_count{0};
};

struct WatchdogWarning {
  TimeoutKind kind{TimeoutKind::Inactivity};
  std::int64_t elapsed_ms{0};
  std::int64_t remaining_ms{0};
  std::string message;
};

struct WatchdogHeartbeat {
  std::int64_t elapsed_ms{0};
  std::int64_t idle_ms{0};
  std::uint64_t event_count{0};
  std::size_t stdout_bytes{0};
  std::size_t stderr_bytes{0};
};

struct WatchdogConfig {
  std::chrono::milliseconds idle_timeout{std::chrono::minutes(5)};
  std::chrono::milliseconds hard_timeout{std::chrono::minutes(20)};
  std::chrono::milliseconds warn_lead{std::chrono::seconds(30)};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(5)};
  std::chrono::milliseconds progress_interval{std::chrono::seconds(30)};

  std::function<void(const WatchdogHeartbeat&)> on_progress;
  std::function<void(const WatchdogWarning&)> on_warning;
  std::function<void(const TimeoutInfo&, const PartialResults&)> on_timeout;
};

// What the watchdog needs from the process it guards.
class ProcessControl {
public:
  virtual ~ProcessControl() = default;

  [[nodiscard]] virtual auto pid() const noexcept -> pid_t = 0;
  // Signals the process group; returns false if nothing was signalled.
  virtual auto send_signal(int sig) noexcept -> bool = 0;
  [[nodiscard]] virtual auto has_exited() const noexcept -> bool = 0;
};

// Enforces an inactivity deadline (re-armed by every output chunk or event)
// and a hard deadline (fixed at start) on one process. Deadlines are tracked
// on a dedicated thread so they fire whether or not anyone awaits the
// result. On timeout the process group gets SIGTERM and, after kill_grace,
// SIGKILL if it is still alive. At most one terminal outcome per instance.
class Watchdog {
public:
  static constexpr std::size_t kMaxTailBytes = 64 * 1024;
  static constexpr std::size_t kMaxEvents = 50;

  Watchdog(std::string id, ProcessControl& process, WatchdogConfig config);
  ~Watchdog();

  Watchdog(const Watchdog&) = delete;
  Watchdog& operator=(const Watchdog&) = delete;

  auto start() -> void;

  auto record_activity() -> void;
  auto record_stdout(std::string_view chunk) -> void;
  auto record_stderr(std::string_view chunk) -> void;
  auto record_event(const Event& event) -> void;

  // Normal completion: cancels every timer without an outcome.
  auto stop() -> void;

  // Terminates the process with the same SIGTERM -> SIGKILL escalation a
  // timeout uses, without reporting a timeout. Returns false if a terminal
  // outcome was already reached.
  auto cancel() -> bool;

  [[nodiscard]] auto timed_out() const noexcept -> bool {
    return timed_out_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto timeout_info() const -> std::optional<TimeoutInfo>;
  [[nodiscard]] auto partial_results() const -> PartialResults;
  [[nodiscard]] auto id() const noexcept -> const std::string& {
    return id_;
  }

private:
  enum class Action : std::uint8_t {
    None,
    Timeout,
    Warn,
    Heartbeat,
    Kill,
  };

  auto run_loop() -> void;
  auto notify() -> void;
  auto touch_locked(Clock::time_point now) -> void;
  auto begin_escalation_locked(Clock::time_point now) -> void;
  [[nodiscard]] auto partial_results_locked() const -> PartialResults;
  [[nodiscard]] auto next_deadline_locked() const -> Clock::time_point;

  std::string id_;
  ProcessControl& process_;
  WatchdogConfig config_;
  int event_fd_{-1};
  std::thread thread_;

  mutable std::mutex mu_;
  Clock::time_point started_at_;
  Clock::time_point last_activity_;
  std::int64_t last_activity_wall_{0};
  Clock::time_point next_heartbeat_;
  Clock::time_point kill_at_;
  bool idle_warned_{false};
  bool hard_warned_{false};
  bool escalating_{false};
  bool finished_{false};
  bool stopping_{false};

  TailBuffer stdout_tail_{kMaxTailBytes};
  TailBuffer stderr_tail_{kMaxTailBytes};
  std::deque<nlohmann::json> events_;
  std::uint64_t event_count_{0};
  std::optional<TimeoutInfo> timeout_;
  std::atomic<bool> timed_out_{false};
};

}  // namespace taskwarden
