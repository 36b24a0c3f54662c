#include "taskwarden/executor/watchdog.hpp"

#include "taskwarden/util/log.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace taskwarden {

namespace {

constexpr auto kEscalationPollInterval = std::chrono::milliseconds(100);

auto to_ms(Clock::duration d) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

}  // namespace

Watchdog::Watchdog(std::string id, ProcessControl& process,
                   WatchdogConfig config)
    : id_(std::move(id)), process_(process), config_(std::move(config)) {
  event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (event_fd_ < 0) {
    log::error("Watchdog {}: failed to create eventfd: {}", id_,
               std::strerror(errno));
  }
  auto now = Clock::now();
  started_at_ = now;
  last_activity_ = now;
  last_activity_wall_ = now_ms();
  next_heartbeat_ = now + config_.progress_interval;
}

Watchdog::~Watchdog() {
  stop();
  if (thread_.joinable()) {
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }
  if (event_fd_ >= 0) {
    close(event_fd_);
    event_fd_ = -1;
  }
}

auto Watchdog::start() -> void {
  {
    std::lock_guard lock(mu_);
    if (thread_.joinable() || finished_) {
      return;
    }
    auto now = Clock::now();
    started_at_ = now;
    touch_locked(now);
    next_heartbeat_ = now + config_.progress_interval;
  }
  thread_ = std::thread([this] { run_loop(); });
  log::debug("Watchdog {} armed: idle {}ms, hard {}ms", id_,
             config_.idle_timeout.count(), config_.hard_timeout.count());
}

auto Watchdog::touch_locked(Clock::time_point now) -> void {
  last_activity_ = now;
  last_activity_wall_ = now_ms();
  idle_warned_ = false;
}

auto Watchdog::record_activity() -> void {
  std::lock_guard lock(mu_);
  touch_locked(Clock::now());
}

auto Watchdog::record_stdout(std::string_view chunk) -> void {
  std::lock_guard lock(mu_);
  touch_locked(Clock::now());
  stdout_tail_.append(chunk);
}

auto Watchdog::record_stderr(std::string_view chunk) -> void {
  std::lock_guard lock(mu_);
  touch_locked(Clock::now());
  stderr_tail_.append(chunk);
}

auto Watchdog::record_event(const Event& event) -> void {
  std::lock_guard lock(mu_);
  touch_locked(Clock::now());
  events_.push_back(event.raw);
  while (events_.size() > kMaxEvents) {
    events_.pop_front();
  }
  ++event_count_;
}

auto Watchdog::notify() -> void {
  if (event_fd_ < 0) {
    return;
  }
  std::uint64_t val = 1;
  if (write(event_fd_, &val, sizeof(val)) < 0) {
    log::warn("Watchdog {}: failed to write to eventfd: {}", id_,
              std::strerror(errno));
  }
}

auto Watchdog::stop() -> void {
  bool kill_now = false;
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    finished_ = true;
    if (escalating_ && !process_.has_exited()) {
      kill_now = true;
    }
    escalating_ = false;
  }
  if (kill_now) {
    log::warn("Watchdog {}: stopped during escalation, sending SIGKILL", id_);
    process_.send_signal(SIGKILL);
  }
  notify();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

auto Watchdog::cancel() -> bool {
  {
    std::lock_guard lock(mu_);
    if (finished_) {
      return false;
    }
    finished_ = true;
    begin_escalation_locked(Clock::now());
  }
  log::info("Watchdog {}: cancelling pid {}", id_, process_.pid());
  process_.send_signal(SIGTERM);
  notify();
  return true;
}

auto Watchdog::begin_escalation_locked(Clock::time_point now) -> void {
  escalating_ = true;
  kill_at_ = now + config_.kill_grace;
}

auto Watchdog::timeout_info() const -> std::optional<TimeoutInfo> {
  std::lock_guard lock(mu_);
  return timeout_;
}

auto Watchdog::partial_results() const -> PartialResults {
  std::lock_guard lock(mu_);
  return partial_results_locked();
}

auto Watchdog::partial_results_locked() const -> PartialResults {
  PartialResults partial;
  partial.events.assign(events_.begin(), events_.end());
  partial.stdout_tail = stdout_tail_.str();
  partial.stderr_tail = stderr_tail_.str();
  partial.last_activity_at = last_activity_wall_;
  partial.event_count = event_count_;
  return partial;
}

auto Watchdog::next_deadline_locked() const -> Clock::time_point {
  auto next = Clock::time_point::max();
  if (escalating_) {
    next = std::min(next, kill_at_);
  }
  if (finished_) {
    return next;
  }

  auto idle_deadline = last_activity_ + config_.idle_timeout;
  auto hard_deadline = started_at_ + config_.hard_timeout;
  next = std::min({next, idle_deadline, hard_deadline});

  if (config_.warn_lead.count() > 0) {
    if (!idle_warned_ && config_.warn_lead < config_.idle_timeout) {
      next = std::min(next, idle_deadline - config_.warn_lead);
    }
    if (!hard_warned_ && config_.warn_lead < config_.hard_timeout) {
      next = std::min(next, hard_deadline - config_.warn_lead);
    }
  }
  if (config_.progress_interval.count() > 0) {
    next = std::min(next, next_heartbeat_);
  }
  return next;
}

auto Watchdog::run_loop() -> void {
  pollfd pfd{event_fd_, POLLIN, 0};

  for (;;) {
    Action action = Action::None;
    TimeoutInfo info;
    PartialResults partial;
    WatchdogWarning warning;
    WatchdogHeartbeat beat;
    int timeout_ms = 0;

    {
      std::lock_guard lock(mu_);
      auto now = Clock::now();

      if (escalating_ && process_.has_exited()) {
        escalating_ = false;
      }
      if (finished_ && !escalating_) {
        break;
      }

      auto idle_deadline = last_activity_ + config_.idle_timeout;
      auto hard_deadline = started_at_ + config_.hard_timeout;
      auto elapsed = to_ms(now - started_at_);
      auto idle = to_ms(now - last_activity_);
      bool warn_enabled = config_.warn_lead.count() > 0;

      if (escalating_ && now >= kill_at_) {
        escalating_ = false;
        action = Action::Kill;
      } else if (!finished_ &&
                 (now >= hard_deadline || now >= idle_deadline)) {
        bool hard = now >= hard_deadline &&
                    (now < idle_deadline || hard_deadline <= idle_deadline);
        info.kind = hard ? TimeoutKind::Hard : TimeoutKind::Inactivity;
        info.elapsed_ms = elapsed;
        info.idle_ms = idle;
        info.limit_ms = hard ? config_.hard_timeout.count()
                             : config_.idle_timeout.count();
        info.pid = process_.pid();
        info.terminating = !process_.has_exited();
        info.message =
            hard ? std::format("Exceeded hard time limit of {}s (ran {}s)",
                               info.limit_ms / 1000, elapsed / 1000)
                 : std::format("No output or events for {}s "
                               "(inactivity limit {}s)",
                               idle / 1000, info.limit_ms / 1000);
        finished_ = true;
        timeout_ = info;
        timed_out_.store(true, std::memory_order_release);
        partial = partial_results_locked();
        begin_escalation_locked(now);
        action = Action::Timeout;
      } else if (!finished_ && warn_enabled && !hard_warned_ &&
                 config_.warn_lead < config_.hard_timeout &&
                 now >= hard_deadline - config_.warn_lead) {
        hard_warned_ = true;
        warning.kind = TimeoutKind::Hard;
        warning.elapsed_ms = elapsed;
        warning.remaining_ms = to_ms(hard_deadline - now);
        warning.message =
            std::format("Hard timeout in {}s (elapsed {}s)",
                        warning.remaining_ms / 1000, elapsed / 1000);
        action = Action::Warn;
      } else if (!finished_ && warn_enabled && !idle_warned_ &&
                 config_.warn_lead < config_.idle_timeout &&
                 now >= idle_deadline - config_.warn_lead) {
        idle_warned_ = true;
        warning.kind = TimeoutKind::Inactivity;
        warning.elapsed_ms = elapsed;
        warning.remaining_ms = to_ms(idle_deadline - now);
        warning.message =
            std::format("Inactivity timeout in {}s (idle {}s)",
                        warning.remaining_ms / 1000, idle / 1000);
        action = Action::Warn;
      } else if (!finished_ && config_.progress_interval.count() > 0 &&
                 now >= next_heartbeat_) {
        while (next_heartbeat_ <= now) {
          next_heartbeat_ += config_.progress_interval;
        }
        beat.elapsed_ms = elapsed;
        beat.idle_ms = idle;
        beat.event_count = event_count_;
        beat.stdout_bytes = stdout_tail_.total_bytes();
        beat.stderr_bytes = stderr_tail_.total_bytes();
        action = Action::Heartbeat;
      } else {
        auto wait = next_deadline_locked() - now;
        if (escalating_) {
          wait = std::min<Clock::duration>(wait, kEscalationPollInterval);
        }
        auto ms = std::chrono::ceil<std::chrono::milliseconds>(wait).count();
        timeout_ms = static_cast<int>(std::clamp<std::int64_t>(ms, 0, INT_MAX));
      }
    }

    switch (action) {
      case Action::Timeout:
        log::warn("Watchdog {}: {} timeout for pid {}: {}", id_,
                  timeout_kind_name(info.kind), info.pid, info.message);
        if (config_.on_timeout) {
          config_.on_timeout(info, partial);
        }
        if (info.terminating && process_.send_signal(SIGTERM)) {
          std::lock_guard lock(mu_);
          if (escalating_) {
            kill_at_ = Clock::now() + config_.kill_grace;
          }
        }
        continue;
      case Action::Kill:
        if (!process_.has_exited()) {
          log::warn("Watchdog {}: pid {} ignored SIGTERM, sending SIGKILL",
                    id_, process_.pid());
          process_.send_signal(SIGKILL);
        }
        continue;
      case Action::Warn:
        log::info("Watchdog {}: {}", id_, warning.message);
        if (config_.on_warning) {
          config_.on_warning(warning);
        }
        continue;
      case Action::Heartbeat:
        if (config_.on_progress) {
          config_.on_progress(beat);
        }
        continue;
      case Action::None:
        break;
    }

    int ret = ::poll(&pfd, 1, timeout_ms);
    if (ret < 0 && errno != EINTR) {
      log::error("Watchdog {}: poll failed: {}", id_, std::strerror(errno));
      break;
    }

    std::uint64_t val;
    while (event_fd_ >= 0 && ::read(event_fd_, &val, sizeof(val)) > 0) {
    }
  }
}

}  // namespace taskwarden
