#include "taskwarden/executor/process_manager.hpp"

#include "taskwarden/util/log.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>

#include <poll.h>
#include <unistd.h>

namespace taskwarden {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr int EXIT_POLL_INTERVAL_MS = 250;

auto append_capped(std::string& out, std::string_view chunk, std::size_t cap,
                   bool& truncated) -> void {
  if (out.size() >= cap) {
    truncated = truncated || !chunk.empty();
    return;
  }
  auto room = cap - out.size();
  if (chunk.size() > room) {
    out.append(chunk.substr(0, room));
    truncated = true;
    return;
  }
  out.append(chunk);
}

}  // namespace

enum class JobState : std::uint8_t {
  Queued,
  Starting,
  Running,
  Done,
};

struct ProcessManager::Job {
  ProcessId id;
  ExecuteOptions options;
  ProcessCallback callback;
  CancellationSource cancel;
  std::atomic<bool> resolved{false};

  // Guarded by ProcessManager::mu_.
  JobState state{JobState::Queued};
  Watchdog* watchdog{nullptr};
  pid_t pid{-1};
  std::int64_t started_at{0};

  // Collected output, guarded by mu.
  std::mutex mu;
  std::vector<Event> events;
  std::string stdout_output;
  std::string stderr_output;
  bool truncated{false};
  Clock::time_point spawned_at{Clock::now()};
};

ProcessManager::ProcessManager(std::size_t max_concurrency)
    : queue_(max_concurrency) {
}

ProcessManager::~ProcessManager() {
  shutdown();
}

auto ProcessManager::execute(ExecuteOptions options) -> Submission {
  auto promise = std::make_shared<std::promise<ProcessResult>>();
  auto future = promise->get_future();
  auto id = submit(std::move(options),
                   [promise](ProcessResult result) mutable {
                     promise->set_value(std::move(result));
                   });
  return Submission{std::move(id), std::move(future)};
}

auto ProcessManager::execute(ExecuteOptions options, ProcessCallback callback)
    -> ProcessId {
  return submit(std::move(options), std::move(callback));
}

auto ProcessManager::submit(ExecuteOptions options, ProcessCallback callback)
    -> ProcessId {
  auto job = std::make_shared<Job>();
  job->id = generate_process_id();
  job->options = std::move(options);
  job->callback = std::move(callback);
  auto id = job->id;

  {
    std::lock_guard lock(mu_);
    jobs_.emplace(id, job);
  }

  if (!queue_.add([this, job] { run_job(job); })) {
    log::warn("Process manager is shutting down, rejecting {}",
              job->options.label);
    ProcessResult result;
    result.process_id = id;
    result.cancelled = true;
    resolve(*job, std::move(result));
    finish(id);
  }
  return id;
}

auto ProcessManager::resolve(Job& job, ProcessResult result) -> void {
  if (job.resolved.exchange(true, std::memory_order_acq_rel)) {
    log::debug("Job {} already resolved, dropping later outcome", job.id);
    return;
  }
  if (job.callback) {
    job.callback(std::move(result));
  }
}

auto ProcessManager::finish(const ProcessId& id) -> void {
  std::lock_guard lock(mu_);
  jobs_.erase(id);
}

auto ProcessManager::snapshot(Job& job) -> ProcessResult {
  ProcessResult result;
  result.process_id = job.id;
  result.pid = job.pid;
  {
    std::lock_guard lock(job.mu);
    result.events = job.events;
    result.stdout_output = job.stdout_output;
    result.stderr_output = job.stderr_output;
    result.output_truncated = job.truncated;
  }
  result.duration_ms = elapsed_ms(job.spawned_at);
  return result;
}

auto ProcessManager::take_event(Job& job, Watchdog& watchdog, Event event)
    -> void {
  watchdog.record_event(event);
  if (job.options.on_event) {
    job.options.on_event(event);
  }
  std::lock_guard lock(job.mu);
  job.events.push_back(std::move(event));
}

auto ProcessManager::pump_output(Job& job, ChildProcess& child,
                                 Watchdog& watchdog,
                                 EventStreamParser& parser) -> void {
  std::array<char, READ_BUFFER_SIZE> buffer;
  auto cap = job.options.max_output_bytes;
  bool exited = false;

  // Returns false once the stream hit EOF or a hard error.
  auto drain = [&](int fd, bool is_stdout) -> bool {
    for (;;) {
      ssize_t n = ::read(fd, buffer.data(), buffer.size());
      if (n > 0) {
        std::string_view chunk{buffer.data(), static_cast<std::size_t>(n)};
        if (is_stdout) {
          watchdog.record_stdout(chunk);
          {
            std::lock_guard lock(job.mu);
            append_capped(job.stdout_output, chunk, cap, job.truncated);
          }
          for (auto& event : parser.feed(chunk)) {
            take_event(job, watchdog, std::move(event));
          }
        } else {
          watchdog.record_stderr(chunk);
          std::lock_guard lock(job.mu);
          append_capped(job.stderr_output, chunk, cap, job.truncated);
        }
        continue;
      }
      if (n == 0) {
        return false;
      }
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return true;
      }
      log::warn("read failed for pid {}: {}", child.pid(),
                std::strerror(errno));
      return false;
    }
  };

  while (child.stdout_fd() >= 0 || child.stderr_fd() >= 0) {
    std::array<pollfd, 3> fds{};
    nfds_t n = 0;
    int out_idx = -1;
    int err_idx = -1;
    int pid_idx = -1;
    if (child.stdout_fd() >= 0) {
      out_idx = static_cast<int>(n);
      fds[n++] = pollfd{child.stdout_fd(), POLLIN, 0};
    }
    if (child.stderr_fd() >= 0) {
      err_idx = static_cast<int>(n);
      fds[n++] = pollfd{child.stderr_fd(), POLLIN, 0};
    }
    if (!exited && child.pid_fd() >= 0) {
      pid_idx = static_cast<int>(n);
      fds[n++] = pollfd{child.pid_fd(), POLLIN, 0};
    }

    int ret = ::poll(fds.data(), n, exited ? 0 : EXIT_POLL_INTERVAL_MS);
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::error("poll failed for pid {}: {}", child.pid(),
                 std::strerror(errno));
      break;
    }

    if (ret == 0) {
      if (exited) {
        // The process is gone and nothing is left in the pipes; any writer
        // still holding them is a detached descendant.
        break;
      }
      if (child.pid_fd() < 0 && child.has_exited()) {
        exited = true;
      }
      continue;
    }

    if (out_idx >= 0 && fds[out_idx].revents != 0 &&
        !drain(child.stdout_fd(), true)) {
      child.close_stdout();
    }
    if (err_idx >= 0 && fds[err_idx].revents != 0 &&
        !drain(child.stderr_fd(), false)) {
      child.close_stderr();
    }
    if (pid_idx >= 0 && fds[pid_idx].revents != 0) {
      exited = true;
    }
  }

  child.close_stdout();
  child.close_stderr();
}

auto ProcessManager::run_job(const std::shared_ptr<Job>& job) -> void {
  const auto& label =
      job->options.label.empty() ? job->id.str() : job->options.label;

  bool cancelled_early = false;
  {
    std::lock_guard lock(mu_);
    cancelled_early = job->cancel.is_cancelled() ||
                      job->options.cancel_token.is_cancelled();
    job->state = cancelled_early ? JobState::Done : JobState::Starting;
  }
  if (cancelled_early) {
    log::info("Job {} cancelled before start", label);
    ProcessResult result;
    result.process_id = job->id;
    result.cancelled = true;
    resolve(*job, std::move(result));
    finish(job->id);
    return;
  }

  job->spawned_at = Clock::now();
  auto spawned = ChildProcess::spawn(job->options.spawn);
  if (!spawned) {
    auto ec = spawned.error();
    log::error("Failed to start '{}' for {}: {}", job->options.spawn.program,
               label, ec.message());
    ProcessResult result;
    result.process_id = job->id;
    result.spawn_error = SpawnFailure{
        ec, std::format("failed to start '{}': {}", job->options.spawn.program,
                        ec.message())};
    result.duration_ms = elapsed_ms(job->spawned_at);
    {
      std::lock_guard lock(mu_);
      job->state = JobState::Done;
    }
    resolve(*job, std::move(result));
    finish(job->id);
    return;
  }
  auto& child = **spawned;

  auto config = job->options.watchdog;
  config.on_timeout = [this, job, user = std::move(config.on_timeout)](
                          const TimeoutInfo& info,
                          const PartialResults& partial) {
    if (user) {
      user(info, partial);
    }
    auto result = snapshot(*job);
    result.timeout = info;
    result.partial = partial;
    resolve(*job, std::move(result));
  };
  Watchdog watchdog(label, child, std::move(config));

  bool cancel_now = false;
  {
    std::lock_guard lock(mu_);
    job->pid = child.pid();
    job->started_at = now_ms();
    job->watchdog = &watchdog;
    job->state = JobState::Running;
    cancel_now = job->cancel.is_cancelled() ||
                 job->options.cancel_token.is_cancelled();
  }
  watchdog.start();
  log::info("Started {} as pid {}", label, child.pid());
  if (job->options.on_spawn) {
    job->options.on_spawn(child.pid());
  }
  if (cancel_now) {
    watchdog.cancel();
  }

  EventStreamParser parser;
  pump_output(*job, child, watchdog, parser);
  if (auto last = parser.flush()) {
    take_event(*job, watchdog, std::move(*last));
  }

  auto status = child.wait();
  {
    std::lock_guard lock(mu_);
    job->watchdog = nullptr;
    job->state = JobState::Done;
  }
  watchdog.stop();

  auto result = snapshot(*job);
  result.exit_code = status.exit_code;
  result.signal = status.signal;
  result.cancelled = job->cancel.is_cancelled();
  result.parser_stats = parser.stats();

  if (status.signal) {
    log::info("{} (pid {}) terminated by signal {}", label, child.pid(),
              *status.signal);
  } else {
    log::info("{} (pid {}) exited with code {}", label, child.pid(),
              status.exit_code.value_or(-1));
  }
  resolve(*job, std::move(result));
  finish(job->id);
}

auto ProcessManager::cancel(const ProcessId& id) -> bool {
  std::shared_ptr<Job> resolve_now;
  {
    std::lock_guard lock(mu_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
      return false;
    }
    auto& job = it->second;
    if (job->state == JobState::Done || !job->cancel.cancel()) {
      return false;
    }
    switch (job->state) {
      case JobState::Queued:
        resolve_now = job;
        break;
      case JobState::Running:
        if (job->watchdog) {
          job->watchdog->cancel();
        }
        break;
      default:
        break;
    }
  }
  log::info("Cancel requested for {}", id);
  if (resolve_now) {
    ProcessResult result;
    result.process_id = id;
    result.cancelled = true;
    resolve(*resolve_now, std::move(result));
  }
  return true;
}

auto ProcessManager::kill_all() -> void {
  std::vector<std::shared_ptr<Job>> queued;
  {
    std::lock_guard lock(mu_);
    for (auto& [id, job] : jobs_) {
      if (job->state == JobState::Done || !job->cancel.cancel()) {
        continue;
      }
      if (job->state == JobState::Queued) {
        queued.push_back(job);
      } else if (job->state == JobState::Running && job->watchdog) {
        log::info("Killing process {} (pid {})", id, job->pid);
        job->watchdog->cancel();
      }
    }
  }
  for (auto& job : queued) {
    ProcessResult result;
    result.process_id = job->id;
    result.cancelled = true;
    resolve(*job, std::move(result));
  }
}

auto ProcessManager::shutdown() -> void {
  kill_all();
  queue_.shutdown();
}

auto ProcessManager::stats() const -> ManagerStats {
  ManagerStats stats;
  {
    std::lock_guard lock(mu_);
    for (const auto& [id, job] : jobs_) {
      if (job->state == JobState::Running) {
        ++stats.active_processes;
      }
    }
  }
  stats.queue = queue_.stats();
  return stats;
}

auto ProcessManager::active_processes() const -> std::vector<ProcessInfo> {
  std::vector<ProcessInfo> out;
  std::lock_guard lock(mu_);
  for (const auto& [id, job] : jobs_) {
    if (job->state == JobState::Running) {
      out.push_back(ProcessInfo{id, job->pid, job->options.label,
                                job->started_at});
    }
  }
  return out;
}

}  // namespace taskwarden
