#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace taskwarden {

struct QueueStats {
  std::size_t running{0};
  std::size_t queued{0};
  std::size_t max_concurrency{0};
};

// FIFO admission with a fixed concurrency limit. Admission is decided in
// add(): the job either takes a free slot right away or waits in line. A
// worker that finishes a job takes the next waiting one before releasing its
// slot, so a freed slot is never left idle while jobs wait.
class ProcessQueue {
public:
  using Job = std::move_only_function<void()>;

  static constexpr std::size_t kDefaultMaxConcurrency = 2;

  explicit ProcessQueue(std::size_t max_concurrency = kDefaultMaxConcurrency);
  ~ProcessQueue();

  ProcessQueue(const ProcessQueue&) = delete;
  ProcessQueue& operator=(const ProcessQueue&) = delete;

  // Returns false once shutdown has begun.
  [[nodiscard]] auto add(Job job) -> bool;

  [[nodiscard]] auto stats() const -> QueueStats;

  // Blocks until no job is running or waiting.
  auto wait_idle() -> void;

  // Stops accepting jobs, lets admitted and waiting jobs finish, joins the
  // workers.
  auto shutdown() -> void;

private:
  auto worker_loop() -> void;
  auto run(Job& job) -> void;

  std::size_t max_concurrency_;
  mutable std::mutex mu_;
  std::condition_variable ready_cv_;
  std::condition_variable idle_cv_;
  std::deque<Job> ready_;
  std::deque<Job> waiting_;
  std::size_t running_{0};
  bool stopping_{false};
  std::vector<std::thread> workers_;
};

}  // namespace taskwarden
