#include "taskwarden/executor/process_queue.hpp"

#include "taskwarden/util/log.hpp"

#include <exception>

namespace taskwarden {

ProcessQueue::ProcessQueue(std::size_t max_concurrency)
    : max_concurrency_(max_concurrency == 0 ? 1 : max_concurrency) {
  workers_.reserve(max_concurrency_);
  for (std::size_t i = 0; i < max_concurrency_; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

ProcessQueue::~ProcessQueue() {
  shutdown();
}

auto ProcessQueue::add(Job job) -> bool {
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return false;
    }
    if (running_ < max_concurrency_) {
      ++running_;
      ready_.push_back(std::move(job));
    } else {
      waiting_.push_back(std::move(job));
      log::debug("Queue full ({} running), {} waiting", running_,
                 waiting_.size());
      return true;
    }
  }
  ready_cv_.notify_one();
  return true;
}

auto ProcessQueue::stats() const -> QueueStats {
  std::lock_guard lock(mu_);
  return {running_, waiting_.size(), max_concurrency_};
}

auto ProcessQueue::wait_idle() -> void {
  std::unique_lock lock(mu_);
  idle_cv_.wait(lock, [this] { return running_ == 0 && waiting_.empty(); });
}

auto ProcessQueue::shutdown() -> void {
  {
    std::lock_guard lock(mu_);
    if (stopping_ && workers_.empty()) {
      return;
    }
    stopping_ = true;
  }
  ready_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

auto ProcessQueue::run(Job& job) -> void {
  try {
    job();
  } catch (const std::exception& e) {
    log::error("Queued job threw: {}", e.what());
  }
}

auto ProcessQueue::worker_loop() -> void {
  std::unique_lock lock(mu_);
  for (;;) {
    ready_cv_.wait(lock, [this] { return !ready_.empty() || stopping_; });
    if (ready_.empty()) {
      return;
    }

    Job job = std::move(ready_.front());
    ready_.pop_front();

    for (;;) {
      lock.unlock();
      run(job);
      job = nullptr;
      lock.lock();

      if (waiting_.empty()) {
        --running_;
        if (running_ == 0) {
          idle_cv_.notify_all();
        }
        break;
      }
      job = std::move(waiting_.front());
      waiting_.pop_front();
    }
  }
}

}  // namespace taskwarden
