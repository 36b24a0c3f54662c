#pragma once

#include "taskwarden/protocol/event.hpp"
#include "taskwarden/util/id.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/stat.h>

namespace taskwarden::test {

[[nodiscard]] inline auto task_id(std::string s) -> TaskId {
  return TaskId{std::move(s)};
}

template <typename T>
class BlockingQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cv_.notify_one();
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto try_pop_for(
      const std::chrono::duration<Rep, Period>& timeout) -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      T value = std::move(queue_.front());
      queue_.pop();
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto size() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

private:
  std::queue<T> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
};

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

// Polls `pred` until it holds or `timeout` passes.
[[nodiscard]] inline auto wait_until(const std::function<bool()>& pred,
                                     std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

// A private directory under /tmp, removed with everything in it.
class TempDir {
public:
  TempDir() {
    std::string pattern = "/tmp/taskwarden_test_XXXXXX";
    if (::mkdtemp(pattern.data()) == nullptr) {
      throw std::runtime_error("mkdtemp failed");
    }
    path_ = pattern;
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

  [[nodiscard]] auto file(std::string_view name) const -> std::string {
    return (path_ / name).string();
  }

  // Writes an executable /bin/sh script and returns its path.
  auto script(std::string_view name, std::string_view body) const
      -> std::string {
    auto p = file(name);
    {
      std::ofstream out(p);
      out << "#!/bin/sh\n" << body << "\n";
    }
    ::chmod(p.c_str(), 0755);
    return p;
  }

private:
  std::filesystem::path path_;
};

// One protocol line as the worker prints it.
[[nodiscard]] inline auto event_line(const nlohmann::json& j) -> std::string {
  return j.dump() + "\n";
}

[[nodiscard]] inline auto make_event(const nlohmann::json& j) -> Event {
  auto event = event_from_json(j);
  if (!event) {
    throw std::runtime_error("not an event: " + j.dump());
  }
  return std::move(*event);
}

}  // namespace taskwarden::test
