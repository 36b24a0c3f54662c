#pragma once

#include "taskwarden/core/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace taskwarden::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(4096);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Asynchronous logger. Lines are formatted on the calling thread and written
// by a single writer thread. Output goes to stderr unless a log file is set,
// so stdout stays free for command output.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;

  std::mutex sink_mu_;
  std::FILE* sink_{stderr};
  bool owns_sink_{false};
  std::atomic<bool> color_{true};

  auto write(std::string_view msg) -> void {
    std::lock_guard lock(sink_mu_);
    std::print(sink_, "{}", msg);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < 64) {
        if (auto msg = queue_.try_pop()) {
          batch.push_back(std::move(*msg));
        } else {
          break;
        }
      }

      for (const auto& msg : batch) {
        write(msg);
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      } else {
        std::lock_guard lock(sink_mu_);
        std::fflush(sink_);
      }
    }

    // accepting_ is already false here, nothing new can be pushed
    while (auto msg = queue_.try_pop()) {
      write(*msg);
    }
    std::lock_guard lock(sink_mu_);
    std::fflush(sink_);
  }

  template <typename... Args>
  auto format_line(std::string& out, Level level,
                   std::format_string<Args...> fmt, Args&&... args) -> void {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (color_.load(std::memory_order_relaxed)) {
      std::format_to(std::back_inserter(out),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                     level_color(level), level_name(level), "\033[0m", tid,
                     std::format(fmt, std::forward<Args>(args)...));
    } else {
      std::format_to(std::back_inserter(out),
                     "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                     level_name(level), tid,
                     std::format(fmt, std::forward<Args>(args)...));
    }
  }

public:
  Logger() = default;
  ~Logger() {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    running_.store(false, std::memory_order_release);
    if (writer_.joinable()) {
      writer_.join();
    }
    if (owns_sink_) {
      std::fclose(sink_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Redirects output to an append-mode file. Returns false and keeps the
  // current sink when the file cannot be opened.
  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::lock_guard lock(sink_mu_);
    if (owns_sink_) {
      std::fclose(sink_);
    }
    sink_ = f;
    owns_sink_ = true;
    color_.store(false, std::memory_order_relaxed);
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto& buf = t_buffer.buffer;
    buf.clear();
    format_line<Args...>(buf, level, fmt, std::forward<Args>(args)...);

    if (!accepting_.load(std::memory_order_acquire)) {
      write(buf);
      return;
    }
    if (!queue_.push(std::string(buf))) {
      write(buf);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskwarden::log
