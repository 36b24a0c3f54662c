#pragma once

#include "taskwarden/util/utf8.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace taskwarden {

// Keeps the most recent `capacity` bytes of an appended stream. The view
// never starts inside a multi-byte UTF-8 character.
class TailBuffer {
public:
  explicit TailBuffer(std::size_t capacity) : capacity_(capacity) {
  }

  auto append(std::string_view data) -> void {
    total_ += data.size();
    if (data.size() >= capacity_) {
      buf_.assign(data.substr(data.size() - capacity_));
      return;
    }
    buf_.append(data);
    // Trim lazily so steady appends stay amortised O(1).
    if (buf_.size() > capacity_ * 2) {
      buf_.erase(0, buf_.size() - capacity_);
    }
  }

  [[nodiscard]] auto view() const -> std::string_view {
    std::string_view v{buf_};
    if (v.size() > capacity_) {
      v.remove_prefix(v.size() - capacity_);
    }
    return total_ > v.size() ? utf8::trim_partial_front(v) : v;
  }

  [[nodiscard]] auto str() const -> std::string {
    return std::string{view()};
  }

  // Bytes ever appended, including those already evicted.
  [[nodiscard]] auto total_bytes() const noexcept -> std::size_t {
    return total_;
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

  auto clear() -> void {
    buf_.clear();
    total_ = 0;
  }

private:
  std::size_t capacity_;
  std::size_t total_{0};
  std::string buf_;
};

// At most the last `max_bytes` bytes of `s` as valid UTF-8. The cut lands
// on a character boundary and malformed bytes become U+FFFD.
[[nodiscard]] inline auto tail_of(std::string_view s, std::size_t max_bytes)
    -> std::string {
  if (s.size() > max_bytes) {
    s = utf8::trim_partial_front(s.substr(s.size() - max_bytes));
  }
  return utf8::sanitize(s);
}

}  // namespace taskwarden
