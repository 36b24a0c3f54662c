#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace taskwarden::utf8 {

inline constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

[[nodiscard]] constexpr auto is_continuation(char c) noexcept -> bool {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at s[0], or 0 when the bytes
// there do not form one (truncated, overlong, surrogate, above U+10FFFF).
[[nodiscard]] constexpr auto sequence_length(std::string_view s) noexcept
    -> std::size_t {
  if (s.empty()) {
    return 0;
  }
  auto b0 = static_cast<unsigned char>(s[0]);
  if (b0 < 0x80) {
    return 1;
  }
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) {
      lo = 0xA0;
    } else if (b0 == 0xED) {
      hi = 0x9F;
    }
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) {
      lo = 0x90;
    } else if (b0 == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }
  if (s.size() < len) {
    return 0;
  }
  auto b1 = static_cast<unsigned char>(s[1]);
  if (b1 < lo || b1 > hi) {
    return 0;
  }
  for (std::size_t i = 2; i < len; ++i) {
    if (!is_continuation(s[i])) {
      return 0;
    }
  }
  return len;
}

[[nodiscard]] constexpr auto is_valid(std::string_view s) noexcept -> bool {
  while (!s.empty()) {
    auto n = sequence_length(s);
    if (n == 0) {
      return false;
    }
    s.remove_prefix(n);
  }
  return true;
}

// Replaces every byte that does not belong to a well-formed sequence with
// U+FFFD.
[[nodiscard]] inline auto sanitize(std::string_view s) -> std::string {
  if (is_valid(s)) {
    return std::string{s};
  }
  std::string out;
  out.reserve(s.size() + 8);
  while (!s.empty()) {
    if (auto n = sequence_length(s); n > 0) {
      out.append(s.substr(0, n));
      s.remove_prefix(n);
    } else {
      out.append(kReplacement);
      s.remove_prefix(1);
    }
  }
  return out;
}

// Drops continuation bytes at the front left over from a cut through a
// multi-byte character.
[[nodiscard]] constexpr auto trim_partial_front(std::string_view s) noexcept
    -> std::string_view {
  std::size_t skip = 0;
  while (skip < 3 && skip < s.size() && is_continuation(s[skip])) {
    ++skip;
  }
  return s.substr(skip);
}

}  // namespace taskwarden::utf8
