#pragma once

#include "taskwarden/protocol/event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taskwarden {

struct ParserStats {
  std::uint64_t lines_processed{0};
  std::uint64_t events_emitted{0};
  std::uint64_t parse_errors{0};
  std::uint64_t oversized_lines{0};
  std::size_t buffered_bytes{0};
};

// Incremental decoder for newline-delimited JSON worker output.
// Chunks may split records anywhere; the incomplete tail is buffered until
// its newline arrives. Lines that are not a JSON object with a string "type"
// are dropped and counted. Nothing here throws.
class EventStreamParser {
public:
  static constexpr std::size_t kDefaultMaxLineBytes = 8 * 1024 * 1024;
  static constexpr std::size_t kPreviewChars = 100;

  explicit EventStreamParser(std::size_t max_line_bytes = kDefaultMaxLineBytes);

  [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<Event>;

  // Decodes the buffered residue if it is a complete record; an incomplete
  // residue is dropped. The buffer is empty afterwards.
  [[nodiscard]] auto flush() -> std::optional<Event>;

  auto reset() -> void;

  [[nodiscard]] auto stats() const noexcept -> ParserStats;

  // Decodes a single line without touching any parser state.
  [[nodiscard]] static auto decode_line(std::string_view line)
      -> std::optional<Event>;

private:
  auto consume_line(std::string_view line, std::vector<Event>& out) -> void;

  std::size_t max_line_bytes_;
  std::string buffer_;
  bool discarding_{false};
  std::uint64_t next_sequence_{0};
  ParserStats stats_;
};

}  // namespace taskwarden
