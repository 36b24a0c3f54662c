#include "taskwarden/protocol/event_parser.hpp"

#include "taskwarden/util/log.hpp"

#include <algorithm>

namespace taskwarden {

namespace {

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  auto start = s.find_first_not_of(ws);
  if (start == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

auto preview(std::string_view line) -> std::string_view {
  return line.substr(0, std::min(line.size(),
                                 EventStreamParser::kPreviewChars));
}

}  // namespace

EventStreamParser::EventStreamParser(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {
}

auto EventStreamParser::decode_line(std::string_view line)
    -> std::optional<Event> {
  auto trimmed = trim(line);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  auto value = nlohmann::json::parse(trimmed, nullptr, false);
  if (value.is_discarded()) {
    return std::nullopt;
  }
  return event_from_json(std::move(value));
}

auto EventStreamParser::consume_line(std::string_view line,
                                     std::vector<Event>& out) -> void {
  if (trim(line).empty()) {
    return;
  }
  ++stats_.lines_processed;

  auto event = decode_line(line);
  if (!event) {
    ++stats_.parse_errors;
    log::debug("Dropping non-event line: {}", preview(trim(line)));
    return;
  }
  event->sequence = next_sequence_++;
  ++stats_.events_emitted;
  out.push_back(std::move(*event));
}

auto EventStreamParser::feed(std::string_view chunk) -> std::vector<Event> {
  std::vector<Event> events;

  while (!chunk.empty()) {
    auto nl = chunk.find('\n');
    auto segment = chunk.substr(0, nl);

    if (discarding_) {
      if (nl == std::string_view::npos) {
        return events;
      }
      discarding_ = false;
      chunk.remove_prefix(nl + 1);
      continue;
    }

    if (nl == std::string_view::npos) {
      buffer_.append(segment);
      if (buffer_.size() > max_line_bytes_) {
        log::warn("Discarding oversized line ({} bytes buffered, limit {})",
                  buffer_.size(), max_line_bytes_);
        buffer_.clear();
        buffer_.shrink_to_fit();
        discarding_ = true;
        ++stats_.oversized_lines;
        ++stats_.parse_errors;
      }
      return events;
    }

    if (buffer_.empty()) {
      if (segment.size() > max_line_bytes_) {
        ++stats_.oversized_lines;
        ++stats_.parse_errors;
        log::warn("Discarding oversized line ({} bytes, limit {})",
                  segment.size(), max_line_bytes_);
      } else {
        consume_line(segment, events);
      }
    } else {
      buffer_.append(segment);
      if (buffer_.size() > max_line_bytes_) {
        ++stats_.oversized_lines;
        ++stats_.parse_errors;
        log::warn("Discarding oversized line ({} bytes, limit {})",
                  buffer_.size(), max_line_bytes_);
      } else {
        consume_line(buffer_, events);
      }
      buffer_.clear();
    }
    chunk.remove_prefix(nl + 1);
  }

  return events;
}

auto EventStreamParser::flush() -> std::optional<Event> {
  if (discarding_) {
    discarding_ = false;
    buffer_.clear();
    return std::nullopt;
  }
  if (trim(buffer_).empty()) {
    buffer_.clear();
    return std::nullopt;
  }

  ++stats_.lines_processed;
  auto event = decode_line(buffer_);
  if (!event) {
    ++stats_.parse_errors;
    log::debug("Dropping incomplete trailing record: {}",
               preview(trim(buffer_)));
    buffer_.clear();
    return std::nullopt;
  }
  buffer_.clear();
  event->sequence = next_sequence_++;
  ++stats_.events_emitted;
  return event;
}

auto EventStreamParser::reset() -> void {
  buffer_.clear();
  discarding_ = false;
  next_sequence_ = 0;
  stats_ = {};
}

auto EventStreamParser::stats() const noexcept -> ParserStats {
  auto s = stats_;
  s.buffered_bytes = buffer_.size();
  return s;
}

}  // namespace taskwarden
