#include "net/sse_parser.hpp"

#include <charconv>

namespace ssebridge::net {

void SseParser::feed(std::string_view chunk, const EventCallback& on_event) {
  for (char c : chunk) {
    if (skip_lf_) {
      skip_lf_ = false;
      if (c == '\n') continue;
    }

    if (c == '\r' || c == '\n') {
      skip_lf_ = (c == '\r');
      auto event = process_line(line_);
      line_.clear();
      if (event && on_event) on_event(*event);
      continue;
    }

    line_ += c;
  }
}

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
  std::vector<SseEvent> events;
  feed(chunk, [&events](const SseEvent& event) {
    events.push_back(event);
  });
  return events;
}

std::optional<SseEvent> SseParser::process_line(std::string_view line) {
  if (line.empty()) {
    return take_event();
  }

  // Comment
  if (line.front() == ':') {
    return std::nullopt;
  }

  std::string_view field = line;
  std::string_view value;

  auto colon = line.find(':');
  if (colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
  }

  if (field == "data") {
    if (data_) {
      *data_ += '\n';
      *data_ += value;
    } else {
      data_ = std::string(value);
    }
    has_fields_ = true;
  } else if (field == "event") {
    type_ = std::string(value);
    has_fields_ = true;
  } else if (field == "id") {
    // An id containing NUL is ignored
    if (value.find('\0') == std::string_view::npos) {
      id_ = std::string(value);
      has_fields_ = true;
    }
  } else if (field == "retry") {
    int64_t retry_ms = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), retry_ms);
    if (!value.empty() && ec == std::errc{} && ptr == value.data() + value.size() && retry_ms >= 0) {
      retry_ = retry_ms;
      has_fields_ = true;
    }
  }

  return std::nullopt;
}

std::optional<SseEvent> SseParser::take_event() {
  if (!has_fields_) {
    return std::nullopt;
  }

  SseEvent event;
  event.id = std::move(id_);
  event.type = std::move(type_);
  event.data = data_.value_or("");
  event.retry = retry_;

  id_.reset();
  type_.reset();
  data_.reset();
  retry_.reset();
  has_fields_ = false;

  return event;
}

void SseParser::reset() {
  line_.clear();
  skip_lf_ = false;
  id_.reset();
  type_.reset();
  data_.reset();
  retry_.reset();
  has_fields_ = false;
}

Result<SseEvent> SseParser::parse_frame(std::string_view frame) {
  SseParser parser;
  std::optional<SseEvent> result;

  parser.feed(frame, [&result](const SseEvent& event) {
    if (!result) result = event;
  });
  if (!result) {
    // Flush the last line and terminate the frame
    parser.feed("\n\n", [&result](const SseEvent& event) {
      if (!result) result = event;
    });
  }

  if (!result) {
    return Result<SseEvent>::failure("Frame contains no SSE field");
  }
  return Result<SseEvent>::success(std::move(*result));
}

}  // namespace ssebridge::net
