#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/event.hpp"
#include "core/types.hpp"

namespace ssebridge::net {

// Incremental parser for the text/event-stream format.
//
// Bytes may arrive in arbitrary chunks; lines end with LF, CRLF or CR. Fields `id`, `event`,
// `data` (joined with '\n') and `retry` accumulate until a blank line, which emits one event
// if any of them was seen. Comments and unknown fields are skipped. Never throws.
class SseParser {
 public:
  using EventCallback = std::function<void(const SseEvent& event)>;

  void feed(std::string_view chunk, const EventCallback& on_event);

  std::vector<SseEvent> feed(std::string_view chunk);

  // Processes one line without its terminator; returns the event a blank line completes
  std::optional<SseEvent> process_line(std::string_view line);

  // Drops any buffered partial line and half-built event
  void reset();

  // Parses one self-contained frame, e.g. "event: x\ndata: y". The trailing blank line is optional.
  static Result<SseEvent> parse_frame(std::string_view frame);

 private:
  std::optional<SseEvent> take_event();

  std::string line_;
  bool skip_lf_ = false;

  std::optional<std::string> id_;
  std::optional<std::string> type_;
  std::optional<std::string> data_;
  std::optional<int64_t> retry_;
  bool has_fields_ = false;
};

}  // namespace ssebridge::net
