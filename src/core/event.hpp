#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ssebridge {

// One dispatched Server-Sent Event
struct SseEvent {
  std::optional<std::string> id;
  std::optional<std::string> type;  // "event:" field; absent means the default "message"
  std::string data;
  std::optional<int64_t> retry;     // Reconnection hint in milliseconds, informational only

  bool operator==(const SseEvent& other) const = default;
};

}  // namespace ssebridge
