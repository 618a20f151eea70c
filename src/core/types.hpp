#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ssebridge {

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Connection state. Idle is initial; Closed, Failed and Cancelled end an attempt.
enum class ConnectionState { Idle, Connecting, Connected, Closed, Failed, Cancelled };

std::string to_string(ConnectionState state);

inline bool is_terminal(ConnectionState state) {
  return state == ConnectionState::Closed || state == ConnectionState::Failed || state == ConnectionState::Cancelled;
}

inline bool is_active(ConnectionState state) {
  return state == ConnectionState::Connecting || state == ConnectionState::Connected;
}

// HTTP methods accepted for an SSE request
enum class HttpMethod { Get, Post };

std::string to_string(HttpMethod method);

// ASCII case-insensitive helpers, used for header names and error classification
bool iequals(std::string_view a, std::string_view b);

bool icontains(std::string_view haystack, std::string_view needle);

bool is_blank(std::string_view str);

}  // namespace ssebridge
