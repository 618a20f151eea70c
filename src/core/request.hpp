#pragma once

#include <optional>
#include <string>

#include "core/headers.hpp"
#include "core/types.hpp"

namespace ssebridge {

// Parameters of one SSE connection attempt.
//
// Validated on construction: a blank URL, or a POST without a body, throws
// std::invalid_argument. The value is immutable afterwards.
class SseRequest {
 public:
  SseRequest(std::string url, HttpMethod method = HttpMethod::Get, Headers headers = {}, std::optional<std::string> body = std::nullopt);

  static SseRequest get(std::string url, Headers headers = {});

  static SseRequest post(std::string url, std::string body, Headers headers = {});

  const std::string& url() const {
    return url_;
  }

  HttpMethod method() const {
    return method_;
  }

  const Headers& headers() const {
    return headers_;
  }

  const std::optional<std::string>& body() const {
    return body_;
  }

 private:
  std::string url_;
  HttpMethod method_;
  Headers headers_;
  std::optional<std::string> body_;
};

}  // namespace ssebridge
