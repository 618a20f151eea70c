#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/headers.hpp"

namespace ssebridge::net {

// Transport-level request, produced from an SseRequest and rewritten by interceptors
struct HttpRequest {
  std::string method = "GET";
  std::string url;
  Headers headers;
  std::string body;
  std::string content_type;  // Sent as Content-Type when the body is non-empty or the method is POST
};

// Response head (status line + headers). For failed handshakes `body` holds the error body.
struct HttpResponse {
  int status_code = 0;
  std::string reason;
  Headers headers;
  std::string body;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

struct Timeouts {
  std::chrono::milliseconds connect{0};
  std::chrono::milliseconds read{0};
  std::chrono::milliseconds write{0};
};

struct TransportError {
  enum class Kind { InvalidUrl, Resolve, Connect, Handshake, Write, Read, Timeout, HttpStatus, InvalidResponse, StreamReset, Interceptor };

  Kind kind = Kind::Read;
  std::string message;
  int status_code = 0;

  // Stream reset by the local side with a cancellation signal
  bool is_cancellation() const;

  static TransportError cancelled();
};

std::string to_string(TransportError::Kind kind);

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

}  // namespace ssebridge::net
