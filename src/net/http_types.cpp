#include "net/http_types.hpp"

#include <cctype>
#include <regex>

#include "core/types.hpp"

namespace ssebridge::net {

bool TransportError::is_cancellation() const {
  return kind == Kind::StreamReset && icontains(message, "cancel");
}

TransportError TransportError::cancelled() {
  return TransportError{Kind::StreamReset, "stream was reset: CANCEL", 0};
}

std::string to_string(TransportError::Kind kind) {
  using Kind = TransportError::Kind;
  switch (kind) {
    case Kind::InvalidUrl:
      return "invalid_url";
    case Kind::Resolve:
      return "resolve";
    case Kind::Connect:
      return "connect";
    case Kind::Handshake:
      return "handshake";
    case Kind::Write:
      return "write";
    case Kind::Read:
      return "read";
    case Kind::Timeout:
      return "timeout";
    case Kind::HttpStatus:
      return "http_status";
    case Kind::InvalidResponse:
      return "invalid_response";
    case Kind::StreamReset:
      return "stream_reset";
    case Kind::Interceptor:
      return "interceptor";
  }
  return "unknown";
}

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  static const std::regex url_regex(R"(^(https?):\/\/([^:\/\s\?]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?$)", std::regex::icase);
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  for (auto& c : result.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

}  // namespace ssebridge::net
