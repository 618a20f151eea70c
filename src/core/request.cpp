#include "core/request.hpp"

#include <stdexcept>

namespace ssebridge {

SseRequest::SseRequest(std::string url, HttpMethod method, Headers headers, std::optional<std::string> body)
    : url_(std::move(url)), method_(method), headers_(std::move(headers)), body_(std::move(body)) {
  if (is_blank(url_)) {
    throw std::invalid_argument("URL cannot be blank");
  }
  if (method_ == HttpMethod::Post && !body_) {
    throw std::invalid_argument("Body is required for POST requests");
  }
}

SseRequest SseRequest::get(std::string url, Headers headers) {
  return SseRequest(std::move(url), HttpMethod::Get, std::move(headers));
}

SseRequest SseRequest::post(std::string url, std::string body, Headers headers) {
  return SseRequest(std::move(url), HttpMethod::Post, std::move(headers), std::move(body));
}

}  // namespace ssebridge
