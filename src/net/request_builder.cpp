#include "net/request_builder.hpp"

namespace ssebridge::net {

HttpRequest build_http_request(const SseRequest& request) {
  HttpRequest result;
  result.method = to_string(request.method());
  result.url = request.url();

  for (const auto& [key, value] : request.headers()) {
    result.headers.add(key, value);
  }

  if (request.method() == HttpMethod::Post) {
    result.body = request.body().value_or("");
    result.content_type = kJsonContentType;
  }

  return result;
}

}  // namespace ssebridge::net
