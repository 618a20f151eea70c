#pragma once

#include "core/request.hpp"
#include "net/http_types.hpp"

namespace ssebridge::net {

// POST bodies are always labelled JSON, whatever they contain
inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";

// Turns a validated SseRequest into the request handed to the interceptor chain.
// Accept/Cache-Control are added later by HeaderInterceptor.
HttpRequest build_http_request(const SseRequest& request);

}  // namespace ssebridge::net
