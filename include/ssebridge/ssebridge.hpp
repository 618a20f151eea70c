#pragma once

#include <string>

// Core types
#include "core/config.hpp"
#include "core/event.hpp"
#include "core/headers.hpp"
#include "core/lifecycle.hpp"
#include "core/request.hpp"
#include "core/types.hpp"

// Logging
#include "log/log.h"

// Network
#include "net/asio_engine.hpp"
#include "net/http_client.hpp"
#include "net/interceptor.hpp"
#include "net/sse_parser.hpp"

// SSE client
#include "sse/listener.hpp"
#include "sse/sse_bridge.hpp"
#include "sse/sse_client.hpp"

namespace ssebridge {

// Get version string
std::string version();

}  // namespace ssebridge
