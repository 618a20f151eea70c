#pragma once

#include <asio.hpp>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/headers.hpp"
#include "core/lifecycle.hpp"
#include "core/request.hpp"
#include "net/interceptor.hpp"
#include "sse/listener.hpp"
#include "sse/sse_client.hpp"

namespace ssebridge {

struct SseBridgeOptions {
  ClientConfig config;
  std::shared_ptr<Lifecycle> lifecycle;
  std::shared_ptr<SseEventListener> listener;
  std::vector<std::shared_ptr<net::Interceptor>> interceptors;
};

// Convenience entry point: builds a configured SseClient and exposes the usual calls
class SseBridge {
 public:
  using Options = SseBridgeOptions;

  static std::shared_ptr<SseBridge> create(asio::io_context& io_ctx, Options options = {});

  static std::shared_ptr<SseBridge> create(std::shared_ptr<net::HttpEngine> engine, Options options = {});

  void connect_get(const std::string& url, const Headers& headers = {});

  // The body is sent as application/json
  void connect_post(const std::string& url, const std::string& body, const Headers& headers = {});

  void connect(const SseRequest& request);

  void disconnect();

  bool is_connecting() const;

  ConnectionState state() const;

  std::shared_ptr<SseClient> client() const {
    return client_;
  }

 private:
  explicit SseBridge(std::shared_ptr<SseClient> client) : client_(std::move(client)) {}

  static std::shared_ptr<SseBridge> wrap(std::shared_ptr<SseClient> client, Options& options);

  std::shared_ptr<SseClient> client_;
};

}  // namespace ssebridge
