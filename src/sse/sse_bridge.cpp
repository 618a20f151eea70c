#include "sse/sse_bridge.hpp"

namespace ssebridge {

std::shared_ptr<SseBridge> SseBridge::create(asio::io_context& io_ctx, Options options) {
  auto client = SseClient::create(io_ctx, options.config, options.lifecycle);
  return wrap(std::move(client), options);
}

std::shared_ptr<SseBridge> SseBridge::create(std::shared_ptr<net::HttpEngine> engine, Options options) {
  auto client = SseClient::create(std::move(engine), options.config, options.lifecycle);
  return wrap(std::move(client), options);
}

std::shared_ptr<SseBridge> SseBridge::wrap(std::shared_ptr<SseClient> client, Options& options) {
  if (options.listener) {
    client->set_event_listener(std::move(options.listener));
  }
  for (auto& interceptor : options.interceptors) {
    client->add_interceptor(std::move(interceptor));
  }
  return std::shared_ptr<SseBridge>(new SseBridge(std::move(client)));
}

void SseBridge::connect_get(const std::string& url, const Headers& headers) {
  client_->connect(SseRequest::get(url, headers));
}

void SseBridge::connect_post(const std::string& url, const std::string& body, const Headers& headers) {
  client_->connect(SseRequest::post(url, body, headers));
}

void SseBridge::connect(const SseRequest& request) {
  client_->connect(request);
}

void SseBridge::disconnect() {
  client_->disconnect();
}

bool SseBridge::is_connecting() const {
  return client_->is_connecting();
}

ConnectionState SseBridge::state() const {
  return client_->state();
}

}  // namespace ssebridge
