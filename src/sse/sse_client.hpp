#pragma once

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

#include "core/config.hpp"
#include "core/lifecycle.hpp"
#include "core/request.hpp"
#include "core/types.hpp"
#include "net/http_client.hpp"
#include "net/interceptor.hpp"
#include "sse/listener.hpp"
#include "sse/state_machine.hpp"

namespace ssebridge {

// Server-Sent Events client.
//
// Runs at most one streaming call at a time and reports its progress to the registered
// listener. None of the public operations block; transport callbacks arrive on the engine's
// thread. When bound to a Lifecycle, destroying it disconnects the client and releases the
// listener, the transport client and the interceptors; no callback fires afterwards.
//
// There is no automatic reconnection: after a terminal state, call connect() again.
class SseClient : public std::enable_shared_from_this<SseClient> {
 public:
  // Client on the asio engine, driven by `io_ctx`
  static std::shared_ptr<SseClient> create(asio::io_context& io_ctx, const ClientConfig& config = ClientConfig{},
                                           std::shared_ptr<Lifecycle> lifecycle = nullptr);

  // Client on a caller-supplied engine
  static std::shared_ptr<SseClient> create(std::shared_ptr<net::HttpEngine> engine, const ClientConfig& config = ClientConfig{},
                                           std::shared_ptr<Lifecycle> lifecycle = nullptr);

  ~SseClient();

  SseClient(const SseClient&) = delete;
  SseClient& operator=(const SseClient&) = delete;

  // Starts a streaming call. Ignored while connecting or connected.
  void connect(const SseRequest& request);

  // Cancels the active call, if any. Safe to call at any time.
  void disconnect();

  // True while Connecting or Connected
  bool is_connecting() const {
    return state_.is_active();
  }

  ConnectionState state() const {
    return state_.state();
  }

  // Applies to callbacks dispatched from now on
  void set_event_listener(std::shared_ptr<SseEventListener> listener);

  // Appends a stage after the built-in logging and header stages.
  // Throws std::logic_error once the transport client has been built by the first connect().
  void add_interceptor(std::shared_ptr<net::Interceptor> interceptor);

  const ClientConfig& config() const {
    return config_;
  }

  // True once the bound lifecycle was destroyed (or released by its owner)
  bool is_destroyed() const;

 private:
  using AttemptId = ConnectionStateMachine::AttemptId;

  class AttemptListener;

  SseClient(std::shared_ptr<net::HttpEngine> engine, const ClientConfig& config, std::shared_ptr<Lifecycle> lifecycle);

  void bind_lifecycle();

  void teardown();

  // Null once torn down
  std::shared_ptr<net::HttpClient> http_client();

  std::shared_ptr<SseEventListener> listener() const;

  void handle_open(AttemptId attempt);

  void handle_event(AttemptId attempt, const SseEvent& event);

  void handle_closed(AttemptId attempt);

  void handle_failure(AttemptId attempt, const net::TransportError& error);

  // on_state_changed first, then the state's own callback
  void dispatch(ConnectionState state, const net::TransportError* error = nullptr);

  const ClientConfig config_;
  std::shared_ptr<net::HttpEngine> engine_;

  std::weak_ptr<Lifecycle> lifecycle_;
  bool lifecycle_bound_ = false;
  Lifecycle::ObserverId observer_id_ = 0;
  std::atomic<bool> torn_down_{false};

  ConnectionStateMachine state_;

  // Held across every listener call and by teardown(), so no callback starts or is still running
  // once teardown() returns. Recursive: a callback may disconnect or destroy the lifecycle.
  std::recursive_mutex dispatch_mutex_;

  mutable std::mutex mutex_;
  std::shared_ptr<net::HttpClient> http_client_;
  std::vector<std::shared_ptr<net::Interceptor>> interceptors_;
  std::shared_ptr<SseEventListener> listener_;
  std::shared_ptr<net::HttpCall> call_;
};

}  // namespace ssebridge
