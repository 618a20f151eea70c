#include "sse/sse_client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "net/asio_engine.hpp"
#include "net/request_builder.hpp"
#include "net/sse_parser.hpp"

namespace ssebridge {

// Per-attempt transport listener. Parses the body and forwards to the client, if it still exists.
class SseClient::AttemptListener : public net::StreamListener {
 public:
  AttemptListener(std::weak_ptr<SseClient> client, AttemptId attempt) : client_(std::move(client)), attempt_(attempt) {}

  void on_open(const net::HttpResponse& response) override {
    spdlog::debug("[SseClient] attempt {} opened: {} {}", attempt_, response.status_code, response.reason);
    if (auto client = client_.lock()) {
      client->handle_open(attempt_);
    }
  }

  void on_data(const std::string& chunk) override {
    auto client = client_.lock();
    if (!client) return;

    parser_.feed(chunk, [&](const SseEvent& event) { client->handle_event(attempt_, event); });
  }

  void on_closed() override {
    if (auto client = client_.lock()) {
      client->handle_closed(attempt_);
    }
  }

  void on_failure(const net::TransportError& error) override {
    if (auto client = client_.lock()) {
      client->handle_failure(attempt_, error);
    }
  }

 private:
  std::weak_ptr<SseClient> client_;
  AttemptId attempt_;
  net::SseParser parser_;
};

std::shared_ptr<SseClient> SseClient::create(asio::io_context& io_ctx, const ClientConfig& config, std::shared_ptr<Lifecycle> lifecycle) {
  return create(std::make_shared<net::AsioHttpEngine>(io_ctx), config, std::move(lifecycle));
}

std::shared_ptr<SseClient> SseClient::create(std::shared_ptr<net::HttpEngine> engine, const ClientConfig& config,
                                             std::shared_ptr<Lifecycle> lifecycle) {
  if (!engine) {
    throw std::invalid_argument("SseClient requires an engine");
  }
  config.validate();

  auto client = std::shared_ptr<SseClient>(new SseClient(std::move(engine), config, std::move(lifecycle)));
  client->bind_lifecycle();
  return client;
}

SseClient::SseClient(std::shared_ptr<net::HttpEngine> engine, const ClientConfig& config, std::shared_ptr<Lifecycle> lifecycle)
    : config_(config), engine_(std::move(engine)), lifecycle_(lifecycle), lifecycle_bound_(lifecycle != nullptr) {}

SseClient::~SseClient() {
  if (auto lifecycle = lifecycle_.lock()) {
    lifecycle->remove_observer(observer_id_);
  }

  std::shared_ptr<net::HttpCall> call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    call = std::move(call_);
  }
  if (call) call->cancel();
}

void SseClient::bind_lifecycle() {
  auto lifecycle = lifecycle_.lock();
  if (!lifecycle) return;

  std::weak_ptr<SseClient> weak = weak_from_this();
  observer_id_ = lifecycle->add_observer([weak]() {
    if (auto self = weak.lock()) {
      self->teardown();
    }
  });
}

bool SseClient::is_destroyed() const {
  if (torn_down_.load()) return true;
  if (!lifecycle_bound_) return false;

  auto lifecycle = lifecycle_.lock();
  return !lifecycle || lifecycle->is_destroyed();
}

void SseClient::connect(const SseRequest& request) {
  if (is_destroyed()) {
    spdlog::warn("[SseClient] connect ignored: lifecycle destroyed");
    return;
  }

  auto attempt = state_.begin_attempt();
  if (!attempt) {
    spdlog::debug("[SseClient] connect ignored: already {}", to_string(state_.state()));
    return;
  }

  spdlog::debug("[SseClient] attempt {}: {} {}", *attempt, to_string(request.method()), request.url());
  dispatch(ConnectionState::Connecting);

  // A listener may have destroyed the lifecycle while handling Connecting
  auto client = http_client();
  if (!client) {
    handle_failure(*attempt, net::TransportError::cancelled());
    return;
  }

  std::shared_ptr<net::HttpCall> call;
  try {
    call = client->stream(net::build_http_request(request), std::make_shared<AttemptListener>(weak_from_this(), *attempt));
  } catch (const std::exception& e) {
    spdlog::error("[SseClient] failed to start stream: {}", e.what());
    handle_failure(*attempt, net::TransportError{net::TransportError::Kind::Interceptor, e.what()});
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    call_ = call;
  }

  // disconnect() may have run before call_ was visible
  if (!state_.is_live(*attempt)) {
    call->cancel();
  }
}

void SseClient::disconnect() {
  std::shared_ptr<net::HttpCall> call;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    call = std::move(call_);
  }

  if (call) call->cancel();

  if (state_.cancel()) {
    spdlog::debug("[SseClient] disconnected");
    dispatch(ConnectionState::Cancelled);
  }
}

void SseClient::set_event_listener(std::shared_ptr<SseEventListener> listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void SseClient::add_interceptor(std::shared_ptr<net::Interceptor> interceptor) {
  if (!interceptor) {
    throw std::invalid_argument("Interceptor cannot be null");
  }
  if (is_destroyed()) {
    spdlog::warn("[SseClient] add_interceptor ignored: lifecycle destroyed");
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (http_client_) {
    throw std::logic_error("Interceptors must be added before the first connect()");
  }
  interceptors_.push_back(std::move(interceptor));
}

std::shared_ptr<net::HttpClient> SseClient::http_client() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (torn_down_) {
    return nullptr;
  }
  if (!http_client_) {
    std::vector<std::shared_ptr<net::Interceptor>> chain;
    chain.push_back(std::make_shared<net::LoggingInterceptor>(config_.enable_logging));
    chain.push_back(std::make_shared<net::HeaderInterceptor>());
    chain.insert(chain.end(), interceptors_.begin(), interceptors_.end());

    net::Timeouts timeouts;
    timeouts.connect = config_.connect_timeout_ms();
    timeouts.read = config_.read_timeout_ms();
    timeouts.write = config_.write_timeout_ms();

    http_client_ = std::make_shared<net::HttpClient>(engine_, timeouts, std::move(chain));
  }
  return http_client_;
}

std::shared_ptr<SseEventListener> SseClient::listener() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listener_;
}

void SseClient::handle_open(AttemptId attempt) {
  if (state_.transition(attempt, ConnectionState::Connected)) {
    dispatch(ConnectionState::Connected);
  }
}

void SseClient::handle_event(AttemptId attempt, const SseEvent& event) {
  std::lock_guard<std::recursive_mutex> guard(dispatch_mutex_);
  if (!state_.is_live(attempt) || is_destroyed()) return;

  if (auto l = listener()) {
    l->on_event(event);
  }
}

void SseClient::handle_closed(AttemptId attempt) {
  if (state_.transition(attempt, ConnectionState::Closed)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      call_.reset();
    }
    dispatch(ConnectionState::Closed);
  }
}

void SseClient::handle_failure(AttemptId attempt, const net::TransportError& error) {
  auto next = error.is_cancellation() ? ConnectionState::Cancelled : ConnectionState::Failed;
  if (!state_.transition(attempt, next)) {
    spdlog::debug("[SseClient] stale failure for attempt {} dropped: {}", attempt, error.message);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    call_.reset();
  }

  if (next == ConnectionState::Cancelled) {
    dispatch(next);
  } else {
    spdlog::warn("[SseClient] stream failed ({}): {}", net::to_string(error.kind), error.message);
    dispatch(next, &error);
  }
}

void SseClient::dispatch(ConnectionState state, const net::TransportError* error) {
  spdlog::debug("[SseClient] state -> {}", to_string(state));

  std::lock_guard<std::recursive_mutex> guard(dispatch_mutex_);
  auto l = listener();
  if (!l || is_destroyed()) return;

  l->on_state_changed(state);

  switch (state) {
    case ConnectionState::Connected:
      l->on_connected();
      break;
    case ConnectionState::Closed:
      l->on_closed();
      break;
    case ConnectionState::Failed:
      if (error) l->on_failure(*error);
      break;
    case ConnectionState::Cancelled:
      l->on_cancelled();
      break;
    case ConnectionState::Idle:
    case ConnectionState::Connecting:
      break;
  }
}

void SseClient::teardown() {
  if (torn_down_.exchange(true)) return;

  spdlog::debug("[SseClient] lifecycle destroyed, tearing down");

  // Waits for a callback in progress on another thread; later ones see torn_down_
  std::lock_guard<std::recursive_mutex> guard(dispatch_mutex_);
  disconnect();

  std::lock_guard<std::mutex> lock(mutex_);
  listener_.reset();
  http_client_.reset();
  interceptors_.clear();
  call_.reset();
}

}  // namespace ssebridge
