#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>

#include "fake_http_engine.hpp"
#include "sse/sse_client.hpp"

using namespace ssebridge;
using ssebridge::testing::FakeHttpEngine;
using ssebridge::testing::RecordingListener;

class SseClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine_ = std::make_shared<FakeHttpEngine>();
    listener_ = std::make_shared<RecordingListener>();
    client_ = SseClient::create(engine_);
    client_->set_event_listener(listener_);
  }

  std::shared_ptr<FakeHttpEngine> engine_;
  std::shared_ptr<RecordingListener> listener_;
  std::shared_ptr<SseClient> client_;
};

TEST_F(SseClientTest, StartsIdle) {
  EXPECT_EQ(client_->state(), ConnectionState::Idle);
  EXPECT_FALSE(client_->is_connecting());
  EXPECT_FALSE(client_->is_destroyed());
}

TEST_F(SseClientTest, FullStreamLifecycle) {
  client_->connect(SseRequest::get("http://localhost/events"));
  EXPECT_EQ(client_->state(), ConnectionState::Connecting);
  EXPECT_TRUE(client_->is_connecting());

  auto call = engine_->last_call();
  ASSERT_NE(call, nullptr);
  call->open();
  EXPECT_EQ(client_->state(), ConnectionState::Connected);

  call->data("event: msg\ndata: one\n\n");
  call->data("data: two\n");
  call->data("\n");
  call->close();

  EXPECT_EQ(client_->state(), ConnectionState::Closed);
  EXPECT_EQ(listener_->log, (std::vector<std::string>{"state:connecting", "state:connected", "connected", "event:one", "event:two",
                                                      "state:closed", "closed"}));
  ASSERT_EQ(listener_->events.size(), 2u);
  EXPECT_EQ(listener_->events[0].type, "msg");
}

TEST_F(SseClientTest, RequestCarriesSseHeadersAndTimeouts) {
  client_->connect(SseRequest::post("http://localhost/chat", "{\"q\":1}", {{"Authorization", "Bearer t"}}));

  auto call = engine_->last_call();
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->request.method, "POST");
  EXPECT_EQ(call->request.body, "{\"q\":1}");
  EXPECT_EQ(call->request.content_type, "application/json; charset=utf-8");
  EXPECT_EQ(call->request.headers.get("Accept"), "text/event-stream");
  EXPECT_EQ(call->request.headers.get("Cache-Control"), "no-cache");
  EXPECT_EQ(call->request.headers.get("Authorization"), "Bearer t");

  // 默认超时：1/2/1 分钟
  EXPECT_EQ(call->timeouts.connect, std::chrono::minutes(1));
  EXPECT_EQ(call->timeouts.read, std::chrono::minutes(2));
  EXPECT_EQ(call->timeouts.write, std::chrono::minutes(1));
}

TEST_F(SseClientTest, ConnectWhileActiveIsIgnored) {
  client_->connect(SseRequest::get("http://localhost/a"));
  client_->connect(SseRequest::get("http://localhost/b"));
  engine_->last_call()->open();
  client_->connect(SseRequest::get("http://localhost/c"));

  ASSERT_EQ(engine_->calls.size(), 1u);
  EXPECT_EQ(engine_->last_call()->request.url, "http://localhost/a");
}

TEST_F(SseClientTest, ReconnectAfterTerminalState) {
  client_->connect(SseRequest::get("http://localhost/a"));
  engine_->last_call()->fail({net::TransportError::Kind::Connect, "connection refused"});
  EXPECT_EQ(client_->state(), ConnectionState::Failed);

  client_->connect(SseRequest::get("http://localhost/b"));
  EXPECT_EQ(engine_->calls.size(), 2u);
  EXPECT_EQ(client_->state(), ConnectionState::Connecting);
}

TEST_F(SseClientTest, DisconnectWhenIdleIsNoop) {
  client_->disconnect();

  EXPECT_EQ(client_->state(), ConnectionState::Idle);
  EXPECT_TRUE(listener_->log.empty());
}

TEST_F(SseClientTest, DisconnectCancelsAndSuppressesLateCallbacks) {
  client_->connect(SseRequest::get("http://localhost/events"));
  auto call = engine_->last_call();
  call->open();

  client_->disconnect();
  EXPECT_EQ(client_->state(), ConnectionState::Cancelled);
  EXPECT_TRUE(call->is_cancelled());

  // The transport reports the cancellation afterwards, plus any data still in flight
  call->data("data: late\n\n");
  call->fail(net::TransportError::cancelled());
  call->fail({net::TransportError::Kind::Read, "socket closed"});

  EXPECT_EQ(client_->state(), ConnectionState::Cancelled);
  EXPECT_TRUE(listener_->events.empty());
  EXPECT_TRUE(listener_->failures.empty());
  EXPECT_EQ(listener_->log,
            (std::vector<std::string>{"state:connecting", "state:connected", "connected", "state:cancelled", "cancelled"}));
}

TEST_F(SseClientTest, DisconnectWhileConnecting) {
  client_->connect(SseRequest::get("http://localhost/events"));
  client_->disconnect();
  client_->disconnect();

  EXPECT_EQ(client_->state(), ConnectionState::Cancelled);
  EXPECT_EQ(engine_->last_call()->cancel_count, 1);

  engine_->last_call()->open();
  EXPECT_EQ(client_->state(), ConnectionState::Cancelled);
}

TEST_F(SseClientTest, TransportCancellationMapsToCancelled) {
  client_->connect(SseRequest::get("http://localhost/events"));
  engine_->last_call()->fail({net::TransportError::Kind::StreamReset, "stream was reset: CANCEL"});

  EXPECT_EQ(client_->state(), ConnectionState::Cancelled);
  EXPECT_TRUE(listener_->failures.empty());
  EXPECT_EQ(listener_->log.back(), "cancelled");
}

TEST_F(SseClientTest, OtherStreamResetIsFailure) {
  client_->connect(SseRequest::get("http://localhost/events"));
  engine_->last_call()->fail({net::TransportError::Kind::StreamReset, "stream was reset: PROTOCOL_ERROR"});

  EXPECT_EQ(client_->state(), ConnectionState::Failed);
  ASSERT_EQ(listener_->failures.size(), 1u);
  EXPECT_EQ(listener_->failures[0].message, "stream was reset: PROTOCOL_ERROR");
}

TEST_F(SseClientTest, HttpErrorReportedAsFailure) {
  client_->connect(SseRequest::get("http://localhost/events"));
  engine_->last_call()->fail({net::TransportError::Kind::HttpStatus, "HTTP 401 Unauthorized", 401});

  EXPECT_EQ(client_->state(), ConnectionState::Failed);
  ASSERT_EQ(listener_->failures.size(), 1u);
  EXPECT_EQ(listener_->failures[0].status_code, 401);
  EXPECT_EQ(listener_->log, (std::vector<std::string>{"state:connecting", "state:failed", "failure"}));
}

TEST_F(SseClientTest, ThrowingInterceptorFailsAttempt) {
  client_->add_interceptor(net::make_interceptor([](net::Chain&) {
    throw std::runtime_error("no token");
  }));

  client_->connect(SseRequest::get("http://localhost/events"));

  EXPECT_TRUE(engine_->calls.empty());
  EXPECT_EQ(client_->state(), ConnectionState::Failed);
  ASSERT_EQ(listener_->failures.size(), 1u);
  EXPECT_EQ(listener_->failures[0].kind, net::TransportError::Kind::Interceptor);
  EXPECT_EQ(listener_->failures[0].message, "no token");
}

TEST_F(SseClientTest, UserInterceptorsRunInAppendOrderAfterBuiltins) {
  std::vector<std::string> order;
  std::optional<std::string> accept_seen;
  std::optional<std::string> api_key_seen;

  client_->add_interceptor(net::make_interceptor([&](net::Chain& chain) {
    order.push_back("first");
    accept_seen = chain.request().headers.get("Accept");
    auto req = chain.request();
    req.headers.set("X-Api-Key", "k");
    chain.proceed(std::move(req));
  }));
  client_->add_interceptor(net::make_interceptor([&](net::Chain& chain) {
    order.push_back("second");
    api_key_seen = chain.request().headers.get("X-Api-Key");
    auto req = chain.request();
    req.headers.set("X-Trace-Id", "t-1");
    chain.proceed(std::move(req));
  }));

  client_->connect(SseRequest::get("http://localhost/events", {{"X-Caller", "c"}}));

  EXPECT_EQ(order, (std::vector<std::string>{"first", "second"}));
  // 内置的 header 拦截器先于用户拦截器执行
  EXPECT_EQ(accept_seen, "text/event-stream");
  EXPECT_EQ(api_key_seen, "k");

  const auto& sent = engine_->last_call()->request.headers;
  EXPECT_EQ(sent.get("Accept"), "text/event-stream");
  EXPECT_EQ(sent.get("Cache-Control"), "no-cache");
  EXPECT_EQ(sent.get("X-Caller"), "c");
  EXPECT_EQ(sent.get("X-Api-Key"), "k");
  EXPECT_EQ(sent.get("X-Trace-Id"), "t-1");
}

TEST_F(SseClientTest, AddInterceptorAfterConnectThrows) {
  client_->connect(SseRequest::get("http://localhost/events"));
  EXPECT_THROW(client_->add_interceptor(net::make_interceptor([](net::Chain& c) { c.proceed(c.request()); })), std::logic_error);
  EXPECT_THROW(client_->add_interceptor(nullptr), std::invalid_argument);
}

TEST_F(SseClientTest, ListenerSwapAppliesToLaterCallbacks) {
  client_->connect(SseRequest::get("http://localhost/events"));
  auto second = std::make_shared<RecordingListener>();
  client_->set_event_listener(second);

  engine_->last_call()->open();
  engine_->last_call()->data("data: x\n\n");

  EXPECT_EQ(listener_->log, (std::vector<std::string>{"state:connecting"}));
  EXPECT_EQ(second->log, (std::vector<std::string>{"state:connected", "connected", "event:x"}));
}

TEST_F(SseClientTest, NoListenerIsHarmless) {
  client_->set_event_listener(nullptr);
  client_->connect(SseRequest::get("http://localhost/events"));
  engine_->last_call()->open();
  engine_->last_call()->data("data: x\n\n");
  engine_->last_call()->close();

  EXPECT_EQ(client_->state(), ConnectionState::Closed);
}

TEST_F(SseClientTest, StaleAttemptEventsDropped) {
  client_->connect(SseRequest::get("http://localhost/a"));
  auto first = engine_->last_call();
  client_->disconnect();

  client_->connect(SseRequest::get("http://localhost/b"));
  auto second = engine_->last_call();
  ASSERT_NE(first, second);

  first->open();
  first->data("data: stale\n\n");
  first->close();
  EXPECT_EQ(client_->state(), ConnectionState::Connecting);

  second->open();
  second->data("data: fresh\n\n");
  ASSERT_EQ(listener_->events.size(), 1u);
  EXPECT_EQ(listener_->events[0].data, "fresh");
}

TEST_F(SseClientTest, NegativeConfigRejected) {
  ClientConfig config;
  config.connect_timeout = -5;
  EXPECT_THROW(SseClient::create(engine_, config), std::invalid_argument);
  EXPECT_THROW(SseClient::create(std::shared_ptr<net::HttpEngine>{}), std::invalid_argument);
}

TEST_F(SseClientTest, CustomTimeoutsReachEngine) {
  ClientConfig config;
  config.connect_timeout = 500;
  config.read_timeout = 0;
  config.write_timeout = 250;
  config.time_unit = TimeUnit::Milliseconds;
  auto client = SseClient::create(engine_, config);

  client->connect(SseRequest::get("http://localhost/events"));
  auto call = engine_->last_call();
  EXPECT_EQ(call->timeouts.connect, std::chrono::milliseconds(500));
  EXPECT_EQ(call->timeouts.read, std::chrono::milliseconds(0));
  EXPECT_EQ(call->timeouts.write, std::chrono::milliseconds(250));
}

// --- SseClientLifecycleTest ---

TEST(SseClientLifecycleTest, DestroyCancelsAndSilencesClient) {
  auto engine = std::make_shared<FakeHttpEngine>();
  auto listener = std::make_shared<RecordingListener>();
  auto lifecycle = std::make_shared<Lifecycle>();
  auto client = SseClient::create(engine, ClientConfig{}, lifecycle);
  client->set_event_listener(listener);

  client->connect(SseRequest::get("http://localhost/events"));
  auto call = engine->last_call();
  call->open();

  lifecycle->destroy();
  EXPECT_TRUE(client->is_destroyed());
  EXPECT_TRUE(call->is_cancelled());
  EXPECT_EQ(client->state(), ConnectionState::Cancelled);

  call->data("data: after\n\n");
  call->fail(net::TransportError::cancelled());
  client->connect(SseRequest::get("http://localhost/events"));

  EXPECT_EQ(engine->calls.size(), 1u);
  EXPECT_TRUE(listener->events.empty());
  EXPECT_EQ(listener->log, (std::vector<std::string>{"state:connecting", "state:connected", "connected"}));

  // Listener is released
  EXPECT_EQ(listener.use_count(), 1);
}

TEST(SseClientLifecycleTest, CreatedAfterDestroyIsInert) {
  auto engine = std::make_shared<FakeHttpEngine>();
  auto lifecycle = std::make_shared<Lifecycle>();
  lifecycle->destroy();

  auto client = SseClient::create(engine, ClientConfig{}, lifecycle);
  EXPECT_TRUE(client->is_destroyed());

  client->connect(SseRequest::get("http://localhost/events"));
  EXPECT_TRUE(engine->calls.empty());
  EXPECT_EQ(client->state(), ConnectionState::Idle);
}

TEST(SseClientLifecycleTest, ReleasedLifecycleTearsDownClient) {
  auto engine = std::make_shared<FakeHttpEngine>();
  auto listener = std::make_shared<RecordingListener>();
  auto lifecycle = std::make_shared<Lifecycle>();
  auto client = SseClient::create(engine, ClientConfig{}, lifecycle);
  client->set_event_listener(listener);

  client->connect(SseRequest::get("http://localhost/events"));
  auto call = engine->last_call();
  call->open();

  // 所有者直接释放 lifecycle，未调用 destroy()
  lifecycle.reset();

  EXPECT_TRUE(client->is_destroyed());
  EXPECT_TRUE(call->is_cancelled());
  EXPECT_EQ(client->state(), ConnectionState::Cancelled);
  EXPECT_FALSE(client->is_connecting());
  EXPECT_EQ(listener.use_count(), 1);

  call->data("data: x\n\n");
  EXPECT_TRUE(listener->events.empty());
}

TEST(SseClientLifecycleTest, DestroyDuringConnectingOpensNoCall) {
  auto engine = std::make_shared<FakeHttpEngine>();
  auto lifecycle = std::make_shared<Lifecycle>();
  auto client = SseClient::create(engine, ClientConfig{}, lifecycle);

  auto listener = std::make_shared<CallbackListener>();
  listener->state_changed = [&lifecycle](ConnectionState state) {
    if (state == ConnectionState::Connecting) lifecycle->destroy();
  };
  client->set_event_listener(listener);

  client->connect(SseRequest::get("http://localhost/events"));

  EXPECT_TRUE(engine->calls.empty());
  EXPECT_EQ(client->state(), ConnectionState::Cancelled);
  EXPECT_TRUE(client->is_destroyed());
}

TEST(SseClientLifecycleTest, NoEventAfterConcurrentDestroyReturns) {
  for (int round = 0; round < 100; ++round) {
    auto engine = std::make_shared<FakeHttpEngine>();
    auto lifecycle = std::make_shared<Lifecycle>();
    auto client = SseClient::create(engine, ClientConfig{}, lifecycle);

    std::atomic<bool> destroy_returned{false};
    std::atomic<int> late_events{0};
    auto listener = std::make_shared<CallbackListener>();
    listener->event = [&](const SseEvent&) {
      if (destroy_returned.load()) ++late_events;
    };
    client->set_event_listener(listener);

    client->connect(SseRequest::get("http://localhost/events"));
    auto call = engine->last_call();
    call->open();

    std::thread transport([call]() {
      for (int i = 0; i < 200; ++i) {
        call->data("data: tick\n\n");
      }
    });

    lifecycle->destroy();
    destroy_returned = true;
    transport.join();

    ASSERT_EQ(late_events.load(), 0) << "round " << round;
  }
}

TEST(SseClientLifecycleTest, ClientWithoutLifecycleNeverDestroyed) {
  auto client = SseClient::create(std::make_shared<FakeHttpEngine>());
  EXPECT_FALSE(client->is_destroyed());
}

TEST(SseClientLifecycleTest, DroppingClientCancelsCall) {
  auto engine = std::make_shared<FakeHttpEngine>();
  auto client = SseClient::create(engine);
  client->connect(SseRequest::get("http://localhost/events"));
  auto call = engine->last_call();

  client.reset();
  EXPECT_TRUE(call->is_cancelled());

  // Callbacks after the client is gone are dropped
  call->open();
  call->fail(net::TransportError::cancelled());
}
