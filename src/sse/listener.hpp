#pragma once

#include <functional>
#include <memory>

#include "core/event.hpp"
#include "core/types.hpp"
#include "net/http_types.hpp"

namespace ssebridge {

// Receives connection progress from an SseClient.
//
// Only on_event() must be implemented. Callbacks arrive on the transport's thread; a state
// change is always reported through on_state_changed() before the matching specific callback.
class SseEventListener {
 public:
  virtual ~SseEventListener() = default;

  virtual void on_state_changed(ConnectionState /*state*/) {}

  virtual void on_connected() {}

  virtual void on_event(const SseEvent& event) = 0;

  virtual void on_closed() {}

  virtual void on_failure(const net::TransportError& /*error*/) {}

  virtual void on_cancelled() {}
};

// Listener assembled from optional callbacks
class CallbackListener : public SseEventListener {
 public:
  std::function<void(ConnectionState)> state_changed;
  std::function<void()> connected;
  std::function<void(const SseEvent&)> event;
  std::function<void()> closed;
  std::function<void(const net::TransportError&)> failure;
  std::function<void()> cancelled;

  void on_state_changed(ConnectionState state) override {
    if (state_changed) state_changed(state);
  }

  void on_connected() override {
    if (connected) connected();
  }

  void on_event(const SseEvent& e) override {
    if (event) event(e);
  }

  void on_closed() override {
    if (closed) closed();
  }

  void on_failure(const net::TransportError& error) override {
    if (failure) failure(error);
  }

  void on_cancelled() override {
    if (cancelled) cancelled();
  }
};

}  // namespace ssebridge
