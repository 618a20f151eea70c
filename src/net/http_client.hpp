#pragma once

#include <memory>
#include <string>
#include <vector>

#include "net/http_types.hpp"
#include "net/interceptor.hpp"

namespace ssebridge::net {

// Progress of one streaming call, delivered on the engine's thread.
// After on_closed() or on_failure() nothing else is delivered.
class StreamListener {
 public:
  virtual ~StreamListener() = default;

  virtual void on_open(const HttpResponse& response) = 0;

  virtual void on_data(const std::string& chunk) = 0;

  virtual void on_closed() = 0;

  virtual void on_failure(const TransportError& error) = 0;
};

// Handle to an in-flight call
class HttpCall {
 public:
  virtual ~HttpCall() = default;

  // Thread-safe. The listener later sees on_failure(TransportError::cancelled()) unless the
  // call had already finished.
  virtual void cancel() = 0;

  virtual bool is_cancelled() const = 0;
};

// The underlying HTTP engine. Owns sockets, TLS and low-level I/O.
class HttpEngine {
 public:
  virtual ~HttpEngine() = default;

  // Must not block and must not call `listener` before returning
  virtual std::shared_ptr<HttpCall> open_stream(const HttpRequest& request, const Timeouts& timeouts,
                                                std::shared_ptr<StreamListener> listener) = 0;
};

// Engine plus timeouts plus an ordered interceptor pipeline
class HttpClient {
 public:
  HttpClient(std::shared_ptr<HttpEngine> engine, Timeouts timeouts, std::vector<std::shared_ptr<Interceptor>> interceptors);

  // Runs the interceptors on the calling thread, then hands the final request to the engine.
  // Throws std::logic_error when an interceptor breaks the proceed-once contract.
  std::shared_ptr<HttpCall> stream(HttpRequest request, std::shared_ptr<StreamListener> listener);

  const Timeouts& timeouts() const {
    return timeouts_;
  }

  const std::vector<std::shared_ptr<Interceptor>>& interceptors() const {
    return interceptors_;
  }

 private:
  std::shared_ptr<HttpEngine> engine_;
  Timeouts timeouts_;
  std::vector<std::shared_ptr<Interceptor>> interceptors_;
};

}  // namespace ssebridge::net
