#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/headers.hpp"
#include "net/http_types.hpp"

namespace ssebridge::net {

// Inspects or rewrites the response head once it arrives
using ResponseHook = std::function<void(HttpResponse& response)>;

class Interceptor;

// One position in the interceptor pipeline.
//
// Each stage receives the current request and must call proceed() exactly once, passing the
// request the remaining stages should see. Hooks given to proceed() run when the response head
// arrives, innermost stage first. Not calling proceed(), or calling it twice, throws
// std::logic_error: short-circuiting is not supported.
class Chain {
 public:
  using Terminal = std::function<void(const HttpRequest& request, std::vector<ResponseHook> hooks)>;

  Chain(const std::vector<std::shared_ptr<Interceptor>>& interceptors, size_t index, HttpRequest request, Terminal terminal,
        std::vector<ResponseHook> hooks = {});

  const HttpRequest& request() const {
    return request_;
  }

  void proceed(HttpRequest request, ResponseHook on_response = nullptr);

  // Run this stage (or the terminal call when past the last interceptor)
  void run();

 private:
  const std::vector<std::shared_ptr<Interceptor>>& interceptors_;
  size_t index_;
  HttpRequest request_;
  Terminal terminal_;
  std::vector<ResponseHook> hooks_;
  bool proceeded_ = false;
};

class Interceptor {
 public:
  virtual ~Interceptor() = default;

  virtual void intercept(Chain& chain) = 0;
};

// Adapts a callable into an Interceptor
class FunctionInterceptor : public Interceptor {
 public:
  explicit FunctionInterceptor(std::function<void(Chain&)> fn) : fn_(std::move(fn)) {}

  void intercept(Chain& chain) override {
    fn_(chain);
  }

 private:
  std::function<void(Chain&)> fn_;
};

std::shared_ptr<Interceptor> make_interceptor(std::function<void(Chain&)> fn);

// Logs "--> METHOD url" and "<-- code reason". Does nothing when disabled.
class LoggingInterceptor : public Interceptor {
 public:
  explicit LoggingInterceptor(bool enabled = true, std::string tag = "SSEBridge") : enabled_(enabled), tag_(std::move(tag)) {}

  void intercept(Chain& chain) override;

  bool enabled() const {
    return enabled_;
  }

 private:
  bool enabled_;
  std::string tag_;
};

// Forces the headers every SSE request needs, plus any bound to this instance
class HeaderInterceptor : public Interceptor {
 public:
  static constexpr const char* kAccept = "Accept";
  static constexpr const char* kCacheControl = "Cache-Control";
  static constexpr const char* kEventStream = "text/event-stream";
  static constexpr const char* kNoCache = "no-cache";

  explicit HeaderInterceptor(Headers additional_headers = {}) : additional_headers_(std::move(additional_headers)) {}

  void intercept(Chain& chain) override;

 private:
  Headers additional_headers_;
};

}  // namespace ssebridge::net
