#include "net/interceptor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ssebridge::net {

Chain::Chain(const std::vector<std::shared_ptr<Interceptor>>& interceptors, size_t index, HttpRequest request, Terminal terminal,
             std::vector<ResponseHook> hooks)
    : interceptors_(interceptors), index_(index), request_(std::move(request)), terminal_(std::move(terminal)), hooks_(std::move(hooks)) {}

void Chain::run() {
  if (index_ >= interceptors_.size()) {
    terminal_(request_, std::move(hooks_));
    return;
  }

  interceptors_[index_]->intercept(*this);
  if (!proceeded_) {
    throw std::logic_error("Interceptor " + std::to_string(index_) + " returned without calling proceed()");
  }
}

void Chain::proceed(HttpRequest request, ResponseHook on_response) {
  if (proceeded_) {
    throw std::logic_error("Interceptor " + std::to_string(index_) + " called proceed() more than once");
  }
  proceeded_ = true;

  auto hooks = hooks_;
  if (on_response) {
    hooks.push_back(std::move(on_response));
  }

  Chain next(interceptors_, index_ + 1, std::move(request), terminal_, std::move(hooks));
  next.run();
}

std::shared_ptr<Interceptor> make_interceptor(std::function<void(Chain&)> fn) {
  return std::make_shared<FunctionInterceptor>(std::move(fn));
}

void LoggingInterceptor::intercept(Chain& chain) {
  if (!enabled_) {
    chain.proceed(chain.request());
    return;
  }

  const auto& request = chain.request();
  spdlog::info("[{}] --> {} {}", tag_, request.method, request.url);

  chain.proceed(request, [tag = tag_](HttpResponse& response) {
    spdlog::info("[{}] <-- {} {}", tag, response.status_code, response.reason);
  });
}

void HeaderInterceptor::intercept(Chain& chain) {
  HttpRequest request = chain.request();
  request.headers.set(kAccept, kEventStream);
  request.headers.set(kCacheControl, kNoCache);

  for (const auto& [key, value] : additional_headers_) {
    request.headers.set(key, value);
  }

  chain.proceed(std::move(request));
}

}  // namespace ssebridge::net
