#include "net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ssebridge::net {

namespace {

// Applies the interceptors' response hooks before forwarding the response head
class HookedListener : public StreamListener {
 public:
  HookedListener(std::shared_ptr<StreamListener> inner, std::vector<ResponseHook> hooks) : inner_(std::move(inner)), hooks_(std::move(hooks)) {}

  void on_open(const HttpResponse& response) override {
    HttpResponse head = response;
    try {
      for (auto it = hooks_.rbegin(); it != hooks_.rend(); ++it) {
        (*it)(head);
      }
    } catch (const std::exception& e) {
      spdlog::error("Response interceptor failed: {}", e.what());
      inner_->on_failure(TransportError{TransportError::Kind::Interceptor, e.what(), response.status_code});
      return;
    }
    inner_->on_open(head);
  }

  void on_data(const std::string& chunk) override {
    inner_->on_data(chunk);
  }

  void on_closed() override {
    inner_->on_closed();
  }

  void on_failure(const TransportError& error) override {
    inner_->on_failure(error);
  }

 private:
  std::shared_ptr<StreamListener> inner_;
  std::vector<ResponseHook> hooks_;
};

}  // namespace

HttpClient::HttpClient(std::shared_ptr<HttpEngine> engine, Timeouts timeouts, std::vector<std::shared_ptr<Interceptor>> interceptors)
    : engine_(std::move(engine)), timeouts_(timeouts), interceptors_(std::move(interceptors)) {
  if (!engine_) {
    throw std::invalid_argument("HttpClient requires an engine");
  }
}

std::shared_ptr<HttpCall> HttpClient::stream(HttpRequest request, std::shared_ptr<StreamListener> listener) {
  std::shared_ptr<HttpCall> call;

  Chain chain(interceptors_, 0, std::move(request), [&](const HttpRequest& final_request, std::vector<ResponseHook> hooks) {
    std::shared_ptr<StreamListener> target = listener;
    if (!hooks.empty()) {
      target = std::make_shared<HookedListener>(listener, std::move(hooks));
    }
    call = engine_->open_stream(final_request, timeouts_, std::move(target));
  });

  try {
    chain.run();
  } catch (...) {
    // An interceptor threw after the call was opened
    if (call) call->cancel();
    throw;
  }

  if (!call) {
    throw std::logic_error("Interceptor chain finished without opening a call");
  }
  return call;
}

}  // namespace ssebridge::net
