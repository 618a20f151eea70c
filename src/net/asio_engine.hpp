#pragma once

#include <asio.hpp>
#include <memory>
#include <string>
#include <string_view>

#include "net/http_client.hpp"

namespace ssebridge::net {

// HTTP/1.1 streaming engine on asio, with TLS through asio::ssl.
//
// Every call gets its own connection. Callbacks run on the threads driving `io_ctx`,
// serialised per call.
class AsioHttpEngine : public HttpEngine {
 public:
  // With `verify_peer`, the certificate chain and the host name are both checked. `ca_file` adds
  // trusted roots to the system defaults.
  explicit AsioHttpEngine(asio::io_context& io_ctx, bool verify_peer = true, const std::string& ca_file = "");

  ~AsioHttpEngine() override;

  std::shared_ptr<HttpCall> open_stream(const HttpRequest& request, const Timeouts& timeouts, std::shared_ptr<StreamListener> listener) override;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// Decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Appends decoded payload to `out`; returns false on malformed framing
  bool feed(std::string_view data, std::string& out);

  // True once the terminating zero-size chunk and trailers were consumed
  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  std::string line_;
  size_t remaining_ = 0;
};

}  // namespace ssebridge::net
