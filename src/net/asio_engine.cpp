#include "net/asio_engine.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <asio/ssl.hpp>
#include <atomic>
#include <charconv>
#include <regex>
#include <sstream>
#include <type_traits>

#include "core/types.hpp"

namespace ssebridge::net {

bool ChunkedDecoder::feed(std::string_view data, std::string& out) {
  size_t i = 0;
  while (i < data.size()) {
    switch (state_) {
      case State::Size: {
        char c = data[i++];
        if (c != '\n') {
          line_ += c;
          if (line_.size() > 1024) return false;
          break;
        }

        std::string_view size_str = line_;
        auto ext = size_str.find(';');
        if (ext != std::string_view::npos) size_str = size_str.substr(0, ext);
        while (!size_str.empty() && (size_str.back() == '\r' || size_str.back() == ' ' || size_str.back() == '\t')) size_str.remove_suffix(1);
        while (!size_str.empty() && (size_str.front() == ' ' || size_str.front() == '\t')) size_str.remove_prefix(1);
        if (size_str.empty()) return false;

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), size, 16);
        if (ec != std::errc{} || ptr != size_str.data() + size_str.size()) return false;

        line_.clear();
        remaining_ = size;
        state_ = size == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        size_t n = std::min(remaining_, data.size() - i);
        out.append(data.substr(i, n));
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        char c = data[i++];
        if (c == '\r') break;
        if (c != '\n') return false;
        state_ = State::Size;
        break;
      }
      case State::Trailer: {
        char c = data[i++];
        if (c != '\n') {
          line_ += c;
          break;
        }
        // Trailer headers are ignored; an empty line ends the body
        if (line_.empty() || line_ == "\r") state_ = State::Done;
        line_.clear();
        break;
      }
      case State::Done:
        return true;
    }
  }
  return true;
}

namespace {

using TcpSocket = asio::ip::tcp::socket;
using SslSocket = asio::ssl::stream<asio::ip::tcp::socket>;
using Strand = asio::strand<asio::io_context::executor_type>;
using Kind = TransportError::Kind;

bool is_eof(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

std::string trim(const std::string& str) {
  auto begin = str.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(begin, end - begin + 1);
}

std::string serialize_request(const HttpRequest& request, const ParsedUrl& url) {
  std::ostringstream req;
  req << request.method << " " << url.path << url.query << " HTTP/1.1\r\n";

  if (!request.headers.contains("Host")) {
    req << "Host: " << url.host;
    if (!url.port.empty()) req << ":" << url.port;
    req << "\r\n";
  }

  for (const auto& [key, value] : request.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!request.content_type.empty() && !request.headers.contains("Content-Type")) {
    req << "Content-Type: " << request.content_type << "\r\n";
  }
  if (!request.body.empty() || request.method == "POST") {
    req << "Content-Length: " << request.body.size() << "\r\n";
  }
  if (!request.headers.contains("Connection")) {
    req << "Connection: keep-alive\r\n";
  }

  req << "\r\n";
  req << request.body;
  return req.str();
}

// One streaming exchange on its own connection. All handlers run on `strand_`.
template <typename Socket>
class StreamSession : public HttpCall, public std::enable_shared_from_this<StreamSession<Socket>> {
 public:
  StreamSession(Strand strand, std::shared_ptr<Socket> socket, ParsedUrl url, std::string request, Timeouts timeouts,
                std::shared_ptr<StreamListener> listener)
      : strand_(strand),
        socket_(std::move(socket)),
        resolver_(strand),
        timer_(strand),
        url_(std::move(url)),
        request_(std::move(request)),
        timeouts_(timeouts),
        listener_(std::move(listener)) {}

  void start() {
    asio::post(strand_, [self = this->shared_from_this()] {
      self->resolve();
    });
  }

  void cancel() override {
    if (cancelled_.exchange(true)) return;
    asio::post(strand_, [self = this->shared_from_this()] {
      self->fail(TransportError::cancelled());
    });
  }

  bool is_cancelled() const override {
    return cancelled_;
  }

 private:
  enum class BodyMode { UntilEof, ContentLength, Chunked };

  void resolve() {
    if (finished_ || cancelled_) return;
    arm_timer(timeouts_.connect, "Connect");

    resolver_.async_resolve(url_.host, url_.port_or_default(),
                            [self = this->shared_from_this()](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                              if (self->stopped(ec, Kind::Resolve, "DNS resolution failed")) return;
                              self->connect(results);
                            });
  }

  void connect(const asio::ip::tcp::resolver::results_type& results) {
    asio::async_connect(socket_->lowest_layer(), results, [self = this->shared_from_this()](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
      if (self->stopped(ec, Kind::Connect, "Connection failed")) return;
      if constexpr (std::is_same_v<Socket, SslSocket>) {
        self->handshake();
      } else {
        self->write();
      }
    });
  }

  void handshake() {
    if constexpr (std::is_same_v<Socket, SslSocket>) {
      socket_->async_handshake(asio::ssl::stream_base::client, [self = this->shared_from_this()](const asio::error_code& ec) {
        if (self->stopped(ec, Kind::Handshake, "SSL handshake failed")) return;
        self->write();
      });
    }
  }

  void write() {
    arm_timer(timeouts_.write, "Write");
    asio::async_write(*socket_, asio::buffer(request_), [self = this->shared_from_this()](const asio::error_code& ec, size_t) {
      if (self->stopped(ec, Kind::Write, "Write failed")) return;
      self->read_head();
    });
  }

  void read_head() {
    arm_timer(timeouts_.read, "Read");
    asio::async_read_until(*socket_, buffer_, "\r\n\r\n", [self = this->shared_from_this()](const asio::error_code& ec, size_t) {
      if (self->stopped(ec, Kind::Read, "Read headers failed")) return;
      self->handle_head();
    });
  }

  void handle_head() {
    std::istream stream(&buffer_);
    std::string status_line;
    std::getline(stream, status_line);
    if (!status_line.empty() && status_line.back() == '\r') status_line.pop_back();

    static const std::regex status_regex(R"(^HTTP/[\d.]+ (\d{3})(?: (.*))?$)");
    std::smatch match;
    if (!std::regex_match(status_line, match, status_regex)) {
      fail({Kind::InvalidResponse, "Invalid HTTP response: " + status_line, 0});
      return;
    }
    head_.status_code = std::stoi(match[1].str());
    head_.reason = match[2].str();

    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
      auto colon = header_line.find(':');
      if (colon == std::string::npos) continue;
      head_.headers.add(trim(header_line.substr(0, colon)), trim(header_line.substr(colon + 1)));
    }

    if (!head_.ok()) {
      head_.body = drain();
      std::string message = "HTTP error " + std::to_string(head_.status_code);
      if (!head_.reason.empty()) message += " " + head_.reason;
      if (!head_.body.empty()) message += ": " + head_.body;
      fail({Kind::HttpStatus, message, head_.status_code});
      return;
    }

    auto content_type = head_.headers.get("Content-Type");
    if (content_type && !icontains(*content_type, "text/event-stream")) {
      fail({Kind::InvalidResponse, "Invalid content-type: " + *content_type, head_.status_code});
      return;
    }

    auto transfer_encoding = head_.headers.get("Transfer-Encoding");
    auto content_length = head_.headers.get("Content-Length");
    if (transfer_encoding && icontains(*transfer_encoding, "chunked")) {
      mode_ = BodyMode::Chunked;
    } else if (content_length) {
      const char* end = content_length->data() + content_length->size();
      auto [ptr, ec] = std::from_chars(content_length->data(), end, remaining_);
      if (ec != std::errc{} || ptr != end) {
        fail({Kind::InvalidResponse, "Invalid Content-Length: " + *content_length, head_.status_code});
        return;
      }
      mode_ = BodyMode::ContentLength;
    }

    listener_->on_open(head_);
    if (finished_ || cancelled_) return;

    if (mode_ == BodyMode::ContentLength && remaining_ == 0) {
      finish();
      return;
    }

    auto leftover = drain();
    if (!leftover.empty() && !deliver(leftover)) return;
    read_body();
  }

  void read_body() {
    arm_timer(timeouts_.read, "Read");
    asio::async_read(*socket_, buffer_, asio::transfer_at_least(1), [self = this->shared_from_this()](const asio::error_code& ec, size_t) {
      if (self->finished_ || self->cancelled_) return;

      auto data = self->drain();
      if (!data.empty() && !self->deliver(data)) return;

      if (!ec) {
        self->read_body();
        return;
      }
      if (is_eof(ec) && !self->timed_out_) {
        self->finish();
        return;
      }
      self->stopped(ec, Kind::Read, "Read failed");
    });
  }

  // Passes body bytes on; returns false once the call has finished
  bool deliver(const std::string& raw) {
    switch (mode_) {
      case BodyMode::UntilEof:
        listener_->on_data(raw);
        break;
      case BodyMode::ContentLength: {
        auto n = std::min(remaining_, raw.size());
        remaining_ -= n;
        if (n > 0) listener_->on_data(raw.substr(0, n));
        if (remaining_ == 0) finish();
        break;
      }
      case BodyMode::Chunked: {
        std::string decoded;
        if (!decoder_.feed(raw, decoded)) {
          fail({Kind::InvalidResponse, "Malformed chunked body", head_.status_code});
          return false;
        }
        if (!decoded.empty()) listener_->on_data(decoded);
        if (decoder_.done()) finish();
        break;
      }
    }
    return !finished_ && !cancelled_;
  }

  // Returns true when the handler must not continue
  bool stopped(const asio::error_code& ec, Kind kind, const char* what) {
    if (finished_ || cancelled_) return true;
    if (!ec) return false;

    if (timed_out_) {
      fail({Kind::Timeout, phase_ + " timed out", head_.status_code});
    } else {
      fail({kind, std::string(what) + ": " + ec.message(), head_.status_code});
    }
    return true;
  }

  void arm_timer(std::chrono::milliseconds timeout, const char* phase) {
    phase_ = phase;
    auto generation = ++timer_generation_;

    if (timeout.count() <= 0) {
      timer_.cancel();
      return;
    }

    timer_.expires_after(timeout);
    timer_.async_wait([self = this->shared_from_this(), generation](const asio::error_code& ec) {
      if (ec || generation != self->timer_generation_ || self->finished_) return;
      self->timed_out_ = true;
      self->close_socket();
    });
  }

  std::string drain() {
    std::string data(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
    buffer_.consume(buffer_.size());
    return data;
  }

  void close_socket() {
    asio::error_code ignored;
    socket_->lowest_layer().close(ignored);
  }

  void finish() {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    close_socket();
    listener_->on_closed();
  }

  void fail(const TransportError& error) {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    close_socket();
    spdlog::debug("Stream to {} ended: {}", url_.host, error.message);
    listener_->on_failure(error);
  }

  Strand strand_;
  std::shared_ptr<Socket> socket_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  asio::streambuf buffer_;

  ParsedUrl url_;
  std::string request_;
  Timeouts timeouts_;
  std::shared_ptr<StreamListener> listener_;

  HttpResponse head_;
  BodyMode mode_ = BodyMode::UntilEof;
  ChunkedDecoder decoder_;
  size_t remaining_ = 0;

  bool finished_ = false;
  bool timed_out_ = false;
  std::string phase_;
  uint64_t timer_generation_ = 0;
  std::atomic<bool> cancelled_{false};
};

// Returned for requests that fail before any I/O (e.g. unparseable URL)
class RejectedCall : public HttpCall, public std::enable_shared_from_this<RejectedCall> {
 public:
  RejectedCall(asio::io_context& io_ctx, TransportError error, std::shared_ptr<StreamListener> listener)
      : io_ctx_(io_ctx), error_(std::move(error)), listener_(std::move(listener)) {}

  void start() {
    asio::post(io_ctx_, [self = shared_from_this()] {
      self->listener_->on_failure(self->cancelled_ ? TransportError::cancelled() : self->error_);
    });
  }

  void cancel() override {
    cancelled_ = true;
  }

  bool is_cancelled() const override {
    return cancelled_;
  }

 private:
  asio::io_context& io_ctx_;
  TransportError error_;
  std::shared_ptr<StreamListener> listener_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace

class AsioHttpEngine::Impl {
 public:
  Impl(asio::io_context& io_ctx, bool verify_peer, const std::string& ca_file)
      : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tls_client), verify_peer_(verify_peer) {
    ssl_ctx_.set_default_verify_paths();
    if (!ca_file.empty()) {
      ssl_ctx_.load_verify_file(ca_file);
    }
    ssl_ctx_.set_verify_mode(verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
  }

  std::shared_ptr<HttpCall> open_stream(const HttpRequest& request, const Timeouts& timeouts, std::shared_ptr<StreamListener> listener) {
    auto parsed = ParsedUrl::parse(request.url);
    if (!parsed) {
      auto call = std::make_shared<RejectedCall>(io_ctx_, TransportError{Kind::InvalidUrl, "Invalid URL: " + request.url, 0}, std::move(listener));
      call->start();
      return call;
    }

    auto request_str = serialize_request(request, *parsed);
    auto strand = asio::make_strand(io_ctx_);

    if (parsed->is_https()) {
      auto socket = std::make_shared<SslSocket>(strand, ssl_ctx_);
      // Set SNI hostname
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      if (verify_peer_) {
        socket->set_verify_callback(asio::ssl::host_name_verification(parsed->host));
      }
      auto session = std::make_shared<StreamSession<SslSocket>>(strand, std::move(socket), *parsed, std::move(request_str), timeouts, std::move(listener));
      session->start();
      return session;
    }

    auto socket = std::make_shared<TcpSocket>(strand);
    auto session = std::make_shared<StreamSession<TcpSocket>>(strand, std::move(socket), *parsed, std::move(request_str), timeouts, std::move(listener));
    session->start();
    return session;
  }

 private:
  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
  bool verify_peer_;
};

AsioHttpEngine::AsioHttpEngine(asio::io_context& io_ctx, bool verify_peer, const std::string& ca_file)
    : impl_(std::make_unique<Impl>(io_ctx, verify_peer, ca_file)) {}

AsioHttpEngine::~AsioHttpEngine() = default;

std::shared_ptr<HttpCall> AsioHttpEngine::open_stream(const HttpRequest& request, const Timeouts& timeouts, std::shared_ptr<StreamListener> listener) {
  return impl_->open_stream(request, timeouts, std::move(listener));
}

}  // namespace ssebridge::net
