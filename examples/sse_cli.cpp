// sse_cli: connect to an SSE endpoint and print what arrives
//
//   sse_cli [-X GET|POST] [-d body] [-H "Name: value"]... [--config file] [--log level] url
//
// Ctrl+C disconnects. Exit code is 0 after Closed/Cancelled, 1 after Failed, 2 on bad usage.

#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>

#include "spdlog/cfg/env.h"
#include "ssebridge/ssebridge.hpp"

using namespace ssebridge;

struct CliOptions {
  HttpMethod method = HttpMethod::Get;
  std::optional<std::string> body;
  Headers headers;
  std::string config_path;
  std::string log_level = "warn";
  std::string url;
};

static void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [-X GET|POST] [-d body] [-H \"Name: value\"]... [--config file] [--log level] url\n";
}

static std::optional<CliOptions> parse_args(int argc, char* argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "-X") {
      auto v = next();
      if (!v) return std::nullopt;
      if (iequals(*v, "GET")) {
        opts.method = HttpMethod::Get;
      } else if (iequals(*v, "POST")) {
        opts.method = HttpMethod::Post;
      } else {
        std::cerr << "Unsupported method: " << *v << "\n";
        return std::nullopt;
      }
    } else if (arg == "-d") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.body = *v;
      opts.method = HttpMethod::Post;
    } else if (arg == "-H") {
      auto v = next();
      if (!v) return std::nullopt;
      auto colon = v->find(':');
      if (colon == std::string::npos) {
        std::cerr << "Malformed header: " << *v << "\n";
        return std::nullopt;
      }
      auto value_start = v->find_first_not_of(' ', colon + 1);
      opts.headers.add(v->substr(0, colon), value_start == std::string::npos ? "" : v->substr(value_start));
    } else if (arg == "--config") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.config_path = *v;
    } else if (arg == "--log") {
      auto v = next();
      if (!v) return std::nullopt;
      opts.log_level = *v;
    } else if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    } else if (opts.url.empty()) {
      opts.url = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return std::nullopt;
    }
  }

  if (opts.url.empty()) return std::nullopt;
  return opts;
}

static void print_event(const SseEvent& event) {
  if (event.id) std::cout << "id: " << *event.id << "\n";
  if (event.type) std::cout << "event: " << *event.type << "\n";
  if (event.retry) std::cout << "retry: " << *event.retry << "\n";
  std::cout << "data: " << event.data << "\n\n" << std::flush;
}

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  if (!opts) {
    print_usage(argv[0]);
    return 2;
  }

  // Log
  init_log(opts->log_level);
  spdlog::cfg::load_env_levels();

  ClientConfig config = opts->config_path.empty() ? ClientConfig::create_default() : ClientConfig::load(opts->config_path);

  std::optional<SseRequest> request;
  try {
    request.emplace(opts->url, opts->method, opts->headers, opts->body);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  std::cerr << "sse_cli " << version() << " -> " << to_string(opts->method) << " " << opts->url << "\n";

  asio::io_context io_ctx;
  std::atomic<int> exit_code{0};

  auto listener = std::make_shared<CallbackListener>();
  listener->state_changed = [&](ConnectionState state) {
    std::cerr << "[" << to_string(state) << "]\n";
    if (is_terminal(state)) {
      if (state == ConnectionState::Failed) exit_code = 1;
      asio::post(io_ctx, [&io_ctx]() { io_ctx.stop(); });
    }
  };
  listener->event = print_event;
  listener->failure = [](const net::TransportError& error) {
    std::cerr << "Error (" << net::to_string(error.kind) << "): " << error.message << "\n";
  };

  SseBridge::Options options;
  options.config = config;
  options.listener = listener;
  auto bridge = SseBridge::create(io_ctx, std::move(options));

  // Ctrl+C
  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code& ec, int) {
    if (!ec) bridge->disconnect();
  });

  auto work = asio::make_work_guard(io_ctx);
  bridge->connect(*request);
  io_ctx.run();

  return exit_code.load();
}
