#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace ssebridge {

using json = nlohmann::json;

enum class TimeUnit { Milliseconds, Seconds, Minutes };

std::string to_string(TimeUnit unit);

TimeUnit time_unit_from_string(const std::string& str);

// Client configuration, supplied once when the client is created.
//
// The defaults (1/2/1 minutes) are unusually coarse for a streaming client but match the
// documented behavior; override them for anything interactive. A timeout of 0 disables it.
struct ClientConfig {
  static constexpr int64_t kDefaultConnectTimeout = 1;
  static constexpr int64_t kDefaultReadTimeout = 2;
  static constexpr int64_t kDefaultWriteTimeout = 1;

  int64_t connect_timeout = kDefaultConnectTimeout;
  int64_t read_timeout = kDefaultReadTimeout;
  int64_t write_timeout = kDefaultWriteTimeout;
  TimeUnit time_unit = TimeUnit::Minutes;
  bool enable_logging = false;

  static ClientConfig create_default() {
    return ClientConfig{};
  }

  // Throws std::invalid_argument on negative timeouts
  void validate() const;

  std::chrono::milliseconds connect_timeout_ms() const {
    return to_millis(connect_timeout);
  }

  std::chrono::milliseconds read_timeout_ms() const {
    return to_millis(read_timeout);
  }

  std::chrono::milliseconds write_timeout_ms() const {
    return to_millis(write_timeout);
  }

  // Load from file; a missing or unreadable file yields the defaults
  static ClientConfig load(const std::filesystem::path& path);

  static ClientConfig from_json(const json& j);

  json to_json() const;

  bool operator==(const ClientConfig& other) const = default;

 private:
  std::chrono::milliseconds to_millis(int64_t value) const;
};

}  // namespace ssebridge
