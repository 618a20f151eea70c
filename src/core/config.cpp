#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace ssebridge {

namespace fs = std::filesystem;

std::string to_string(TimeUnit unit) {
  switch (unit) {
    case TimeUnit::Milliseconds:
      return "milliseconds";
    case TimeUnit::Seconds:
      return "seconds";
    case TimeUnit::Minutes:
      return "minutes";
  }
  return "minutes";
}

TimeUnit time_unit_from_string(const std::string& str) {
  if (str == "milliseconds" || str == "ms") return TimeUnit::Milliseconds;
  if (str == "seconds" || str == "s") return TimeUnit::Seconds;
  if (str == "minutes" || str == "min") return TimeUnit::Minutes;
  throw std::invalid_argument("Unknown time unit: " + str);
}

void ClientConfig::validate() const {
  if (connect_timeout < 0) throw std::invalid_argument("connect_timeout must not be negative");
  if (read_timeout < 0) throw std::invalid_argument("read_timeout must not be negative");
  if (write_timeout < 0) throw std::invalid_argument("write_timeout must not be negative");
}

std::chrono::milliseconds ClientConfig::to_millis(int64_t value) const {
  switch (time_unit) {
    case TimeUnit::Milliseconds:
      return std::chrono::milliseconds(value);
    case TimeUnit::Seconds:
      return std::chrono::seconds(value);
    case TimeUnit::Minutes:
      return std::chrono::minutes(value);
  }
  return std::chrono::minutes(value);
}

ClientConfig ClientConfig::from_json(const json& j) {
  ClientConfig config;
  config.connect_timeout = j.value("connect_timeout", kDefaultConnectTimeout);
  config.read_timeout = j.value("read_timeout", kDefaultReadTimeout);
  config.write_timeout = j.value("write_timeout", kDefaultWriteTimeout);
  if (j.contains("time_unit")) {
    config.time_unit = time_unit_from_string(j["time_unit"].get<std::string>());
  }
  config.enable_logging = j.value("enable_logging", false);
  config.validate();
  return config;
}

json ClientConfig::to_json() const {
  return json{
      {"connect_timeout", connect_timeout}, {"read_timeout", read_timeout},     {"write_timeout", write_timeout},
      {"time_unit", to_string(time_unit)},  {"enable_logging", enable_logging},
  };
}

ClientConfig ClientConfig::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return ClientConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot open config file {}, using defaults", path.string());
    return ClientConfig{};
  }

  try {
    return from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("Invalid config file {}: {}, using defaults", path.string(), e.what());
    return ClientConfig{};
  }
}

}  // namespace ssebridge
