#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace ssebridge {

spdlog::level::level_enum parse_log_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_log(const std::string& level, const std::string& log_path) {
  try {
    spdlog::sink_ptr sink;

    if (log_path.empty()) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      namespace fs = std::filesystem;
      fs::path actual_path = log_path;
      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
      }
      // 每次启动都是新的干净文件
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    }

    auto logger = std::make_shared<spdlog::logger>("ssebridge", sink);
    logger->set_level(parse_log_level(level));

    // [时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::drop("ssebridge");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace ssebridge
