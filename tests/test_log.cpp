#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "log/log.h"

using namespace ssebridge;

namespace fs = std::filesystem;

TEST(LogTest, ParseLevel) {
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("err"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
  // 未知级别按 info 处理
  EXPECT_EQ(parse_log_level("verbose"), spdlog::level::info);
}

TEST(LogTest, FileSinkWritesPattern) {
  auto path = fs::temp_directory_path() / "ssebridge_log_test" / "client.log";
  init_log("debug", path.string());

  spdlog::debug("hello {}", 42);
  get_logger()->flush();

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("[debug]"), std::string::npos);
  EXPECT_NE(content.str().find("hello 42"), std::string::npos);

  // 恢复到 stderr，避免影响其他测试
  init_log("warn");
  fs::remove_all(path.parent_path());
}
