#include <gtest/gtest.h>

#include "common/logging.hpp"

auto main(int argc, char** argv) -> int {
  // 为所有测试统一初始化日志系统
  whiz::logger::LogConfig config =
      whiz::logger::LogConfig::loadFromConfigManager();
  config.log_directory = "./logs/tests";
  config.global_level = whiz::logger::LogLevel::DEBUG;
  config.file_enabled = true;
  config.console_enabled = true;
  config.max_files = 10;
  whiz::logger::Logger::Init(argv[0], config);

  testing::InitGoogleTest(&argc, argv);
  const int result = RUN_ALL_TESTS();

  whiz::logger::Logger::shutdown();
  return result;
}
