#pragma once

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include "common/process_utils.hpp"
#include "lifecycle/atomic_segment.hpp"
#include "lifecycle/instance_lock.hpp"
#include "lifecycle/window_activator.hpp"

namespace whiz::test {

class MockWindowActivator : public lifecycle::WindowActivator {
 public:
  MOCK_METHOD(bool, activate, (), (override));
  MOCK_METHOD(std::string, name, (), (const, override));
};

/**
 * @brief 生成进程内唯一的应用名，避免测试之间共享命名对象。
 */
inline auto unique_app_name(const std::string& prefix) -> std::string {
  static std::atomic<int> counter{0};
  return prefix + "_" + std::to_string(common::current_process_id()) + "_" +
         std::to_string(counter++);
}

/**
 * @brief 轮询等待文件出现。
 */
inline auto wait_for_file(const std::filesystem::path& path,
                          std::chrono::milliseconds timeout) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::filesystem::exists(path)) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return std::filesystem::exists(path);
}

/**
 * @brief 为每个测试准备独立的应用名和锁目录，结束时清理所有命名对象。
 */
class LockTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    app_name_ = unique_app_name("whiz_test");
    lock_dir_ = std::filesystem::temp_directory_path() / app_name_;
    std::filesystem::create_directories(lock_dir_);
  }

  void TearDown() override {
    lifecycle::AtomicSegment::forceRemove(
        lifecycle::SegmentNames::forApp(app_name_));
    std::error_code ec;
    std::filesystem::remove_all(lock_dir_, ec);
  }

  auto makeOptions() const -> lifecycle::InstanceLockOptions {
    lifecycle::InstanceLockOptions options;
    options.app_name = app_name_;
    options.lock_directory = lock_dir_;
    options.semaphore_timeout = std::chrono::seconds(2);
    return options;
  }

  auto lockFile() const -> std::filesystem::path {
    return lifecycle::LockRecordStore::defaultPathFor(app_name_, lock_dir_);
  }

  std::string app_name_;
  std::filesystem::path lock_dir_;
};

}  // namespace whiz::test
