#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>
#include <memory>
#include <vector>

#include "common/process_utils.hpp"
#include "lifecycle/instance_lock.hpp"
#include "utils/lifecycle_utils.hpp"

#ifndef WHIZ_INSTANCE_LOCK_HELPER
#error "WHIZ_INSTANCE_LOCK_HELPER must point to the helper executable"
#endif

using namespace whiz::lifecycle;
using whiz::common::Process;
using whiz::test::MockWindowActivator;
using ::testing::Return;

namespace {
constexpr int kAcquired = 0;
constexpr int kNotAcquired = 1;
constexpr int kActivated = 2;
}  // namespace

class InstanceLockProcessTest : public whiz::test::LockTestBase {
 protected:
  auto spawnHelper(const std::string& mode, std::vector<std::string> extra = {})
      -> std::unique_ptr<Process> {
    std::vector<std::string> args = {"--mode=" + mode, "--app=" + app_name_,
                                     "--dir=" + lock_dir_.string()};
    args.insert(args.end(), extra.begin(), extra.end());
    return std::make_unique<Process>(WHIZ_INSTANCE_LOCK_HELPER, args);
  }

  auto readyFile(const std::string& tag) const -> std::filesystem::path {
    return lock_dir_ / (tag + ".ready");
  }

  auto makeLock(bool activation_result, int expected_calls)
      -> std::unique_ptr<InstanceLock> {
    auto activator = std::make_unique<MockWindowActivator>();
    EXPECT_CALL(*activator, activate())
        .Times(expected_calls)
        .WillRepeatedly(Return(activation_result));
    return std::make_unique<InstanceLock>(makeOptions(), std::move(activator));
  }
};

TEST_F(InstanceLockProcessTest, LockIsExclusiveAcrossProcesses) {
  auto holder = spawnHelper(
      "try", {"--hold-ms=1500", "--ready=" + readyFile("holder").string()});
  ASSERT_TRUE(whiz::test::wait_for_file(readyFile("holder"),
                                        std::chrono::seconds(10)));

  auto lock = makeLock(false, 1);
  const auto result = lock->tryAcquire();
  EXPECT_FALSE(result.acquired);
  EXPECT_FALSE(lock->isHeld());

  EXPECT_EQ(holder->waitForExit(), kAcquired);

  // 持有者释放后可以重新获取
  const auto after = lock->tryAcquire();
  EXPECT_TRUE(after.acquired);
  EXPECT_FALSE(after.note.has_value());
}

TEST_F(InstanceLockProcessTest, SecondProcessActivatesExistingInstance) {
  auto lock = makeLock(false, 0);
  ASSERT_TRUE(lock->tryAcquire().acquired);

  auto failing = spawnHelper("try");
  EXPECT_EQ(failing->waitForExit(), kNotAcquired);

  auto activating = spawnHelper("try", {"--activation-succeeds"});
  EXPECT_EQ(activating->waitForExit(), kActivated);

  // 失败的进程没有删除我们的记录
  const auto record = LockRecordStore(lockFile()).read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner_pid, whiz::common::current_process_id());
}

TEST_F(InstanceLockProcessTest, ConcurrentStartersYieldSingleOwner) {
  constexpr int kStarters = 6;
  std::vector<std::unique_ptr<Process>> starters;
  for (int i = 0; i < kStarters; ++i) {
    starters.push_back(spawnHelper("try", {"--hold-ms=2000"}));
  }

  int owners = 0;
  int rejected = 0;
  for (auto& starter : starters) {
    const auto code = starter->waitForExit();
    ASSERT_TRUE(code.has_value());
    if (*code == kAcquired) {
      ++owners;
    } else if (*code == kNotAcquired) {
      ++rejected;
    }
  }
  EXPECT_EQ(owners, 1);
  EXPECT_EQ(rejected, kStarters - 1);
}

TEST_F(InstanceLockProcessTest, CrashedOwnerIsReclaimed) {
  auto crashed = spawnHelper("crash");
  ASSERT_EQ(crashed->waitForExit(), kAcquired);

  // 段和记录都遗留了下来
  ASSERT_TRUE(std::filesystem::exists(lockFile()));

  auto lock = makeLock(false, 0);
  const auto result = lock->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());
}

#ifndef _WIN32
TEST_F(InstanceLockProcessTest, SignalRunsShutdownCleanup) {
  auto host = spawnHelper("hooks", {"--ready=" + readyFile("host").string()});
  ASSERT_TRUE(
      whiz::test::wait_for_file(readyFile("host"), std::chrono::seconds(10)));
  ASSERT_TRUE(std::filesystem::exists(lockFile()));
  ASSERT_TRUE(host->pid().has_value());

  ASSERT_EQ(::kill(*host->pid(), SIGTERM), 0);
  // 清理完成后恢复默认处理并重新发出信号，进程应被 SIGTERM 终止
  EXPECT_FALSE(host->waitForExit(std::chrono::seconds(20)).has_value());
  EXPECT_FALSE(host->isRunning());
  EXPECT_EQ(host->terminationSignal(), SIGTERM);

  EXPECT_FALSE(std::filesystem::exists(lockFile()));
  auto lock = makeLock(false, 0);
  EXPECT_TRUE(lock->tryAcquire().acquired);
}
#endif

TEST_F(InstanceLockProcessTest, NormalExitRunsShutdownCleanup) {
  auto host = spawnHelper("atexit");
  EXPECT_EQ(host->waitForExit(), kAcquired);

  EXPECT_FALSE(std::filesystem::exists(lockFile()));
  auto lock = makeLock(false, 0);
  EXPECT_TRUE(lock->tryAcquire().acquired);
}
