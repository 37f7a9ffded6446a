#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <boost/interprocess/shared_memory_object.hpp>
#include <fstream>

#include "common/config_manager.hpp"
#include "lifecycle/instance_lock.hpp"
#include "utils/lifecycle_utils.hpp"

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace whiz::lifecycle;
using whiz::test::MockWindowActivator;
using ::testing::Return;

class InstanceLockTest : public whiz::test::LockTestBase {
 protected:
  auto makeLock(bool activation_result, int expected_calls = 0)
      -> std::unique_ptr<InstanceLock> {
    auto activator = std::make_unique<MockWindowActivator>();
    EXPECT_CALL(*activator, activate())
        .Times(expected_calls)
        .WillRepeatedly(Return(activation_result));
    return std::make_unique<InstanceLock>(makeOptions(), std::move(activator));
  }

  // 模拟崩溃进程留下的段：创建后不删除
  void leaveOrphanSegment() const {
    namespace bip = boost::interprocess;
    bip::shared_memory_object segment(
        bip::create_only, SegmentNames::forApp(app_name_).segment.c_str(),
        bip::read_write);
  }

  void writeRecord(const LockRecord& record) const {
    LockRecordStore store(lockFile());
    ASSERT_TRUE(store.write(record).has_value());
  }
};

TEST_F(InstanceLockTest, AcquireAndRelease) {
  auto lock = makeLock(false);

  const auto result = lock->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());
  EXPECT_TRUE(lock->isHeld());

  const auto record = LockRecordStore(lockFile()).read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner_pid, whiz::common::current_process_id());

  EXPECT_TRUE(lock->release());
  EXPECT_FALSE(lock->isHeld());
  EXPECT_FALSE(std::filesystem::exists(lockFile()));
}

TEST_F(InstanceLockTest, ReacquireAfterRelease) {
  auto lock = makeLock(false);
  ASSERT_TRUE(lock->tryAcquire().acquired);
  ASSERT_TRUE(lock->release());

  auto second = makeLock(false);
  const auto result = second->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());
}

TEST_F(InstanceLockTest, TryAcquireWhileHeldIsNoop) {
  auto lock = makeLock(false);
  ASSERT_TRUE(lock->tryAcquire().acquired);

  const auto again = lock->tryAcquire();
  EXPECT_TRUE(again.acquired);
  EXPECT_FALSE(again.note.has_value());
  EXPECT_TRUE(lock->isHeld());
}

TEST_F(InstanceLockTest, ReleaseWhenNotHeldReturnsTrue) {
  auto lock = makeLock(false);
  EXPECT_TRUE(lock->release());
  EXPECT_TRUE(lock->release());
}

TEST_F(InstanceLockTest, SecondInstanceIsActivated) {
  auto first = makeLock(false);
  ASSERT_TRUE(first->tryAcquire().acquired);

  auto second = makeLock(true, 1);
  const auto result = second->tryAcquire();
  EXPECT_TRUE(result.acquired);
  ASSERT_TRUE(result.note.has_value());
  EXPECT_EQ(*result.note, "Existing instance activated");
  EXPECT_FALSE(second->isHeld());

  // 第一个实例的锁不受影响
  EXPECT_TRUE(first->isHeld());
  EXPECT_TRUE(std::filesystem::exists(lockFile()));
}

TEST_F(InstanceLockTest, SecondInstanceActivationFails) {
  auto first = makeLock(false);
  ASSERT_TRUE(first->tryAcquire().acquired);

  auto second = makeLock(false, 1);
  const auto result = second->tryAcquire();
  EXPECT_FALSE(result.acquired);
  ASSERT_TRUE(result.note.has_value());
  EXPECT_EQ(*result.note, "Existing instance found but could not be activated");

  // 获取失败的实例释放时不能删除真正持有者的记录
  EXPECT_TRUE(second->release());
  EXPECT_TRUE(std::filesystem::exists(lockFile()));
  EXPECT_TRUE(first->isHeld());
}

TEST_F(InstanceLockTest, DeadPidRecordIsReclaimed) {
  leaveOrphanSegment();
  writeRecord(LockRecord{999999, unix_now()});

  auto lock = makeLock(false);
  const auto result = lock->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());

  const auto record = LockRecordStore(lockFile()).read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner_pid, whiz::common::current_process_id());
}

TEST_F(InstanceLockTest, StaleTimestampIsReclaimed) {
  leaveOrphanSegment();
  LockRecord record = LockRecordStore::makeCurrent();
  record.acquired_at -= 10 * 60;
  writeRecord(record);

  auto lock = makeLock(false);
  const auto result = lock->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());
}

TEST_F(InstanceLockTest, ReleaseAfterTakeoverKeepsNewOwnersLock) {
  auto first = makeLock(false);
  ASSERT_TRUE(first->tryAcquire().acquired);

  // 第一个持有者的记录超过陈旧时限，被第二个实例接管
  auto record = LockRecordStore(lockFile()).read();
  ASSERT_TRUE(record.has_value());
  record->acquired_at -= 10 * 60;
  writeRecord(*record);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  auto second = makeLock(false);
  const auto taken = second->tryAcquire();
  ASSERT_TRUE(taken.acquired);
  ASSERT_FALSE(taken.note.has_value());

  EXPECT_TRUE(first->release());
  EXPECT_TRUE(second->isHeld());
  EXPECT_TRUE(std::filesystem::exists(lockFile()));

  auto third = makeLock(false, 1);
  const auto result = third->tryAcquire();
  EXPECT_FALSE(result.acquired);
  EXPECT_EQ(result.note, std::string(InstanceLock::kNotActivatedNote));
  EXPECT_FALSE(third->isHeld());
}

TEST_F(InstanceLockTest, MissingRecordWithOrphanSegmentIsReclaimed) {
  leaveOrphanSegment();

  auto lock = makeLock(false);
  EXPECT_TRUE(lock->tryAcquire().acquired);
  EXPECT_TRUE(lock->isHeld());
}

TEST_F(InstanceLockTest, MalformedRecordIsReclaimed) {
  leaveOrphanSegment();
  {
    std::ofstream file(lockFile());
    file << "garbage";
  }

  auto lock = makeLock(false);
  EXPECT_TRUE(lock->tryAcquire().acquired);
}

#ifndef _WIN32
TEST_F(InstanceLockTest, NonOwnerRecordSurvivesRelease) {
  auto lock = makeLock(false);
  ASSERT_TRUE(lock->tryAcquire().acquired);

  // 另一个存活进程改写了记录
  writeRecord(LockRecord{getppid(), unix_now()});

  EXPECT_TRUE(lock->release());
  EXPECT_FALSE(lock->isHeld());
  const auto record = LockRecordStore(lockFile()).read();
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner_pid, getppid());
}

TEST_F(InstanceLockTest, ForceReleaseRecoversFromForeignLock) {
  leaveOrphanSegment();
  writeRecord(LockRecord{getppid(), unix_now()});

  auto lock = makeLock(false, 1);
  EXPECT_FALSE(lock->tryAcquire().acquired);

  EXPECT_TRUE(lock->forceRelease());
  EXPECT_FALSE(std::filesystem::exists(lockFile()));

  const auto result = lock->tryAcquire();
  EXPECT_TRUE(result.acquired);
  EXPECT_FALSE(result.note.has_value());
}
#endif

TEST_F(InstanceLockTest, ForceReleaseToleratesMissingResources) {
  auto lock = makeLock(false);
  EXPECT_TRUE(lock->forceRelease());
  EXPECT_TRUE(lock->status().atomic_backend_available);
}

TEST_F(InstanceLockTest, DestructorReleasesHeldLock) {
  {
    auto lock = makeLock(false);
    ASSERT_TRUE(lock->tryAcquire().acquired);
  }
  EXPECT_FALSE(std::filesystem::exists(lockFile()));

  auto next = makeLock(false);
  EXPECT_TRUE(next->tryAcquire().acquired);
}

TEST_F(InstanceLockTest, StatusReflectsState) {
  auto lock = makeLock(false);

  auto status = lock->status();
  EXPECT_FALSE(status.held);
  EXPECT_FALSE(status.lock_file_exists);
  EXPECT_EQ(status.pid, whiz::common::current_process_id());
  EXPECT_EQ(status.lock_file_path, lockFile().string());
  EXPECT_DOUBLE_EQ(status.timeout_seconds, 300.0);
  EXPECT_TRUE(status.atomic_backend_available);

  ASSERT_TRUE(lock->tryAcquire().acquired);
  status = lock->status();
  EXPECT_TRUE(status.held);
  EXPECT_TRUE(status.lock_file_exists);

  const nlohmann::json json = status;
  EXPECT_TRUE(json["held"].get<bool>());
  EXPECT_EQ(json["lock_file_path"], lockFile().string());
  EXPECT_TRUE(json.contains("atomic_backend_available"));
  EXPECT_TRUE(json.contains("timeout_seconds"));
}

class RecordOnlyLockTest : public InstanceLockTest {
 protected:
  auto makeRecordOnlyLock(bool activation_result, int expected_calls = 0)
      -> std::unique_ptr<InstanceLock> {
    auto options = makeOptions();
    options.use_atomic_backend = false;
    auto activator = std::make_unique<MockWindowActivator>();
    EXPECT_CALL(*activator, activate())
        .Times(expected_calls)
        .WillRepeatedly(Return(activation_result));
    return std::make_unique<InstanceLock>(options, std::move(activator));
  }
};

TEST_F(RecordOnlyLockTest, AcquireReleaseWithoutAtomicBackend) {
  auto lock = makeRecordOnlyLock(false);
  EXPECT_FALSE(lock->status().atomic_backend_available);

  EXPECT_TRUE(lock->tryAcquire().acquired);
  EXPECT_TRUE(std::filesystem::exists(lockFile()));
  EXPECT_TRUE(lock->release());
  EXPECT_FALSE(std::filesystem::exists(lockFile()));
}

TEST_F(RecordOnlyLockTest, LiveRecordTriggersActivation) {
  auto first = makeRecordOnlyLock(false);
  ASSERT_TRUE(first->tryAcquire().acquired);

  auto second = makeRecordOnlyLock(false, 1);
  const auto result = second->tryAcquire();
  EXPECT_FALSE(result.acquired);
  EXPECT_EQ(result.note.value_or(""),
            "Existing instance found but could not be activated");
}

TEST_F(RecordOnlyLockTest, DeadPidRecordIsReclaimed) {
  writeRecord(LockRecord{999999, unix_now()});

  auto lock = makeRecordOnlyLock(false);
  EXPECT_TRUE(lock->tryAcquire().acquired);
}

TEST_F(InstanceLockTest, OptionsFromConfig) {
  auto& config = whiz::common::ConfigManager::getInstance();
  config.reset();
  ASSERT_TRUE(config
                  .loadFromJson(nlohmann::json{
                      {"instance_lock",
                       {{"app_name", "whiz_cfg"},
                        {"window_title", "Whiz Dev"},
                        {"stale_timeout_minutes", 0.5},
                        {"activation_timeout_seconds", 2},
                        {"semaphore_timeout_seconds", 1.5},
                        {"use_atomic_backend", false}}}})
                  .has_value());

  const auto options = InstanceLockOptions::fromConfig(config);
  EXPECT_EQ(options.app_name, "whiz_cfg");
  EXPECT_EQ(options.window_title, "Whiz Dev");
  EXPECT_EQ(options.stale_timeout, std::chrono::seconds(30));
  EXPECT_EQ(options.activation_timeout, std::chrono::milliseconds(2000));
  EXPECT_EQ(options.semaphore_timeout, std::chrono::milliseconds(1500));
  EXPECT_FALSE(options.use_atomic_backend);

  config.reset();
  const auto defaults = InstanceLockOptions::fromConfig(config);
  EXPECT_EQ(defaults.app_name, "whiz");
  EXPECT_EQ(defaults.window_title, "Whiz");
  EXPECT_EQ(defaults.stale_timeout, std::chrono::minutes(5));
  EXPECT_TRUE(defaults.use_atomic_backend);
}

TEST(WindowActivatorTest, UnsupportedVariantAlwaysFails) {
  UnsupportedWindowActivator activator;
  EXPECT_FALSE(activator.activate());
  EXPECT_EQ(activator.name(), "unsupported");
}

TEST(WindowActivatorTest, MissingCommandsReportFailure) {
  CommandWindowActivator activator(
      "test",
      {{"/nonexistent/whiz-activate", {}}, {"/nonexistent/other", {"-a"}}},
      std::chrono::milliseconds(500));
  EXPECT_FALSE(activator.activate());
}

TEST(WindowActivatorTest, CommandVariantsAreNamed) {
  EXPECT_EQ(make_linux_activator("Whiz", std::chrono::seconds(1))->name(),
            "linux");
  EXPECT_EQ(make_macos_activator("Whiz", std::chrono::seconds(1))->name(),
            "macos");
}

TEST(WindowActivatorTest, FactoryPicksPlatformVariant) {
  const auto activator =
      make_window_activator("Whiz", std::chrono::milliseconds(100));
  ASSERT_NE(activator, nullptr);
#if defined(_WIN32)
  EXPECT_EQ(activator->name(), "win32");
#elif defined(__APPLE__)
  EXPECT_EQ(activator->name(), "macos");
#elif defined(__linux__)
  EXPECT_EQ(activator->name(), "linux");
#else
  EXPECT_EQ(activator->name(), "unsupported");
#endif
}

#ifndef _WIN32
TEST(WindowActivatorTest, FirstSuccessfulCommandWins) {
  CommandWindowActivator activator(
      "test", {{"false", {}}, {"true", {}}}, std::chrono::seconds(5));
  EXPECT_TRUE(activator.activate());
}

TEST(WindowActivatorTest, SlowCommandTimesOut) {
  CommandWindowActivator activator("test", {{"sleep", {"10"}}},
                                   std::chrono::milliseconds(200));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(activator.activate());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(WindowActivatorTest, CommandsShareOneDeadline) {
  CommandWindowActivator activator(
      "test", {{"sleep", {"10"}}, {"sleep", {"10"}}, {"true", {}}},
      std::chrono::milliseconds(500));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(activator.activate());
  EXPECT_LT(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(900));
}
#endif
