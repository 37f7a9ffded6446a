#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <tl/expected.hpp>

#include "common/process_utils.hpp"

namespace whiz::lifecycle {

/**
 * @brief 锁记录：持有单实例锁的进程及其获取时间
 */
struct LockRecord {
  common::ProcessId owner_pid{0};
  double acquired_at{0.0};  // Unix 时间戳（秒）
};

struct LockRecordError {
  std::string message;

  explicit LockRecordError(std::string msg) : message(std::move(msg)) {}
};

template <typename T>
using LockRecordResult = tl::expected<T, LockRecordError>;

/**
 * @brief 当前时间的 Unix 时间戳（秒，带小数）
 */
auto unix_now() -> double;

/**
 * @class LockRecordStore
 * @brief 读写磁盘上的锁记录文件
 *
 * 文件格式为两行文本：`<pid>\n<timestamp>`。缺失或格式错误的文件
 * 视为"没有记录"。写入先写临时文件再重命名，读者不会看到半写的内容。
 */
class LockRecordStore {
 public:
  explicit LockRecordStore(std::filesystem::path path);

  /**
   * @brief 默认锁文件路径：`<temp_dir>/<app>_app.lock`
   * @param directory 为空时使用系统临时目录
   */
  static auto defaultPathFor(
      const std::string& app_name,
      const std::optional<std::filesystem::path>& directory = std::nullopt)
      -> std::filesystem::path;

  [[nodiscard]] auto read() const -> std::optional<LockRecord>;
  [[nodiscard]] auto write(const LockRecord& record) const
      -> LockRecordResult<void>;

  /**
   * @brief 删除锁文件，文件不存在也视为成功
   */
  [[nodiscard]] auto remove() const -> LockRecordResult<void>;

  [[nodiscard]] auto exists() const -> bool;
  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

  /**
   * @brief 以当前进程和当前时间生成记录
   */
  static auto makeCurrent() -> LockRecord;

  /**
   * @brief 判断记录是否陈旧：持有者进程已退出，或记录时间超过 timeout
   */
  static auto isStale(const LockRecord& record,
                      std::chrono::seconds timeout) -> bool;

 private:
  std::filesystem::path path_;
};

}  // namespace whiz::lifecycle
