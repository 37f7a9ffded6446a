#pragma once

#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/sync/named_semaphore.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <tl/expected.hpp>

namespace whiz::lifecycle {

struct SegmentError {
  std::string message;

  explicit SegmentError(std::string msg) : message(std::move(msg)) {}
};

template <typename T>
using SegmentResult = tl::expected<T, SegmentError>;

/**
 * @brief 跨进程命名对象的名称
 */
struct SegmentNames {
  std::string segment;    // <app>_single_instance
  std::string semaphore;  // <app>_single_instance_sem

  static auto forApp(const std::string& app_name) -> SegmentNames;
};

enum class CreateOutcome { Created, AlreadyExists };

/**
 * @class AtomicSegment
 * @brief 由命名信号量保护的、操作系统全局的独占创建段
 *
 * 段的"排他创建"是单实例判定的原子原语；信号量把"检查或创建 + 写锁记录"
 * 串成一个跨进程临界区。基于 Boost.Interprocess 实现。
 */
class AtomicSegment {
  struct Key {
    explicit Key() = default;
  };

 public:
  /**
   * @class CriticalSection
   * @brief 信号量临界区的 RAII 守卫，析构时释放信号量
   */
  class CriticalSection {
   public:
    explicit CriticalSection(boost::interprocess::named_semaphore* semaphore)
        : semaphore_(semaphore) {}
    ~CriticalSection();

    CriticalSection(CriticalSection&& other) noexcept
        : semaphore_(other.semaphore_) {
      other.semaphore_ = nullptr;
    }
    CriticalSection(const CriticalSection&) = delete;
    auto operator=(const CriticalSection&) -> CriticalSection& = delete;
    auto operator=(CriticalSection&&) -> CriticalSection& = delete;

   private:
    boost::interprocess::named_semaphore* semaphore_;
  };

  /**
   * @brief 打开（必要时创建）信号量。失败说明该平台上原子后端不可用。
   */
  static auto open(const SegmentNames& names)
      -> SegmentResult<std::unique_ptr<AtomicSegment>>;

  AtomicSegment(Key key, SegmentNames names,
                std::unique_ptr<boost::interprocess::named_semaphore> semaphore);
  ~AtomicSegment();

  AtomicSegment(const AtomicSegment&) = delete;
  auto operator=(const AtomicSegment&) -> AtomicSegment& = delete;

  /**
   * @brief 在限定时间内进入临界区
   */
  [[nodiscard]] auto enter(std::chrono::milliseconds timeout)
      -> SegmentResult<CriticalSection>;

  /**
   * @brief 排他地创建段。调用者应已进入临界区。
   */
  [[nodiscard]] auto create() -> SegmentResult<CreateOutcome>;

  /**
   * @brief 删除崩溃进程遗留的段（不属于本对象）
   */
  auto removeOrphan() -> bool;

  /**
   * @brief 关闭本进程持有的段并将其删除
   */
  [[nodiscard]] auto detach() -> SegmentResult<void>;

  /**
   * @brief 只关闭句柄，不删除段。锁已被其他实例接管时使用。
   */
  void abandon();

  [[nodiscard]] auto owns() const -> bool { return segment_ != nullptr; }
  [[nodiscard]] auto names() const -> const SegmentNames& { return names_; }

  /**
   * @brief 无条件删除段和信号量，资源不存在时忽略
   */
  static void forceRemove(const SegmentNames& names);

 private:
  SegmentNames names_;
  std::unique_ptr<boost::interprocess::named_semaphore> semaphore_;
  std::unique_ptr<boost::interprocess::shared_memory_object> segment_;
};

}  // namespace whiz::lifecycle
