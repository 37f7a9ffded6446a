#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace whiz::lifecycle {

/**
 * @class ExitHooks
 * @brief 在信号 (SIGINT/SIGTERM) 或正常退出 (std::atexit) 时执行一次关闭例程
 *
 * 信号由后台线程上的 boost::asio::signal_set 接收，因此关闭例程不在
 * 信号处理上下文中运行。处理完信号后恢复默认处置并重新发出该信号，
 * 进程按默认语义终止。
 *
 * std::atexit 不接受闭包，因此进程内同一时刻只有一个 ExitHooks 可以
 * 通过静态指针接管正常退出。
 */
class ExitHooks {
 public:
  explicit ExitHooks(std::function<void()> routine);
  ~ExitHooks();

  ExitHooks(const ExitHooks&) = delete;
  auto operator=(const ExitHooks&) -> ExitHooks& = delete;

  void install(const std::vector<int>& signals = {SIGINT, SIGTERM});

  /**
   * @brief 执行关闭例程，所有触发源和线程合计只执行一次
   * @return 本次调用实际执行了例程时返回 true
   */
  auto runOnce() -> bool;

  [[nodiscard]] auto hasRun() const -> bool;
  [[nodiscard]] auto isInstalled() const -> bool { return installed_; }

  /**
   * @brief 阻塞直到关闭例程执行完毕
   */
  void waitForShutdown();

 private:
  void onSignal(int signal_number);
  static void atexitBridge();

  std::function<void()> routine_;
  std::once_flag once_;

  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  bool done_{false};

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  std::thread signal_thread_;
  bool installed_{false};

  static std::atomic<ExitHooks*> active_;
};

}  // namespace whiz::lifecycle
