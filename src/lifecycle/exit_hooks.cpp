#include "lifecycle/exit_hooks.hpp"

#include <boost/system/error_code.hpp>
#include <cstdlib>
#include <exception>

#include "common/logging.hpp"

namespace whiz::lifecycle {

namespace {

constexpr const char* kModule = "lifecycle";

std::once_flag g_atexit_registered;

}  // namespace

std::atomic<ExitHooks*> ExitHooks::active_{nullptr};

ExitHooks::ExitHooks(std::function<void()> routine)
    : routine_(std::move(routine)) {}

ExitHooks::~ExitHooks() {
  ExitHooks* expected = this;
  active_.compare_exchange_strong(expected, nullptr);

  io_context_.stop();
  if (signal_thread_.joinable()) {
    signal_thread_.join();
  }
  if (signals_) {
    // 恢复默认信号处置
    boost::system::error_code ec;
    signals_->clear(ec);
  }
}

void ExitHooks::install(const std::vector<int>& signals) {
  if (installed_) {
    return;
  }

  signals_ = std::make_unique<boost::asio::signal_set>(io_context_);
  for (const int signal_number : signals) {
    signals_->add(signal_number);
  }
  signals_->async_wait(
      [this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
          return;  // 被取消
        }
        onSignal(signal_number);
      });
  signal_thread_ = std::thread([this]() { io_context_.run(); });

  active_.store(this);
  std::call_once(g_atexit_registered, []() { std::atexit(atexitBridge); });

  installed_ = true;
  LOG_MODULE(kModule, DEBUG) << "Exit hooks installed for " << signals.size()
                             << " signals";
}

auto ExitHooks::runOnce() -> bool {
  bool ran = false;
  std::call_once(once_, [this, &ran]() {
    ran = true;
    try {
      routine_();
    } catch (const std::exception& e) {
      LOG_MODULE(kModule, ERROR) << "Shutdown routine failed: " << e.what();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    done_cv_.notify_all();
  });
  return ran;
}

auto ExitHooks::hasRun() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_;
}

void ExitHooks::waitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this]() { return done_; });
}

void ExitHooks::onSignal(int signal_number) {
  LOG_MODULE(kModule, INFO) << "Received signal " << signal_number
                            << ", shutting down";
  runOnce();

  boost::system::error_code ec;
  signals_->clear(ec);
  std::signal(signal_number, SIG_DFL);
  logger::Logger::flush();
  std::raise(signal_number);
}

void ExitHooks::atexitBridge() {
  ExitHooks* hooks = active_.load();
  if (hooks != nullptr) {
    hooks->runOnce();
  }
}

}  // namespace whiz::lifecycle
