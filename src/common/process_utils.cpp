#include "process_utils.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#endif

namespace whiz::common {

namespace {
constexpr auto kWaitPollInterval = std::chrono::milliseconds(10);
}  // namespace

auto current_process_id() -> ProcessId {
#ifdef _WIN32
  return GetCurrentProcessId();
#else
  return getpid();
#endif
}

auto is_process_running(ProcessId pid) -> bool {
#ifdef _WIN32
  if (pid == 0) {
    return false;
  }
  HANDLE process = OpenProcess(SYNCHRONIZE, FALSE, pid);
  if (process == nullptr) {
    // 拒绝访问说明进程存在，只是属于其他用户
    return GetLastError() == ERROR_ACCESS_DENIED;
  }
  const DWORD ret = WaitForSingleObject(process, 0);
  CloseHandle(process);
  return ret == WAIT_TIMEOUT;
#else
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) == 0) {
    return true;
  }
  // EPERM: 进程存在但没有发送信号的权限
  return errno == EPERM;
#endif
}

#ifdef _WIN32
Process::Process(const std::string& executable,
                 const std::vector<std::string>& args, bool discard_output) {
  std::string command_line = "\"" + executable + "\"";
  for (const auto& arg : args) {
    command_line += " \"" + arg + "\"";
  }

  STARTUPINFOA si;
  PROCESS_INFORMATION pi;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  ZeroMemory(&pi, sizeof(pi));

  const DWORD flags = discard_output ? CREATE_NO_WINDOW : 0;
  if (!CreateProcessA(nullptr, &command_line[0], nullptr, nullptr, FALSE, flags,
                      nullptr, nullptr, &si, &pi)) {
    const DWORD error = GetLastError();
    LOG_DEBUG << "CreateProcess failed for " << executable << " (" << error
              << ")";
    throw std::runtime_error("Failed to execute " + executable +
                             ": error " + std::to_string(error));
  }

  process_handle_ = pi.hProcess;
  pid_ = pi.dwProcessId;
  CloseHandle(pi.hThread);
  LOG_DEBUG << "Process started: " << executable << " (PID " << *pid_ << ")";
}

Process::~Process() {
  if (isRunning()) {
    (void)terminate();
  }
  if (process_handle_ != nullptr) {
    CloseHandle(process_handle_);
  }
}

auto Process::isRunning() const -> bool {
  if (!pid_ || process_handle_ == nullptr) {
    return false;
  }
  return WaitForSingleObject(process_handle_, 0) == WAIT_TIMEOUT;
}

auto Process::terminate() -> bool {
  if (!isRunning()) {
    return true;
  }
  if (TerminateProcess(process_handle_, 1)) {
    LOG_DEBUG << "Process terminated. PID: " << *pid_;
    WaitForSingleObject(process_handle_, INFINITE);
    CloseHandle(process_handle_);
    pid_.reset();
    process_handle_ = nullptr;
    return true;
  }
  LOG_ERROR << "Failed to terminate process. PID: " << *pid_
            << ", Error: " << GetLastError();
  return false;
}

auto Process::waitForExit() -> std::optional<int> {
  return waitForExit(std::chrono::milliseconds(INFINITE));
}

auto Process::waitForExit(std::chrono::milliseconds timeout)
    -> std::optional<int> {
  if (!pid_ || process_handle_ == nullptr) {
    return std::nullopt;
  }

  const DWORD wait_ms = static_cast<DWORD>(timeout.count());
  if (WaitForSingleObject(process_handle_, wait_ms) != WAIT_OBJECT_0) {
    return std::nullopt;
  }

  DWORD exit_code = 0;
  const bool have_code = GetExitCodeProcess(process_handle_, &exit_code) != 0;
  CloseHandle(process_handle_);
  process_handle_ = nullptr;
  pid_.reset();
  if (!have_code) {
    return std::nullopt;
  }
  return static_cast<int>(exit_code);
}

#else  // POSIX implementation
Process::Process(const std::string& executable,
                 const std::vector<std::string>& args, bool discard_output) {
  std::array<int, 2> pipefd{};
  if (pipe(pipefd.data()) == -1) {
    throw std::runtime_error("Failed to create pipe for process creation: " +
                             std::string(strerror(errno)));
  }

  const pid_t child = fork();
  if (child < 0) {
    const int error_code = errno;
    close(pipefd[0]);
    close(pipefd[1]);
    throw std::runtime_error("Failed to fork process: " +
                             std::string(strerror(error_code)));
  }

  if (child == 0) {  // 子进程
    close(pipefd[0]);
    fcntl(pipefd[1], F_SETFD, FD_CLOEXEC);

    if (discard_output) {
      const int null_fd = open("/dev/null", O_WRONLY);
      if (null_fd >= 0) {
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        close(null_fd);
      }
    }

    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
      c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    execvp(executable.c_str(), c_args.data());
    // execvp 返回即失败，通过管道把 errno 交给父进程
    const int error_code = errno;
    (void)!write(pipefd[1], &error_code, sizeof(error_code));
    close(pipefd[1]);
    _exit(127);
  }

  close(pipefd[1]);

  int error_code = 0;
  const ssize_t bytes_read = read(pipefd[0], &error_code, sizeof(error_code));
  close(pipefd[0]);

  if (bytes_read > 0) {
    int status = 0;
    waitpid(child, &status, 0);
    throw std::runtime_error("Failed to execute " + executable + ": " +
                             std::string(strerror(error_code)));
  }

  pid_ = child;
  LOG_DEBUG << "Process started: " << executable << " (PID " << *pid_ << ")";
}

Process::~Process() {
  if (isRunning()) {
    (void)terminate();
  }
}

auto Process::isRunning() const -> bool {
  if (!pid_) {
    return false;
  }
  return is_process_running(*pid_);
}

auto Process::terminate() -> bool {
  if (!pid_) {
    return true;
  }

  if (kill(*pid_, SIGKILL) == 0 || errno == ESRCH) {
    LOG_DEBUG << "Process terminated. PID: " << *pid_;
    int status = 0;
    waitpid(*pid_, &status, 0);
    pid_.reset();
    return true;
  }

  LOG_ERROR << "Failed to kill process with PID: " << *pid_ << " ("
            << strerror(errno) << ")";
  return false;
}

auto Process::waitForExit() -> std::optional<int> {
  if (!pid_) {
    return std::nullopt;
  }

  int status = 0;
  if (waitpid(*pid_, &status, 0) == -1) {
    LOG_ERROR << "waitpid() failed for PID: " << *pid_ << " ("
              << strerror(errno) << ")";
    pid_.reset();
    return std::nullopt;
  }

  pid_.reset();
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    term_signal_ = WTERMSIG(status);
  }
  return std::nullopt;
}

auto Process::waitForExit(std::chrono::milliseconds timeout)
    -> std::optional<int> {
  if (!pid_) {
    return std::nullopt;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int status = 0;
    const pid_t result = waitpid(*pid_, &status, WNOHANG);
    if (result == *pid_) {
      pid_.reset();
      if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
      }
      if (WIFSIGNALED(status)) {
        term_signal_ = WTERMSIG(status);
      }
      return std::nullopt;
    }
    if (result == -1) {
      LOG_ERROR << "waitpid() failed for PID: " << *pid_ << " ("
                << strerror(errno) << ")";
      pid_.reset();
      return std::nullopt;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
}
#endif

}  // namespace whiz::common
