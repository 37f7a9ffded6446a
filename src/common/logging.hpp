#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "platform_fixes.hpp"

namespace whiz::logger {

enum class LogLevel : std::uint8_t {
  TRACE = 0,
  DEBUG,
  INFO,
  WARNING,
  ERROR,
  FATAL,
  NUM_SEVERITIES
};

/**
 * @brief 日志条目结构
 *
 * 同一个日志文件可能被多个实例（持有锁的进程和刚启动、随即退出的进程）
 * 同时追加，因此每条记录都带上写入进程的 PID。
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level{LogLevel::INFO};
  std::string file;
  int line{0};
  std::string function;
  std::thread::id thread_id;
  std::int64_t pid{0};
  std::string module;
  std::string message;
};

/**
 * @brief 日志配置结构
 */
struct LogConfig {
  static constexpr const char* kDefaultPattern =
      "[{timestamp}] [{level}] [pid {pid}] [{location}] {module}{message}";

  LogLevel global_level = LogLevel::INFO;
  bool file_enabled = true;
  bool console_enabled = false;

  // 文件输出配置
  std::string log_directory = "./logs";
  std::string filename_pattern = "{program}.log";
  size_t max_file_size_mb = 10;
  size_t max_files = 10;
  bool auto_flush = true;

  // 控制台输出配置
  bool console_colored = true;
  LogLevel console_min_level = LogLevel::WARNING;

  std::string format_pattern = kDefaultPattern;

  // 模块级别配置，如 "instance_lock"、"cleanup"
  std::map<std::string, LogLevel> module_levels;

  static LogConfig loadFromConfigManager();

  // 应用环境变量覆盖 (WHIZ_LOG_*)
  void applyEnvironmentOverrides();

  static LogLevel parseLogLevel(const std::string& level_str);
};

auto to_string(LogLevel level) -> std::string;

/**
 * @brief 抽象日志输出流
 */
class LogOutputStream {
 public:
  virtual ~LogOutputStream() = default;
  virtual void write(const LogEntry& entry, const std::string& formatted) = 0;
  virtual void flush() = 0;
  virtual bool shouldLog(LogLevel /*level*/) const { return true; }
};

/**
 * @brief 日志格式化器
 *
 * 支持的占位符: {timestamp} {level} {location} {function} {thread}
 * {module} {message} {pid}。未知占位符原样输出。
 */
class LogFormatter {
 public:
  explicit LogFormatter(const std::string& pattern);
  std::string format(const LogEntry& entry) const;

 private:
  std::string pattern_;
  std::vector<std::function<std::string(const LogEntry&)>> formatters_;
  void parsePattern();
};

/**
 * @brief 等级过滤器，模块级别优先于全局级别
 */
class LevelFilter {
 public:
  void setGlobalLevel(LogLevel level);
  void setModuleLevel(const std::string& module, LogLevel level);
  void reset();

  bool shouldLog(LogLevel level, const std::string& module = "") const;
  LogLevel getEffectiveLevel(const std::string& module = "") const;

 private:
  LogLevel global_level_ = LogLevel::INFO;
  std::map<std::string, LogLevel> module_levels_;
  mutable std::shared_mutex filter_mutex_;
};

/**
 * @brief 文件日志输出流，超过大小后轮转
 *
 * 以追加方式打开。文件可能被另一个实例轮转走，写入前发现路径上的
 * 文件已不是当前打开的文件时重新打开。
 */
class FileLogStream : public LogOutputStream {
 public:
  FileLogStream(const std::string& directory,
                const std::string& filename_pattern, size_t max_size_mb,
                size_t max_files, bool auto_flush = true,
                const std::string& program_name = "whiz");

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;

 private:
  std::string directory_;
  std::string filename_pattern_;
  std::string program_name_;
  size_t max_size_bytes_;
  size_t max_files_;
  bool auto_flush_;

  std::unique_ptr<std::ofstream> current_file_;
  std::string current_filename_;
  size_t current_size_ = 0;
  std::mutex file_mutex_;

  void openFile();
  void syncWithDisk();
  void rotateFile();
  std::string generateFilename() const;
};

/**
 * @brief 控制台日志输出流 (stderr)
 */
class ConsoleLogStream : public LogOutputStream {
 public:
  explicit ConsoleLogStream(bool colored = true,
                            LogLevel min_level = LogLevel::INFO);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  bool shouldLog(LogLevel level) const override { return level >= min_level_; }

 private:
  bool colored_;
  LogLevel min_level_;
  std::mutex console_mutex_;

  std::string getColorCode(LogLevel level) const;
};

/**
 * @brief 内存缓冲区日志输出流（用于测试）
 */
class MemoryLogStream : public LogOutputStream {
 public:
  explicit MemoryLogStream(size_t max_entries = 1000);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override {}

  std::vector<std::string> getEntries() const;
  bool contains(const std::string& needle) const;

 private:
  size_t max_entries_;
  std::vector<std::string> entries_;
  mutable std::mutex buffer_mutex_;
};

/**
 * @brief 主Logger类，进程内唯一
 *
 * 退出钩子在进程终止前调用 flush()，保证清理报告落盘。
 */
class Logger {
 public:
  static void Init(const std::string& program_name, const LogConfig& config);
  static void InitFromConfigManager(const std::string& program_name);

  static void addOutputStream(std::unique_ptr<LogOutputStream> stream);

  static void setModuleLevel(const std::string& module, LogLevel level);
  static LogLevel getEffectiveLevel(const std::string& module = "");

  static void flush();
  static void shutdown();

  static void log(LogLevel level, const char* file, int line,
                  const char* function, const std::string& message,
                  const std::string& module = "");

  static bool shouldLog(LogLevel level, const std::string& module = "");

  static Logger& getInstance();

  // 流式日志类，析构时提交
  class LogStream {
   public:
    LogStream(const char* file, int line, const char* function, LogLevel level,
              const std::string& module = "", bool condition = true);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& val) {
      if (should_log_) {
        stream_ << val;
      }
      return *this;
    }

   private:
    std::ostringstream stream_;
    const char* file_;
    int line_;
    const char* function_;
    LogLevel level_;
    std::string module_;
    bool should_log_;
  };

 private:
  Logger() = default;
  ~Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  std::string program_name_;
  LogConfig config_;
  LevelFilter level_filter_;
  std::vector<std::unique_ptr<LogOutputStream>> output_streams_;
  std::unique_ptr<LogFormatter> formatter_;

  mutable std::mutex logger_mutex_;

  void writeToStreams(const LogEntry& entry);
};

}  // namespace whiz::logger

#define WHIZ_LOG_STREAM(level, module, condition)                      \
  ::whiz::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__,  \
                                    ::whiz::logger::LogLevel::level, \
                                    module, condition)

#define LOG_DEBUG WHIZ_LOG_STREAM(DEBUG, "", true)
#define LOG_INFO WHIZ_LOG_STREAM(INFO, "", true)
#define LOG_WARNING WHIZ_LOG_STREAM(WARNING, "", true)
#define LOG_ERROR WHIZ_LOG_STREAM(ERROR, "", true)

// 模块化日志宏
#define LOG_MODULE(module, level) WHIZ_LOG_STREAM(level, module, true)

// 条件日志宏
#define LOG_IF(level, condition) WHIZ_LOG_STREAM(level, "", condition)
