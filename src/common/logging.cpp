#include "logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>

#include "common/config_manager.hpp"
#include "common/process_utils.hpp"

namespace whiz::logger {

// ======================== LogConfig 实现 ========================

LogConfig LogConfig::loadFromConfigManager() {
  auto& config_manager = ::whiz::common::ConfigManager::getInstance();
  LogConfig log_config;

  log_config.global_level = parseLogLevel(
      config_manager.getWithDefault<std::string>("logging.level", "INFO"));
  log_config.file_enabled =
      config_manager.getWithDefault<bool>("logging.file_enabled", true);
  log_config.console_enabled =
      config_manager.getWithDefault<bool>("logging.console_enabled", false);

  // 文件配置
  log_config.log_directory = config_manager.getWithDefault<std::string>(
      "logging.file.directory", "./logs");
  log_config.filename_pattern = config_manager.getWithDefault<std::string>(
      "logging.file.filename_pattern", "{program}.log");
  log_config.max_file_size_mb = static_cast<size_t>(
      config_manager.getWithDefault<int>("logging.file.max_size_mb", 10));
  log_config.max_files = static_cast<size_t>(
      config_manager.getWithDefault<int>("logging.file.max_files", 10));
  log_config.auto_flush =
      config_manager.getWithDefault<bool>("logging.file.auto_flush", true);

  // 控制台配置
  log_config.console_colored =
      config_manager.getWithDefault<bool>("logging.console.colored", true);
  log_config.console_min_level =
      parseLogLevel(config_manager.getWithDefault<std::string>(
          "logging.console.min_level", "WARNING"));

  log_config.format_pattern = config_manager.getWithDefault<std::string>(
      "logging.format.pattern", kDefaultPattern);

  const auto config = config_manager.getConfig();
  if (config.contains("logging") && config["logging"].is_object() &&
      config["logging"].contains("module_levels") &&
      config["logging"]["module_levels"].is_object()) {
    for (const auto& [module, level] :
         config["logging"]["module_levels"].items()) {
      if (level.is_string()) {
        log_config.module_levels[module] =
            parseLogLevel(level.get<std::string>());
      }
    }
  }

  return log_config;
}

void LogConfig::applyEnvironmentOverrides() {
  auto is_truthy = [](const std::string& value) {
    return value == "true" || value == "1";
  };

  if (const char* env_level = std::getenv("WHIZ_LOG_LEVEL")) {
    global_level = parseLogLevel(env_level);
  }
  if (const char* env_dir = std::getenv("WHIZ_LOG_DIR")) {
    log_directory = env_dir;
  }
  if (const char* env_console = std::getenv("WHIZ_LOG_CONSOLE")) {
    console_enabled = is_truthy(env_console);
  }
  if (const char* env_colored = std::getenv("WHIZ_LOG_COLORED")) {
    console_colored = is_truthy(env_colored);
  }
  if (const char* env_file = std::getenv("WHIZ_LOG_FILE")) {
    filename_pattern = env_file;
  }
}

namespace {

struct LevelInfo {
  LogLevel level;
  const char* name;   // 输出用名称
  const char* alias;  // 配置中可用的另一种写法
  const char* color;  // ANSI 颜色
};

constexpr std::array<LevelInfo, 6> kLevels = {{
    {LogLevel::TRACE, "TRACE", "TRACE", "\033[37m"},
    {LogLevel::DEBUG, "DEBUG", "DEBUG", "\033[36m"},
    {LogLevel::INFO, "INFO", "INFO", "\033[32m"},
    {LogLevel::WARNING, "WARN", "WARNING", "\033[33m"},
    {LogLevel::ERROR, "ERROR", "ERROR", "\033[31m"},
    {LogLevel::FATAL, "FATAL", "FATAL", "\033[35m"},
}};

auto find_level(LogLevel level) -> const LevelInfo* {
  const auto it =
      std::find_if(kLevels.begin(), kLevels.end(),
                   [level](const LevelInfo& info) { return info.level == level; });
  return it == kLevels.end() ? nullptr : &*it;
}

}  // namespace

LogLevel LogConfig::parseLogLevel(const std::string& level_str) {
  std::string upper_level = level_str;
  std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  for (const auto& info : kLevels) {
    if (upper_level == info.name || upper_level == info.alias) {
      return info.level;
    }
  }
  return LogLevel::INFO;
}

auto to_string(LogLevel level) -> std::string {
  const auto* info = find_level(level);
  return info != nullptr ? info->name : "UNKN";
}

// ======================== LogFormatter 实现 ========================

LogFormatter::LogFormatter(const std::string& pattern) : pattern_(pattern) {
  parsePattern();
}

std::string LogFormatter::format(const LogEntry& entry) const {
  std::string result;
  result.reserve(256);
  for (const auto& formatter : formatters_) {
    result += formatter(entry);
  }
  return result;
}

void LogFormatter::parsePattern() {
  const std::regex placeholder_regex(R"(\{([^}]+)\})");
  std::sregex_iterator begin(pattern_.begin(), pattern_.end(),
                             placeholder_regex);
  std::sregex_iterator end;

  size_t last_pos = 0;

  for (auto it = begin; it != end; ++it) {
    const std::smatch& match = *it;
    const auto match_pos = static_cast<size_t>(match.position());

    if (match_pos > last_pos) {
      std::string literal = pattern_.substr(last_pos, match_pos - last_pos);
      formatters_.push_back([literal](const LogEntry&) { return literal; });
    }

    const std::string placeholder = match[1].str();
    if (placeholder == "timestamp") {
      formatters_.push_back([](const LogEntry& entry) {
        const auto time_t =
            std::chrono::system_clock::to_time_t(entry.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            entry.timestamp.time_since_epoch()) %
                        1000;
        std::tm local_tm{};
#ifdef _WIN32
        localtime_s(&local_tm, &time_t);
#else
        localtime_r(&time_t, &local_tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
      });
    } else if (placeholder == "level") {
      formatters_.push_back(
          [](const LogEntry& entry) { return to_string(entry.level); });
    } else if (placeholder == "location") {
      formatters_.push_back([](const LogEntry& entry) {
        const size_t pos = entry.file.find_last_of("/\\");
        const std::string filename = (pos == std::string::npos)
                                         ? entry.file
                                         : entry.file.substr(pos + 1);
        return filename + ":" + std::to_string(entry.line);
      });
    } else if (placeholder == "function") {
      formatters_.push_back(
          [](const LogEntry& entry) { return entry.function; });
    } else if (placeholder == "thread") {
      formatters_.push_back([](const LogEntry& entry) {
        std::ostringstream oss;
        oss << entry.thread_id;
        return oss.str();
      });
    } else if (placeholder == "module") {
      formatters_.push_back([](const LogEntry& entry) {
        return entry.module.empty() ? std::string()
                                    : "[" + entry.module + "]";
      });
    } else if (placeholder == "message") {
      formatters_.push_back(
          [](const LogEntry& entry) { return entry.message; });
    } else if (placeholder == "pid") {
      formatters_.push_back(
          [](const LogEntry& entry) { return std::to_string(entry.pid); });
    } else {
      std::string literal = "{" + placeholder + "}";
      formatters_.push_back([literal](const LogEntry&) { return literal; });
    }

    last_pos = match_pos + static_cast<size_t>(match.length());
  }

  if (last_pos < pattern_.length()) {
    std::string literal = pattern_.substr(last_pos);
    formatters_.push_back([literal](const LogEntry&) { return literal; });
  }
}

// ======================== LevelFilter 实现 ========================

void LevelFilter::setGlobalLevel(LogLevel level) {
  std::unique_lock lock(filter_mutex_);
  global_level_ = level;
}

void LevelFilter::setModuleLevel(const std::string& module, LogLevel level) {
  std::unique_lock lock(filter_mutex_);
  module_levels_[module] = level;
}

void LevelFilter::reset() {
  std::unique_lock lock(filter_mutex_);
  global_level_ = LogLevel::INFO;
  module_levels_.clear();
}

bool LevelFilter::shouldLog(LogLevel level, const std::string& module) const {
  return level >= getEffectiveLevel(module);
}

LogLevel LevelFilter::getEffectiveLevel(const std::string& module) const {
  std::shared_lock lock(filter_mutex_);
  if (!module.empty()) {
    auto it = module_levels_.find(module);
    if (it != module_levels_.end()) {
      return it->second;
    }
  }
  return global_level_;
}

// ======================== FileLogStream 实现 ========================

FileLogStream::FileLogStream(const std::string& directory,
                             const std::string& filename_pattern,
                             size_t max_size_mb, size_t max_files,
                             bool auto_flush, const std::string& program_name)
    : directory_(directory),
      filename_pattern_(filename_pattern),
      program_name_(program_name),
      max_size_bytes_(max_size_mb * 1024 * 1024),
      max_files_(max_files),
      auto_flush_(auto_flush) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);

  current_filename_ = generateFilename();
  openFile();
}

void FileLogStream::openFile() {
  current_file_ =
      std::make_unique<std::ofstream>(current_filename_, std::ios::app);
  std::error_code ec;
  const auto size = std::filesystem::file_size(current_filename_, ec);
  current_size_ = ec ? 0 : static_cast<size_t>(size);
}

void FileLogStream::syncWithDisk() {
  // 另一个实例把文件轮转走后路径上已没有文件
  std::error_code ec;
  if (!std::filesystem::exists(current_filename_, ec)) {
    openFile();
  }
}

void FileLogStream::write(const LogEntry& /*entry*/,
                          const std::string& formatted) {
  std::lock_guard lock(file_mutex_);

  if (!current_file_ || !current_file_->is_open()) {
    return;
  }

  syncWithDisk();
  *current_file_ << formatted << '\n';
  current_size_ += formatted.length() + 1;

  if (auto_flush_) {
    current_file_->flush();
  }

  if (current_size_ > max_size_bytes_) {
    current_file_->flush();
    std::error_code ec;
    const auto on_disk = std::filesystem::file_size(current_filename_, ec);
    if (ec || static_cast<size_t>(on_disk) < current_size_) {
      // 路径上已是另一个实例轮转后新建的文件
      openFile();
    } else {
      rotateFile();
    }
  }
}

void FileLogStream::flush() {
  std::lock_guard lock(file_mutex_);
  if (current_file_ && current_file_->is_open()) {
    current_file_->flush();
  }
}

void FileLogStream::rotateFile() {
  if (!current_file_) return;

  current_file_->close();

  // 轮转时的文件系统错误不能影响业务日志，只能放弃本次轮转
  std::error_code ec;
  const std::string oldest_file =
      current_filename_ + "." + std::to_string(max_files_);
  std::filesystem::remove(oldest_file, ec);

  for (size_t i = max_files_ > 0 ? max_files_ - 1 : 0; i > 0; --i) {
    const std::string old_name = current_filename_ + "." + std::to_string(i);
    const std::string new_name =
        current_filename_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }

  std::filesystem::rename(current_filename_, current_filename_ + ".1", ec);
  openFile();
}

std::string FileLogStream::generateFilename() const {
  std::string filename = filename_pattern_;

  const std::string program_token = "{program}";
  size_t pos = filename.find(program_token);
  if (pos != std::string::npos) {
    filename.replace(pos, program_token.size(),
                     std::filesystem::path(program_name_).filename().string());
  }

  const std::string date_token = "{date}";
  pos = filename.find(date_token);
  if (pos != std::string::npos) {
    const auto now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &now);
#else
    localtime_r(&now, &local_tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y%m%d");
    filename.replace(pos, date_token.size(), oss.str());
  }

  return (std::filesystem::path(directory_) / filename).string();
}

// ======================== ConsoleLogStream 实现 ========================

ConsoleLogStream::ConsoleLogStream(bool colored, LogLevel min_level)
    : colored_(colored), min_level_(min_level) {}

void ConsoleLogStream::write(const LogEntry& entry,
                             const std::string& formatted) {
  std::lock_guard lock(console_mutex_);

  if (colored_) {
    std::cerr << getColorCode(entry.level) << formatted << "\033[0m"
              << std::endl;
  } else {
    std::cerr << formatted << std::endl;
  }
}

void ConsoleLogStream::flush() {
  std::lock_guard lock(console_mutex_);
  std::cerr.flush();
}

std::string ConsoleLogStream::getColorCode(LogLevel level) const {
  const auto* info = find_level(level);
  return info != nullptr ? info->color : "";
}

// ======================== MemoryLogStream 实现 ========================

MemoryLogStream::MemoryLogStream(size_t max_entries)
    : max_entries_(max_entries) {}

void MemoryLogStream::write(const LogEntry& /*entry*/,
                            const std::string& formatted) {
  std::lock_guard lock(buffer_mutex_);

  entries_.push_back(formatted);
  if (entries_.size() > max_entries_) {
    entries_.erase(entries_.begin());
  }
}

std::vector<std::string> MemoryLogStream::getEntries() const {
  std::lock_guard lock(buffer_mutex_);
  return entries_;
}

bool MemoryLogStream::contains(const std::string& needle) const {
  std::lock_guard lock(buffer_mutex_);
  return std::any_of(entries_.begin(), entries_.end(),
                     [&needle](const std::string& entry) {
                       return entry.find(needle) != std::string::npos;
                     });
}

// ======================== Logger 主类实现 ========================

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::Init(const std::string& program_name, const LogConfig& config) {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  instance.program_name_ = program_name;
  instance.config_ = config;

  instance.level_filter_.reset();
  instance.level_filter_.setGlobalLevel(config.global_level);
  for (const auto& [module, level] : config.module_levels) {
    instance.level_filter_.setModuleLevel(module, level);
  }

  instance.formatter_ = std::make_unique<LogFormatter>(config.format_pattern);

  instance.output_streams_.clear();

  if (config.file_enabled) {
    instance.output_streams_.push_back(std::make_unique<FileLogStream>(
        config.log_directory, config.filename_pattern, config.max_file_size_mb,
        config.max_files, config.auto_flush, program_name));
  }

  if (config.console_enabled) {
    instance.output_streams_.push_back(std::make_unique<ConsoleLogStream>(
        config.console_colored, config.console_min_level));
  }
}

void Logger::InitFromConfigManager(const std::string& program_name) {
  LogConfig config = LogConfig::loadFromConfigManager();
  config.applyEnvironmentOverrides();
  Init(program_name, config);
}

void Logger::addOutputStream(std::unique_ptr<LogOutputStream> stream) {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);
  if (!instance.formatter_) {
    instance.formatter_ =
        std::make_unique<LogFormatter>(instance.config_.format_pattern);
  }
  instance.output_streams_.push_back(std::move(stream));
}

void Logger::setModuleLevel(const std::string& module, LogLevel level) {
  auto& instance = getInstance();
  instance.level_filter_.setModuleLevel(module, level);

  std::lock_guard lock(instance.logger_mutex_);
  instance.config_.module_levels[module] = level;
}

LogLevel Logger::getEffectiveLevel(const std::string& module) {
  return getInstance().level_filter_.getEffectiveLevel(module);
}

void Logger::flush() {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  for (auto& stream : instance.output_streams_) {
    stream->flush();
  }
}

void Logger::shutdown() {
  auto& instance = getInstance();
  std::lock_guard lock(instance.logger_mutex_);

  for (auto& stream : instance.output_streams_) {
    stream->flush();
  }

  instance.output_streams_.clear();
  instance.level_filter_.reset();
  instance.formatter_.reset();
}

void Logger::log(LogLevel level, const char* file, int line,
                 const char* function, const std::string& message,
                 const std::string& module) {
  if (!shouldLog(level, module)) {
    return;
  }

  LogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.level = level;
  entry.file = file;
  entry.line = line;
  entry.function = function;
  entry.thread_id = std::this_thread::get_id();
  entry.pid = static_cast<std::int64_t>(::whiz::common::current_process_id());
  entry.module = module;
  entry.message = message;

  getInstance().writeToStreams(entry);
}

bool Logger::shouldLog(LogLevel level, const std::string& module) {
  return getInstance().level_filter_.shouldLog(level, module);
}

void Logger::writeToStreams(const LogEntry& entry) {
  std::lock_guard lock(logger_mutex_);
  if (!formatter_) {
    return;
  }
  const std::string formatted_message = formatter_->format(entry);
  for (auto& stream : output_streams_) {
    if (stream->shouldLog(entry.level)) {
      stream->write(entry, formatted_message);
    }
  }
}

// ======================== LogStream 实现 ========================

Logger::LogStream::LogStream(const char* file, int line, const char* function,
                             LogLevel level, const std::string& module,
                             bool condition)
    : file_(file),
      line_(line),
      function_(function),
      level_(level),
      module_(module),
      should_log_(condition && Logger::shouldLog(level, module)) {}

Logger::LogStream::~LogStream() {
  if (should_log_) {
    Logger::log(level_, file_, line_, function_, stream_.str(), module_);
  }
}

}  // namespace whiz::logger
