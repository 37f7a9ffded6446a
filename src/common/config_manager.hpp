#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <tl/expected.hpp>
#include <unordered_map>

namespace whiz::common {

/**
 * @brief 配置错误类型
 */
struct ConfigError {
  std::string message;

  explicit ConfigError(std::string msg) : message(std::move(msg)) {}
};

/**
 * @brief 配置结果类型
 */
template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/**
 * @brief 配置管理器
 *
 * 使用 nlohmann/json 存储配置，键为点分路径（如 "cleanup.global_timeout_seconds"），
 * 读取失败通过 tl::expected 返回。加载后会应用 WHIZ_* 环境变量覆盖。
 */
class ConfigManager {
 public:
  static ConfigManager& getInstance();

  // 加载配置
  ConfigResult<void> loadFromFile(const std::string& filename);
  ConfigResult<void> loadFromJson(const nlohmann::json& json);

  // 不加载文件时，仅在当前配置上应用 WHIZ_* 环境变量
  void loadFromEnvironment();

  // 清空配置（主要供测试使用）
  void reset();

  ConfigResult<std::string> getString(const std::string& key) const;
  ConfigResult<int> getInt(const std::string& key) const;
  ConfigResult<bool> getBool(const std::string& key) const;
  ConfigResult<double> getDouble(const std::string& key) const;

  // 获取配置值，如果不存在则使用提供的默认值
  template <typename T>
  T getWithDefault(const std::string& key, const T& default_value) const;

  template <typename T>
  void set(const std::string& key, const T& value);

  bool hasKey(const std::string& key) const;

  ConfigResult<void> saveToFile(const std::string& filename) const;

  // 获取整个配置的副本
  nlohmann::json getConfig() const;

  // 验证配置完整性
  bool validateConfig() const;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  mutable std::shared_mutex mutex_;
  nlohmann::json config_ = nlohmann::json::object();
  mutable std::unordered_map<std::string, nlohmann::json> cache_;

  ConfigResult<nlohmann::json> getJsonValue(const std::string& key) const;
  void loadEnvironmentVariables();
  void validateCriticalConfigs() const;

  // 内部方法，假设调用者已持有锁
  template <typename T>
  void setNoLock(const std::string& key, const T& value);
  ConfigResult<nlohmann::json> getJsonValueNoLock(const std::string& key) const;
};

template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value);

template <>
void ConfigManager::set<int>(const std::string& key, const int& value);

template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value);

template <>
void ConfigManager::set<double>(const std::string& key, const double& value);

template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const;

template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const;

template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const;

template <>
double ConfigManager::getWithDefault<double>(const std::string& key,
                                             const double& default_value) const;

}  // namespace whiz::common
