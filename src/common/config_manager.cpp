#include "config_manager.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <utility>
#include <vector>

#include "common/logging.hpp"

namespace whiz::common {

using json = nlohmann::json;

namespace {

// 按点分路径查找节点，找不到返回 nullptr
auto find_path(const json& root, const std::string& key) -> const json* {
  const json* current = &root;
  size_t start = 0;
  while (start <= key.size()) {
    const size_t end = key.find('.', start);
    const std::string part = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!part.empty()) {
      if (!current->is_object()) {
        return nullptr;
      }
      auto it = current->find(part);
      if (it == current->end()) {
        return nullptr;
      }
      current = &(*it);
    }

    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return current == &root && !key.empty() ? nullptr : current;
}

}  // namespace

ConfigManager& ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

ConfigResult<void> ConfigManager::loadFromFile(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open config file: " + filename});
  }

  json json_config;
  try {
    file >> json_config;
  } catch (const json::exception& e) {
    return tl::make_unexpected(ConfigError{"Failed to parse config file " +
                                           filename + ": " + e.what()});
  }

  if (!json_config.is_object()) {
    return tl::make_unexpected(
        ConfigError{"Config file " + filename + " must contain a JSON object"});
  }

  {
    std::unique_lock lock(mutex_);
    config_ = std::move(json_config);
    cache_.clear();
    loadEnvironmentVariables();
  }

  LOG_INFO << "Loaded config from: " << filename;
  validateCriticalConfigs();
  return {};
}

ConfigResult<void> ConfigManager::loadFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return tl::make_unexpected(
        ConfigError{"Config root must be a JSON object, got " +
                    std::string(json.type_name())});
  }

  {
    std::unique_lock lock(mutex_);
    config_ = json;
    cache_.clear();
    loadEnvironmentVariables();
  }

  validateCriticalConfigs();
  return {};
}

void ConfigManager::loadFromEnvironment() {
  std::unique_lock lock(mutex_);
  cache_.clear();
  loadEnvironmentVariables();
}

void ConfigManager::reset() {
  std::unique_lock lock(mutex_);
  config_ = json::object();
  cache_.clear();
}

ConfigResult<std::string> ConfigManager::getString(
    const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_string()) {
    LOG_WARNING << "Config value type mismatch for key '" << key
                << "': expected string, got " << result->type_name();
    return tl::make_unexpected(
        ConfigError{"Value at key '" + key + "' is not a string"});
  }
  return result->get<std::string>();
}

ConfigResult<int> ConfigManager::getInt(const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_number_integer()) {
    LOG_WARNING << "Config value type mismatch for key '" << key
                << "': expected integer, got " << result->type_name();
    return tl::make_unexpected(
        ConfigError{"Value at key '" + key + "' is not an integer"});
  }
  return result->get<int>();
}

ConfigResult<bool> ConfigManager::getBool(const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  if (!result->is_boolean()) {
    LOG_WARNING << "Config value type mismatch for key '" << key
                << "': expected boolean, got " << result->type_name();
    return tl::make_unexpected(
        ConfigError{"Value at key '" + key + "' is not a boolean"});
  }
  return result->get<bool>();
}

ConfigResult<double> ConfigManager::getDouble(const std::string& key) const {
  auto result = getJsonValue(key);
  if (!result) {
    return tl::make_unexpected(result.error());
  }
  // 整数同样可以作为浮点数读取
  if (!result->is_number()) {
    LOG_WARNING << "Config value type mismatch for key '" << key
                << "': expected number, got " << result->type_name();
    return tl::make_unexpected(
        ConfigError{"Value at key '" + key + "' is not a number"});
  }
  return result->get<double>();
}

bool ConfigManager::hasKey(const std::string& key) const {
  return getJsonValue(key).has_value();
}

ConfigResult<void> ConfigManager::saveToFile(
    const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open file for writing: " + filename});
  }

  std::shared_lock lock(mutex_);
  file << config_.dump(4);
  if (!file) {
    return tl::make_unexpected(
        ConfigError{"Failed to write config to file: " + filename});
  }
  return {};
}

nlohmann::json ConfigManager::getConfig() const {
  std::shared_lock lock(mutex_);
  return config_;
}

bool ConfigManager::validateConfig() const {
  std::shared_lock lock(mutex_);

  bool is_valid = true;

  const auto app_name = getJsonValueNoLock("instance_lock.app_name");
  if (app_name.has_value() &&
      (!app_name->is_string() || app_name->get<std::string>().empty())) {
    LOG_ERROR << "Invalid instance_lock.app_name: must be a non-empty string";
    is_valid = false;
  }

  const std::vector<std::string> positive_numbers = {
      "instance_lock.stale_timeout_minutes",
      "instance_lock.activation_timeout_seconds",
      "instance_lock.semaphore_timeout_seconds",
      "cleanup.global_timeout_seconds",
      "cleanup.verify_timeout_seconds"};

  for (const auto& key : positive_numbers) {
    auto result = getJsonValueNoLock(key);
    if (!result.has_value()) {
      continue;
    }
    if (!result->is_number()) {
      LOG_ERROR << "Invalid value type in key '" << key
                << "': expected number, got " << result->type_name();
      is_valid = false;
    } else if (result->get<double>() <= 0.0) {
      LOG_ERROR << "Invalid value for '" << key << "': " << result->dump()
                << " (must be positive)";
      is_valid = false;
    }
  }

  const auto use_atomic = getJsonValueNoLock("instance_lock.use_atomic_backend");
  if (use_atomic.has_value() && !use_atomic->is_boolean()) {
    LOG_ERROR << "Invalid instance_lock.use_atomic_backend: expected boolean";
    is_valid = false;
  }

  if (is_valid) {
    LOG_INFO << "Configuration validation passed";
  } else {
    LOG_ERROR << "Configuration validation failed";
  }

  return is_valid;
}

ConfigResult<nlohmann::json> ConfigManager::getJsonValue(
    const std::string& key) const {
  {
    std::shared_lock lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    return it->second;
  }

  auto result = getJsonValueNoLock(key);
  if (result) {
    cache_[key] = *result;
  }
  return result;
}

void ConfigManager::loadEnvironmentVariables() {
  // 调用者已持有 mutex_
  if (const char* app_name = std::getenv("WHIZ_APP_NAME")) {
    if (*app_name != '\0') {
      setNoLock("instance_lock.app_name", std::string(app_name));
    }
  }

  auto load_number = [this](const char* env_name, const std::string& key) {
    const char* value = std::getenv(env_name);
    if (value == nullptr) {
      return;
    }
    try {
      setNoLock(key, std::stod(value));
    } catch (const std::exception& e) {
      LOG_WARNING << "Invalid " << env_name << " value: " << value << " ("
                  << e.what() << ")";
    }
  };

  load_number("WHIZ_LOCK_TIMEOUT_MINUTES",
              "instance_lock.stale_timeout_minutes");
  load_number("WHIZ_CLEANUP_TIMEOUT_SECONDS", "cleanup.global_timeout_seconds");
}

void ConfigManager::validateCriticalConfigs() const {
  std::shared_lock lock(mutex_);

  const std::vector<std::pair<std::string, std::string>> expected_keys = {
      {"instance_lock.app_name", "Application name"},
      {"cleanup.global_timeout_seconds", "Global cleanup timeout"},
      {"logging.level", "Logging level"}};

  for (const auto& [key, description] : expected_keys) {
    if (!getJsonValueNoLock(key).has_value()) {
      LOG_DEBUG << "Config missing: " << description << " (key: " << key
                << ") - will use default value";
    }
  }

  auto log_level = getJsonValueNoLock("logging.level");
  if (log_level.has_value() && log_level->is_string()) {
    const std::string level = log_level->get<std::string>();
    const std::vector<std::string> valid_levels = {
        "TRACE", "DEBUG", "INFO", "WARNING", "WARN", "ERROR", "FATAL"};
    if (std::find(valid_levels.begin(), valid_levels.end(), level) ==
        valid_levels.end()) {
      LOG_WARNING << "Invalid logging level: " << level
                  << " - will use default";
    }
  }
}

ConfigResult<nlohmann::json> ConfigManager::getJsonValueNoLock(
    const std::string& key) const {
  const json* node = find_path(config_, key);
  if (node == nullptr) {
    return tl::make_unexpected(ConfigError{"Key not found: " + key});
  }
  return *node;
}

template <typename T>
void ConfigManager::setNoLock(const std::string& key, const T& value) {
  json* current = &config_;
  size_t start = 0;

  while (true) {
    const size_t end = key.find('.', start);
    const std::string part = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!current->is_object()) {
      *current = json::object();
    }

    if (end == std::string::npos) {
      (*current)[part] = value;
      break;
    }

    if (!part.empty()) {
      current = &(*current)[part];
    }
    start = end + 1;
  }
  cache_.clear();
}

template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<int>(const std::string& key, const int& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<double>(const std::string& key, const double& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const {
  auto result = getString(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key << "': '"
              << default_value << "' (reason: " << result.error().message
              << ")";
    return default_value;
  }
  return result.value();
}

template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const {
  auto result = getInt(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << default_value
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const {
  auto result = getBool(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << (default_value ? "true" : "false")
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

template <>
double ConfigManager::getWithDefault<double>(
    const std::string& key, const double& default_value) const {
  auto result = getDouble(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << default_value
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

}  // namespace whiz::common
