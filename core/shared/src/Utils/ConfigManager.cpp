/**
 * @file ConfigManager.cpp
 * @brief ConfigManager 구현부
 */

#include "Utils/ConfigManager.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigVariableExpander.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// =============================================================================
// ConfigManager 생성자
// =============================================================================

ConfigManager::ConfigManager() : initialized_(false) {}

// =============================================================================
// 초기화 관련
// =============================================================================

void ConfigManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire)) {
    return;
  }

  static thread_local bool in_config_init = false;
  if (in_config_init) {
    return; // 현재 스레드에서 이미 초기화 중이면 재진입 방지
  }

  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }

  in_config_init = true;
  doInitialize();
  in_config_init = false;

  initialized_.store(true, std::memory_order_release);
}

bool ConfigManager::doInitialize() {
  std::string path = findConfigFile();
  {
    std::lock_guard<std::mutex> lock(configMutex);
    envFilePath = path;
  }

  if (path.empty()) {
    LogManager::getInstance().log("config", LogLevel::INFO,
                                  "설정 파일 없음 - 환경변수만 사용");
    return false;
  }

  bool loaded = loadConfigFile(path);
  expandAllVariables();
  return loaded;
}

bool ConfigManager::initialize(const std::string &config_path) {
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  {
    std::lock_guard<std::mutex> guard(configMutex);
    explicitPath_ = config_path;
    configMap.clear();
    loadedFiles_.clear();
  }
  bool loaded = doInitialize();
  initialized_.store(true, std::memory_order_release);
  return loaded;
}

void ConfigManager::reload() {
  LogManager::getInstance().log("config", LogLevel::INFO,
                                "ConfigManager 재로딩 시작...");
  std::lock_guard<std::recursive_mutex> lock(init_mutex_);
  {
    std::lock_guard<std::mutex> guard(configMutex);
    configMap.clear();
    loadedFiles_.clear();
  }
  doInitialize();
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap.clear();
}

std::string ConfigManager::findConfigFile() const {
  {
    std::lock_guard<std::mutex> lock(configMutex);
    if (!explicitPath_.empty())
      return explicitPath_;
  }

  const char *env_config = std::getenv("DEVICEWATCH_CONFIG");
  if (env_config && std::filesystem::exists(env_config)) {
    return std::string(env_config);
  }

  const std::vector<std::string> search_paths = {
      "./config/devicewatch.env", "../config/devicewatch.env",
      "./devicewatch.env"};

  for (const auto &path : search_paths) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
      return std::filesystem::absolute(path, ec).string();
    }
  }
  return "";
}

// =============================================================================
// 설정 파일 파싱
// =============================================================================

bool ConfigManager::loadConfigFile(const std::string &filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    LogManager::getInstance().log("config", LogLevel::LOG_ERROR,
                                  "파일 열기 실패: " + filepath);
    return false;
  }

  std::string line;
  int line_count = 0;
  int parsed_count = 0;

  {
    std::lock_guard<std::mutex> lock(configMutex);
    while (std::getline(file, line)) {
      line_count++;
      if (parseLine(line))
        parsed_count++;
    }
    loadedFiles_.push_back(filepath);
  }

  LogManager::getInstance().log(
      "config", LogLevel::INFO,
      std::filesystem::path(filepath).filename().string() + " - " +
          std::to_string(parsed_count) + "/" + std::to_string(line_count) +
          " 라인 파싱됨");
  return true;
}

bool ConfigManager::parseLine(const std::string &line) {
  std::string trimmed = line;
  trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
  if (trimmed.empty() || trimmed[0] == '#') {
    return false;
  }

  size_t pos = trimmed.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  std::string key = trimmed.substr(0, pos);
  std::string value = trimmed.substr(pos + 1);

  key.erase(key.find_last_not_of(" \t\r\n") + 1);
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);

  if (value.length() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.length() - 2);
  }

  if (key.empty()) {
    return false;
  }
  configMap[key] = value;
  return true;
}

// =============================================================================
// 조회 / 변경
// =============================================================================

std::string ConfigManager::get(const std::string &key) const {
  // 1. 메모리 설정 확인
  {
    std::lock_guard<std::mutex> lock(configMutex);
    auto it = configMap.find(key);
    if (it != configMap.end() && !it->second.empty()) {
      return it->second;
    }
  }

  // 2. 환경변수 확인
  const char *env_val = std::getenv(key.c_str());
  if (env_val) {
    return std::string(env_val);
  }

  return "";
}

std::string ConfigManager::getOrDefault(const std::string &key,
                                        const std::string &defaultValue) const {
  std::string value = get(key);
  return value.empty() ? defaultValue : value;
}

void ConfigManager::set(const std::string &key, const std::string &value) {
  std::lock_guard<std::mutex> lock(configMutex);
  configMap[key] = value;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap.find(key) != configMap.end();
}

std::map<std::string, std::string> ConfigManager::listAll() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return configMap;
}

std::string ConfigManager::getConfigFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return envFilePath;
}

std::vector<std::string> ConfigManager::getLoadedFiles() const {
  std::lock_guard<std::mutex> lock(configMutex);
  return loadedFiles_;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stoi(value);
  } catch (const std::exception &) {
    LogManager::getInstance().log("config", LogLevel::WARN,
                                  "정수 변환 실패: " + key + "=" + value);
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;

  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  if (value == "true" || value == "yes" || value == "1" || value == "on")
    return true;
  if (value == "false" || value == "no" || value == "0" || value == "off")
    return false;
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::string value = get(key);
  if (value.empty())
    return defaultValue;
  try {
    return std::stod(value);
  } catch (const std::exception &) {
    LogManager::getInstance().log("config", LogLevel::WARN,
                                  "실수 변환 실패: " + key + "=" + value);
    return defaultValue;
  }
}

// =============================================================================
// 변수 확장
// =============================================================================

void ConfigManager::expandAllVariables() {
  std::lock_guard<std::mutex> lock(configMutex);
  std::map<std::string, std::string> snapshot = configMap;

  auto provider = [&snapshot](const std::string &name) -> std::string {
    auto it = snapshot.find(name);
    if (it != snapshot.end())
      return it->second;
    const char *env_val = std::getenv(name.c_str());
    return env_val ? std::string(env_val) : std::string();
  };

  for (auto &kv : configMap) {
    kv.second = DeviceWatch::Utils::ConfigVariableExpander::expand(kv.second,
                                                                   provider);
  }
}

std::string ConfigManager::expandVariables(const std::string &value) const {
  return DeviceWatch::Utils::ConfigVariableExpander::expand(
      value, [this](const std::string &name) { return get(name); });
}
