#pragma once

/**
 * @file ConfigManager.h
 * @brief 통합 설정 관리자 (.env 형식 key=value)
 *
 * 탐색 순서:
 * 1. initialize(path)로 명시한 파일 (--config=)
 * 2. DEVICEWATCH_CONFIG 환경변수
 * 3. ./config/devicewatch.env, ../config/devicewatch.env, ./devicewatch.env
 *
 * 파일이 없으면 환경변수만 사용한다. get()은 파일 값이 없을 때
 * 같은 이름의 환경변수로 fallback 한다.
 */

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

class ConfigManager {
public:
  // ==========================================================================
  // 전역 싱글톤 패턴
  // ==========================================================================

  static ConfigManager &getInstance() {
    static ConfigManager instance;
    instance.ensureInitialized();
    return instance;
  }

  bool isInitialized() const {
    return initialized_.load(std::memory_order_acquire);
  }

  // ==========================================================================
  // 읽기 인터페이스
  // ==========================================================================

  /**
   * @brief 지정한 파일로 설정을 다시 구성한다.
   * @return 파일을 읽었으면 true
   */
  bool initialize(const std::string &config_path);
  void reload();
  bool load(const std::string &filepath) { return loadConfigFile(filepath); }

  std::string get(const std::string &key) const;
  std::string getOrDefault(const std::string &key,
                           const std::string &defaultValue) const;
  void set(const std::string &key, const std::string &value);
  bool hasKey(const std::string &key) const;
  std::map<std::string, std::string> listAll() const;

  // 테스트/재구성용: 메모리 설정 비우기
  void clear();

  std::string getConfigFilePath() const;
  std::vector<std::string> getLoadedFiles() const;

  // 편의 기능들
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;

  // ${VAR} 확장 (설정값 -> 환경변수 순)
  std::string expandVariables(const std::string &value) const;

private:
  ConfigManager();
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;
  ConfigManager(ConfigManager &&) = delete;
  ConfigManager &operator=(ConfigManager &&) = delete;

  void ensureInitialized();
  bool doInitialize();

  // 설정 파일 처리
  bool parseLine(const std::string &line);
  bool loadConfigFile(const std::string &filepath);
  std::string findConfigFile() const;
  void expandAllVariables();

  // ==========================================================================
  // 멤버 변수들
  // ==========================================================================

  std::atomic<bool> initialized_;
  mutable std::recursive_mutex init_mutex_;
  std::map<std::string, std::string> configMap;
  mutable std::mutex configMutex;
  std::string envFilePath;
  std::string explicitPath_;
  std::vector<std::string> loadedFiles_;
};

// =============================================================================
// 전역 편의 함수들
// =============================================================================

inline ConfigManager &Config() { return ConfigManager::getInstance(); }

inline std::string GetConfig(const std::string &key,
                             const std::string &defaultValue = "") {
  return ConfigManager::getInstance().getOrDefault(key, defaultValue);
}

inline int GetConfigInt(const std::string &key, int defaultValue = 0) {
  return ConfigManager::getInstance().getInt(key, defaultValue);
}

inline bool GetConfigBool(const std::string &key, bool defaultValue = false) {
  return ConfigManager::getInstance().getBool(key, defaultValue);
}
