#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

/**
 * @file LogManager.h
 * @brief DeviceWatch 로그 진입점 - LogLib::LoggerEngine 위임
 * @details
 * 파일/콘솔 출력, 로테이션, sink 전달은 LoggerEngine이 맡는다.
 * 이 클래스는 DeviceWatch LogLevel 변환과 ConfigManager 기반 초기 설정
 * (LOG_LEVEL, LOG_TO_CONSOLE, LOG_TO_FILE, LOG_FILE_PATH,
 *  LOG_MAX_SIZE_MB, LOG_MAX_FILES)을 담당한다.
 */

#include "Common/Enums.h"

#include "LoggerEngine.hpp"

#include <atomic>
#include <mutex>
#include <string>

using LogLevel = DeviceWatch::Enums::LogLevel;

class LogManager {
public:
  static LogManager &getInstance() {
    static LogManager instance;
    instance.ensureInitialized();
    return instance;
  }

  // 카테고리 없는 로그 ("system.log")
  void Info(const std::string &message) { log("", LogLevel::INFO, message); }
  void Warn(const std::string &message) { log("", LogLevel::WARN, message); }
  void Error(const std::string &message) {
    log("", LogLevel::LOG_ERROR, message);
  }
  void Fatal(const std::string &message) {
    log("", LogLevel::LOG_FATAL, message);
  }

  // 카테고리 로그 (scheduler, alarm, database, cache, config, provider, engine)
  void log(const std::string &category, LogLevel level,
           const std::string &message);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  /// ConfigManager 값을 다시 읽어 LoggerEngine에 적용
  void reloadSettings();
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  void cleanupOldLogs(int retentionDays);

  // sink 등록 (이벤트 버스 LOG 스트림)
  int addSink(LogLib::LogSink sink);
  void removeSink(int sink_id);

  void flushAll();

  static LogLib::LogLevel ToEngineLevel(LogLevel level);
  static LogLevel FromEngineLevel(LogLib::LogLevel level);

private:
  LogManager() : initialized_(false) {}
  ~LogManager() = default;

  LogManager(const LogManager &) = delete;
  LogManager &operator=(const LogManager &) = delete;

  void ensureInitialized();
  void applyConfig();

  std::atomic<bool> initialized_;
  std::mutex init_mutex_;
};

#endif // LOG_MANAGER_H
