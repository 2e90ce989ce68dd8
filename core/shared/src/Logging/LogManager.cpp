#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <iostream>

// 두 enum은 값이 같지만 변환은 명시적으로 한다
LogLib::LogLevel LogManager::ToEngineLevel(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:     return LogLib::LogLevel::TRACE;
  case LogLevel::DEBUG:     return LogLib::LogLevel::DEBUG;
  case LogLevel::INFO:      return LogLib::LogLevel::INFO;
  case LogLevel::WARN:      return LogLib::LogLevel::WARN;
  case LogLevel::LOG_ERROR: return LogLib::LogLevel::LOG_ERROR;
  case LogLevel::LOG_FATAL: return LogLib::LogLevel::LOG_FATAL;
  case LogLevel::OFF:       return LogLib::LogLevel::OFF;
  }
  return LogLib::LogLevel::INFO;
}

LogLevel LogManager::FromEngineLevel(LogLib::LogLevel level) {
  switch (level) {
  case LogLib::LogLevel::TRACE:     return LogLevel::TRACE;
  case LogLib::LogLevel::DEBUG:     return LogLevel::DEBUG;
  case LogLib::LogLevel::INFO:      return LogLevel::INFO;
  case LogLib::LogLevel::WARN:      return LogLevel::WARN;
  case LogLib::LogLevel::LOG_ERROR: return LogLevel::LOG_ERROR;
  case LogLib::LogLevel::LOG_FATAL: return LogLevel::LOG_FATAL;
  case LogLib::LogLevel::OFF:       return LogLevel::OFF;
  }
  return LogLevel::OFF;
}

void LogManager::ensureInitialized() {
  if (initialized_.load(std::memory_order_acquire))
    return;

  // ConfigManager 초기화 중 남긴 로그가 여기로 다시 들어오는 경우
  static thread_local bool applying = false;
  if (applying)
    return;

  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_.load(std::memory_order_relaxed))
    return;

  applying = true;
  applyConfig();
  applying = false;
  initialized_.store(true, std::memory_order_release);
}

void LogManager::applyConfig() {
  auto &engine = LogLib::LoggerEngine::getInstance();
  try {
    auto &config = ConfigManager::getInstance();
    engine.setLogLevel(LogLib::LoggerEngine::stringToLogLevel(
        config.getOrDefault("LOG_LEVEL", "INFO")));
    engine.setConsoleOutput(config.getBool("LOG_TO_CONSOLE", true));
    engine.setFileOutput(config.getBool("LOG_TO_FILE", true));
    engine.setLogBasePath(config.getOrDefault("LOG_FILE_PATH", "./logs/"));
    engine.setMaxLogSizeMB(
        static_cast<size_t>(config.getInt("LOG_MAX_SIZE_MB", 100)));
    engine.setMaxLogFiles(config.getInt("LOG_MAX_FILES", 30));
  } catch (const std::exception &e) {
    std::cerr << "[LogManager] keeping default log settings: " << e.what()
              << std::endl;
  }
}

void LogManager::log(const std::string &category, LogLevel level,
                     const std::string &message) {
  LogLib::LoggerEngine::getInstance().log(category, ToEngineLevel(level),
                                          message);
}

void LogManager::setLogLevel(LogLevel level) {
  LogLib::LoggerEngine::getInstance().setLogLevel(ToEngineLevel(level));
}

LogLevel LogManager::getLogLevel() const {
  return FromEngineLevel(LogLib::LoggerEngine::getInstance().getLogLevel());
}

void LogManager::reloadSettings() { applyConfig(); }

void LogManager::setConsoleOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setConsoleOutput(enabled);
}

void LogManager::setFileOutput(bool enabled) {
  LogLib::LoggerEngine::getInstance().setFileOutput(enabled);
}

void LogManager::cleanupOldLogs(int retentionDays) {
  LogLib::LoggerEngine::getInstance().cleanupOldLogs(retentionDays);
}

int LogManager::addSink(LogLib::LogSink sink) {
  return LogLib::LoggerEngine::getInstance().addSink(std::move(sink));
}

void LogManager::removeSink(int sink_id) {
  LogLib::LoggerEngine::getInstance().removeSink(sink_id);
}

void LogManager::flushAll() { LogLib::LoggerEngine::getInstance().flushAll(); }
