#ifndef LOGGER_ENGINE_HPP
#define LOGGER_ENGINE_HPP

#include "LogExport.hpp"
#include "LogTypes.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>

namespace LogLib {

/**
 * @brief Process-wide log engine: level filter, category files and sinks.
 * @details
 * Each accepted record is built once (LogRecord), printed to the console,
 * appended to <base>/<YYYYMMDD>/<category>.log and handed to every sink.
 * A category file that grows past the size limit is renamed with a
 * timestamp suffix; only the newest max_files renamed copies are kept.
 */
class LOGLIB_API LoggerEngine {
public:
  static LoggerEngine &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void setLogBasePath(const std::string &path);
  void setConsoleOutput(bool enabled);
  void setFileOutput(bool enabled);
  bool isConsoleOutputEnabled() const;

  void setMaxLogSizeMB(size_t size_mb);
  void setMaxLogFiles(int count);

  // sink는 레벨 필터를 통과한 모든 레코드를 받는다
  int addSink(LogSink sink);
  void removeSink(int sink_id);

  void log(const std::string &category, LogLevel level,
           const std::string &message);

  // 열린 파일을 모두 flush 후 닫는다. 다음 로그에서 다시 연다.
  void flushAll();

  /// retentionDays 보다 오래된 *.log 파일 삭제
  void cleanupOldLogs(int retentionDays);

  LogStatistics getStatistics() const;
  void resetStatistics();

  static LogLevel stringToLogLevel(const std::string &level);

private:
  LoggerEngine();
  ~LoggerEngine();

  LoggerEngine(const LoggerEngine &) = delete;
  LoggerEngine &operator=(const LoggerEngine &) = delete;

  LogRecord makeRecord(const std::string &category, LogLevel level,
                       const std::string &message) const;
  void writeRecord(const LogRecord &record);
  std::filesystem::path categoryPath(const std::string &category) const;
  std::ofstream *openFile(const std::filesystem::path &path);
  void rotateIfOversized(const std::filesystem::path &path,
                         std::ofstream &stream);
  void pruneRotatedFiles(const std::filesystem::path &path);
  void dispatchToSinks(const LogRecord &record);
  void countRecord(LogLevel level);

  static std::string formatTime(std::chrono::system_clock::time_point tp,
                                const char *pattern, bool with_millis);

  mutable std::mutex mutex_;
  std::map<std::string, std::ofstream> files_; // key: 전체 파일 경로

  LogLevel min_level_;
  std::filesystem::path base_path_;
  bool console_output_;
  bool file_output_;
  size_t max_size_bytes_;
  int max_files_;

  std::mutex sinks_mutex_;
  std::map<int, LogSink> sinks_;
  int next_sink_id_;

  LogStatistics statistics_;
};

} // namespace LogLib

#endif // LOGGER_ENGINE_HPP
