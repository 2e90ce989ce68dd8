#include "LoggerEngine.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace LogLib {

namespace fs = std::filesystem;

namespace {
constexpr size_t kBytesPerMB = 1024 * 1024;
const char *const kDefaultBasePath = "./logs";
} // namespace

LoggerEngine::LoggerEngine()
    : min_level_(LogLevel::INFO), base_path_(kDefaultBasePath),
      console_output_(true), file_output_(true),
      max_size_bytes_(100 * kBytesPerMB), max_files_(30), next_sink_id_(1) {}

LoggerEngine::~LoggerEngine() { flushAll(); }

LoggerEngine &LoggerEngine::getInstance() {
  static LoggerEngine instance;
  return instance;
}

// =============================================================================
// 설정
// =============================================================================

void LoggerEngine::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel LoggerEngine::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void LoggerEngine::setLogBasePath(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  base_path_ = path.empty() ? fs::path(kDefaultBasePath) : fs::path(path);
  // 열린 파일은 이전 위치를 가리킨다
  files_.clear();
}

void LoggerEngine::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  console_output_ = enabled;
}

void LoggerEngine::setFileOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_output_ = enabled;
  if (!enabled)
    files_.clear();
}

bool LoggerEngine::isConsoleOutputEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return console_output_;
}

void LoggerEngine::setMaxLogSizeMB(size_t size_mb) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_size_bytes_ = std::max<size_t>(size_mb, 1) * kBytesPerMB;
}

void LoggerEngine::setMaxLogFiles(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_files_ = count;
}

int LoggerEngine::addSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  int id = next_sink_id_++;
  sinks_[id] = std::move(sink);
  return id;
}

void LoggerEngine::removeSink(int sink_id) {
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.erase(sink_id);
}

// =============================================================================
// 기록
// =============================================================================

void LoggerEngine::log(const std::string &category, LogLevel level,
                       const std::string &message) {
  if (level == LogLevel::OFF || static_cast<int>(level) <
                                    static_cast<int>(getLogLevel()))
    return;

  LogRecord record = makeRecord(category, level, message);
  writeRecord(record);
  dispatchToSinks(record);
}

LogRecord LoggerEngine::makeRecord(const std::string &category, LogLevel level,
                                   const std::string &message) const {
  LogRecord record;
  record.category = category;
  record.level = level;
  record.message = message;
  record.timestamp = std::chrono::system_clock::now();

  // [2026-01-01 12:00:00.123][INFO][scheduler] message
  std::string line = "[" +
                     formatTime(record.timestamp, "%Y-%m-%d %H:%M:%S", true) +
                     "][" + LogLevelToString(level) + "]";
  if (!category.empty())
    line += "[" + category + "]";
  record.formatted = line + " " + message;
  return record;
}

void LoggerEngine::writeRecord(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  countRecord(record.level);

  if (console_output_)
    std::cout << record.formatted << std::endl;
  if (!file_output_)
    return;

  fs::path path = categoryPath(record.category);
  std::ofstream *stream = openFile(path);
  if (!stream)
    return;
  *stream << record.formatted << std::endl;
  rotateIfOversized(path, *stream);
}

fs::path LoggerEngine::categoryPath(const std::string &category) const {
  std::string name = category.empty() ? "system" : category;
  std::replace(name.begin(), name.end(), '/', '_');
  return base_path_ /
         formatTime(std::chrono::system_clock::now(), "%Y%m%d", false) /
         (name + ".log");
}

std::ofstream *LoggerEngine::openFile(const fs::path &path) {
  const std::string key = path.string();
  auto it = files_.find(key);
  if (it != files_.end() && it->second.is_open())
    return &it->second;

  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);

  std::ofstream &stream = files_[key];
  stream.open(path, std::ios::app);
  if (!stream.is_open()) {
    files_.erase(key);
    return nullptr;
  }
  return &stream;
}

void LoggerEngine::rotateIfOversized(const fs::path &path,
                                     std::ofstream &stream) {
  std::streamoff size = stream.tellp();
  if (size < 0 || static_cast<size_t>(size) < max_size_bytes_)
    return;

  stream.close();
  // scheduler.log -> scheduler_20260101_120000.123.log
  std::string stamp = formatTime(std::chrono::system_clock::now(),
                                 "%Y%m%d_%H%M%S", true);
  fs::path rotated = path.parent_path() / (path.stem().string() + "_" + stamp +
                                           path.extension().string());
  std::error_code ec;
  fs::rename(path, rotated, ec);
  pruneRotatedFiles(path);

  stream.open(path, std::ios::app);
}

void LoggerEngine::pruneRotatedFiles(const fs::path &path) {
  if (max_files_ <= 0)
    return;

  const std::string prefix = path.stem().string() + "_";
  std::vector<std::pair<fs::file_time_type, fs::path>> rotated;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(path.parent_path(), ec)) {
    const std::string name = entry.path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0)
      continue;
    std::error_code time_ec;
    auto mtime = entry.last_write_time(time_ec);
    if (!time_ec)
      rotated.emplace_back(mtime, entry.path());
  }

  const size_t keep = static_cast<size_t>(max_files_);
  if (rotated.size() <= keep)
    return;

  // 오래된 것부터 지운다
  std::sort(rotated.begin(), rotated.end());
  for (size_t i = 0; i < rotated.size() - keep; ++i) {
    std::error_code remove_ec;
    fs::remove(rotated[i].second, remove_ec);
  }
}

void LoggerEngine::dispatchToSinks(const LogRecord &record) {
  // sink 안에서 남긴 로그는 sink로 다시 보내지 않는다
  static thread_local bool dispatching = false;
  if (dispatching)
    return;

  std::vector<LogSink> sinks;
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto &kv : sinks_)
      sinks.push_back(kv.second);
  }

  dispatching = true;
  for (const auto &sink : sinks) {
    try {
      sink(record);
    } catch (const std::exception &e) {
      std::lock_guard<std::mutex> lock(mutex_);
      ++statistics_.dropped_sink_calls;
      if (console_output_)
        std::cerr << "[LogLib] sink failed: " << e.what() << std::endl;
    }
  }
  dispatching = false;
}

void LoggerEngine::flushAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &kv : files_)
    kv.second.flush();
  files_.clear();
}

// =============================================================================
// 보존 기간
// =============================================================================

void LoggerEngine::cleanupOldLogs(int retentionDays) {
  if (retentionDays <= 0)
    return;

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!fs::exists(base_path_, ec))
    return;

  const auto cutoff = fs::file_time_type::clock::now() -
                      std::chrono::hours(24 * retentionDays);
  std::vector<fs::path> expired;
  for (fs::recursive_directory_iterator
           it(base_path_, fs::directory_options::skip_permission_denied, ec),
       end;
       !ec && it != end; it.increment(ec)) {
    if (it->path().extension() != ".log")
      continue;
    std::error_code file_ec;
    if (!it->is_regular_file(file_ec))
      continue;
    auto mtime = it->last_write_time(file_ec);
    if (!file_ec && mtime < cutoff)
      expired.push_back(it->path());
  }

  size_t removed = 0;
  for (const auto &path : expired) {
    files_.erase(path.string());
    std::error_code remove_ec;
    if (fs::remove(path, remove_ec))
      ++removed;
  }

  if (removed > 0 && console_output_) {
    std::cout << "[LogLib] removed " << removed << " log file(s) older than "
              << retentionDays << " day(s)" << std::endl;
  }
}

// =============================================================================
// 통계
// =============================================================================

void LoggerEngine::countRecord(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    ++statistics_.trace_count;
    break;
  case LogLevel::DEBUG:
    ++statistics_.debug_count;
    break;
  case LogLevel::INFO:
    ++statistics_.info_count;
    break;
  case LogLevel::WARN:
    ++statistics_.warn_count;
    break;
  case LogLevel::LOG_ERROR:
    ++statistics_.error_count;
    break;
  case LogLevel::LOG_FATAL:
    ++statistics_.fatal_count;
    break;
  default:
    break;
  }
  ++statistics_.total_logs;
  statistics_.last_log_time = std::chrono::system_clock::now();
}

LogStatistics LoggerEngine::getStatistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return statistics_;
}

void LoggerEngine::resetStatistics() {
  std::lock_guard<std::mutex> lock(mutex_);
  statistics_ = LogStatistics{};
}

// =============================================================================
// 유틸리티
// =============================================================================

LogLevel LoggerEngine::stringToLogLevel(const std::string &level) {
  std::string upper;
  for (char c : level)
    upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  static const std::map<std::string, LogLevel> kLevels = {
      {"TRACE", LogLevel::TRACE},     {"DEBUG", LogLevel::DEBUG},
      {"INFO", LogLevel::INFO},       {"WARN", LogLevel::WARN},
      {"WARNING", LogLevel::WARN},    {"ERROR", LogLevel::LOG_ERROR},
      {"FATAL", LogLevel::LOG_FATAL}, {"OFF", LogLevel::OFF}};
  auto it = kLevels.find(upper);
  return it != kLevels.end() ? it->second : LogLevel::INFO;
}

std::string LoggerEngine::formatTime(std::chrono::system_clock::time_point tp,
                                     const char *pattern, bool with_millis) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, pattern);
  if (with_millis) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch())
                  .count() %
              1000;
    oss << '.' << std::setfill('0') << std::setw(3) << ms;
  }
  return oss.str();
}

} // namespace LogLib
