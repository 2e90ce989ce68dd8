// core/shared/include/Common/Enums.h
#ifndef DEVICEWATCH_COMMON_ENUMS_H
#define DEVICEWATCH_COMMON_ENUMS_H

#include <cstdint>
#include <string>

// =============================================================================
// Windows 매크로 충돌 방지 - 반드시 enum 정의 전에!
// =============================================================================
#ifdef _WIN32
#ifdef ERROR
#undef ERROR
#endif

#ifdef min
#undef min
#endif

#ifdef max
#undef max
#endif

#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

// Linux/system headers might define INFO, DEBUG, or WARN as macros
#ifdef INFO
#undef INFO
#endif

#ifdef DEBUG
#undef DEBUG
#endif

#ifdef WARN
#undef WARN
#endif

namespace DeviceWatch {
namespace Enums {

// =========================================================================
// 로그 레벨
// =========================================================================
enum class LogLevel : uint8_t {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  LOG_ERROR = 4, // ERROR 매크로 충돌 방지
  LOG_FATAL = 5,
  OFF = 255
};

// =========================================================================
// 디바이스 상태
// =========================================================================
enum class DeviceStatus : uint8_t {
  ONLINE = 0,
  CONNECTION_FAILED = 1,
  UNKNOWN = 2
};

// =========================================================================
// 알람 레벨
// =========================================================================
enum class AlertLevel : uint8_t { WARNING = 0, CRITICAL = 1, ANOMALY = 2 };

// =========================================================================
// 에러 코드
// =========================================================================
enum class ErrorCode : uint16_t {
  SUCCESS = 0,
  UNKNOWN_ERROR = 1,

  // 연결 관련
  CONNECTION_FAILED = 10,

  // 통신 관련
  TIMEOUT = 100,

  // 데이터 관련
  INVALID_DATA = 200,
  DATA_FORMAT_ERROR = 203,

  // 디바이스 관련
  DEVICE_NOT_FOUND = 303,
  DEVICE_BUSY = 301,

  // 설정 관련
  CONFIGURATION_ERROR = 402,
  INVALID_PARAMETER = 403,

  // 시스템 관련
  INTERNAL_ERROR = 502,

  // 저장소 관련
  PERSISTENCE_ERROR = 700,
  DATABASE_UNAVAILABLE = 701,

  // 알람 관련
  ALERT_NOT_FOUND = 800
};

// =========================================================================
// 문자열 변환 함수들 (인라인)
// =========================================================================

inline std::string DeviceStatusToString(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::ONLINE:
    return "Online";
  case DeviceStatus::CONNECTION_FAILED:
    return "Connection Failed";
  default:
    return "Unknown";
  }
}

inline DeviceStatus StringToDeviceStatus(const std::string &status_str) {
  if (status_str == "Online")
    return DeviceStatus::ONLINE;
  if (status_str == "Connection Failed")
    return DeviceStatus::CONNECTION_FAILED;
  return DeviceStatus::UNKNOWN;
}

inline std::string AlertLevelToString(AlertLevel level) {
  switch (level) {
  case AlertLevel::WARNING:
    return "warning";
  case AlertLevel::CRITICAL:
    return "critical";
  case AlertLevel::ANOMALY:
    return "anomaly";
  default:
    return "warning";
  }
}

inline AlertLevel StringToAlertLevel(const std::string &level_str) {
  if (level_str == "critical")
    return AlertLevel::CRITICAL;
  if (level_str == "anomaly")
    return AlertLevel::ANOMALY;
  return AlertLevel::WARNING;
}

inline std::string LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::LOG_ERROR:
    return "ERROR";
  case LogLevel::LOG_FATAL:
    return "FATAL";
  case LogLevel::OFF:
    return "OFF";
  default:
    return "UNKNOWN";
  }
}

inline std::string ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::SUCCESS:
    return "SUCCESS";
  case ErrorCode::CONNECTION_FAILED:
    return "CONNECTION_FAILED";
  case ErrorCode::TIMEOUT:
    return "TIMEOUT";
  case ErrorCode::INVALID_DATA:
    return "INVALID_DATA";
  case ErrorCode::DATA_FORMAT_ERROR:
    return "DATA_FORMAT_ERROR";
  case ErrorCode::DEVICE_NOT_FOUND:
    return "DEVICE_NOT_FOUND";
  case ErrorCode::DEVICE_BUSY:
    return "DEVICE_BUSY";
  case ErrorCode::CONFIGURATION_ERROR:
    return "CONFIGURATION_ERROR";
  case ErrorCode::INVALID_PARAMETER:
    return "INVALID_PARAMETER";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  case ErrorCode::PERSISTENCE_ERROR:
    return "PERSISTENCE_ERROR";
  case ErrorCode::DATABASE_UNAVAILABLE:
    return "DATABASE_UNAVAILABLE";
  case ErrorCode::ALERT_NOT_FOUND:
    return "ALERT_NOT_FOUND";
  default:
    return "UNKNOWN_ERROR";
  }
}

} // namespace Enums
} // namespace DeviceWatch

#endif // DEVICEWATCH_COMMON_ENUMS_H
