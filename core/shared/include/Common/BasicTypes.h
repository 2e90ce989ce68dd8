#ifndef COMMON_BASIC_TYPES_H
#define COMMON_BASIC_TYPES_H

/**
 * @file BasicTypes.h
 * @brief DeviceWatch 기본 타입 정의
 * @details
 * - 식별자는 모든 플랫폼에서 string으로 통일
 * - 저장/전송용 타임스탬프는 ISO-8601 UTC (밀리초) 문자열
 */

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace DeviceWatch {
namespace BasicTypes {

// =========================================================================
// 핵심 식별자 타입들
// =========================================================================

using UniqueId = std::string;
using DeviceID = std::string; // 하드웨어 고유 ID (예: MAC)
using AlertID = std::string;  // deviceId + "_" + metric

// 시간 관련 타입
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// =========================================================================
// 유틸리티 함수들
// =========================================================================

/**
 * @brief 현재 타임스탬프 반환
 */
inline Timestamp GetCurrentTimestamp() {
  return std::chrono::system_clock::now();
}

/**
 * @brief 타임스탬프를 ISO-8601 UTC 문자열로 변환 (2026-01-02T03:04:05.678Z)
 */
inline std::string TimestampToIsoString(const Timestamp &timestamp) {
  auto time_t = std::chrono::system_clock::to_time_t(timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) %
            1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
    time_t -= 1;
  }

  std::tm tm_buf{};
#ifdef _WIN32
  gmtime_s(&tm_buf, &time_t);
#else
  gmtime_r(&time_t, &tm_buf);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << ms.count() << 'Z';
  return ss.str();
}

/**
 * @brief ISO-8601 UTC 문자열을 타임스탬프로 변환
 * @return 형식이 맞지 않으면 nullopt
 */
inline std::optional<Timestamp> ParseIsoTimestamp(const std::string &text) {
  std::tm tm_buf{};
  std::istringstream ss(text);
  ss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail())
    return std::nullopt;

  int millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    std::string digits;
    while (std::isdigit(ss.peek()) && digits.size() < 3)
      digits.push_back(static_cast<char>(ss.get()));
    while (digits.size() < 3)
      digits.push_back('0');
    millis = std::stoi(digits);
  }

#ifdef _WIN32
  std::time_t seconds = _mkgmtime(&tm_buf);
#else
  std::time_t seconds = timegm(&tm_buf);
#endif
  if (seconds == static_cast<std::time_t>(-1))
    return std::nullopt;

  return std::chrono::system_clock::from_time_t(seconds) +
         std::chrono::milliseconds(millis);
}

} // namespace BasicTypes
} // namespace DeviceWatch

#endif // COMMON_BASIC_TYPES_H
