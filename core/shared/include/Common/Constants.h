// core/shared/include/Common/Constants.h
#ifndef DEVICEWATCH_COMMON_CONSTANTS_H
#define DEVICEWATCH_COMMON_CONSTANTS_H

/**
 * @file Constants.h
 * @brief DeviceWatch 통합 상수 정의
 * @details ConfigManager 키가 비어 있을 때 사용하는 기본값들
 */

#include <cstddef>

namespace DeviceWatch {
namespace Constants {

// =========================================================================
// 스케줄러
// =========================================================================
constexpr int DEFAULT_MONITORING_INTERVAL_SECONDS = 5;
constexpr int DEFAULT_MAX_CONCURRENT_MONITORS = 10;
constexpr int DEFAULT_TASK_TIMEOUT_SECONDS = 30;

// =========================================================================
// 히스토리 / 베이스라인
// =========================================================================
constexpr size_t DEFAULT_MAX_HISTORY_SIZE = 100;
constexpr size_t DEFAULT_ANOMALY_MIN_SAMPLES = 20;
constexpr size_t BASELINE_STATS_MIN_SAMPLES = 10;
constexpr double DEFAULT_ANOMALY_Z_THRESHOLD = 2.5;
constexpr double STDDEV_EPSILON = 0.001;

// =========================================================================
// 알람
// =========================================================================
constexpr size_t DEFAULT_ALERT_HISTORY_CAPACITY = 1000;
constexpr const char *DEFAULT_ALERT_THRESHOLDS =
    "cpu:80:95,memory:85:95,disk:90:98";
constexpr int DEFAULT_THRESHOLD_DURATION_SECONDS = 60;

// =========================================================================
// 캐시
// =========================================================================
constexpr int DEFAULT_CACHE_TTL_SECONDS = 300;
constexpr size_t DEFAULT_CACHE_CAPACITY = 1000;
constexpr size_t DEFAULT_CACHE_SHARDS = 16;

// =========================================================================
// 데이터베이스
// =========================================================================
constexpr const char *DEFAULT_DATABASE_PATH = "./data/db/devicewatch.db";
constexpr int DEFAULT_DATABASE_CONNECTIONS = 5;
constexpr int DEFAULT_BUSY_TIMEOUT_MS = 5000;
constexpr int DEFAULT_SQLITE_CACHE_SIZE = 10000;

// =========================================================================
// 이벤트 버스
// =========================================================================
constexpr size_t DEFAULT_RECENT_EVENT_CAPACITY = 500;
constexpr size_t DEFAULT_EVENT_QUEUE_CAPACITY = 1000;

} // namespace Constants
} // namespace DeviceWatch

#endif // DEVICEWATCH_COMMON_CONSTANTS_H
