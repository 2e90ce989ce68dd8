/**
 * @file MonitoringConfig.h
 * @brief DeviceWatch 엔진 설정 (ConfigManager 키에서 구성)
 */

#ifndef DEVICEWATCH_MONITORING_CONFIG_H
#define DEVICEWATCH_MONITORING_CONFIG_H

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Common/Constants.h"
#include "Common/Structs.h"

class ConfigManager;

namespace DeviceWatch {
namespace Core {

using std::chrono::milliseconds;

struct MonitoringConfig {
  // 스케줄러
  milliseconds interval{Constants::DEFAULT_MONITORING_INTERVAL_SECONDS * 1000};
  size_t max_concurrent_monitors = Constants::DEFAULT_MAX_CONCURRENT_MONITORS;
  milliseconds task_timeout{Constants::DEFAULT_TASK_TIMEOUT_SECONDS * 1000};
  milliseconds failed_device_retry{0};

  // 히스토리 / 기준선 윈도우
  size_t max_history_size = Constants::DEFAULT_MAX_HISTORY_SIZE;

  // provider 캐시 (ttl 0 이면 캐시 없음)
  milliseconds cache_ttl{Constants::DEFAULT_CACHE_TTL_SECONDS * 1000};
  size_t cache_capacity = Constants::DEFAULT_CACHE_CAPACITY;

  // 데이터베이스
  std::string database_path = Constants::DEFAULT_DATABASE_PATH;
  int database_connections = Constants::DEFAULT_DATABASE_CONNECTIONS;
  int busy_timeout_ms = Constants::DEFAULT_BUSY_TIMEOUT_MS;

  // 알람
  std::vector<Structs::AlertThreshold> thresholds;
  size_t alert_history_capacity = Constants::DEFAULT_ALERT_HISTORY_CAPACITY;
  double anomaly_z_threshold = Constants::DEFAULT_ANOMALY_Z_THRESHOLD;
  size_t anomaly_min_samples = Constants::DEFAULT_ANOMALY_MIN_SAMPLES;
  bool anomaly_overrides_thresholds = true;

  // 시드 디바이스 (DEVICES)
  std::vector<Structs::DeviceInfo> seed_devices;

  /**
   * @brief ConfigManager 키에서 설정 구성
   * @return ALERT_THRESHOLDS / DEVICES 형식 오류 시 CONFIGURATION_ERROR
   */
  static Structs::OpResult<MonitoringConfig> FromConfigManager(const ConfigManager &config);
  static Structs::OpResult<MonitoringConfig> FromConfigManager();

  // "cpu:80:95,memory:85:95"
  static Structs::OpResult<std::vector<Structs::AlertThreshold>>
  ParseThresholds(const std::string &text);

  // "id@ip[/hostname],..."
  static Structs::OpResult<std::vector<Structs::DeviceInfo>>
  ParseDevices(const std::string &text);

  Structs::OpResult<void> Validate() const;
  nlohmann::json toJson() const;
};

} // namespace Core
} // namespace DeviceWatch

#endif // DEVICEWATCH_MONITORING_CONFIG_H
