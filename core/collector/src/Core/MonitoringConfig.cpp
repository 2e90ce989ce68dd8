/**
 * @file MonitoringConfig.cpp
 */

#include "Core/MonitoringConfig.h"

#include <sstream>

#include "Utils/ConfigManager.h"

namespace DeviceWatch {
namespace Core {

using Enums::ErrorCode;
using Structs::OpResult;

namespace {

std::string Trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

std::vector<std::string> Split(const std::string &text, char delimiter) {
  std::vector<std::string> parts;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    item = Trim(item);
    if (!item.empty())
      parts.push_back(item);
  }
  return parts;
}

bool ParseDouble(const std::string &text, double &out) {
  try {
    size_t pos = 0;
    out = std::stod(text, &pos);
    return pos == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

size_t PositiveOr(int value, size_t fallback) {
  return value > 0 ? static_cast<size_t>(value) : fallback;
}

} // namespace

// =============================================================================
// 파싱
// =============================================================================

OpResult<std::vector<Structs::AlertThreshold>>
MonitoringConfig::ParseThresholds(const std::string &text) {
  std::vector<Structs::AlertThreshold> thresholds;

  for (const auto &entry : Split(text, ',')) {
    auto fields = Split(entry, ':');
    if (fields.size() != 3) {
      return OpResult<std::vector<Structs::AlertThreshold>>::Failure(
          ErrorCode::CONFIGURATION_ERROR,
          "invalid threshold entry '" + entry + "' (expected metric:warning:critical)");
    }

    Structs::AlertThreshold threshold;
    threshold.metric = fields[0];
    if (!ParseDouble(fields[1], threshold.warning_level) ||
        !ParseDouble(fields[2], threshold.critical_level)) {
      return OpResult<std::vector<Structs::AlertThreshold>>::Failure(
          ErrorCode::CONFIGURATION_ERROR,
          "non-numeric threshold level in '" + entry + "'");
    }
    if (threshold.warning_level > threshold.critical_level) {
      return OpResult<std::vector<Structs::AlertThreshold>>::Failure(
          ErrorCode::CONFIGURATION_ERROR,
          "warning level above critical level in '" + entry + "'");
    }
    thresholds.push_back(threshold);
  }
  return thresholds;
}

OpResult<std::vector<Structs::DeviceInfo>>
MonitoringConfig::ParseDevices(const std::string &text) {
  std::vector<Structs::DeviceInfo> devices;

  for (const auto &entry : Split(text, ',')) {
    size_t at = entry.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= entry.size()) {
      return OpResult<std::vector<Structs::DeviceInfo>>::Failure(
          ErrorCode::CONFIGURATION_ERROR,
          "invalid device entry '" + entry + "' (expected id@ip[/hostname])");
    }

    Structs::DeviceInfo device;
    device.id = Trim(entry.substr(0, at));
    std::string rest = entry.substr(at + 1);
    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
      device.ip = Trim(rest);
      device.hostname = device.ip;
    } else {
      device.ip = Trim(rest.substr(0, slash));
      device.hostname = Trim(rest.substr(slash + 1));
    }
    if (device.ip.empty()) {
      return OpResult<std::vector<Structs::DeviceInfo>>::Failure(
          ErrorCode::CONFIGURATION_ERROR, "empty ip in device entry '" + entry + "'");
    }

    // 설정으로 등록된 디바이스는 도달 가능한 것으로 보고 바로 폴링 대상
    device.status = Enums::DeviceStatus::ONLINE;
    device.monitoring_enabled = true;
    devices.push_back(device);
  }
  return devices;
}

// =============================================================================
// ConfigManager -> MonitoringConfig
// =============================================================================

OpResult<MonitoringConfig> MonitoringConfig::FromConfigManager() {
  return FromConfigManager(ConfigManager::getInstance());
}

OpResult<MonitoringConfig>
MonitoringConfig::FromConfigManager(const ConfigManager &config) {
  MonitoringConfig mc;

  mc.interval = milliseconds(
      1000LL * config.getInt("MONITORING_INTERVAL_SECONDS",
                             Constants::DEFAULT_MONITORING_INTERVAL_SECONDS));
  mc.max_history_size = PositiveOr(
      config.getInt("MAX_HISTORY_SIZE",
                     static_cast<int>(Constants::DEFAULT_MAX_HISTORY_SIZE)),
      Constants::DEFAULT_MAX_HISTORY_SIZE);
  mc.cache_ttl = milliseconds(
      1000LL * config.getInt("CACHE_TTL_SECONDS", Constants::DEFAULT_CACHE_TTL_SECONDS));
  mc.cache_capacity = PositiveOr(
      config.getInt("CACHE_CAPACITY",
                     static_cast<int>(Constants::DEFAULT_CACHE_CAPACITY)),
      Constants::DEFAULT_CACHE_CAPACITY);
  mc.max_concurrent_monitors = PositiveOr(
      config.getInt("MAX_CONCURRENT_MONITORS", Constants::DEFAULT_MAX_CONCURRENT_MONITORS),
      Constants::DEFAULT_MAX_CONCURRENT_MONITORS);
  mc.task_timeout = milliseconds(
      1000LL * config.getInt("TASK_TIMEOUT_SECONDS", Constants::DEFAULT_TASK_TIMEOUT_SECONDS));
  mc.failed_device_retry =
      milliseconds(1000LL * config.getInt("FAILED_DEVICE_RETRY_SECONDS", 0));

  mc.database_path =
      config.getOrDefault("DATABASE_PATH", Constants::DEFAULT_DATABASE_PATH);
  mc.database_connections =
      config.getInt("DATABASE_CONNECTIONS", Constants::DEFAULT_DATABASE_CONNECTIONS);
  mc.busy_timeout_ms =
      config.getInt("DATABASE_BUSY_TIMEOUT_MS", Constants::DEFAULT_BUSY_TIMEOUT_MS);

  mc.alert_history_capacity = PositiveOr(
      config.getInt("ALERT_HISTORY_CAPACITY",
                     static_cast<int>(Constants::DEFAULT_ALERT_HISTORY_CAPACITY)),
      Constants::DEFAULT_ALERT_HISTORY_CAPACITY);
  mc.anomaly_z_threshold =
      config.getDouble("ANOMALY_Z_THRESHOLD", Constants::DEFAULT_ANOMALY_Z_THRESHOLD);
  mc.anomaly_min_samples = PositiveOr(
      config.getInt("ANOMALY_MIN_SAMPLES",
                     static_cast<int>(Constants::DEFAULT_ANOMALY_MIN_SAMPLES)),
      Constants::DEFAULT_ANOMALY_MIN_SAMPLES);
  mc.anomaly_overrides_thresholds =
      config.getBool("ANOMALY_OVERRIDES_THRESHOLDS", true);

  auto thresholds = ParseThresholds(
      config.getOrDefault("ALERT_THRESHOLDS", Constants::DEFAULT_ALERT_THRESHOLDS));
  if (!thresholds)
    return OpResult<MonitoringConfig>(thresholds.Error());
  mc.thresholds = thresholds.Value();

  auto devices = ParseDevices(config.getOrDefault("DEVICES", ""));
  if (!devices)
    return OpResult<MonitoringConfig>(devices.Error());
  mc.seed_devices = devices.Value();

  auto valid = mc.Validate();
  if (!valid)
    return OpResult<MonitoringConfig>(valid.Error());
  return mc;
}

OpResult<void> MonitoringConfig::Validate() const {
  if (interval.count() <= 0)
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "MONITORING_INTERVAL_SECONDS must be positive");
  if (task_timeout.count() <= 0)
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "TASK_TIMEOUT_SECONDS must be positive");
  if (cache_ttl.count() < 0)
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "CACHE_TTL_SECONDS must not be negative");
  if (database_path.empty())
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "DATABASE_PATH is empty");
  if (database_connections <= 0)
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "DATABASE_CONNECTIONS must be positive");
  if (anomaly_z_threshold <= 0.0)
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "ANOMALY_Z_THRESHOLD must be positive");
  return OpResult<void>::Success();
}

nlohmann::json MonitoringConfig::toJson() const {
  nlohmann::json j;
  j["interval_ms"] = interval.count();
  j["max_concurrent_monitors"] = max_concurrent_monitors;
  j["task_timeout_ms"] = task_timeout.count();
  j["failed_device_retry_ms"] = failed_device_retry.count();
  j["max_history_size"] = max_history_size;
  j["cache_ttl_ms"] = cache_ttl.count();
  j["cache_capacity"] = cache_capacity;
  j["database_path"] = database_path;
  j["database_connections"] = database_connections;
  j["alert_history_capacity"] = alert_history_capacity;
  j["anomaly_z_threshold"] = anomaly_z_threshold;
  j["anomaly_min_samples"] = anomaly_min_samples;
  j["anomaly_overrides_thresholds"] = anomaly_overrides_thresholds;
  j["thresholds"] = nlohmann::json::array();
  for (const auto &t : thresholds)
    j["thresholds"].push_back(t.toJson());
  j["seed_devices"] = seed_devices.size();
  return j;
}

} // namespace Core
} // namespace DeviceWatch
