/**
 * @file MonitoringEngine.h
 * @brief DeviceWatch 엔진 - 구성요소 조립 및 소비자 API
 */

#ifndef DEVICEWATCH_MONITORING_ENGINE_H
#define DEVICEWATCH_MONITORING_ENGINE_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Common/Structs.h"
#include "Core/MonitoringConfig.h"
#include "Workers/MonitoringScheduler.h"

namespace DbLib {
class ConnectionPool;
}

namespace DeviceWatch {
namespace Alarm {
class AnomalyDetector;
class AlertManager;
} // namespace Alarm
namespace Database {
class AlertStore;
class DbLoggerAdapter;
} // namespace Database
namespace Event {
class MonitoringEventBus;
}
namespace Workers {
class DeviceRegistry;
class ITelemetryProvider;
class CachingTelemetryProvider;
} // namespace Workers
} // namespace DeviceWatch

namespace DeviceWatch {
namespace Core {

/**
 * @brief 모니터링 엔진
 *
 * initialize() 순서:
 * - 커넥션 풀 -> AlertStore(스키마)
 * - DeviceRegistry (저장된 디바이스 + DEVICES 시드)
 * - AnomalyDetector -> AlertManager (미해제 알람 복원)
 * - MonitoringEventBus -> MonitoringScheduler
 */
class MonitoringEngine {
public:
  MonitoringEngine(MonitoringConfig config,
                   std::shared_ptr<Workers::ITelemetryProvider> provider);
  ~MonitoringEngine();

  MonitoringEngine(const MonitoringEngine &) = delete;
  MonitoringEngine &operator=(const MonitoringEngine &) = delete;

  // ==========================================================================
  // 생명주기
  // ==========================================================================

  /**
   * @return CONFIGURATION_ERROR 또는 DATABASE_UNAVAILABLE 이면 시작 불가
   */
  Structs::OpResult<void> initialize();
  bool isInitialized() const { return initialized_.load(); }

  bool start();
  void stop();
  bool isRunning() const;
  Workers::CycleReport pollOnce();

  // ==========================================================================
  // 소비자 API
  // ==========================================================================
  std::vector<Structs::Alert> getActiveAlerts() const;
  std::vector<Structs::Alert> getAlertHistory(size_t limit = 0) const;

  /**
   * @brief 메모리 상태 확인 후 저장. 저장 실패는 로그만 남긴다.
   */
  Structs::OpResult<Structs::Alert> acknowledgeAlert(const std::string &alert_id);

  Structs::OpResult<void> addDevice(const Structs::DeviceInfo &device);
  bool setMonitoringEnabled(const std::string &device_id, bool enabled);
  std::vector<Structs::DeviceInfo> getDevices() const;
  std::vector<Structs::MetricSample> getMetricHistory(const std::string &device_id,
                                                      const std::string &metric) const;

  std::shared_ptr<Event::MonitoringEventBus> events() const { return event_bus_; }
  std::shared_ptr<Alarm::AlertManager> alertManager() const { return alert_manager_; }
  std::shared_ptr<Database::AlertStore> store() const { return store_; }

  nlohmann::json getStatistics() const;
  const MonitoringConfig &getConfig() const { return config_; }

private:
  bool ensureDatabaseDirectory();
  size_t loadDevices();
  size_t restoreAlerts();

  MonitoringConfig config_;
  std::shared_ptr<Workers::ITelemetryProvider> raw_provider_;

  std::unique_ptr<Database::DbLoggerAdapter> db_logger_;
  std::shared_ptr<DbLib::ConnectionPool> pool_;
  std::shared_ptr<Database::AlertStore> store_;
  std::shared_ptr<Workers::DeviceRegistry> registry_;
  std::shared_ptr<Workers::CachingTelemetryProvider> caching_provider_;
  std::shared_ptr<Alarm::AnomalyDetector> detector_;
  std::shared_ptr<Alarm::AlertManager> alert_manager_;
  std::shared_ptr<Event::MonitoringEventBus> event_bus_;
  std::unique_ptr<Workers::MonitoringScheduler> scheduler_;

  std::atomic<bool> initialized_{false};
  std::mutex init_mutex_;
};

} // namespace Core
} // namespace DeviceWatch

#endif // DEVICEWATCH_MONITORING_ENGINE_H
