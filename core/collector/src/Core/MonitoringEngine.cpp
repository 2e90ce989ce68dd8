/**
 * @file MonitoringEngine.cpp
 */

#include "Core/MonitoringEngine.h"

#include <filesystem>

#include "Alarm/AlertManager.h"
#include "Alarm/AnomalyDetector.h"
#include "Cache/TelemetryCache.h"
#include "ConnectionPool.hpp"
#include "Database/AlertStore.h"
#include "Database/DbLoggerAdapter.h"
#include "Event/MonitoringEventBus.h"
#include "Logging/LogManager.h"
#include "Workers/CachingTelemetryProvider.h"
#include "Workers/DeviceRegistry.h"

namespace DeviceWatch {
namespace Core {

using Enums::ErrorCode;
using Structs::OpResult;

MonitoringEngine::MonitoringEngine(
    MonitoringConfig config, std::shared_ptr<Workers::ITelemetryProvider> provider)
    : config_(std::move(config)), raw_provider_(std::move(provider)) {}

MonitoringEngine::~MonitoringEngine() {
  stop();
  if (pool_)
    pool_->shutdown();
}

// =============================================================================
// 초기화
// =============================================================================

OpResult<void> MonitoringEngine::initialize() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (initialized_.load())
    return OpResult<void>::Success();

  auto &log = LogManager::getInstance();
  log.log("engine", LogLevel::INFO, "=== DEVICEWATCH ENGINE INITIALIZATION ===");

  auto valid = config_.Validate();
  if (!valid) {
    log.log("engine", LogLevel::LOG_ERROR,
            "✗ Invalid configuration: " + valid.Error().message);
    return valid;
  }
  if (!raw_provider_) {
    return OpResult<void>::Failure(ErrorCode::CONFIGURATION_ERROR,
                                   "no telemetry provider configured");
  }

  // 1. 데이터베이스
  log.log("engine", LogLevel::INFO,
          "Step 1/5: Opening database " + config_.database_path);
  if (!ensureDatabaseDirectory()) {
    return OpResult<void>::Failure(ErrorCode::DATABASE_UNAVAILABLE,
                                   "cannot create database directory for " +
                                       config_.database_path);
  }

  DbLib::PoolConfig pool_config;
  pool_config.sqlite_path = config_.database_path;
  pool_config.pool_size = config_.database_connections;
  pool_config.busy_timeout_ms = config_.busy_timeout_ms;
  pool_config.cache_size = Constants::DEFAULT_SQLITE_CACHE_SIZE;

  db_logger_ = std::make_unique<Database::DbLoggerAdapter>();
  pool_ = std::make_shared<DbLib::ConnectionPool>();
  if (!pool_->initialize(pool_config, db_logger_.get())) {
    log.log("engine", LogLevel::LOG_FATAL,
            "✗ No database connection could be opened: " + config_.database_path);
    return OpResult<void>::Failure(ErrorCode::DATABASE_UNAVAILABLE,
                                   "no database connection could be opened");
  }

  store_ = std::make_shared<Database::AlertStore>(pool_);
  auto schema = store_->initializeSchema();
  if (!schema) {
    return OpResult<void>::Failure(ErrorCode::DATABASE_UNAVAILABLE,
                                   schema.Error().message);
  }
  log.log("engine", LogLevel::INFO, "✓ Database ready");

  // 2. 디바이스
  log.log("engine", LogLevel::INFO, "Step 2/5: Loading devices...");
  registry_ = std::make_shared<Workers::DeviceRegistry>(config_.max_history_size);
  size_t device_count = loadDevices();
  log.log("engine", LogLevel::INFO,
          "✓ " + std::to_string(device_count) + " devices registered");

  // 3. 알람
  log.log("engine", LogLevel::INFO, "Step 3/5: Initializing alert manager...");
  Alarm::AnomalyDetectorConfig detector_config;
  detector_config.window_size = config_.max_history_size;
  detector_config.min_samples = config_.anomaly_min_samples;
  detector_config.z_threshold = config_.anomaly_z_threshold;
  detector_ = std::make_shared<Alarm::AnomalyDetector>(detector_config);

  event_bus_ = std::make_shared<Event::MonitoringEventBus>();

  Alarm::AlertManagerConfig alert_config;
  alert_config.history_capacity = config_.alert_history_capacity;
  alert_config.anomaly_overrides_thresholds = config_.anomaly_overrides_thresholds;
  alert_manager_ =
      std::make_shared<Alarm::AlertManager>(detector_, alert_config, event_bus_);
  for (const auto &threshold : config_.thresholds)
    alert_manager_->setThreshold(threshold);

  size_t restored = restoreAlerts();
  log.log("engine", LogLevel::INFO,
          "✓ " + std::to_string(config_.thresholds.size()) + " thresholds, " +
              std::to_string(restored) + " unresolved alerts restored");

  // 4. provider (캐시 데코레이터)
  log.log("engine", LogLevel::INFO, "Step 4/5: Preparing telemetry provider...");
  std::shared_ptr<Workers::ITelemetryProvider> provider = raw_provider_;
  if (config_.cache_ttl.count() > 0) {
    auto cache = std::make_shared<Workers::JsonCache>(config_.cache_capacity,
                                                      config_.cache_ttl);
    caching_provider_ =
        std::make_shared<Workers::CachingTelemetryProvider>(raw_provider_, cache);
    provider = caching_provider_;
  }
  log.log("engine", LogLevel::INFO, "✓ Provider: " + provider->name());

  // 5. 스케줄러
  log.log("engine", LogLevel::INFO, "Step 5/5: Creating scheduler...");
  Workers::SchedulerConfig scheduler_config;
  scheduler_config.interval = config_.interval;
  scheduler_config.max_concurrent_monitors = config_.max_concurrent_monitors;
  scheduler_config.task_timeout = config_.task_timeout;
  scheduler_config.failed_device_retry = config_.failed_device_retry;
  scheduler_ = std::make_unique<Workers::MonitoringScheduler>(
      scheduler_config, registry_, provider, alert_manager_, store_, event_bus_);

  initialized_.store(true);
  log.log("engine", LogLevel::INFO, "=== DEVICEWATCH ENGINE READY ===");
  return OpResult<void>::Success();
}

bool MonitoringEngine::ensureDatabaseDirectory() {
  if (config_.database_path == ":memory:")
    return true;

  std::error_code ec;
  auto parent = std::filesystem::path(config_.database_path).parent_path();
  if (parent.empty() || std::filesystem::exists(parent, ec))
    return true;

  std::filesystem::create_directories(parent, ec);
  if (ec) {
    LogManager::getInstance().log("engine", LogLevel::LOG_ERROR,
                                  "Failed to create " + parent.string() + ": " +
                                      ec.message());
    return false;
  }
  return true;
}

size_t MonitoringEngine::loadDevices() {
  auto stored = store_->loadDevices();
  if (stored) {
    for (const auto &device : stored.Value()) {
      auto added = registry_->upsert(device);
      if (!added) {
        LogManager::getInstance().log("engine", LogLevel::WARN,
                                      "Skipping stored device " + device.id +
                                          ": " + added.Error().message);
      }
    }
  } else {
    LogManager::getInstance().log("engine", LogLevel::WARN,
                                  "Failed to load stored devices: " +
                                      stored.Error().GetSummary());
  }

  // 시드 디바이스는 저장된 레코드가 없을 때만 추가
  for (const auto &device : config_.seed_devices) {
    if (registry_->get(device.id))
      continue;
    auto added = addDevice(device);
    if (!added) {
      LogManager::getInstance().log("engine", LogLevel::WARN,
                                    "Failed to add seed device " + device.id +
                                        ": " + added.Error().message);
    }
  }
  return registry_->size();
}

size_t MonitoringEngine::restoreAlerts() {
  auto stored = store_->loadAlerts(true);
  if (!stored) {
    LogManager::getInstance().log("engine", LogLevel::WARN,
                                  "Failed to load unresolved alerts: " +
                                      stored.Error().GetSummary());
    return 0;
  }
  return alert_manager_->restoreAlerts(stored.Value());
}

// =============================================================================
// 생명주기
// =============================================================================

bool MonitoringEngine::start() {
  if (!initialized_.load() || !scheduler_) {
    LogManager::getInstance().log("engine", LogLevel::LOG_ERROR,
                                  "start() called before initialize()");
    return false;
  }
  scheduler_->start();
  return scheduler_->isRunning();
}

void MonitoringEngine::stop() {
  if (scheduler_)
    scheduler_->stop();
}

bool MonitoringEngine::isRunning() const {
  return scheduler_ && scheduler_->isRunning();
}

Workers::CycleReport MonitoringEngine::pollOnce() {
  if (!scheduler_)
    return Workers::CycleReport{};
  return scheduler_->pollOnce();
}

// =============================================================================
// 소비자 API
// =============================================================================

std::vector<Structs::Alert> MonitoringEngine::getActiveAlerts() const {
  if (!alert_manager_)
    return {};
  return alert_manager_->getActiveAlerts();
}

std::vector<Structs::Alert> MonitoringEngine::getAlertHistory(size_t limit) const {
  if (!alert_manager_)
    return {};
  return alert_manager_->getAlertHistory(limit);
}

OpResult<Structs::Alert>
MonitoringEngine::acknowledgeAlert(const std::string &alert_id) {
  if (!alert_manager_) {
    return OpResult<Structs::Alert>::Failure(ErrorCode::INTERNAL_ERROR,
                                             "engine not initialized");
  }

  auto result = alert_manager_->acknowledgeAlert(alert_id);
  if (result && store_) {
    auto saved = store_->saveAlert(result.Value());
    if (!saved) {
      LogManager::getInstance().log("engine", LogLevel::WARN,
                                    "Acknowledged alert not persisted: " +
                                        saved.Error().GetSummary());
    }
  }
  return result;
}

OpResult<void> MonitoringEngine::addDevice(const Structs::DeviceInfo &device) {
  if (!registry_) {
    return OpResult<void>::Failure(ErrorCode::INTERNAL_ERROR,
                                   "engine not initialized");
  }

  auto added = registry_->upsert(device);
  if (!added)
    return added;

  if (store_) {
    auto saved = store_->saveDevice(device);
    if (!saved)
      return saved;
  }
  LogManager::getInstance().log("engine", LogLevel::INFO,
                                "Device registered: " + device.id + " (" +
                                    device.ip + ")");
  return OpResult<void>::Success();
}

bool MonitoringEngine::setMonitoringEnabled(const std::string &device_id,
                                            bool enabled) {
  if (!registry_ || !registry_->setMonitoringEnabled(device_id, enabled))
    return false;

  if (store_) {
    auto device = registry_->get(device_id);
    if (device) {
      auto saved = store_->saveDevice(*device);
      if (!saved) {
        LogManager::getInstance().log("engine", LogLevel::WARN,
                                      "Device change not persisted: " +
                                          saved.Error().GetSummary());
      }
    }
  }
  return true;
}

std::vector<Structs::DeviceInfo> MonitoringEngine::getDevices() const {
  if (!registry_)
    return {};
  return registry_->snapshot();
}

std::vector<Structs::MetricSample>
MonitoringEngine::getMetricHistory(const std::string &device_id,
                                   const std::string &metric) const {
  if (!registry_)
    return {};
  return registry_->getHistory(device_id, metric);
}

nlohmann::json MonitoringEngine::getStatistics() const {
  nlohmann::json j;
  j["initialized"] = initialized_.load();
  j["devices"] = registry_ ? registry_->size() : 0;
  if (scheduler_)
    j["scheduler"] = scheduler_->getStatistics();
  if (alert_manager_)
    j["alerts"] = alert_manager_->getStatistics();
  if (store_)
    j["database"] = store_->getStatistics();
  if (caching_provider_)
    j["cache"] = caching_provider_->getCache()->getStatistics();
  if (event_bus_) {
    j["events"] = {{"published", event_bus_->publishedCount()},
                   {"subscribers", event_bus_->subscriberCount()},
                   {"handler_errors", event_bus_->handlerErrorCount()}};
  }
  return j;
}

} // namespace Core
} // namespace DeviceWatch
