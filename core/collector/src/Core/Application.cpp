/**
 * @file Application.cpp
 * @brief DeviceWatch Collector - 엔진 실행 및 유지보수 명령
 */

#include "Core/Application.h"

#include "ConnectionPool.hpp"
#include "Alarm/AlertManager.h"
#include "Core/MonitoringEngine.h"
#include "Database/AlertStore.h"
#include "Database/DbLoggerAdapter.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"
#include "Workers/SimulatedTelemetryProvider.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace DeviceWatch {
namespace Core {

namespace {

std::string FormatAlertLine(const Structs::Alert &alert) {
  std::ostringstream oss;
  oss << std::left << std::setw(28) << alert.id << " " << std::setw(9)
      << Enums::AlertLevelToString(alert.level) << " " << std::right
      << std::fixed << std::setprecision(1) << std::setw(7) << alert.value
      << "  " << BasicTypes::TimestampToIsoString(alert.timestamp) << "  "
      << (alert.acknowledged ? "ACK " : "    ")
      << (alert.resolved ? "RESOLVED " : "") << alert.message;
  return oss.str();
}

} // namespace

CollectorApplication::CollectorApplication(std::string config_path)
    : config_path_(std::move(config_path)) {
  LogManager::getInstance().Info("CollectorApplication initialized");
}

CollectorApplication::~CollectorApplication() {
  Cleanup();
  LogManager::getInstance().Info("CollectorApplication destroyed");
}

void CollectorApplication::SetProvider(
    std::shared_ptr<Workers::ITelemetryProvider> provider) {
  provider_ = std::move(provider);
}

// =============================================================================
// 초기화
// =============================================================================

bool CollectorApplication::LoadConfiguration() {
  auto &config = ConfigManager::getInstance();

  // 1. 설정 파일
  if (!config_path_.empty()) {
    if (!config.initialize(config_path_)) {
      LogManager::getInstance().Error("✗ Cannot read config file: " +
                                      config_path_);
      return false;
    }
  }
  LogManager::getInstance().reloadSettings();
  LogManager::getInstance().Info("✓ Configuration loaded from " +
                                 config.getConfigFilePath());

  // 2. 엔진 설정
  auto loaded = MonitoringConfig::FromConfigManager(config);
  if (!loaded) {
    LogManager::getInstance().Error("✗ Invalid configuration: " +
                                    loaded.Error().message);
    return false;
  }
  config_ = loaded.Value();

  // 3. 보관 설정
  log_retention_days_ = config.getInt("LOG_RETENTION_DAYS", 30);
  alert_retention_days_ = config.getInt("ALERT_RETENTION_DAYS", 30);
  metric_retention_days_ = config.getInt("METRIC_RETENTION_DAYS", 7);
  int report_seconds = config.getInt("STATS_REPORT_INTERVAL_SECONDS", 600);
  if (report_seconds > 0)
    stats_report_interval_ = std::chrono::seconds(report_seconds);

  return true;
}

bool CollectorApplication::InitializeEngine() {
  if (!provider_)
    provider_ = std::make_shared<Workers::SimulatedTelemetryProvider>();

  engine_ = std::make_unique<MonitoringEngine>(config_, provider_);
  auto result = engine_->initialize();
  if (!result) {
    LogManager::getInstance().Fatal("✗ Engine initialization failed: " +
                                    result.Error().GetSummary());
    return false;
  }
  return true;
}

bool CollectorApplication::OpenStore() {
  DbLib::PoolConfig pool_config;
  pool_config.sqlite_path = config_.database_path;
  pool_config.pool_size = 1;
  pool_config.busy_timeout_ms = config_.busy_timeout_ms;
  pool_config.cache_size = Constants::DEFAULT_SQLITE_CACHE_SIZE;

  db_logger_ = std::make_unique<Database::DbLoggerAdapter>();
  pool_ = std::make_shared<DbLib::ConnectionPool>();
  if (!pool_->initialize(pool_config, db_logger_.get())) {
    std::cerr << "❌ Cannot open database: " << config_.database_path
              << std::endl;
    return false;
  }

  store_ = std::make_shared<Database::AlertStore>(pool_);
  auto schema = store_->initializeSchema();
  if (!schema) {
    std::cerr << "❌ " << schema.Error().GetSummary() << std::endl;
    return false;
  }
  return true;
}

// =============================================================================
// 명령
// =============================================================================

int CollectorApplication::Run() {
  LogManager::getInstance().Info("DeviceWatch Collector starting...");

  try {
    if (!LoadConfiguration() || !InitializeEngine()) {
      LogManager::getInstance().Error("Initialization failed");
      return 1;
    }

    if (!engine_->start()) {
      LogManager::getInstance().Error("Failed to start monitoring scheduler");
      return 1;
    }

    is_running_.store(true);
    LogManager::getInstance().Info("DeviceWatch Collector started successfully");
    MainLoop();

  } catch (const std::exception &e) {
    LogManager::getInstance().Error("Runtime error: " + std::string(e.what()));
    Cleanup();
    return 1;
  }

  Cleanup();
  LogManager::getInstance().Info("DeviceWatch Collector shutdown complete");
  return 0;
}

int CollectorApplication::RunOnce() {
  if (!LoadConfiguration() || !InitializeEngine())
    return 1;

  auto report = engine_->pollOnce();
  std::cout << report.toJson().dump(2) << std::endl;

  auto active = engine_->getActiveAlerts();
  std::cout << "Active alerts: " << active.size() << std::endl;
  for (const auto &alert : active)
    std::cout << "  " << FormatAlertLine(alert) << std::endl;

  Cleanup();
  return 0;
}

int CollectorApplication::ListAlerts(bool include_resolved) {
  if (!LoadConfiguration() || !OpenStore())
    return 1;

  auto alerts = store_->loadAlerts(!include_resolved);
  if (!alerts) {
    std::cerr << "❌ " << alerts.Error().GetSummary() << std::endl;
    return 1;
  }

  std::cout << (include_resolved ? "Alerts: " : "Active alerts: ")
            << alerts.Value().size() << std::endl;
  for (const auto &alert : alerts.Value())
    std::cout << "  " << FormatAlertLine(alert) << std::endl;
  return 0;
}

int CollectorApplication::AcknowledgeAlert(const std::string &alert_id) {
  if (!LoadConfiguration() || !OpenStore())
    return 1;

  auto result = store_->acknowledgeAlert(alert_id);
  if (!result) {
    std::cerr << "❌ " << result.Error().message << std::endl;
    return result.Code() == Enums::ErrorCode::ALERT_NOT_FOUND ? 2 : 1;
  }
  std::cout << "✅ Acknowledged " << alert_id << std::endl;
  return 0;
}

int CollectorApplication::Prune(int days) {
  if (days < 0) {
    std::cerr << "❌ --days must not be negative" << std::endl;
    return 1;
  }
  if (!LoadConfiguration() || !OpenStore())
    return 1;

  const auto cutoff =
      BasicTypes::GetCurrentTimestamp() - std::chrono::hours(24 * days);

  auto alerts = store_->pruneResolvedAlerts(cutoff);
  if (!alerts) {
    std::cerr << "❌ " << alerts.Error().GetSummary() << std::endl;
    return 1;
  }
  auto metrics = store_->pruneMetrics(cutoff);
  if (!metrics) {
    std::cerr << "❌ " << metrics.Error().GetSummary() << std::endl;
    return 1;
  }

  std::cout << "🧹 Removed " << alerts.Value() << " resolved alerts and "
            << metrics.Value() << " metric rows older than " << days
            << " days" << std::endl;
  return 0;
}

int CollectorApplication::ListDevices() {
  if (!LoadConfiguration() || !OpenStore())
    return 1;

  auto devices = store_->loadDevices();
  if (!devices) {
    std::cerr << "❌ " << devices.Error().GetSummary() << std::endl;
    return 1;
  }

  std::cout << "Devices: " << devices.Value().size() << std::endl;
  for (const auto &device : devices.Value()) {
    std::cout << "  " << std::left << std::setw(20) << device.id << " "
              << std::setw(16) << device.ip << " " << std::setw(18)
              << Enums::DeviceStatusToString(device.status)
              << (device.monitoring_enabled ? "monitored" : "disabled")
              << "  errors=" << device.connection_errors << "  last_seen="
              << (device.last_update
                      ? BasicTypes::TimestampToIsoString(*device.last_update)
                      : std::string("-"))
              << std::endl;
  }
  return 0;
}

void CollectorApplication::Stop() {
  LogManager::getInstance().Info("Shutdown requested");
  is_running_.store(false);

  // Fast shutdown: notify the condition variable
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_cv_.notify_all();
  }
}

// =============================================================================
// 런타임
// =============================================================================

void CollectorApplication::MainLoop() {
  LogManager::getInstance().Info("Main loop started");

  auto last_stats_report = std::chrono::steady_clock::now();
  auto last_retention = std::chrono::steady_clock::time_point{};

  while (is_running_.load()) {
    try {
      auto now = std::chrono::steady_clock::now();

      // 주기적 통계 리포트
      if (now - last_stats_report >= stats_report_interval_) {
        LogManager::getInstance().Info("=== STATISTICS REPORT ===");
        LogManager::getInstance().Info(engine_->getStatistics().dump());
        last_stats_report = now;
      }

      // 24시간마다 보관 기간 정리
      if (last_retention == std::chrono::steady_clock::time_point{} ||
          now - last_retention >= std::chrono::hours(24)) {
        RunRetention();
        last_retention = now;
      }

      std::unique_lock<std::mutex> lock(stop_mutex_);
      if (stop_cv_.wait_for(lock, std::chrono::seconds(30),
                            [this]() { return !is_running_.load(); })) {
        LogManager::getInstance().Info(
            "MainLoop exiting due to shutdown signal");
        break;
      }

    } catch (const std::exception &e) {
      LogManager::getInstance().Error("Exception in MainLoop: " +
                                      std::string(e.what()));
      std::unique_lock<std::mutex> lock(stop_mutex_);
      stop_cv_.wait_for(lock, std::chrono::seconds(10),
                        [this]() { return !is_running_.load(); });
    }
  }

  LogManager::getInstance().Info("Main loop ended");
}

void CollectorApplication::RunRetention() {
  auto &lm = LogManager::getInstance();
  if (log_retention_days_ > 0)
    lm.cleanupOldLogs(log_retention_days_);

  auto store = engine_ ? engine_->store() : nullptr;
  if (!store)
    return;

  const auto now = BasicTypes::GetCurrentTimestamp();
  if (alert_retention_days_ > 0) {
    auto pruned = store->pruneResolvedAlerts(
        now - std::chrono::hours(24 * alert_retention_days_));
    if (!pruned)
      lm.Warn("Alert retention failed: " + pruned.Error().GetSummary());
  }
  if (metric_retention_days_ > 0) {
    auto pruned = store->pruneMetrics(
        now - std::chrono::hours(24 * metric_retention_days_));
    if (!pruned)
      lm.Warn("Metric retention failed: " + pruned.Error().GetSummary());
    else if (pruned.Value() > 0)
      lm.Info("Pruned " + std::to_string(pruned.Value()) + " metric rows");
  }

  // 라이브 맵의 해제 알람 정리 (히스토리에는 남아 있다)
  if (engine_->alertManager())
    engine_->alertManager()->pruneResolved();
}

void CollectorApplication::Cleanup() {
  is_running_.store(false);

  if (engine_) {
    LogManager::getInstance().Info("=== SYSTEM CLEANUP STARTING ===");
    engine_->stop();
    engine_.reset();
    LogManager::getInstance().Info("=== SYSTEM CLEANUP COMPLETED ===");
  }

  store_.reset();
  if (pool_) {
    pool_->shutdown();
    pool_.reset();
  }
  LogManager::getInstance().flushAll();
}

} // namespace Core
} // namespace DeviceWatch
