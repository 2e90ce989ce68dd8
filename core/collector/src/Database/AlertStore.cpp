// =============================================================================
// collector/src/Database/AlertStore.cpp
// =============================================================================

#include "Database/AlertStore.h"

#include <type_traits>

#include "Database/SQLQueries.h"
#include "Logging/LogManager.h"
#include "SqliteStatement.hpp"

namespace DeviceWatch {
namespace Database {

using DbLib::SqliteStatement;
using Enums::ErrorCode;

namespace {

// 손상된 JSON 컬럼은 기본값으로 대체
nlohmann::json ParseJsonColumn(const std::string& text, nlohmann::json fallback) {
    if (text.empty()) return fallback;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) return fallback;
    return parsed;
}

Alert ReadAlertRow(const SqliteStatement& stmt) {
    Alert alert;
    alert.id = stmt.columnText(0);
    alert.device_id = stmt.columnText(1);
    alert.metric = stmt.columnText(2);
    alert.level = Enums::StringToAlertLevel(stmt.columnText(3));
    alert.value = stmt.columnDouble(4);
    alert.threshold = stmt.columnDouble(5);
    auto ts = BasicTypes::ParseIsoTimestamp(stmt.columnText(6));
    alert.timestamp = ts ? *ts : BasicTypes::GetCurrentTimestamp();
    alert.acknowledged = stmt.columnBool(7);
    alert.resolved = stmt.columnBool(8);
    alert.message = stmt.columnText(9);
    return alert;
}

void BindAlert(SqliteStatement& stmt, const Alert& alert) {
    stmt.bindText(1, alert.id)
        .bindText(2, alert.device_id)
        .bindText(3, alert.metric)
        .bindText(4, Enums::AlertLevelToString(alert.level))
        .bindDouble(5, alert.value)
        .bindDouble(6, alert.threshold)
        .bindText(7, BasicTypes::TimestampToIsoString(alert.timestamp))
        .bindBool(8, alert.acknowledged)
        .bindBool(9, alert.resolved)
        .bindText(10, alert.message);
}

} // namespace

AlertStore::AlertStore(std::shared_ptr<DbLib::ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

template <typename T, typename Fn>
OpResult<T> AlertStore::run(const std::string& operation, Fn&& fn) {
    if (!pool_) {
        failures_.fetch_add(1);
        return OpResult<T>::Failure(ErrorCode::PERSISTENCE_ERROR, operation + ": no connection pool");
    }

    try {
        if constexpr (std::is_void<T>::value) {
            pool_->withConnection(std::forward<Fn>(fn));
            return OpResult<T>::Success();
        } else {
            return OpResult<T>(pool_->withConnection(std::forward<Fn>(fn)));
        }
    } catch (const DbLib::DatabaseException& e) {
        failures_.fetch_add(1);
        LogManager::getInstance().log("database", LogLevel::LOG_ERROR,
            operation + " failed: " + e.what() + " (sqlite code " + std::to_string(e.sqliteCode()) + ")");
        return OpResult<T>::Failure(ErrorCode::PERSISTENCE_ERROR, operation + " failed: " + e.what());
    } catch (const nlohmann::json::exception& e) {
        failures_.fetch_add(1);
        LogManager::getInstance().log("database", LogLevel::LOG_ERROR,
            operation + " failed to serialize: " + e.what());
        return OpResult<T>::Failure(ErrorCode::PERSISTENCE_ERROR, operation + " failed: " + e.what());
    }
}

// =============================================================================
// 🎯 스키마
// =============================================================================

OpResult<void> AlertStore::initializeSchema() {
    auto result = run<void>("initializeSchema", [](sqlite3* db) {
        DbLib::ExecuteSql(db, SQL::Schema::CREATE_DEVICES_TABLE);
        DbLib::ExecuteSql(db, SQL::Schema::CREATE_METRICS_TABLE);
        DbLib::ExecuteSql(db, SQL::Schema::CREATE_ALERTS_TABLE);
        DbLib::ExecuteSql(db, SQL::Schema::CREATE_INDEXES);
    });
    if (result) {
        LogManager::getInstance().log("database", LogLevel::INFO, "Schema ready (devices, metrics, alerts)");
    }
    return result;
}

// =============================================================================
// 🎯 devices
// =============================================================================

OpResult<void> AlertStore::saveDevice(const DeviceInfo& device) {
    auto result = run<void>("saveDevice", [&device](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Device::UPSERT);
        stmt.bindText(1, device.id)
            .bindText(2, device.ip)
            .bindText(3, device.hostname)
            .bindText(4, device.os_type)
            .bindText(5, Enums::DeviceStatusToString(device.status))
            .bindBool(6, device.monitoring_enabled)
            .bindText(8, device.hardware_info.dump())
            .bindText(9, nlohmann::json(device.services).dump())
            .bindInt64(10, static_cast<int64_t>(device.connection_errors));
        if (device.last_update) {
            stmt.bindText(7, BasicTypes::TimestampToIsoString(*device.last_update));
        } else {
            stmt.bindNull(7);
        }
        stmt.execute();
    });
    if (result) writes_.fetch_add(1);
    return result;
}

OpResult<std::vector<DeviceInfo>> AlertStore::loadDevices() {
    auto result = run<std::vector<DeviceInfo>>("loadDevices", [](sqlite3* db) {
        std::vector<DeviceInfo> devices;
        SqliteStatement stmt(db, SQL::Device::FIND_ALL);
        while (stmt.step()) {
            DeviceInfo device;
            device.id = stmt.columnText(0);
            device.ip = stmt.columnText(1);
            device.hostname = stmt.columnText(2);
            device.os_type = stmt.columnText(3);
            device.status = Enums::StringToDeviceStatus(stmt.columnText(4));
            device.monitoring_enabled = stmt.columnBool(5);
            if (!stmt.columnIsNull(6)) {
                device.last_update = BasicTypes::ParseIsoTimestamp(stmt.columnText(6));
            }
            device.hardware_info = ParseJsonColumn(stmt.columnText(7), nlohmann::json::object());

            auto services = ParseJsonColumn(stmt.columnText(8), nlohmann::json::object());
            for (auto it = services.begin(); it != services.end(); ++it) {
                if (it.value().is_number()) device.services[it.key()] = it.value().get<double>();
            }
            device.connection_errors = static_cast<uint32_t>(stmt.columnInt64(9));
            devices.push_back(std::move(device));
        }
        return devices;
    });
    if (result) reads_.fetch_add(1);
    return result;
}

OpResult<void> AlertStore::removeDevice(const std::string& device_id) {
    return run<void>("removeDevice", [&device_id](sqlite3* db) {
        DbLib::SqliteTransaction tx(db);
        SqliteStatement metrics(db, SQL::Metric::DELETE_BY_DEVICE);
        metrics.bindText(1, device_id).execute();
        SqliteStatement stmt(db, SQL::Device::DELETE_BY_ID);
        stmt.bindText(1, device_id).execute();
        tx.commit();
    });
}

// =============================================================================
// 🎯 metrics
// =============================================================================

OpResult<void> AlertStore::saveMetricSnapshot(const std::string& device_id,
                                              const MetricSnapshot& snapshot,
                                              const BasicTypes::Timestamp& timestamp) {
    auto result = run<void>("saveMetricSnapshot", [&](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Metric::INSERT);
        stmt.bindText(1, device_id)
            .bindText(2, BasicTypes::TimestampToIsoString(timestamp))
            .bindDouble(3, snapshot.cpu)
            .bindDouble(4, snapshot.memory)
            .bindDouble(5, snapshot.disk);

        if (snapshot.network_bytes_sent) stmt.bindInt64(6, *snapshot.network_bytes_sent);
        else stmt.bindNull(6);
        if (snapshot.network_bytes_recv) stmt.bindInt64(7, *snapshot.network_bytes_recv);
        else stmt.bindNull(7);
        if (!snapshot.load_avg.empty()) stmt.bindDouble(8, snapshot.load_avg.front());
        else stmt.bindNull(8);

        stmt.execute();
    });
    if (result) writes_.fetch_add(1);
    return result;
}

OpResult<int64_t> AlertStore::countMetrics(const std::string& device_id) {
    return run<int64_t>("countMetrics", [&device_id](sqlite3* db) -> int64_t {
        SqliteStatement stmt(db, SQL::Metric::COUNT_BY_DEVICE);
        stmt.bindText(1, device_id);
        return stmt.step() ? stmt.columnInt64(0) : 0;
    });
}

OpResult<size_t> AlertStore::pruneMetrics(const BasicTypes::Timestamp& older_than) {
    return run<size_t>("pruneMetrics", [&older_than](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Metric::DELETE_OLDER_THAN);
        stmt.bindText(1, BasicTypes::TimestampToIsoString(older_than));
        return static_cast<size_t>(stmt.execute());
    });
}

// =============================================================================
// 🎯 alerts
// =============================================================================

OpResult<void> AlertStore::saveAlert(const Alert& alert) {
    auto result = run<void>("saveAlert", [&alert](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Alert::UPSERT);
        BindAlert(stmt, alert);
        stmt.execute();
    });
    if (result) writes_.fetch_add(1);
    return result;
}

OpResult<void> AlertStore::saveAlerts(const std::vector<Alert>& alerts) {
    if (alerts.empty()) return OpResult<void>::Success();

    auto result = run<void>("saveAlerts", [&alerts](sqlite3* db) {
        DbLib::SqliteTransaction tx(db);
        SqliteStatement stmt(db, SQL::Alert::UPSERT);
        for (const auto& alert : alerts) {
            BindAlert(stmt, alert);
            stmt.execute();
            stmt.reset();
        }
        tx.commit();
    });
    if (result) writes_.fetch_add(alerts.size());
    return result;
}

OpResult<std::vector<Alert>> AlertStore::loadAlerts(bool only_unresolved) {
    auto result = run<std::vector<Alert>>("loadAlerts", [only_unresolved](sqlite3* db) {
        std::vector<Alert> alerts;
        SqliteStatement stmt(db, only_unresolved ? SQL::Alert::FIND_UNRESOLVED : SQL::Alert::FIND_ALL);
        while (stmt.step()) {
            alerts.push_back(ReadAlertRow(stmt));
        }
        return alerts;
    });
    if (result) reads_.fetch_add(1);
    return result;
}

OpResult<void> AlertStore::acknowledgeAlert(const std::string& alert_id) {
    auto changed = run<int>("acknowledgeAlert", [&alert_id](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Alert::ACKNOWLEDGE);
        return stmt.bindText(1, alert_id).execute();
    });
    if (!changed) return OpResult<void>(changed.Error());

    if (changed.Value() == 0) {
        return OpResult<void>::Failure(ErrorCode::ALERT_NOT_FOUND, "Alert not found: " + alert_id);
    }
    writes_.fetch_add(1);
    return OpResult<void>::Success();
}

OpResult<size_t> AlertStore::pruneResolvedAlerts(const BasicTypes::Timestamp& older_than) {
    auto result = run<size_t>("pruneResolvedAlerts", [&older_than](sqlite3* db) {
        SqliteStatement stmt(db, SQL::Alert::DELETE_RESOLVED_OLDER_THAN);
        stmt.bindText(1, BasicTypes::TimestampToIsoString(older_than));
        return static_cast<size_t>(stmt.execute());
    });
    if (result && result.Value() > 0) {
        LogManager::getInstance().log("database", LogLevel::INFO,
            "Pruned " + std::to_string(result.Value()) + " resolved alerts");
    }
    return result;
}

nlohmann::json AlertStore::getStatistics() const {
    nlohmann::json j;
    j["writes"] = writes_.load();
    j["reads"] = reads_.load();
    j["failures"] = failures_.load();
    if (pool_) {
        j["pool_size"] = pool_->size();
        j["pool_available"] = pool_->available();
        j["degraded_connections"] = pool_->degradedCount();
    }
    return j;
}

} // namespace Database
} // namespace DeviceWatch
