// =============================================================================
// collector/include/Database/SQLQueries.h
// 🎯 SQL 쿼리 상수 중앙 관리 (devices / metrics / alerts)
// =============================================================================

#ifndef SQL_QUERIES_H
#define SQL_QUERIES_H

#include <string>

namespace DeviceWatch {
namespace Database {
namespace SQL {

// =============================================================================
// 🎯 스키마
// =============================================================================
namespace Schema {

const std::string CREATE_DEVICES_TABLE = R"(
        CREATE TABLE IF NOT EXISTS devices (
            id TEXT PRIMARY KEY,
            ip TEXT NOT NULL,
            hostname TEXT,
            os_type TEXT,
            status TEXT,
            monitoring_enabled INTEGER DEFAULT 1,
            last_seen TEXT,
            hardware_info TEXT,
            services TEXT,
            connection_errors INTEGER DEFAULT 0
        )
    )";

const std::string CREATE_METRICS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS metrics (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            device_id TEXT REFERENCES devices(id),
            timestamp TEXT NOT NULL,
            cpu_percent REAL,
            memory_percent REAL,
            disk_percent REAL,
            network_bytes_sent INTEGER,
            network_bytes_recv INTEGER,
            load_avg_1 REAL
        )
    )";

const std::string CREATE_ALERTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS alerts (
            id TEXT PRIMARY KEY,
            device_id TEXT NOT NULL,
            metric TEXT NOT NULL,
            level TEXT NOT NULL,
            value REAL,
            threshold_value REAL,
            timestamp TEXT NOT NULL,
            acknowledged INTEGER DEFAULT 0,
            resolved INTEGER DEFAULT 0,
            message TEXT
        )
    )";

const std::string CREATE_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_metrics_device_time ON metrics(device_id, timestamp);
        CREATE INDEX IF NOT EXISTS idx_alerts_device_resolved ON alerts(device_id, resolved);
        CREATE INDEX IF NOT EXISTS idx_alerts_resolved_time ON alerts(resolved, timestamp);
    )";

} // namespace Schema

// =============================================================================
// 🎯 devices
// =============================================================================
namespace Device {

const std::string UPSERT = R"(
        INSERT OR REPLACE INTO devices (
            id, ip, hostname, os_type, status, monitoring_enabled,
            last_seen, hardware_info, services, connection_errors
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

const std::string FIND_ALL = R"(
        SELECT id, ip, hostname, os_type, status, monitoring_enabled,
               last_seen, hardware_info, services, connection_errors
        FROM devices
        ORDER BY id
    )";

const std::string DELETE_BY_ID = "DELETE FROM devices WHERE id = ?";

} // namespace Device

// =============================================================================
// 🎯 metrics
// =============================================================================
namespace Metric {

const std::string INSERT = R"(
        INSERT INTO metrics (
            device_id, timestamp, cpu_percent, memory_percent, disk_percent,
            network_bytes_sent, network_bytes_recv, load_avg_1
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )";

const std::string COUNT_BY_DEVICE = "SELECT COUNT(*) FROM metrics WHERE device_id = ?";

const std::string DELETE_OLDER_THAN = "DELETE FROM metrics WHERE timestamp < ?";

const std::string DELETE_BY_DEVICE = "DELETE FROM metrics WHERE device_id = ?";

} // namespace Metric

// =============================================================================
// 🎯 alerts
// =============================================================================
namespace Alert {

const std::string UPSERT = R"(
        INSERT OR REPLACE INTO alerts (
            id, device_id, metric, level, value, threshold_value,
            timestamp, acknowledged, resolved, message
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

const std::string FIND_ALL = R"(
        SELECT id, device_id, metric, level, value, threshold_value,
               timestamp, acknowledged, resolved, message
        FROM alerts
        ORDER BY timestamp, id
    )";

const std::string FIND_UNRESOLVED = R"(
        SELECT id, device_id, metric, level, value, threshold_value,
               timestamp, acknowledged, resolved, message
        FROM alerts
        WHERE resolved = 0
        ORDER BY timestamp, id
    )";

const std::string ACKNOWLEDGE = "UPDATE alerts SET acknowledged = 1 WHERE id = ?";

// ISO-8601 UTC 문자열은 사전순 비교 = 시간순 비교
const std::string DELETE_RESOLVED_OLDER_THAN = R"(
        DELETE FROM alerts WHERE resolved = 1 AND timestamp < ?
    )";

} // namespace Alert

} // namespace SQL
} // namespace Database
} // namespace DeviceWatch

#endif // SQL_QUERIES_H
