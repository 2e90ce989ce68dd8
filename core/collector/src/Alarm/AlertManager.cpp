// =============================================================================
// collector/src/Alarm/AlertManager.cpp
// =============================================================================

#include "Alarm/AlertManager.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "Event/MonitoringEventBus.h"
#include "Logging/LogManager.h"

namespace DeviceWatch {
namespace Alarm {

using AlertShard = Utils::ConcurrentMap<std::string, Alert>::Shard;

namespace {

std::string FormatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

Event::MonitoringEventType ToEventType(AlertTransitionType type) {
    switch (type) {
        case AlertTransitionType::CREATED:      return Event::MonitoringEventType::ALERT_CREATED;
        case AlertTransitionType::UPDATED:      return Event::MonitoringEventType::ALERT_UPDATED;
        case AlertTransitionType::RESOLVED:     return Event::MonitoringEventType::ALERT_RESOLVED;
        case AlertTransitionType::ACKNOWLEDGED: return Event::MonitoringEventType::ALERT_ACKNOWLEDGED;
    }
    return Event::MonitoringEventType::ALERT_UPDATED;
}

} // namespace

std::string AlertTransitionTypeToString(AlertTransitionType type) {
    switch (type) {
        case AlertTransitionType::CREATED:      return "created";
        case AlertTransitionType::UPDATED:      return "updated";
        case AlertTransitionType::RESOLVED:     return "resolved";
        case AlertTransitionType::ACKNOWLEDGED: return "acknowledged";
    }
    return "unknown";
}

AlertManager::AlertManager(std::shared_ptr<AnomalyDetector> detector,
                           AlertManagerConfig config,
                           std::shared_ptr<Event::MonitoringEventBus> event_bus)
    : detector_(detector ? std::move(detector) : std::make_shared<AnomalyDetector>())
    , config_(config)
    , event_bus_(std::move(event_bus))
    , history_(config.history_capacity) {
}

// =============================================================================
// 🎯 평가
// =============================================================================

std::optional<AlertTransition> AlertManager::evaluate(const std::string& device_id,
                                                      const std::string& metric,
                                                      double value) {
    auto threshold = getThreshold(metric);
    if (!threshold || !threshold->enabled) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        LogManager::getInstance().log("alarm", LogLevel::WARN,
            "Ignoring non-finite " + metric + " value for " + device_id);
        return std::nullopt;
    }

    evaluations_.fetch_add(1);

    // 관측값을 기준선에 넣은 뒤 판정
    AnomalyResult anomaly = detector_->updateAndDetect(device_id, metric, value);
    auto classification = classify(metric, value, *threshold, anomaly);

    const std::string alert_id = Alert::MakeId(device_id, metric);
    const auto now = BasicTypes::GetCurrentTimestamp();

    auto transition = alerts_.withExclusive(alert_id, [&](AlertShard& map) -> std::optional<AlertTransition> {
        auto it = map.find(alert_id);

        // 1. 기존 알람 없음
        if (it == map.end()) {
            if (!classification) return std::nullopt;

            Alert alert;
            alert.id = alert_id;
            alert.device_id = device_id;
            alert.metric = metric;
            alert.level = classification->level;
            alert.value = value;
            alert.threshold = classification->threshold;
            alert.timestamp = now;
            alert.acknowledged = false;
            alert.resolved = false;
            alert.message = classification->message;
            map.emplace(alert_id, alert);
            return AlertTransition{AlertTransitionType::CREATED, alert, std::nullopt};
        }

        Alert& alert = it->second;

        // 2. 정상 복귀
        if (!classification) {
            if (alert.resolved) return std::nullopt;
            alert.resolved = true;
            alert.timestamp = now;
            alert.message = metric + " returned to normal levels";
            return AlertTransition{AlertTransitionType::RESOLVED, alert, std::nullopt};
        }

        // 3. 같은 레벨 유지 (미해제) -> 변화 없음
        if (!alert.resolved && alert.level == classification->level) {
            return std::nullopt;
        }

        // 4. 레벨 변경 또는 해제 후 재발생
        AlertLevel previous = alert.level;
        if (alert.resolved) {
            alert.acknowledged = false;
        }
        alert.level = classification->level;
        alert.value = value;
        alert.threshold = classification->threshold;
        alert.timestamp = now;
        alert.message = classification->message;
        alert.resolved = false;
        return AlertTransition{AlertTransitionType::UPDATED, alert, previous};
    });

    if (transition) {
        onTransition(*transition);
    }
    return transition;
}

std::optional<AlertManager::Classification> AlertManager::classify(const std::string& metric, double value,
                                                                   const AlertThreshold& threshold,
                                                                   const AnomalyResult& anomaly) const {
    std::optional<Classification> by_threshold;
    if (value >= threshold.critical_level) {
        by_threshold = Classification{AlertLevel::CRITICAL, threshold.critical_level,
                                      metric + " usage critically high: " + FormatFixed(value, 1) + "%"};
    } else if (value >= threshold.warning_level) {
        by_threshold = Classification{AlertLevel::WARNING, threshold.warning_level,
                                      metric + " usage high: " + FormatFixed(value, 1) + "%"};
    }

    std::optional<Classification> by_anomaly;
    if (anomaly.is_anomalous) {
        by_anomaly = Classification{AlertLevel::ANOMALY, 0.0,
                                    "Anomalous " + metric + " value detected (z-score: " +
                                        FormatFixed(anomaly.z_score, 2) + ")"};
    }

    if (config_.anomaly_overrides_thresholds) {
        return by_anomaly ? by_anomaly : by_threshold;
    }
    return by_threshold ? by_threshold : by_anomaly;
}

void AlertManager::onTransition(const AlertTransition& transition) {
    const Alert& alert = transition.alert;

    switch (transition.type) {
        case AlertTransitionType::CREATED:
            created_.fetch_add(1);
            break;
        case AlertTransitionType::UPDATED:
            updated_.fetch_add(1);
            break;
        case AlertTransitionType::RESOLVED:
            resolved_.fetch_add(1);
            history_.append(alert);
            break;
        case AlertTransitionType::ACKNOWLEDGED:
            acknowledged_.fetch_add(1);
            break;
    }

    LogManager::getInstance().log("alarm",
        transition.type == AlertTransitionType::RESOLVED ? LogLevel::INFO : LogLevel::WARN,
        "Alert " + AlertTransitionTypeToString(transition.type) + " [" + alert.id + "] " +
            Enums::AlertLevelToString(alert.level) + ": " + alert.message);

    if (event_bus_) {
        event_bus_->publishAlert(ToEventType(transition.type), alert);
    }
}

// =============================================================================
// 🎯 확인 / 조회
// =============================================================================

Structs::OpResult<Alert> AlertManager::acknowledgeAlert(const std::string& alert_id) {
    auto acked = alerts_.withExclusive(alert_id, [&](AlertShard& map) -> std::optional<Alert> {
        auto it = map.find(alert_id);
        if (it == map.end()) return std::nullopt;
        it->second.acknowledged = true;
        return it->second;
    });

    if (!acked) {
        return Structs::OpResult<Alert>::Failure(Enums::ErrorCode::ALERT_NOT_FOUND,
                                                 "Alert not found: " + alert_id);
    }

    onTransition(AlertTransition{AlertTransitionType::ACKNOWLEDGED, *acked, std::nullopt});
    return *acked;
}

std::vector<Alert> AlertManager::getActiveAlerts() const {
    std::vector<Alert> active;
    alerts_.forEach([&active](const std::string&, const Alert& alert) {
        if (!alert.resolved) active.push_back(alert);
    });

    std::sort(active.begin(), active.end(), [](const Alert& a, const Alert& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.id < b.id;
    });
    return active;
}

std::optional<Alert> AlertManager::getAlert(const std::string& alert_id) const {
    return alerts_.find(alert_id);
}

std::vector<Alert> AlertManager::getAlertHistory(size_t limit) const {
    return history_.recent(limit);
}

// =============================================================================
// 🎯 임계값
// =============================================================================

void AlertManager::setThreshold(const std::string& metric, double warning_level, double critical_level,
                                int duration_seconds) {
    AlertThreshold threshold;
    threshold.metric = metric;
    threshold.warning_level = warning_level;
    threshold.critical_level = critical_level;
    threshold.duration_seconds = duration_seconds;
    threshold.enabled = true;
    setThreshold(threshold);
}

void AlertManager::setThreshold(const AlertThreshold& threshold) {
    std::unique_lock<std::shared_mutex> lock(thresholds_mutex_);
    thresholds_[threshold.metric] = threshold;
}

bool AlertManager::setThresholdEnabled(const std::string& metric, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(thresholds_mutex_);
    auto it = thresholds_.find(metric);
    if (it == thresholds_.end()) return false;
    it->second.enabled = enabled;
    return true;
}

std::optional<AlertThreshold> AlertManager::getThreshold(const std::string& metric) const {
    std::shared_lock<std::shared_mutex> lock(thresholds_mutex_);
    auto it = thresholds_.find(metric);
    if (it == thresholds_.end()) return std::nullopt;
    return it->second;
}

std::vector<AlertThreshold> AlertManager::getThresholds() const {
    std::shared_lock<std::shared_mutex> lock(thresholds_mutex_);
    std::vector<AlertThreshold> out;
    for (const auto& kv : thresholds_) out.push_back(kv.second);
    return out;
}

// =============================================================================
// 🎯 복구 / 정리
// =============================================================================

size_t AlertManager::restoreAlerts(const std::vector<Alert>& alerts) {
    size_t restored = 0;
    for (const auto& alert : alerts) {
        if (alert.id.empty()) continue;
        bool inserted = alerts_.withExclusive(alert.id, [&](AlertShard& map) {
            return map.emplace(alert.id, alert).second;
        });
        if (inserted) ++restored;
    }

    if (restored > 0) {
        LogManager::getInstance().log("alarm", LogLevel::INFO,
            "Restored " + std::to_string(restored) + " alerts from storage");
    }
    return restored;
}

size_t AlertManager::pruneResolved() {
    return alerts_.eraseIf([](const std::string&, const Alert& alert) { return alert.resolved; });
}

json AlertManager::getStatistics() const {
    size_t active = 0;
    alerts_.forEach([&active](const std::string&, const Alert& alert) {
        if (!alert.resolved) ++active;
    });

    return json{
        {"evaluations", evaluations_.load()},
        {"created", created_.load()},
        {"updated", updated_.load()},
        {"resolved", resolved_.load()},
        {"acknowledged", acknowledged_.load()},
        {"active_alerts", active},
        {"tracked_alerts", alerts_.size()},
        {"history_size", history_.size()},
        {"history_capacity", history_.capacity()}
    };
}

} // namespace Alarm
} // namespace DeviceWatch
