// =============================================================================
// collector/include/Alarm/AlertManager.h
// 알람 생명주기 상태 머신 (생성 / 갱신 / 해제 / 확인)
// =============================================================================

#ifndef ALARM_ALERT_MANAGER_H
#define ALARM_ALERT_MANAGER_H

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Alarm/AlertHistory.h"
#include "Alarm/AnomalyDetector.h"
#include "Common/Structs.h"
#include "Utils/ConcurrentMap.h"

namespace DeviceWatch {
namespace Event {
class MonitoringEventBus;
}

namespace Alarm {

    using json = nlohmann::json;
    using Alert = Structs::Alert;
    using AlertThreshold = Structs::AlertThreshold;
    using AlertLevel = Enums::AlertLevel;

enum class AlertTransitionType : uint8_t {
    CREATED = 0,
    UPDATED,
    RESOLVED,
    ACKNOWLEDGED
};

std::string AlertTransitionTypeToString(AlertTransitionType type);

struct AlertTransition {
    AlertTransitionType type = AlertTransitionType::CREATED;
    Alert alert;                                // 전이 후 스냅샷
    std::optional<AlertLevel> previous_level;   // UPDATED 일 때 이전 레벨
};

struct AlertManagerConfig {
    size_t history_capacity = Constants::DEFAULT_ALERT_HISTORY_CAPACITY;
    // true: Anomaly > Critical > Warning, false: Critical > Warning > Anomaly
    bool anomaly_overrides_thresholds = true;
};

/**
 * @brief (device, metric) 당 알람 하나를 관리하는 상태 머신
 * @details
 * - evaluate의 read-modify-write는 해당 알람 키의 shard 락 안에서만 일어난다.
 * - 이벤트 발행 / 히스토리 기록 / 로그는 shard 락을 놓은 뒤 수행한다.
 */
class AlertManager {
public:
    AlertManager(std::shared_ptr<AnomalyDetector> detector,
                 AlertManagerConfig config = AlertManagerConfig{},
                 std::shared_ptr<Event::MonitoringEventBus> event_bus = nullptr);

    AlertManager(const AlertManager&) = delete;
    AlertManager& operator=(const AlertManager&) = delete;

    // =======================================================================
    // 평가
    // =======================================================================

    /**
     * @brief 새 관측값으로 알람 상태를 평가한다.
     * @return 상태가 바뀐 경우에만 전이 정보
     */
    std::optional<AlertTransition> evaluate(const std::string& device_id,
                                            const std::string& metric,
                                            double value);

    Structs::OpResult<Alert> acknowledgeAlert(const std::string& alert_id);

    // 미해제 알람 (timestamp, id 순)
    std::vector<Alert> getActiveAlerts() const;
    std::optional<Alert> getAlert(const std::string& alert_id) const;
    std::vector<Alert> getAlertHistory(size_t limit = 0) const;

    // =======================================================================
    // 임계값
    // =======================================================================
    void setThreshold(const std::string& metric, double warning_level, double critical_level,
                      int duration_seconds = Constants::DEFAULT_THRESHOLD_DURATION_SECONDS);
    void setThreshold(const AlertThreshold& threshold);
    bool setThresholdEnabled(const std::string& metric, bool enabled);
    std::optional<AlertThreshold> getThreshold(const std::string& metric) const;
    std::vector<AlertThreshold> getThresholds() const;

    // =======================================================================
    // 복구 / 정리
    // =======================================================================

    // 재시작 시 저장된 미해제 알람 복원. 이미 있는 키는 덮어쓰지 않는다.
    size_t restoreAlerts(const std::vector<Alert>& alerts);

    // 해제된 레코드를 라이브 맵에서 제거 (히스토리는 유지)
    size_t pruneResolved();

    size_t alertCount() const { return alerts_.size(); }
    json getStatistics() const;

    const AlertManagerConfig& getConfig() const { return config_; }
    std::shared_ptr<AnomalyDetector> getDetector() const { return detector_; }

private:
    struct Classification {
        AlertLevel level;
        double threshold;
        std::string message;
    };

    std::optional<Classification> classify(const std::string& metric, double value,
                                           const AlertThreshold& threshold,
                                           const AnomalyResult& anomaly) const;

    void onTransition(const AlertTransition& transition);

    std::shared_ptr<AnomalyDetector> detector_;
    AlertManagerConfig config_;
    std::shared_ptr<Event::MonitoringEventBus> event_bus_;

    mutable std::shared_mutex thresholds_mutex_;
    std::map<std::string, AlertThreshold> thresholds_;

    Utils::ConcurrentMap<std::string, Alert> alerts_;
    AlertHistory history_;

    // 통계
    std::atomic<uint64_t> evaluations_{0};
    std::atomic<uint64_t> created_{0};
    std::atomic<uint64_t> updated_{0};
    std::atomic<uint64_t> resolved_{0};
    std::atomic<uint64_t> acknowledged_{0};
};

} // namespace Alarm
} // namespace DeviceWatch

#endif // ALARM_ALERT_MANAGER_H
