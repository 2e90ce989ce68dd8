// =============================================================================
// collector/include/Workers/DeviceRegistry.h
// 모니터링 대상 디바이스 레코드 + 메트릭 히스토리
// =============================================================================

#ifndef WORKERS_DEVICE_REGISTRY_H
#define WORKERS_DEVICE_REGISTRY_H

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Common/Constants.h"
#include "Common/Structs.h"
#include "Utils/ConcurrentMap.h"

namespace DeviceWatch::Workers {

using Structs::DeviceInfo;
using Structs::MetricSample;

/**
 * @brief 디바이스 한 대의 상태
 * @details
 * - access mutex (timed): 폴링 태스크 / upsert 등 쓰기 측 배타 접근
 * - published 복사본: 읽기 측은 access mutex를 기다리지 않는다
 */
class DeviceRecord {
public:
    DeviceRecord(DeviceInfo info, size_t max_history_size);

    DeviceRecord(const DeviceRecord&) = delete;
    DeviceRecord& operator=(const DeviceRecord&) = delete;

    std::timed_mutex& accessMutex() { return access_mutex_; }

    // ---- access mutex를 잡은 상태에서만 호출 ----
    DeviceInfo& info() { return info_; }
    void appendSample(const std::string& metric, const MetricSample& sample);
    void markAttempt();
    void publish();

    // ---- 읽기 ----
    const std::string& id() const { return id_; }
    DeviceInfo snapshot() const;
    std::vector<MetricSample> history(const std::string& metric) const;
    std::vector<std::string> metricNames() const;
    std::optional<std::chrono::steady_clock::time_point> lastAttempt() const;

    // 다른 태스크가 잡고 있는지 (잠깐 try_lock)
    bool isBusy();

private:
    const std::string id_;
    const size_t max_history_size_;

    std::timed_mutex access_mutex_;
    DeviceInfo info_;

    mutable std::mutex published_mutex_;
    DeviceInfo published_;
    std::map<std::string, std::deque<MetricSample>> histories_;
    std::optional<std::chrono::steady_clock::time_point> last_attempt_;
};

using DeviceRecordPtr = std::shared_ptr<DeviceRecord>;

class DeviceRegistry {
public:
    explicit DeviceRegistry(size_t max_history_size = Constants::DEFAULT_MAX_HISTORY_SIZE,
                            std::chrono::milliseconds lock_timeout = std::chrono::seconds(5));

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief 추가 또는 교체. 기존 레코드의 히스토리는 유지된다.
     * @return 레코드가 lock_timeout 안에 풀리지 않으면 DEVICE_BUSY
     */
    Structs::OpResult<void> upsert(const DeviceInfo& device);

    std::optional<DeviceInfo> get(const std::string& device_id) const;
    DeviceRecordPtr record(const std::string& device_id) const;
    bool remove(const std::string& device_id);
    bool setMonitoringEnabled(const std::string& device_id, bool enabled);
    bool setStatus(const std::string& device_id, Enums::DeviceStatus status);

    /**
     * @brief monitoring_enabled && ONLINE 이고 사용 중이 아닌 레코드를 최대 limit개
     * @details 정렬된 id 위에서 마지막 선택 이후부터 순환 선택한다.
     */
    std::vector<DeviceRecordPtr> selectEligible(size_t limit);

    std::vector<MetricSample> getHistory(const std::string& device_id, const std::string& metric) const;

    // 마지막 시도 후 older_than 이상 지난 CONNECTION_FAILED 디바이스를 ONLINE으로 되돌린다
    size_t requeueFailed(std::chrono::milliseconds older_than);

    size_t size() const { return devices_.size(); }
    std::vector<DeviceInfo> snapshot() const;   // id 순

    size_t maxHistorySize() const { return max_history_size_; }

private:
    template <typename Fn> bool mutate(const std::string& device_id, Fn&& fn);

    Utils::ConcurrentMap<std::string, DeviceRecordPtr> devices_;
    const size_t max_history_size_;
    const std::chrono::milliseconds lock_timeout_;

    std::mutex cursor_mutex_;
    std::string last_selected_;
};

} // namespace DeviceWatch::Workers

#endif // WORKERS_DEVICE_REGISTRY_H
