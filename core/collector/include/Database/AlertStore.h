// =============================================================================
// collector/include/Database/AlertStore.h
// devices / metrics / alerts 영속화 (SQLite 커넥션 풀 기반)
// =============================================================================

#ifndef DATABASE_ALERT_STORE_H
#define DATABASE_ALERT_STORE_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ConnectionPool.hpp"
#include "Common/Structs.h"

namespace DeviceWatch {
namespace Database {

    using Structs::OpResult;
    using Structs::Alert;
    using Structs::DeviceInfo;
    using Structs::MetricSnapshot;

/**
 * @brief 모니터링 상태 저장소
 * @details 모든 SQLite 실패는 내부에서 DbLib::DatabaseException으로 잡혀
 *          PERSISTENCE_ERROR OpResult로 반환된다. 예외는 밖으로 나가지 않는다.
 */
class AlertStore {
public:
    explicit AlertStore(std::shared_ptr<DbLib::ConnectionPool> pool);

    AlertStore(const AlertStore&) = delete;
    AlertStore& operator=(const AlertStore&) = delete;

    // 테이블 / 인덱스 생성 (IF NOT EXISTS)
    OpResult<void> initializeSchema();

    // =======================================================================
    // 🎯 devices
    // =======================================================================
    OpResult<void> saveDevice(const DeviceInfo& device);
    OpResult<std::vector<DeviceInfo>> loadDevices();
    OpResult<void> removeDevice(const std::string& device_id);

    // =======================================================================
    // 🎯 metrics
    // =======================================================================
    OpResult<void> saveMetricSnapshot(const std::string& device_id,
                                      const MetricSnapshot& snapshot,
                                      const BasicTypes::Timestamp& timestamp);
    OpResult<int64_t> countMetrics(const std::string& device_id);
    OpResult<size_t> pruneMetrics(const BasicTypes::Timestamp& older_than);

    // =======================================================================
    // 🎯 alerts
    // =======================================================================
    OpResult<void> saveAlert(const Alert& alert);
    OpResult<void> saveAlerts(const std::vector<Alert>& alerts);   // 단일 트랜잭션
    OpResult<std::vector<Alert>> loadAlerts(bool only_unresolved);

    // CLI 오프라인 확인. 변경된 행이 없으면 ALERT_NOT_FOUND
    OpResult<void> acknowledgeAlert(const std::string& alert_id);
    OpResult<size_t> pruneResolvedAlerts(const BasicTypes::Timestamp& older_than);

    uint64_t failureCount() const { return failures_.load(); }
    nlohmann::json getStatistics() const;

private:
    template <typename T, typename Fn>
    OpResult<T> run(const std::string& operation, Fn&& fn);

    std::shared_ptr<DbLib::ConnectionPool> pool_;
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> reads_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace Database
} // namespace DeviceWatch

#endif // DATABASE_ALERT_STORE_H
