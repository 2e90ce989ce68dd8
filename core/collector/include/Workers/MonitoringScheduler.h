// =============================================================================
// collector/include/Workers/MonitoringScheduler.h
// 주기적 / 동시성 제한 폴링 루프
// =============================================================================

#ifndef WORKERS_MONITORING_SCHEDULER_H
#define WORKERS_MONITORING_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "Common/Constants.h"
#include "Workers/DeviceRegistry.h"
#include "Workers/ITelemetryProvider.h"

namespace DeviceWatch::Alarm {
class AlertManager;
}
namespace DeviceWatch::Database {
class AlertStore;
}
namespace DeviceWatch::Event {
class MonitoringEventBus;
}

namespace DeviceWatch::Workers {

enum class SchedulerState : uint8_t {
    STOPPED = 0,
    RUNNING
};

std::string SchedulerStateToString(SchedulerState state);

struct SchedulerConfig {
    std::chrono::milliseconds interval{Constants::DEFAULT_MONITORING_INTERVAL_SECONDS * 1000};
    size_t max_concurrent_monitors = Constants::DEFAULT_MAX_CONCURRENT_MONITORS;
    std::chrono::milliseconds task_timeout{Constants::DEFAULT_TASK_TIMEOUT_SECONDS * 1000};
    // 0 이면 CONNECTION_FAILED 디바이스를 자동으로 다시 폴링하지 않는다
    std::chrono::milliseconds failed_device_retry{0};
};

enum class TaskOutcome : uint8_t {
    SUCCEEDED = 0,
    CONNECTION_FAILED,
    FETCH_FAILED,
    FORMAT_ERROR,
    DEVICE_BUSY,
    SKIPPED,        // 선정 후 락을 잡기 전에 비활성화 / 상태 변경됨
    TIMED_OUT,
    CANCELLED,
    FAILED
};

std::string TaskOutcomeToString(TaskOutcome outcome);

// 한 사이클 결과 (pollOnce 반환값)
struct CycleReport {
    size_t dispatched = 0;
    size_t succeeded = 0;
    size_t connection_failures = 0;
    size_t fetch_failures = 0;
    size_t format_errors = 0;
    size_t timeouts = 0;
    size_t skipped = 0;
    size_t other_failures = 0;
    std::chrono::milliseconds duration{0};

    nlohmann::json toJson() const;
};

/**
 * @brief 모니터링 스케줄러
 * @details
 * - driver 스레드 1개, 디바이스 태스크마다 std::thread 1개
 * - 세마포어(max_concurrent_monitors)로 동시 실행 태스크 수 제한.
 *   타임아웃으로 버려진 태스크도 끝날 때까지 permit을 잡고 있다.
 * - 태스크는 공유 컨텍스트를 shared_ptr로 잡으므로 스케줄러보다 오래 살아도 된다.
 */
class MonitoringScheduler {
public:
    MonitoringScheduler(SchedulerConfig config,
                        std::shared_ptr<DeviceRegistry> registry,
                        std::shared_ptr<ITelemetryProvider> provider,
                        std::shared_ptr<Alarm::AlertManager> alert_manager,
                        std::shared_ptr<Database::AlertStore> store = nullptr,
                        std::shared_ptr<Event::MonitoringEventBus> event_bus = nullptr);
    ~MonitoringScheduler();

    MonitoringScheduler(const MonitoringScheduler&) = delete;
    MonitoringScheduler& operator=(const MonitoringScheduler&) = delete;

    // =======================================================================
    // 라이프사이클
    // =======================================================================

    // @return 이 호출이 루프를 시작했으면 true (이미 실행 중이면 false)
    bool start();
    void stop();

    bool isRunning() const { return running_.load(); }
    SchedulerState state() const { return running_.load() ? SchedulerState::RUNNING : SchedulerState::STOPPED; }

    // 한 사이클을 동기적으로 실행
    CycleReport pollOnce();

    nlohmann::json getStatistics() const;
    const SchedulerConfig& getConfig() const;

    struct Context;

private:
    void runLoop(std::shared_ptr<std::atomic<bool>> cancel);
    CycleReport runCycle(const std::shared_ptr<std::atomic<bool>>& cancel);
    void sleepFor(std::chrono::milliseconds duration);

    std::shared_ptr<Context> ctx_;

    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;
    std::thread loop_thread_;
    std::shared_ptr<std::atomic<bool>> cancel_token_;

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
};

} // namespace DeviceWatch::Workers

#endif // WORKERS_MONITORING_SCHEDULER_H
