// =============================================================================
// collector/src/Workers/MonitoringScheduler.cpp
// =============================================================================

#include "Workers/MonitoringScheduler.h"

#include <future>
#include <system_error>
#include <utility>
#include <vector>

#include "Alarm/AlertManager.h"
#include "Database/AlertStore.h"
#include "Event/MonitoringEventBus.h"
#include "Logging/LogManager.h"
#include "Utils/CountingSemaphore.h"

namespace DeviceWatch::Workers {

using Clock = std::chrono::steady_clock;
using Event::MonitoringEventType;

std::string SchedulerStateToString(SchedulerState state) {
    return state == SchedulerState::RUNNING ? "running" : "stopped";
}

std::string TaskOutcomeToString(TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::SUCCEEDED:         return "succeeded";
        case TaskOutcome::CONNECTION_FAILED: return "connection_failed";
        case TaskOutcome::FETCH_FAILED:      return "fetch_failed";
        case TaskOutcome::FORMAT_ERROR:      return "format_error";
        case TaskOutcome::DEVICE_BUSY:       return "device_busy";
        case TaskOutcome::SKIPPED:           return "skipped";
        case TaskOutcome::TIMED_OUT:         return "timed_out";
        case TaskOutcome::CANCELLED:         return "cancelled";
        case TaskOutcome::FAILED:            return "failed";
    }
    return "unknown";
}

nlohmann::json CycleReport::toJson() const {
    return nlohmann::json{
        {"dispatched", dispatched},
        {"succeeded", succeeded},
        {"connection_failures", connection_failures},
        {"fetch_failures", fetch_failures},
        {"format_errors", format_errors},
        {"timeouts", timeouts},
        {"skipped", skipped},
        {"other_failures", other_failures},
        {"duration_ms", duration.count()}
    };
}

// =============================================================================
// 공유 컨텍스트 (버려진 태스크도 참조)
// =============================================================================

struct MonitoringScheduler::Context {
    Context(SchedulerConfig cfg,
            std::shared_ptr<DeviceRegistry> reg,
            std::shared_ptr<ITelemetryProvider> prov,
            std::shared_ptr<Alarm::AlertManager> alerts,
            std::shared_ptr<Database::AlertStore> st,
            std::shared_ptr<Event::MonitoringEventBus> bus)
        : config(cfg)
        , registry(std::move(reg))
        , provider(std::move(prov))
        , alert_manager(std::move(alerts))
        , store(std::move(st))
        , event_bus(std::move(bus))
        , permits(cfg.max_concurrent_monitors) {}

    SchedulerConfig config;
    std::shared_ptr<DeviceRegistry> registry;
    std::shared_ptr<ITelemetryProvider> provider;
    std::shared_ptr<Alarm::AlertManager> alert_manager;
    std::shared_ptr<Database::AlertStore> store;
    std::shared_ptr<Event::MonitoringEventBus> event_bus;
    Utils::CountingSemaphore permits;

    // 통계
    std::atomic<uint64_t> cycles{0};
    std::atomic<uint64_t> tasks_dispatched{0};
    std::atomic<uint64_t> tasks_succeeded{0};
    std::atomic<uint64_t> connection_failures{0};
    std::atomic<uint64_t> fetch_failures{0};
    std::atomic<uint64_t> format_errors{0};
    std::atomic<uint64_t> persistence_errors{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> busy_skips{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> task_errors{0};
    std::atomic<uint64_t> overruns{0};
    std::atomic<int64_t> last_cycle_ms{0};

    void note(LogLevel level, const std::string& message) {
        LogManager::getInstance().log("scheduler", level, message);
        if (event_bus) {
            event_bus->publishLog(Enums::LogLevelToString(level), message);
        }
    }

    void publishDevice(const DeviceInfo& device, const std::string& message) {
        if (!event_bus) return;
        Event::MonitoringEvent event;
        event.type = MonitoringEventType::DEVICE_UPDATED;
        event.device_id = device.id;
        event.level = Enums::DeviceStatusToString(device.status);
        event.message = message;
        event_bus->publish(event);
    }

    void persistDevice(const DeviceInfo& device) {
        if (!store) return;
        auto result = store->saveDevice(device);
        if (!result) {
            persistence_errors.fetch_add(1);
            LogManager::getInstance().log("scheduler", LogLevel::WARN,
                "Failed to persist device " + device.id + ": " + result.Error().GetSummary());
        }
    }
};

namespace {

using ContextPtr = std::shared_ptr<MonitoringScheduler::Context>;
using CancelToken = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief 디바이스 한 대 폴링: 락 -> connect -> fetch -> 히스토리/알람 -> 저장
 * @details 단계 사이마다 취소 플래그를 확인한다.
 */
TaskOutcome RunDeviceTask(MonitoringScheduler::Context& ctx,
                          const DeviceRecordPtr& record,
                          const std::atomic<bool>& cancel,
                          Clock::time_point deadline) {
    // 0. permit
    if (!ctx.permits.tryAcquireUntil(deadline)) {
        return TaskOutcome::TIMED_OUT;
    }
    Utils::SemaphorePermit permit(ctx.permits);

    // 1. 레코드 배타 접근
    std::unique_lock<std::timed_mutex> lock(record->accessMutex(), std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return TaskOutcome::DEVICE_BUSY;
    }
    if (cancel.load()) return TaskOutcome::CANCELLED;

    DeviceInfo& device = record->info();
    // 선정 이후 setMonitoringEnabled(false) 등이 먼저 락을 잡았을 수 있다
    if (!device.monitoring_enabled || device.status != Enums::DeviceStatus::ONLINE) {
        return TaskOutcome::SKIPPED;
    }
    record->markAttempt();

    // 2. 연결
    auto connected = ctx.provider->connect(device);
    if (!connected || !connected.Value()) {
        device.connection_errors += 1;
        device.status = Enums::DeviceStatus::CONNECTION_FAILED;
        record->publish();

        const std::string reason = connected ? "connection refused" : connected.Error().GetSummary();
        LogManager::getInstance().log("scheduler", LogLevel::WARN,
            "Failed to connect to device: " + device.ip + " (errors: " +
            std::to_string(device.connection_errors) + ", " + reason + ")");

        DeviceInfo copy = device;
        lock.unlock();
        ctx.persistDevice(copy);
        ctx.publishDevice(copy, "connection failed");
        return TaskOutcome::CONNECTION_FAILED;
    }
    device.connection_errors = 0;
    device.status = Enums::DeviceStatus::ONLINE;
    record->publish();

    if (cancel.load()) return TaskOutcome::CANCELLED;

    // 3. 메트릭 수집 / 파싱
    auto payload = ctx.provider->fetchMetrics(device);
    if (!payload) {
        LogManager::getInstance().log("scheduler", LogLevel::LOG_ERROR,
            "Failed to get metrics from " + device.id + ": " + payload.Error().GetSummary());
        return TaskOutcome::FETCH_FAILED;
    }

    auto parsed = Structs::MetricSnapshot::FromJson(payload.Value());
    if (!parsed) {
        LogManager::getInstance().log("scheduler", LogLevel::LOG_ERROR,
            "Invalid metric payload from " + device.id + ": " + parsed.Error().message);
        return TaskOutcome::FORMAT_ERROR;
    }
    const Structs::MetricSnapshot& snapshot = parsed.Value();
    const auto timestamp = BasicTypes::GetCurrentTimestamp();
    const auto values = snapshot.GetMetricValues();

    for (const auto& mv : values) {
        record->appendSample(mv.first, MetricSample(mv.second, timestamp));
    }

    if (cancel.load()) return TaskOutcome::CANCELLED;

    // 4. 알람 평가 (디바이스 안에서는 순차)
    std::vector<Structs::Alert> changed_alerts;
    for (const auto& mv : values) {
        auto transition = ctx.alert_manager->evaluate(device.id, mv.first, mv.second);
        if (transition) changed_alerts.push_back(transition->alert);
    }

    for (const auto& svc : snapshot.top_services) {
        device.services[svc.first] = svc.second;
    }
    device.last_update = timestamp;
    record->publish();

    DeviceInfo copy = device;
    lock.unlock();

    // 5. 저장 (실패는 기록만 하고 계속)
    ctx.persistDevice(copy);
    if (ctx.store) {
        auto saved = ctx.store->saveMetricSnapshot(copy.id, snapshot, timestamp);
        if (!saved) {
            ctx.persistence_errors.fetch_add(1);
            LogManager::getInstance().log("scheduler", LogLevel::WARN,
                "Failed to persist metrics for " + copy.id + ": " + saved.Error().GetSummary());
        }
        for (const auto& alert : changed_alerts) {
            auto result = ctx.store->saveAlert(alert);
            if (!result) {
                ctx.persistence_errors.fetch_add(1);
                LogManager::getInstance().log("scheduler", LogLevel::WARN,
                    "Failed to persist alert " + alert.id + ": " + result.Error().GetSummary());
            }
        }
    }

    ctx.publishDevice(copy, "metrics updated");
    return TaskOutcome::SUCCEEDED;
}

} // namespace

// =============================================================================
// MonitoringScheduler
// =============================================================================

MonitoringScheduler::MonitoringScheduler(SchedulerConfig config,
                                         std::shared_ptr<DeviceRegistry> registry,
                                         std::shared_ptr<ITelemetryProvider> provider,
                                         std::shared_ptr<Alarm::AlertManager> alert_manager,
                                         std::shared_ptr<Database::AlertStore> store,
                                         std::shared_ptr<Event::MonitoringEventBus> event_bus) {
    if (config.max_concurrent_monitors == 0) config.max_concurrent_monitors = 1;
    ctx_ = std::make_shared<Context>(config, std::move(registry), std::move(provider),
                                     std::move(alert_manager), std::move(store), std::move(event_bus));
}

MonitoringScheduler::~MonitoringScheduler() {
    stop();
}

const SchedulerConfig& MonitoringScheduler::getConfig() const {
    return ctx_->config;
}

bool MonitoringScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }

    if (loop_thread_.joinable()) loop_thread_.join();

    cancel_token_ = std::make_shared<std::atomic<bool>>(false);
    loop_thread_ = std::thread(&MonitoringScheduler::runLoop, this, cancel_token_);

    ctx_->note(LogLevel::INFO, "Starting monitoring loop with interval: " +
                                   std::to_string(ctx_->config.interval.count()) + "ms");
    return true;
}

void MonitoringScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    bool was_running = running_.exchange(false);
    if (cancel_token_) cancel_token_->store(true);
    {
        std::lock_guard<std::mutex> sleep_lock(sleep_mutex_);
    }
    sleep_cv_.notify_all();

    if (loop_thread_.joinable()) loop_thread_.join();

    if (was_running) {
        ctx_->note(LogLevel::INFO, "Monitoring loop stopped");
    }
}

CycleReport MonitoringScheduler::pollOnce() {
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    return runCycle(cancel);
}

void MonitoringScheduler::runLoop(std::shared_ptr<std::atomic<bool>> cancel) {
    while (running_.load()) {
        const auto cycle_start = Clock::now();
        CycleReport report = runCycle(cancel);
        if (!running_.load()) break;

        const auto interval = ctx_->config.interval;
        if (report.dispatched == 0) {
            sleepFor(interval);
            continue;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - cycle_start);
        if (elapsed < interval) {
            sleepFor(interval - elapsed);
        } else {
            ctx_->overruns.fetch_add(1);
            ctx_->note(LogLevel::WARN, "Monitoring cycle overran interval: " +
                                           std::to_string(elapsed.count()) + "ms");
        }
    }
}

void MonitoringScheduler::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

CycleReport MonitoringScheduler::runCycle(const std::shared_ptr<std::atomic<bool>>& cancel) {
    Context& ctx = *ctx_;
    CycleReport report;
    const auto cycle_start = Clock::now();

    if (ctx.config.failed_device_retry.count() > 0) {
        size_t requeued = ctx.registry->requeueFailed(ctx.config.failed_device_retry);
        if (requeued > 0) {
            LogManager::getInstance().log("scheduler", LogLevel::INFO,
                "Retrying " + std::to_string(requeued) + " failed devices");
        }
    }

    // 1. 대상 선정
    auto records = ctx.registry->selectEligible(ctx.config.max_concurrent_monitors);
    if (records.empty()) {
        return report;
    }

    // 2. 디스패치
    const auto deadline = Clock::now() + ctx.config.task_timeout;
    std::vector<std::pair<std::string, std::future<TaskOutcome>>> pending;
    pending.reserve(records.size());

    for (const auto& record : records) {
        auto promise = std::make_shared<std::promise<TaskOutcome>>();
        auto future = promise->get_future();
        ContextPtr shared_ctx = ctx_;

        try {
            std::thread([shared_ctx, record, cancel, deadline, promise]() {
                TaskOutcome outcome = TaskOutcome::FAILED;
                try {
                    outcome = RunDeviceTask(*shared_ctx, record, *cancel, deadline);
                } catch (const std::exception& e) {
                    shared_ctx->task_errors.fetch_add(1);
                    LogManager::getInstance().log("scheduler", LogLevel::LOG_ERROR,
                        "Error monitoring device " + record->id() + ": " + e.what());
                }
                promise->set_value(outcome);
            }).detach();
        } catch (const std::system_error& e) {
            ctx.task_errors.fetch_add(1);
            report.other_failures++;
            LogManager::getInstance().log("scheduler", LogLevel::LOG_ERROR,
                "Failed to start task for " + record->id() + ": " + e.what());
            continue;
        }

        ctx.tasks_dispatched.fetch_add(1);
        report.dispatched++;
        pending.emplace_back(record->id(), std::move(future));
    }

    // 3. 완료 또는 deadline 대기
    for (auto& entry : pending) {
        if (entry.second.wait_until(deadline) != std::future_status::ready) {
            ctx.timeouts.fetch_add(1);
            report.timeouts++;
            ctx.note(LogLevel::LOG_ERROR, "Timeout monitoring device " + entry.first);
            continue;
        }

        switch (entry.second.get()) {
            case TaskOutcome::SUCCEEDED:
                ctx.tasks_succeeded.fetch_add(1);
                report.succeeded++;
                break;
            case TaskOutcome::CONNECTION_FAILED:
                ctx.connection_failures.fetch_add(1);
                report.connection_failures++;
                break;
            case TaskOutcome::FETCH_FAILED:
                ctx.fetch_failures.fetch_add(1);
                report.fetch_failures++;
                break;
            case TaskOutcome::FORMAT_ERROR:
                ctx.format_errors.fetch_add(1);
                report.format_errors++;
                break;
            case TaskOutcome::TIMED_OUT:
                ctx.timeouts.fetch_add(1);
                report.timeouts++;
                ctx.note(LogLevel::LOG_ERROR, "Timeout monitoring device " + entry.first);
                break;
            case TaskOutcome::DEVICE_BUSY:
                ctx.busy_skips.fetch_add(1);
                report.other_failures++;
                break;
            case TaskOutcome::SKIPPED:
                ctx.skipped.fetch_add(1);
                report.skipped++;
                break;
            case TaskOutcome::CANCELLED:
            case TaskOutcome::FAILED:
                report.other_failures++;
                break;
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - cycle_start);
    ctx.cycles.fetch_add(1);
    ctx.last_cycle_ms.store(report.duration.count());

    LogManager::getInstance().log("scheduler", LogLevel::INFO,
        "Monitoring cycle completed in " + std::to_string(report.duration.count()) + "ms (" +
        std::to_string(report.succeeded) + "/" + std::to_string(report.dispatched) + " succeeded)");

    if (ctx.event_bus) {
        Event::MonitoringEvent event;
        event.type = MonitoringEventType::CYCLE_COMPLETED;
        event.level = "INFO";
        event.message = report.toJson().dump();
        ctx.event_bus->publish(event);
    }
    return report;
}

nlohmann::json MonitoringScheduler::getStatistics() const {
    const Context& ctx = *ctx_;
    return nlohmann::json{
        {"state", SchedulerStateToString(state())},
        {"cycles", ctx.cycles.load()},
        {"tasks_dispatched", ctx.tasks_dispatched.load()},
        {"tasks_succeeded", ctx.tasks_succeeded.load()},
        {"connection_failures", ctx.connection_failures.load()},
        {"fetch_failures", ctx.fetch_failures.load()},
        {"format_errors", ctx.format_errors.load()},
        {"persistence_errors", ctx.persistence_errors.load()},
        {"timeouts", ctx.timeouts.load()},
        {"busy_skips", ctx.busy_skips.load()},
        {"skipped", ctx.skipped.load()},
        {"task_errors", ctx.task_errors.load()},
        {"overruns", ctx.overruns.load()},
        {"last_cycle_ms", ctx.last_cycle_ms.load()},
        {"permits_available", ctx.permits.available()},
        {"max_concurrent_monitors", ctx.config.max_concurrent_monitors}
    };
}

} // namespace DeviceWatch::Workers
