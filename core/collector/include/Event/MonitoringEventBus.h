// =============================================================================
// collector/include/Event/MonitoringEventBus.h
// 상태 변경 / 로그 라인을 표시 계층으로 내보내는 publish-subscribe 채널
// =============================================================================

#ifndef EVENT_MONITORING_EVENT_BUS_H
#define EVENT_MONITORING_EVENT_BUS_H

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Common/Constants.h"
#include "Common/Structs.h"
#include "Utils/ThreadSafeQueue.h"

namespace DeviceWatch {
namespace Event {

enum class MonitoringEventType : uint8_t {
    DEVICE_UPDATED = 0,
    ALERT_CREATED,
    ALERT_UPDATED,
    ALERT_RESOLVED,
    ALERT_ACKNOWLEDGED,
    CYCLE_COMPLETED,
    LOG
};

std::string MonitoringEventTypeToString(MonitoringEventType type);

struct MonitoringEvent {
    MonitoringEventType type = MonitoringEventType::LOG;
    std::string device_id;
    std::optional<Structs::Alert> alert;
    std::string level;      // 로그 레벨 또는 알람 레벨 문자열
    std::string message;
    BasicTypes::Timestamp timestamp = BasicTypes::GetCurrentTimestamp();

    nlohmann::json toJson() const;
};

using SubscriptionId = uint64_t;
using EventHandler = std::function<void(const MonitoringEvent&)>;
using EventQueue = Utils::ThreadSafeQueue<MonitoringEvent>;

/**
 * @brief 모니터링 이벤트 버스
 * @details
 * - push 구독: 핸들러는 publish 호출 스레드에서 실행된다.
 *   예외를 던진 핸들러는 로그만 남기고 나머지 핸들러는 계속 호출된다.
 * - pull 구독: subscribeQueue()가 돌려준 큐에서 직접 꺼낸다.
 * - 최근 이벤트 링 (기본 500개)
 */
class MonitoringEventBus {
public:
    explicit MonitoringEventBus(size_t recent_capacity = Constants::DEFAULT_RECENT_EVENT_CAPACITY);
    ~MonitoringEventBus();

    MonitoringEventBus(const MonitoringEventBus&) = delete;
    MonitoringEventBus& operator=(const MonitoringEventBus&) = delete;

    SubscriptionId subscribe(EventHandler handler);

    /**
     * @brief pull 방식 구독
     * @param capacity 0이면 무제한, 아니면 가득 찼을 때 가장 오래된 이벤트를 버린다
     */
    std::shared_ptr<EventQueue> subscribeQueue(size_t capacity = Constants::DEFAULT_EVENT_QUEUE_CAPACITY,
                                               SubscriptionId* id_out = nullptr);

    // 큐 구독이면 큐를 닫는다
    bool unsubscribe(SubscriptionId id);

    void publish(const MonitoringEvent& event);

    // 편의 함수
    void publishLog(const std::string& level, const std::string& message);
    void publishAlert(MonitoringEventType type, const Structs::Alert& alert);

    /**
     * @brief 최근 이벤트 (오래된 것부터)
     * @param limit 0이면 전부
     */
    std::vector<MonitoringEvent> recentEvents(size_t limit = 0) const;

    /**
     * @brief LogManager sink를 등록해 로그 라인을 LOG 이벤트로 전달
     * @details sink는 버스를 직접 잡지 않고 LogStreamLink를 공유한다.
     *          detach(소멸자 포함)는 진행 중인 전달이 끝날 때까지 기다린 뒤
     *          링크를 끊으므로, 그 이후 sink 호출은 아무것도 하지 않는다.
     */
    void attachLogStream();
    void detachLogStream();

    size_t subscriberCount() const;
    uint64_t publishedCount() const { return published_.load(); }
    uint64_t handlerErrorCount() const { return handler_errors_.load(); }

private:
    // sink와 버스 사이의 공유 상태. bus가 nullptr이면 끊긴 링크
    struct LogStreamLink {
        std::recursive_mutex mutex;   // 핸들러 안의 로그가 같은 sink로 재진입한다
        MonitoringEventBus* bus = nullptr;
    };

    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<SubscriptionId, EventHandler> handlers_;
    std::map<SubscriptionId, std::shared_ptr<EventQueue>> queues_;

    mutable std::mutex recent_mutex_;
    std::deque<MonitoringEvent> recent_;
    const size_t recent_capacity_;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> handler_errors_{0};
    std::mutex log_stream_mutex_;
    int log_sink_id_ = -1;
    std::shared_ptr<LogStreamLink> log_link_;
};

} // namespace Event
} // namespace DeviceWatch

#endif // EVENT_MONITORING_EVENT_BUS_H
