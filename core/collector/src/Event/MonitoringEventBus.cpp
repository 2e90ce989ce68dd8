// =============================================================================
// collector/src/Event/MonitoringEventBus.cpp
// =============================================================================

#include "Event/MonitoringEventBus.h"

#include "Logging/LogManager.h"

namespace DeviceWatch {
namespace Event {

std::string MonitoringEventTypeToString(MonitoringEventType type) {
    switch (type) {
        case MonitoringEventType::DEVICE_UPDATED:     return "device_updated";
        case MonitoringEventType::ALERT_CREATED:      return "alert_created";
        case MonitoringEventType::ALERT_UPDATED:      return "alert_updated";
        case MonitoringEventType::ALERT_RESOLVED:     return "alert_resolved";
        case MonitoringEventType::ALERT_ACKNOWLEDGED: return "alert_acknowledged";
        case MonitoringEventType::CYCLE_COMPLETED:    return "cycle_completed";
        case MonitoringEventType::LOG:                return "log";
    }
    return "unknown";
}

nlohmann::json MonitoringEvent::toJson() const {
    nlohmann::json j;
    j["type"] = MonitoringEventTypeToString(type);
    j["device_id"] = device_id;
    j["level"] = level;
    j["message"] = message;
    j["timestamp"] = BasicTypes::TimestampToIsoString(timestamp);
    j["alert"] = alert ? alert->toJson() : nlohmann::json();
    return j;
}

MonitoringEventBus::MonitoringEventBus(size_t recent_capacity)
    : recent_capacity_(recent_capacity == 0 ? 1 : recent_capacity) {}

MonitoringEventBus::~MonitoringEventBus() {
    detachLogStream();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : queues_) {
        kv.second->close();
    }
}

// =============================================================================
// 구독 관리
// =============================================================================

SubscriptionId MonitoringEventBus::subscribe(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_[id] = std::move(handler);
    return id;
}

std::shared_ptr<EventQueue> MonitoringEventBus::subscribeQueue(size_t capacity, SubscriptionId* id_out) {
    auto queue = std::make_shared<EventQueue>(capacity);

    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    queues_[id] = queue;
    if (id_out) *id_out = id;
    return queue;
}

bool MonitoringEventBus::unsubscribe(SubscriptionId id) {
    std::shared_ptr<EventQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handlers_.erase(id) > 0) return true;

        auto it = queues_.find(id);
        if (it == queues_.end()) return false;
        queue = it->second;
        queues_.erase(it);
    }
    queue->close();
    return true;
}

size_t MonitoringEventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size() + queues_.size();
}

// =============================================================================
// 발행
// =============================================================================

void MonitoringEventBus::publish(const MonitoringEvent& event) {
    {
        std::lock_guard<std::mutex> lock(recent_mutex_);
        recent_.push_back(event);
        while (recent_.size() > recent_capacity_) {
            recent_.pop_front();
        }
    }

    // 핸들러가 버스를 다시 호출할 수 있으므로 락 밖에서 실행
    std::vector<EventHandler> handlers;
    std::vector<std::shared_ptr<EventQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers.reserve(handlers_.size());
        for (const auto& kv : handlers_) handlers.push_back(kv.second);
        queues.reserve(queues_.size());
        for (const auto& kv : queues_) queues.push_back(kv.second);
    }

    published_.fetch_add(1);

    for (auto& queue : queues) {
        queue->push(event);
    }

    for (auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            handler_errors_.fetch_add(1);
            // LOG 이벤트 처리 중 실패는 다시 로그로 돌리지 않는다
            if (event.type != MonitoringEventType::LOG) {
                LogManager::getInstance().log("engine", LogLevel::WARN,
                    "Event handler failed for " + MonitoringEventTypeToString(event.type) + ": " + e.what());
            }
        }
    }
}

void MonitoringEventBus::publishLog(const std::string& level, const std::string& message) {
    MonitoringEvent event;
    event.type = MonitoringEventType::LOG;
    event.level = level;
    event.message = message;
    publish(event);
}

void MonitoringEventBus::publishAlert(MonitoringEventType type, const Structs::Alert& alert) {
    MonitoringEvent event;
    event.type = type;
    event.device_id = alert.device_id;
    event.alert = alert;
    event.level = Enums::AlertLevelToString(alert.level);
    event.message = alert.message;
    event.timestamp = alert.timestamp;
    publish(event);
}

std::vector<MonitoringEvent> MonitoringEventBus::recentEvents(size_t limit) const {
    std::lock_guard<std::mutex> lock(recent_mutex_);
    size_t count = (limit == 0 || limit > recent_.size()) ? recent_.size() : limit;
    return std::vector<MonitoringEvent>(recent_.end() - static_cast<std::ptrdiff_t>(count), recent_.end());
}

// =============================================================================
// 로그 스트림
// =============================================================================

void MonitoringEventBus::attachLogStream() {
    std::lock_guard<std::mutex> lock(log_stream_mutex_);
    if (log_link_) return;

    auto link = std::make_shared<LogStreamLink>();
    link->bus = this;

    log_sink_id_ = LogManager::getInstance().addSink([link](const LogLib::LogRecord& record) {
        std::lock_guard<std::recursive_mutex> guard(link->mutex);
        if (!link->bus) return;

        MonitoringEvent event;
        event.type = MonitoringEventType::LOG;
        event.level = LogLib::LogLevelToString(record.level);
        event.message = record.category.empty() ? record.message
                                                : "[" + record.category + "] " + record.message;
        link->bus->publish(event);
    });
    log_link_ = std::move(link);
}

void MonitoringEventBus::detachLogStream() {
    std::shared_ptr<LogStreamLink> link;
    int id = -1;
    {
        std::lock_guard<std::mutex> lock(log_stream_mutex_);
        link = std::move(log_link_);
        log_link_.reset();
        id = log_sink_id_;
        log_sink_id_ = -1;
    }
    if (!link) return;

    {
        // 다른 스레드에서 진행 중인 publish가 끝날 때까지 대기
        std::lock_guard<std::recursive_mutex> guard(link->mutex);
        link->bus = nullptr;
    }
    LogManager::getInstance().removeSink(id);
}

} // namespace Event
} // namespace DeviceWatch
