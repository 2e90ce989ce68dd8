// =============================================================================
// collector/src/Workers/DeviceRegistry.cpp
// =============================================================================

#include "Workers/DeviceRegistry.h"

#include <algorithm>

#include "Logging/LogManager.h"

namespace DeviceWatch::Workers {

// =============================================================================
// DeviceRecord
// =============================================================================

DeviceRecord::DeviceRecord(DeviceInfo info, size_t max_history_size)
    : id_(info.id)
    , max_history_size_(max_history_size == 0 ? 1 : max_history_size)
    , info_(info)
    , published_(std::move(info)) {
}

void DeviceRecord::appendSample(const std::string& metric, const MetricSample& sample) {
    std::lock_guard<std::mutex> lock(published_mutex_);
    auto& history = histories_[metric];
    history.push_back(sample);
    while (history.size() > max_history_size_) {
        history.pop_front();
    }
}

void DeviceRecord::markAttempt() {
    std::lock_guard<std::mutex> lock(published_mutex_);
    last_attempt_ = std::chrono::steady_clock::now();
}

void DeviceRecord::publish() {
    std::lock_guard<std::mutex> lock(published_mutex_);
    published_ = info_;
}

DeviceInfo DeviceRecord::snapshot() const {
    std::lock_guard<std::mutex> lock(published_mutex_);
    return published_;
}

std::vector<MetricSample> DeviceRecord::history(const std::string& metric) const {
    std::lock_guard<std::mutex> lock(published_mutex_);
    auto it = histories_.find(metric);
    if (it == histories_.end()) return {};
    return std::vector<MetricSample>(it->second.begin(), it->second.end());
}

std::vector<std::string> DeviceRecord::metricNames() const {
    std::lock_guard<std::mutex> lock(published_mutex_);
    std::vector<std::string> names;
    for (const auto& kv : histories_) names.push_back(kv.first);
    return names;
}

std::optional<std::chrono::steady_clock::time_point> DeviceRecord::lastAttempt() const {
    std::lock_guard<std::mutex> lock(published_mutex_);
    return last_attempt_;
}

bool DeviceRecord::isBusy() {
    if (!access_mutex_.try_lock()) return true;
    access_mutex_.unlock();
    return false;
}

// =============================================================================
// DeviceRegistry
// =============================================================================

DeviceRegistry::DeviceRegistry(size_t max_history_size, std::chrono::milliseconds lock_timeout)
    : max_history_size_(max_history_size)
    , lock_timeout_(lock_timeout) {
}

template <typename Fn>
bool DeviceRegistry::mutate(const std::string& device_id, Fn&& fn) {
    auto rec = record(device_id);
    if (!rec) return false;

    std::unique_lock<std::timed_mutex> lock(rec->accessMutex(), std::defer_lock);
    if (!lock.try_lock_for(lock_timeout_)) {
        LogManager::getInstance().log("scheduler", LogLevel::WARN,
            "Device record busy, change skipped: " + device_id);
        return false;
    }
    fn(rec->info());
    rec->publish();
    return true;
}

Structs::OpResult<void> DeviceRegistry::upsert(const DeviceInfo& device) {
    if (device.id.empty()) {
        return Structs::OpResult<void>::Failure(Enums::ErrorCode::INVALID_PARAMETER, "device id is empty");
    }

    using Shard = Utils::ConcurrentMap<std::string, DeviceRecordPtr>::Shard;
    bool inserted = devices_.withExclusive(device.id, [&](Shard& map) {
        if (map.count(device.id) > 0) return false;
        map.emplace(device.id, std::make_shared<DeviceRecord>(device, max_history_size_));
        return true;
    });
    if (inserted) return Structs::OpResult<void>::Success();

    bool replaced = mutate(device.id, [&device](DeviceInfo& info) { info = device; });
    if (!replaced) {
        return Structs::OpResult<void>::Failure(Enums::ErrorCode::DEVICE_BUSY,
                                                "device record is busy: " + device.id);
    }
    return Structs::OpResult<void>::Success();
}

std::optional<DeviceInfo> DeviceRegistry::get(const std::string& device_id) const {
    auto rec = record(device_id);
    if (!rec) return std::nullopt;
    return rec->snapshot();
}

DeviceRecordPtr DeviceRegistry::record(const std::string& device_id) const {
    auto found = devices_.find(device_id);
    return found ? *found : nullptr;
}

bool DeviceRegistry::remove(const std::string& device_id) {
    return devices_.erase(device_id);
}

bool DeviceRegistry::setMonitoringEnabled(const std::string& device_id, bool enabled) {
    return mutate(device_id, [enabled](DeviceInfo& info) { info.monitoring_enabled = enabled; });
}

bool DeviceRegistry::setStatus(const std::string& device_id, Enums::DeviceStatus status) {
    return mutate(device_id, [status](DeviceInfo& info) {
        info.status = status;
        if (status == Enums::DeviceStatus::ONLINE) info.connection_errors = 0;
    });
}

std::vector<DeviceRecordPtr> DeviceRegistry::selectEligible(size_t limit) {
    std::vector<DeviceRecordPtr> selected;
    if (limit == 0) return selected;

    std::vector<std::string> ids = devices_.keys();
    if (ids.empty()) return selected;
    std::sort(ids.begin(), ids.end());

    std::lock_guard<std::mutex> lock(cursor_mutex_);

    // 마지막으로 선택된 id 다음부터 순환
    size_t start = static_cast<size_t>(
        std::upper_bound(ids.begin(), ids.end(), last_selected_) - ids.begin());

    for (size_t i = 0; i < ids.size() && selected.size() < limit; ++i) {
        const std::string& id = ids[(start + i) % ids.size()];
        auto rec = record(id);
        if (!rec) continue;

        DeviceInfo info = rec->snapshot();
        if (!info.monitoring_enabled || info.status != Enums::DeviceStatus::ONLINE) continue;
        if (rec->isBusy()) continue;

        selected.push_back(rec);
        last_selected_ = id;
    }
    return selected;
}

std::vector<MetricSample> DeviceRegistry::getHistory(const std::string& device_id, const std::string& metric) const {
    auto rec = record(device_id);
    if (!rec) return {};
    return rec->history(metric);
}

size_t DeviceRegistry::requeueFailed(std::chrono::milliseconds older_than) {
    const auto now = std::chrono::steady_clock::now();
    size_t requeued = 0;

    for (const auto& id : devices_.keys()) {
        auto rec = record(id);
        if (!rec) continue;

        DeviceInfo info = rec->snapshot();
        if (!info.monitoring_enabled || info.status != Enums::DeviceStatus::CONNECTION_FAILED) continue;

        auto last = rec->lastAttempt();
        if (last && now - *last < older_than) continue;

        // 재시도 대상은 connection_errors를 유지해 높은 실패율 구간 판단에 쓴다
        std::unique_lock<std::timed_mutex> lock(rec->accessMutex(), std::try_to_lock);
        if (!lock.owns_lock()) continue;
        rec->info().status = Enums::DeviceStatus::ONLINE;
        rec->publish();
        ++requeued;
    }
    return requeued;
}

std::vector<DeviceInfo> DeviceRegistry::snapshot() const {
    std::vector<DeviceInfo> out;
    devices_.forEach([&out](const std::string&, const DeviceRecordPtr& rec) {
        out.push_back(rec->snapshot());
    });
    std::sort(out.begin(), out.end(), [](const DeviceInfo& a, const DeviceInfo& b) { return a.id < b.id; });
    return out;
}

} // namespace DeviceWatch::Workers
