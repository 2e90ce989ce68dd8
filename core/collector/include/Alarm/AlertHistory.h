// =============================================================================
// collector/include/Alarm/AlertHistory.h - 해제된 알람 스냅샷 보관 (FIFO)
// =============================================================================

#ifndef ALARM_ALERT_HISTORY_H
#define ALARM_ALERT_HISTORY_H

#include <deque>
#include <mutex>
#include <vector>

#include "Common/Constants.h"
#include "Common/Structs.h"

namespace DeviceWatch {
namespace Alarm {

class AlertHistory {
public:
    explicit AlertHistory(size_t capacity = Constants::DEFAULT_ALERT_HISTORY_CAPACITY)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // 가득 차면 가장 오래된 스냅샷을 버린다
    void append(const Structs::Alert& alert) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(alert);
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
    }

    // 오래된 것부터, limit 0 이면 전부
    std::vector<Structs::Alert> recent(size_t limit = 0) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = (limit == 0 || limit > entries_.size()) ? entries_.size() : limit;
        return std::vector<Structs::Alert>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const { return capacity_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Structs::Alert> entries_;
    const size_t capacity_;
};

} // namespace Alarm
} // namespace DeviceWatch

#endif // ALARM_ALERT_HISTORY_H
