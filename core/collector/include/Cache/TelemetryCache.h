// =============================================================================
// collector/include/Cache/TelemetryCache.h - TTL + 용량 제한 캐시
// =============================================================================

#ifndef CACHE_TELEMETRY_CACHE_H
#define CACHE_TELEMETRY_CACHE_H

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "Common/Constants.h"
#include "Utils/ConcurrentMap.h"

namespace DeviceWatch {
namespace Cache {

/**
 * @brief 비싼 조회(연결 확인, 메트릭 수집)를 위한 TTL + 용량 제한 캐시
 * @details
 * - get: 만료된 엔트리는 그 자리에서 제거하고 nullopt
 * - put: 용량이 찼으면 cleanupExpired() 후에도 차 있을 때 한 개를 축출한다.
 *   축출 대상은 회전 커서가 가리키는 첫 번째 비어있지 않은 shard 안에서
 *   expires_at이 가장 이른 엔트리다. 기존 키 교체는 축출하지 않는다.
 * - 백그라운드 sweep 없음
 */
template <typename V> class TelemetryCache {
public:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry {
        V value;
        Clock::time_point expires_at;
    };

    TelemetryCache(size_t capacity, std::chrono::milliseconds default_ttl,
                   size_t shard_count = Constants::DEFAULT_CACHE_SHARDS)
        : entries_(shard_count)
        , capacity_(capacity == 0 ? 1 : capacity)
        , default_ttl_(default_ttl) {}

    TelemetryCache(const TelemetryCache&) = delete;
    TelemetryCache& operator=(const TelemetryCache&) = delete;

    // =======================================================================
    // 조회 / 저장
    // =======================================================================

    void put(const std::string& key, V value) {
        put(key, std::move(value), default_ttl_);
    }

    void put(const std::string& key, V value, std::chrono::milliseconds ttl) {
        const auto expires_at = Clock::now() + ttl;

        // 1. 기존 키 교체는 용량과 무관
        bool replaced = entries_.withExclusive(key, [&](Shard& map) {
            auto it = map.find(key);
            if (it == map.end()) return false;
            it->second = CacheEntry{value, expires_at};
            return true;
        });
        if (replaced) return;

        // 2. 새 키: 슬롯 예약 (용량 초과 방지)
        reserveSlot();

        bool inserted = entries_.withExclusive(key, [&](Shard& map) {
            return map.insert_or_assign(key, CacheEntry{std::move(value), expires_at}).second;
        });
        if (!inserted) {
            // 다른 스레드가 같은 키를 먼저 넣은 경우 예약 반환
            size_.fetch_sub(1);
        }
    }

    std::optional<V> get(const std::string& key) {
        const auto now = Clock::now();
        auto result = entries_.withExclusive(key, [&](Shard& map) -> std::optional<V> {
            auto it = map.find(key);
            if (it == map.end()) return std::nullopt;
            if (now >= it->second.expires_at) {
                map.erase(it);
                size_.fetch_sub(1);
                expirations_.fetch_add(1);
                return std::nullopt;
            }
            return it->second.value;
        });

        if (result) {
            hits_.fetch_add(1);
        } else {
            misses_.fetch_add(1);
        }
        return result;
    }

    // =======================================================================
    // 관리
    // =======================================================================

    /**
     * @brief 만료된 엔트리를 모두 제거한다.
     * @return 제거된 개수
     */
    size_t cleanupExpired() {
        const auto now = Clock::now();
        size_t removed = entries_.eraseIf([now](const std::string&, const CacheEntry& entry) {
            return now >= entry.expires_at;
        });
        if (removed > 0) {
            size_.fetch_sub(removed);
            expirations_.fetch_add(removed);
        }
        return removed;
    }

    bool erase(const std::string& key) {
        if (entries_.erase(key)) {
            size_.fetch_sub(1);
            return true;
        }
        return false;
    }

    void clear() {
        size_t removed = entries_.eraseIf([](const std::string&, const CacheEntry&) { return true; });
        size_.fetch_sub(removed);
    }

    size_t size() const { return size_.load(); }
    size_t capacity() const { return capacity_; }
    std::chrono::milliseconds defaultTtl() const { return default_ttl_; }

    uint64_t hits() const { return hits_.load(); }
    uint64_t misses() const { return misses_.load(); }
    uint64_t evictions() const { return evictions_.load(); }
    uint64_t expirations() const { return expirations_.load(); }

    nlohmann::json getStatistics() const {
        const uint64_t h = hits_.load();
        const uint64_t m = misses_.load();
        return nlohmann::json{
            {"size", size_.load()},
            {"capacity", capacity_},
            {"hits", h},
            {"misses", m},
            {"evictions", evictions_.load()},
            {"expirations", expirations_.load()},
            {"hit_rate", (h + m) > 0 ? static_cast<double>(h) / static_cast<double>(h + m) : 0.0}
        };
    }

private:
    using Shard = typename Utils::ConcurrentMap<std::string, CacheEntry>::Shard;

    void reserveSlot() {
        while (true) {
            size_t current = size_.load();
            if (current < capacity_) {
                if (size_.compare_exchange_weak(current, current + 1)) return;
                continue;
            }

            // 용량 초과: 만료 정리 먼저, 그래도 차 있으면 하나 축출
            if (cleanupExpired() > 0) continue;
            if (!evictOne()) {
                // 예약만 되고 아직 삽입되지 않은 슬롯뿐인 경우
                std::this_thread::yield();
            }
        }
    }

    bool evictOne() {
        const size_t shard_count = entries_.shardCount();
        const size_t start = evict_cursor_.fetch_add(1);

        for (size_t i = 0; i < shard_count; ++i) {
            bool evicted = entries_.withShardAt(start + i, [&](Shard& map) {
                if (map.empty()) return false;
                auto victim = map.begin();
                for (auto it = map.begin(); it != map.end(); ++it) {
                    if (it->second.expires_at < victim->second.expires_at) victim = it;
                }
                map.erase(victim);
                return true;
            });
            if (evicted) {
                size_.fetch_sub(1);
                evictions_.fetch_add(1);
                return true;
            }
        }
        return false;
    }

    Utils::ConcurrentMap<std::string, CacheEntry> entries_;
    const size_t capacity_;
    const std::chrono::milliseconds default_ttl_;

    std::atomic<size_t> size_{0};
    std::atomic<size_t> evict_cursor_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace Cache
} // namespace DeviceWatch

#endif // CACHE_TELEMETRY_CACHE_H
