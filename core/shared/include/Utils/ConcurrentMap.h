// =============================================================================
// shared/include/Utils/ConcurrentMap.h
// shard 단위로 락을 나눈 해시 맵 (텔레메트리 캐시 저장소)
// =============================================================================

#ifndef DEVICEWATCH_UTILS_CONCURRENT_MAP_H
#define DEVICEWATCH_UTILS_CONCURRENT_MAP_H

#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace DeviceWatch {
namespace Utils {

/**
 * @brief Hash map split into independently locked shards.
 * @details A key only ever locks its own shard, so operations on unrelated
 *          keys proceed in parallel. Callbacks passed to withExclusive /
 *          withShared run under the shard lock and must not re-enter the map.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ConcurrentMap {
public:
    using Shard = std::unordered_map<K, V, Hash>;

    explicit ConcurrentMap(size_t shard_count = 16)
        : shards_(shard_count == 0 ? 1 : shard_count) {}

    ConcurrentMap(const ConcurrentMap&) = delete;
    ConcurrentMap& operator=(const ConcurrentMap&) = delete;

    size_t shardCount() const { return shards_.size(); }
    size_t shardIndex(const K& key) const { return hasher_(key) % shards_.size(); }

    /**
     * @brief key가 속한 shard를 배타 락으로 잡고 fn(shard map)을 실행한다.
     */
    template <typename Fn>
    auto withExclusive(const K& key, Fn&& fn) {
        auto& shard = shards_[shardIndex(key)];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return fn(shard.map);
    }

    template <typename Fn>
    auto withShared(const K& key, Fn&& fn) const {
        const auto& shard = shards_[shardIndex(key)];
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        return fn(static_cast<const Shard&>(shard.map));
    }

    // index 번째 shard 전체를 배타 락으로 잡는다 (eviction 등)
    template <typename Fn>
    auto withShardAt(size_t index, Fn&& fn) {
        auto& shard = shards_[index % shards_.size()];
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return fn(shard.map);
    }

    std::optional<V> find(const K& key) const {
        return withShared(key, [&key](const Shard& map) -> std::optional<V> {
            auto it = map.find(key);
            if (it == map.end()) return std::nullopt;
            return it->second;
        });
    }

    bool contains(const K& key) const {
        return withShared(key, [&key](const Shard& map) { return map.count(key) > 0; });
    }

    // 새로 추가되었으면 true
    bool insert_or_assign(const K& key, V value) {
        return withExclusive(key, [&](Shard& map) {
            return map.insert_or_assign(key, std::move(value)).second;
        });
    }

    bool erase(const K& key) {
        return withExclusive(key, [&key](Shard& map) { return map.erase(key) > 0; });
    }

    // shard를 하나씩 잠그므로 전체 스냅샷은 아니다
    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.map.clear();
        }
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            for (const auto& kv : shard.map) fn(kv.first, kv.second);
        }
    }

    // 지운 항목 수
    template <typename Pred>
    size_t eraseIf(Pred&& pred) {
        size_t erased = 0;
        for (auto& shard : shards_) {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            for (auto it = shard.map.begin(); it != shard.map.end();) {
                if (pred(it->first, it->second)) {
                    it = shard.map.erase(it);
                    ++erased;
                } else {
                    ++it;
                }
            }
        }
        return erased;
    }

    std::vector<V> values() const {
        std::vector<V> out;
        forEach([&out](const K&, const V& v) { out.push_back(v); });
        return out;
    }

    std::vector<K> keys() const {
        std::vector<K> out;
        forEach([&out](const K& k, const V&) { out.push_back(k); });
        return out;
    }

private:
    struct ShardSlot {
        mutable std::shared_mutex mutex;
        Shard map;
    };

    std::vector<ShardSlot> shards_;
    Hash hasher_;
};

} // namespace Utils
} // namespace DeviceWatch

#endif // DEVICEWATCH_UTILS_CONCURRENT_MAP_H
