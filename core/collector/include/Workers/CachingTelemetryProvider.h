// =============================================================================
// collector/include/Workers/CachingTelemetryProvider.h
// 연결 확인 / 메트릭 조회 결과를 TTL 동안 재사용하는 데코레이터
// =============================================================================

#ifndef WORKERS_CACHING_TELEMETRY_PROVIDER_H
#define WORKERS_CACHING_TELEMETRY_PROVIDER_H

#include <memory>

#include "Cache/TelemetryCache.h"
#include "Workers/ITelemetryProvider.h"

namespace DeviceWatch::Workers {

using JsonCache = Cache::TelemetryCache<nlohmann::json>;

/**
 * @brief 캐시 키: connection_<ip>, metrics_<ip>
 * @details 실패 결과(에러)는 캐시하지 않는다. connect의 false 결과는 캐시한다.
 */
class CachingTelemetryProvider : public ITelemetryProvider {
public:
    CachingTelemetryProvider(std::shared_ptr<ITelemetryProvider> inner,
                             std::shared_ptr<JsonCache> cache);

    Structs::OpResult<bool> connect(Structs::DeviceInfo& device) override;
    Structs::OpResult<nlohmann::json> fetchMetrics(const Structs::DeviceInfo& device) override;
    std::string name() const override;

    std::shared_ptr<JsonCache> getCache() const { return cache_; }

    // 특정 호스트의 캐시 항목 제거 (수동 새로고침)
    void invalidate(const std::string& ip);

    static std::string ConnectionKey(const std::string& ip) { return "connection_" + ip; }
    static std::string MetricsKey(const std::string& ip) { return "metrics_" + ip; }

private:
    std::shared_ptr<ITelemetryProvider> inner_;
    std::shared_ptr<JsonCache> cache_;
};

} // namespace DeviceWatch::Workers

#endif // WORKERS_CACHING_TELEMETRY_PROVIDER_H
