// =============================================================================
// collector/src/Workers/CachingTelemetryProvider.cpp
// =============================================================================

#include "Workers/CachingTelemetryProvider.h"

#include "Logging/LogManager.h"

namespace DeviceWatch::Workers {

CachingTelemetryProvider::CachingTelemetryProvider(std::shared_ptr<ITelemetryProvider> inner,
                                                   std::shared_ptr<JsonCache> cache)
    : inner_(std::move(inner))
    , cache_(std::move(cache)) {
}

Structs::OpResult<bool> CachingTelemetryProvider::connect(Structs::DeviceInfo& device) {
    const std::string key = ConnectionKey(device.ip);

    if (auto cached = cache_->get(key)) {
        if (cached->is_boolean()) {
            LogManager::getInstance().log("cache", LogLevel::TRACE, "Connection cache hit: " + device.ip);
            return cached->get<bool>();
        }
    }

    auto result = inner_->connect(device);
    if (result) {
        cache_->put(key, nlohmann::json(result.Value()));
    }
    return result;
}

Structs::OpResult<nlohmann::json> CachingTelemetryProvider::fetchMetrics(const Structs::DeviceInfo& device) {
    const std::string key = MetricsKey(device.ip);

    if (auto cached = cache_->get(key)) {
        LogManager::getInstance().log("cache", LogLevel::TRACE, "Metrics cache hit: " + device.ip);
        return *cached;
    }

    auto result = inner_->fetchMetrics(device);
    if (result) {
        cache_->put(key, result.Value());
    }
    return result;
}

std::string CachingTelemetryProvider::name() const {
    return "caching(" + inner_->name() + ")";
}

void CachingTelemetryProvider::invalidate(const std::string& ip) {
    cache_->erase(ConnectionKey(ip));
    cache_->erase(MetricsKey(ip));
}

} // namespace DeviceWatch::Workers
