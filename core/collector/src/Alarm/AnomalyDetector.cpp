// =============================================================================
// collector/src/Alarm/AnomalyDetector.cpp
// =============================================================================

#include "Alarm/AnomalyDetector.h"

#include <cmath>

namespace DeviceWatch {
namespace Alarm {

using Window = std::deque<double>;
using BaselineShard = Utils::ConcurrentMap<std::string, Window>::Shard;

AnomalyDetector::AnomalyDetector(AnomalyDetectorConfig config)
    : config_(config) {
    if (config_.window_size == 0) config_.window_size = 1;
}

// =============================================================================
// 기준선 갱신 / 판정
// =============================================================================

void AnomalyDetector::updateBaseline(const std::string& entity_id, const std::string& metric, double value) {
    if (!std::isfinite(value)) return;
    const std::string key = makeKey(entity_id, metric);
    baselines_.withExclusive(key, [&](BaselineShard& map) {
        append(map[key], value);
    });
}

AnomalyResult AnomalyDetector::detect(const std::string& entity_id, const std::string& metric, double value) const {
    const std::string key = makeKey(entity_id, metric);
    return baselines_.withShared(key, [&](const BaselineShard& map) {
        auto it = map.find(key);
        if (it == map.end()) return AnomalyResult{};
        return score(it->second, value);
    });
}

AnomalyResult AnomalyDetector::updateAndDetect(const std::string& entity_id, const std::string& metric, double value) {
    // NaN/Inf 는 창에 넣지 않는다 (mean/stddev 전체가 NaN 이 됨)
    if (!std::isfinite(value)) return AnomalyResult{};
    const std::string key = makeKey(entity_id, metric);
    return baselines_.withExclusive(key, [&](BaselineShard& map) {
        Window& window = map[key];
        append(window, value);
        return score(window, value);
    });
}

std::optional<BaselineStats> AnomalyDetector::getBaselineStats(const std::string& entity_id,
                                                               const std::string& metric) const {
    const std::string key = makeKey(entity_id, metric);
    return baselines_.withShared(key, [&](const BaselineShard& map) -> std::optional<BaselineStats> {
        auto it = map.find(key);
        if (it == map.end() || it->second.size() < Constants::BASELINE_STATS_MIN_SAMPLES) {
            return std::nullopt;
        }
        return computeStats(it->second);
    });
}

size_t AnomalyDetector::sampleCount(const std::string& entity_id, const std::string& metric) const {
    const std::string key = makeKey(entity_id, metric);
    return baselines_.withShared(key, [&](const BaselineShard& map) -> size_t {
        auto it = map.find(key);
        return it == map.end() ? 0 : it->second.size();
    });
}

void AnomalyDetector::reset(const std::string& entity_id, const std::string& metric) {
    baselines_.erase(makeKey(entity_id, metric));
}

void AnomalyDetector::clear() {
    baselines_.clear();
}

// =============================================================================
// 내부 계산
// =============================================================================

BaselineStats AnomalyDetector::computeStats(const Window& window) {
    BaselineStats stats;
    stats.samples = window.size();
    if (window.empty()) return stats;

    double sum = 0.0;
    for (double v : window) sum += v;
    stats.mean = sum / static_cast<double>(window.size());

    double sq = 0.0;
    for (double v : window) sq += (v - stats.mean) * (v - stats.mean);
    stats.variance = sq / static_cast<double>(window.size());
    stats.stddev = std::sqrt(stats.variance);
    return stats;
}

AnomalyResult AnomalyDetector::score(const Window& window, double value) const {
    if (window.size() < config_.min_samples || !std::isfinite(value)) return AnomalyResult{};

    BaselineStats stats = computeStats(window);
    if (stats.stddev <= Constants::STDDEV_EPSILON) return AnomalyResult{};

    AnomalyResult result;
    result.z_score = std::fabs(value - stats.mean) / stats.stddev;
    result.is_anomalous = result.z_score > config_.z_threshold;
    return result;
}

void AnomalyDetector::append(Window& window, double value) const {
    window.push_back(value);
    while (window.size() > config_.window_size) {
        window.pop_front();
    }
}

} // namespace Alarm
} // namespace DeviceWatch
