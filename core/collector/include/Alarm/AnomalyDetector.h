// =============================================================================
// collector/include/Alarm/AnomalyDetector.h
// (entity, metric) 별 이동 기준선 + z-score 이상치 판정
// =============================================================================

#ifndef ALARM_ANOMALY_DETECTOR_H
#define ALARM_ANOMALY_DETECTOR_H

#include <deque>
#include <optional>
#include <string>

#include "Common/Constants.h"
#include "Utils/ConcurrentMap.h"

namespace DeviceWatch {
namespace Alarm {

struct AnomalyDetectorConfig {
    size_t window_size = Constants::DEFAULT_MAX_HISTORY_SIZE;
    size_t min_samples = Constants::DEFAULT_ANOMALY_MIN_SAMPLES;
    double z_threshold = Constants::DEFAULT_ANOMALY_Z_THRESHOLD;
};

struct AnomalyResult {
    bool is_anomalous = false;
    double z_score = 0.0;
};

struct BaselineStats {
    double mean = 0.0;
    double stddev = 0.0;
    double variance = 0.0;
    size_t samples = 0;
};

/**
 * @brief 기준선 윈도우를 유지하고 새 관측값을 z-score로 분류한다.
 * @details 윈도우 키는 entityId + "_" + metric.
 *          mean/stddev는 모집단 통계이며 detect 호출마다 다시 계산한다.
 */
class AnomalyDetector {
public:
    explicit AnomalyDetector(AnomalyDetectorConfig config = AnomalyDetectorConfig{});

    AnomalyDetector(const AnomalyDetector&) = delete;
    AnomalyDetector& operator=(const AnomalyDetector&) = delete;

    // NaN/Inf 값은 무시한다
    void updateBaseline(const std::string& entity_id, const std::string& metric, double value);

    /**
     * @return min_samples 미만, stddev <= 0.001, 또는 value가 NaN/Inf 이면 (false, 0.0)
     */
    AnomalyResult detect(const std::string& entity_id, const std::string& metric, double value) const;

    /**
     * @brief updateBaseline 후 detect를 같은 shard 락 안에서 수행
     * @details 관측값은 자신이 평가되는 윈도우에 포함된다.
     */
    AnomalyResult updateAndDetect(const std::string& entity_id, const std::string& metric, double value);

    // 10개 이상 쌓였을 때만 값이 있다
    std::optional<BaselineStats> getBaselineStats(const std::string& entity_id,
                                                  const std::string& metric) const;

    size_t sampleCount(const std::string& entity_id, const std::string& metric) const;
    void reset(const std::string& entity_id, const std::string& metric);
    void clear();

    const AnomalyDetectorConfig& getConfig() const { return config_; }

private:
    static std::string makeKey(const std::string& entity_id, const std::string& metric) {
        return entity_id + "_" + metric;
    }

    static BaselineStats computeStats(const std::deque<double>& window);
    AnomalyResult score(const std::deque<double>& window, double value) const;
    void append(std::deque<double>& window, double value) const;

    AnomalyDetectorConfig config_;
    Utils::ConcurrentMap<std::string, std::deque<double>> baselines_;
};

} // namespace Alarm
} // namespace DeviceWatch

#endif // ALARM_ANOMALY_DETECTOR_H
