// =============================================================================
// collector/include/Workers/SimulatedTelemetryProvider.h
// 데모용 provider (네트워크 I/O 없음)
// =============================================================================

#ifndef WORKERS_SIMULATED_TELEMETRY_PROVIDER_H
#define WORKERS_SIMULATED_TELEMETRY_PROVIDER_H

#include <chrono>
#include <mutex>
#include <random>

#include "Workers/ITelemetryProvider.h"

namespace DeviceWatch::Workers {

struct SimulatedProviderConfig {
    std::chrono::milliseconds connect_latency{100};
    std::chrono::milliseconds fetch_latency{0};
    double failure_rate = 0.1;
    double degraded_failure_rate = 0.3;   // connection_errors > 3 인 디바이스
    uint32_t degraded_after_errors = 3;
    uint32_t seed = 0;                    // 0 이면 random_device
};

/**
 * @brief 사인파 기반 cpu/memory/disk + 지터, 확률적 연결 실패
 */
class SimulatedTelemetryProvider : public ITelemetryProvider {
public:
    explicit SimulatedTelemetryProvider(SimulatedProviderConfig config = SimulatedProviderConfig{});

    Structs::OpResult<bool> connect(Structs::DeviceInfo& device) override;
    Structs::OpResult<nlohmann::json> fetchMetrics(const Structs::DeviceInfo& device) override;
    std::string name() const override { return "simulated"; }

private:
    double uniform(double max);

    SimulatedProviderConfig config_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace DeviceWatch::Workers

#endif // WORKERS_SIMULATED_TELEMETRY_PROVIDER_H
