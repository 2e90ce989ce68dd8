// =============================================================================
// collector/src/Workers/SimulatedTelemetryProvider.cpp
// =============================================================================

#include "Workers/SimulatedTelemetryProvider.h"

#include <algorithm>
#include <cmath>
#include <thread>

namespace DeviceWatch::Workers {

namespace {

double Clamp(double value) {
    return std::max(0.0, std::min(100.0, value));
}

} // namespace

SimulatedTelemetryProvider::SimulatedTelemetryProvider(SimulatedProviderConfig config)
    : config_(config)
    , rng_(config.seed != 0 ? config.seed : std::random_device{}()) {
}

double SimulatedTelemetryProvider::uniform(double max) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_real_distribution<double> dist(0.0, max);
    return dist(rng_);
}

Structs::OpResult<bool> SimulatedTelemetryProvider::connect(Structs::DeviceInfo& device) {
    if (config_.connect_latency.count() > 0) {
        std::this_thread::sleep_for(config_.connect_latency);
    }

    const double failure_rate = device.connection_errors > config_.degraded_after_errors
                                    ? config_.degraded_failure_rate
                                    : config_.failure_rate;
    const bool success = uniform(1.0) >= failure_rate;

    if (success && device.hardware_info.empty()) {
        device.hardware_info = nlohmann::json{{"provider", "simulated"}, {"cpu_cores", 4}, {"memory_gb", 16}};
        if (device.os_type.empty()) device.os_type = "Linux";
    }
    return success;
}

Structs::OpResult<nlohmann::json> SimulatedTelemetryProvider::fetchMetrics(const Structs::DeviceInfo& device) {
    (void)device;
    if (config_.fetch_latency.count() > 0) {
        std::this_thread::sleep_for(config_.fetch_latency);
    }

    const double base_time = static_cast<double>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    const double cpu_base = 20.0 + 30.0 * std::sin(base_time * 0.001);
    const double memory_base = 40.0 + 25.0 * std::cos(base_time * 0.0008);
    const double disk_base = 60.0 + 15.0 * std::sin(base_time * 0.0005);

    nlohmann::json metrics;
    metrics["cpu"] = Clamp(cpu_base + uniform(15.0));
    metrics["memory"] = Clamp(memory_base + uniform(10.0));
    metrics["disk"] = Clamp(disk_base + uniform(8.0));
    metrics["load_avg"] = {uniform(3.0), uniform(2.5), uniform(2.0)};
    metrics["processes"] = 80 + static_cast<int>(uniform(120.0));
    metrics["network_bytes_sent"] = static_cast<int64_t>(uniform(1000000.0));
    metrics["network_bytes_recv"] = static_cast<int64_t>(uniform(1000000.0));
    metrics["top_services"] = {
        {"systemd", uniform(5.0)},
        {"chrome", uniform(20.0)},
        {"mysql", uniform(15.0)}
    };
    metrics["timestamp"] = BasicTypes::TimestampToIsoString(BasicTypes::GetCurrentTimestamp());
    return metrics;
}

} // namespace DeviceWatch::Workers
