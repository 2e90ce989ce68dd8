/**
 * @file MockTelemetryProvider.h
 * @brief 테스트용 ITelemetryProvider 구현 (gmock / 지연 fake)
 */

#ifndef TESTS_MOCK_TELEMETRY_PROVIDER_H
#define TESTS_MOCK_TELEMETRY_PROVIDER_H

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Workers/ITelemetryProvider.h"

namespace DeviceWatch::Testing {

class MockTelemetryProvider : public Workers::ITelemetryProvider {
public:
    MOCK_METHOD(Structs::OpResult<bool>, connect, (Structs::DeviceInfo& device), (override));
    MOCK_METHOD(Structs::OpResult<nlohmann::json>, fetchMetrics, (const Structs::DeviceInfo& device), (override));
    MOCK_METHOD(std::string, name, (), (const, override));
};

inline nlohmann::json MakePayload(double cpu, double memory, double disk) {
    return nlohmann::json{
        {"cpu", cpu},
        {"memory", memory},
        {"disk", disk},
        {"load_avg", {0.5, 0.4, 0.3}},
        {"processes", 120},
        {"top_services", {{"systemd", 1.0}, {"mysql", 4.5}}}
    };
}

/**
 * @brief fetchMetrics가 지정 시간만큼 멈추는 provider
 * @details 스케줄러가 버린 태스크가 테스트보다 오래 살 수 있으므로
 *          gmock 대신 수명과 무관한 fake를 쓴다.
 */
class SlowTelemetryProvider : public Workers::ITelemetryProvider {
public:
    explicit SlowTelemetryProvider(std::chrono::milliseconds delay) : delay_(delay) {}

    Structs::OpResult<bool> connect(Structs::DeviceInfo&) override { return true; }

    Structs::OpResult<nlohmann::json> fetchMetrics(const Structs::DeviceInfo&) override {
        started_.store(true);
        std::this_thread::sleep_for(delay_);
        finished_.store(true);
        return MakePayload(10.0, 20.0, 30.0);
    }

    std::string name() const override { return "slow"; }

    bool started() const { return started_.load(); }
    bool finished() const { return finished_.load(); }

private:
    const std::chrono::milliseconds delay_;
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
};

/**
 * @brief 호출을 기록하는 fake provider
 * @details
 * - gate_id 디바이스의 connect는 release() 전까지 멈춘다
 * - fetchMetrics는 fetch_delay 만큼 지연된다
 */
class RecordingTelemetryProvider : public Workers::ITelemetryProvider {
public:
    using Clock = std::chrono::steady_clock;

    explicit RecordingTelemetryProvider(std::chrono::milliseconds fetch_delay = std::chrono::milliseconds(0),
                                        std::string gate_id = "")
        : fetch_delay_(fetch_delay), gate_id_(std::move(gate_id)) {}

    Structs::OpResult<bool> connect(Structs::DeviceInfo& device) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_.push_back(device.id);
            if (!first_connect_) first_connect_ = Clock::now();
        }
        if (device.id == gate_id_) {
            std::unique_lock<std::mutex> lock(mutex_);
            gate_cv_.wait(lock, [this] { return released_; });
        }
        return true;
    }

    Structs::OpResult<nlohmann::json> fetchMetrics(const Structs::DeviceInfo&) override {
        if (fetch_delay_.count() > 0) std::this_thread::sleep_for(fetch_delay_);
        fetches_.fetch_add(1);
        return MakePayload(10.0, 20.0, 30.0);
    }

    std::string name() const override { return "recording"; }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        gate_cv_.notify_all();
    }

    std::vector<std::string> connectedIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    std::optional<Clock::time_point> firstConnectAt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_connect_;
    }

    size_t fetchCount() const { return fetches_.load(); }

private:
    const std::chrono::milliseconds fetch_delay_;
    const std::string gate_id_;

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool released_ = false;
    std::vector<std::string> connected_;
    std::optional<Clock::time_point> first_connect_;
    std::atomic<size_t> fetches_{0};
};

} // namespace DeviceWatch::Testing

#endif // TESTS_MOCK_TELEMETRY_PROVIDER_H
