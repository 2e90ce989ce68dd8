/**
 * @file test_device_registry.cpp
 * @brief DeviceRegistry 선택 / 히스토리 / 상태 테스트
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

#include "Logging/LogManager.h"
#include "Workers/DeviceRegistry.h"

using namespace DeviceWatch;
using namespace DeviceWatch::Workers;
using DeviceWatch::Enums::DeviceStatus;
using DeviceWatch::Enums::ErrorCode;

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::LOG_ERROR);
        LogManager::getInstance().setFileOutput(false);
    }

    static DeviceInfo makeDevice(const std::string& id, DeviceStatus status = DeviceStatus::ONLINE) {
        DeviceInfo device;
        device.id = id;
        device.ip = "10.0.0." + std::to_string(id.size());
        device.hostname = id + ".local";
        device.status = status;
        return device;
    }

    static std::vector<std::string> ids(const std::vector<DeviceRecordPtr>& records) {
        std::vector<std::string> out;
        for (const auto& rec : records) out.push_back(rec->id());
        return out;
    }
};

TEST_F(DeviceRegistryTest, UpsertRejectsEmptyId) {
    DeviceRegistry registry;
    auto result = registry.upsert(makeDevice(""));
    EXPECT_TRUE(result.IsFailure());
    EXPECT_EQ(result.Code(), ErrorCode::INVALID_PARAMETER);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DeviceRegistryTest, UpsertReplacesInfoAndKeepsHistory) {
    DeviceRegistry registry;
    ASSERT_TRUE(registry.upsert(makeDevice("web-01")).IsSuccess());

    auto rec = registry.record("web-01");
    ASSERT_NE(rec, nullptr);
    {
        std::lock_guard<std::timed_mutex> lock(rec->accessMutex());
        rec->appendSample("cpu", MetricSample(42.0, BasicTypes::GetCurrentTimestamp()));
    }

    auto updated = makeDevice("web-01");
    updated.hostname = "renamed";
    ASSERT_TRUE(registry.upsert(updated).IsSuccess());

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get("web-01")->hostname, "renamed");
    ASSERT_EQ(registry.getHistory("web-01", "cpu").size(), 1u);
    EXPECT_DOUBLE_EQ(registry.getHistory("web-01", "cpu")[0].value, 42.0);
}

TEST_F(DeviceRegistryTest, HistoryIsBoundedOldestFirst) {
    DeviceRegistry registry(3);
    registry.upsert(makeDevice("web-01"));
    auto rec = registry.record("web-01");

    for (int i = 0; i < 5; ++i) {
        rec->appendSample("memory", MetricSample(i, BasicTypes::GetCurrentTimestamp()));
    }

    auto history = registry.getHistory("web-01", "memory");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_DOUBLE_EQ(history.front().value, 2.0);
    EXPECT_DOUBLE_EQ(history.back().value, 4.0);
    EXPECT_TRUE(registry.getHistory("web-01", "disk").empty());
    EXPECT_TRUE(registry.getHistory("ghost", "memory").empty());
}

TEST_F(DeviceRegistryTest, SelectEligibleSkipsDisabledAndFailed) {
    DeviceRegistry registry;
    registry.upsert(makeDevice("a"));
    registry.upsert(makeDevice("b", DeviceStatus::CONNECTION_FAILED));
    registry.upsert(makeDevice("c"));
    registry.upsert(makeDevice("d"));
    ASSERT_TRUE(registry.setMonitoringEnabled("d", false));

    auto selected = ids(registry.selectEligible(10));
    EXPECT_EQ(selected, (std::vector<std::string>{"a", "c"}));
}

TEST_F(DeviceRegistryTest, SelectEligibleRotatesAcrossCycles) {
    DeviceRegistry registry;
    for (const char* id : {"a", "b", "c", "d", "e"}) registry.upsert(makeDevice(id));

    EXPECT_EQ(ids(registry.selectEligible(2)), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(ids(registry.selectEligible(2)), (std::vector<std::string>{"c", "d"}));
    EXPECT_EQ(ids(registry.selectEligible(2)), (std::vector<std::string>{"e", "a"}));
}

TEST_F(DeviceRegistryTest, SelectEligibleSkipsBusyRecords) {
    DeviceRegistry registry;
    registry.upsert(makeDevice("a"));
    registry.upsert(makeDevice("b"));

    std::promise<void> locked;
    std::promise<void> release;
    auto release_future = release.get_future();
    std::thread holder([&]() {
        std::lock_guard<std::timed_mutex> lock(registry.record("a")->accessMutex());
        locked.set_value();
        release_future.wait();
    });
    locked.get_future().wait();

    EXPECT_EQ(ids(registry.selectEligible(10)), (std::vector<std::string>{"b"}));

    release.set_value();
    holder.join();
}

TEST_F(DeviceRegistryTest, UpsertTimesOutOnBusyRecord) {
    DeviceRegistry registry(10, std::chrono::milliseconds(50));
    registry.upsert(makeDevice("a"));

    std::promise<void> locked;
    std::promise<void> release;
    auto release_future = release.get_future();
    std::thread holder([&]() {
        std::lock_guard<std::timed_mutex> lock(registry.record("a")->accessMutex());
        locked.set_value();
        release_future.wait();
    });
    locked.get_future().wait();

    // 읽기는 락을 기다리지 않는다
    EXPECT_TRUE(registry.get("a").has_value());

    auto result = registry.upsert(makeDevice("a"));
    EXPECT_EQ(result.Code(), ErrorCode::DEVICE_BUSY);

    release.set_value();
    holder.join();
}

TEST_F(DeviceRegistryTest, SetStatusOnlineResetsErrors) {
    DeviceRegistry registry;
    auto device = makeDevice("a", DeviceStatus::CONNECTION_FAILED);
    device.connection_errors = 4;
    registry.upsert(device);

    ASSERT_TRUE(registry.setStatus("a", DeviceStatus::ONLINE));
    EXPECT_EQ(registry.get("a")->connection_errors, 0u);
    EXPECT_FALSE(registry.setStatus("ghost", DeviceStatus::ONLINE));
}

TEST_F(DeviceRegistryTest, RequeueFailedKeepsErrorCount) {
    DeviceRegistry registry;
    auto device = makeDevice("a", DeviceStatus::CONNECTION_FAILED);
    device.connection_errors = 2;
    registry.upsert(device);
    registry.upsert(makeDevice("b"));

    EXPECT_EQ(registry.requeueFailed(std::chrono::milliseconds(0)), 1u);
    auto info = registry.get("a");
    EXPECT_EQ(info->status, DeviceStatus::ONLINE);
    EXPECT_EQ(info->connection_errors, 2u);
}

TEST_F(DeviceRegistryTest, RequeueWaitsForRetryDelay) {
    DeviceRegistry registry;
    registry.upsert(makeDevice("a", DeviceStatus::CONNECTION_FAILED));
    registry.record("a")->markAttempt();

    EXPECT_EQ(registry.requeueFailed(std::chrono::hours(1)), 0u);
    EXPECT_EQ(registry.get("a")->status, DeviceStatus::CONNECTION_FAILED);
}

TEST_F(DeviceRegistryTest, SnapshotIsSortedById) {
    DeviceRegistry registry;
    registry.upsert(makeDevice("zeta"));
    registry.upsert(makeDevice("alpha"));
    registry.upsert(makeDevice("mid"));

    auto all = registry.snapshot();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "alpha");
    EXPECT_EQ(all[2].id, "zeta");

    EXPECT_TRUE(registry.remove("mid"));
    EXPECT_FALSE(registry.remove("mid"));
    EXPECT_EQ(registry.size(), 2u);
}
