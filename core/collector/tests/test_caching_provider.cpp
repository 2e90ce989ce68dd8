/**
 * @file test_caching_provider.cpp
 * @brief CachingTelemetryProvider 캐시 동작 테스트
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "Logging/LogManager.h"
#include "MockTelemetryProvider.h"
#include "Workers/CachingTelemetryProvider.h"

using namespace DeviceWatch;
using namespace DeviceWatch::Workers;
using DeviceWatch::Testing::MakePayload;
using DeviceWatch::Testing::MockTelemetryProvider;
using ::testing::_;
using ::testing::Return;

class CachingTelemetryProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::LOG_ERROR);
        LogManager::getInstance().setFileOutput(false);

        inner_ = std::make_shared<MockTelemetryProvider>();
        cache_ = std::make_shared<JsonCache>(100, std::chrono::seconds(60));
        provider_ = std::make_unique<CachingTelemetryProvider>(inner_, cache_);

        device_.id = "web-01";
        device_.ip = "10.0.0.11";
    }

    std::shared_ptr<MockTelemetryProvider> inner_;
    std::shared_ptr<JsonCache> cache_;
    std::unique_ptr<CachingTelemetryProvider> provider_;
    Structs::DeviceInfo device_;
};

TEST_F(CachingTelemetryProviderTest, MetricsAreFetchedOncePerTtl) {
    EXPECT_CALL(*inner_, fetchMetrics(_))
        .Times(1)
        .WillOnce(Return(Structs::OpResult<nlohmann::json>(MakePayload(55.0, 60.0, 70.0))));

    auto first = provider_->fetchMetrics(device_);
    auto second = provider_->fetchMetrics(device_);

    ASSERT_TRUE(first.IsSuccess());
    ASSERT_TRUE(second.IsSuccess());
    EXPECT_EQ(second.Value()["cpu"], 55.0);
    EXPECT_TRUE(cache_->get(CachingTelemetryProvider::MetricsKey("10.0.0.11")).has_value());
}

TEST_F(CachingTelemetryProviderTest, FailedConnectResultIsCached) {
    EXPECT_CALL(*inner_, connect(_)).Times(1).WillOnce(Return(Structs::OpResult<bool>(false)));

    EXPECT_FALSE(provider_->connect(device_).Value());
    EXPECT_FALSE(provider_->connect(device_).Value());
}

TEST_F(CachingTelemetryProviderTest, ErrorsAreNotCached) {
    EXPECT_CALL(*inner_, fetchMetrics(_))
        .Times(2)
        .WillOnce(Return(Structs::OpResult<nlohmann::json>::Failure(Enums::ErrorCode::TIMEOUT, "timed out")))
        .WillOnce(Return(Structs::OpResult<nlohmann::json>(MakePayload(1.0, 2.0, 3.0))));

    EXPECT_EQ(provider_->fetchMetrics(device_).Code(), Enums::ErrorCode::TIMEOUT);
    EXPECT_TRUE(provider_->fetchMetrics(device_).IsSuccess());
}

TEST_F(CachingTelemetryProviderTest, InvalidateForcesRefetch) {
    EXPECT_CALL(*inner_, connect(_)).Times(2).WillRepeatedly(Return(Structs::OpResult<bool>(true)));

    EXPECT_TRUE(provider_->connect(device_).Value());
    provider_->invalidate(device_.ip);
    EXPECT_TRUE(provider_->connect(device_).Value());
}

TEST_F(CachingTelemetryProviderTest, EntriesAreKeyedByHostAddress) {
    Structs::DeviceInfo other = device_;
    other.id = "web-02";
    other.ip = "10.0.0.12";

    EXPECT_CALL(*inner_, fetchMetrics(_))
        .Times(2)
        .WillRepeatedly(Return(Structs::OpResult<nlohmann::json>(MakePayload(1.0, 2.0, 3.0))));

    provider_->fetchMetrics(device_);
    provider_->fetchMetrics(other);
    EXPECT_EQ(cache_->size(), 2u);
}

TEST_F(CachingTelemetryProviderTest, NameWrapsInnerProvider) {
    EXPECT_CALL(*inner_, name()).WillOnce(Return(std::string("simulated")));
    EXPECT_EQ(provider_->name(), "caching(simulated)");
}
