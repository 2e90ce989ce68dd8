/**
 * @file test_monitoring_config.cpp
 * @brief MonitoringConfig 파싱 / 검증 테스트
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "Core/MonitoringConfig.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

using namespace DeviceWatch;
using namespace DeviceWatch::Core;
using DeviceWatch::Enums::ErrorCode;

class MonitoringConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::LOG_ERROR);
        LogManager::getInstance().setFileOutput(false);
        env_path_ = std::filesystem::temp_directory_path() / "devicewatch_config_test.env";
    }

    void TearDown() override {
        ConfigManager::getInstance().clear();
        std::error_code ec;
        std::filesystem::remove(env_path_, ec);
    }

    void loadEnv(const std::string& content) {
        std::ofstream out(env_path_);
        out << content;
        out.close();
        ASSERT_TRUE(ConfigManager::getInstance().initialize(env_path_.string()));
    }

    std::filesystem::path env_path_;
};

TEST_F(MonitoringConfigTest, ParsesThresholdList) {
    auto parsed = MonitoringConfig::ParseThresholds("cpu:80:95, memory:85:95,disk:90:98");
    ASSERT_TRUE(parsed.IsSuccess());
    ASSERT_EQ(parsed.Value().size(), 3u);
    EXPECT_EQ(parsed.Value()[1].metric, "memory");
    EXPECT_DOUBLE_EQ(parsed.Value()[1].warning_level, 85.0);
    EXPECT_DOUBLE_EQ(parsed.Value()[2].critical_level, 98.0);
    EXPECT_TRUE(parsed.Value()[0].enabled);
}

TEST_F(MonitoringConfigTest, RejectsMalformedThresholds) {
    EXPECT_EQ(MonitoringConfig::ParseThresholds("cpu:80").Code(), ErrorCode::CONFIGURATION_ERROR);
    EXPECT_EQ(MonitoringConfig::ParseThresholds("cpu:high:95").Code(), ErrorCode::CONFIGURATION_ERROR);
    EXPECT_EQ(MonitoringConfig::ParseThresholds("cpu:96:95").Code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(MonitoringConfigTest, ParsesDeviceList) {
    auto parsed = MonitoringConfig::ParseDevices("web-01@10.0.0.11/web-01.local, edge-01@10.0.1.5");
    ASSERT_TRUE(parsed.IsSuccess());
    ASSERT_EQ(parsed.Value().size(), 2u);

    const auto& web = parsed.Value()[0];
    EXPECT_EQ(web.id, "web-01");
    EXPECT_EQ(web.ip, "10.0.0.11");
    EXPECT_EQ(web.hostname, "web-01.local");
    EXPECT_EQ(web.status, Enums::DeviceStatus::ONLINE);

    // hostname 생략 시 ip
    EXPECT_EQ(parsed.Value()[1].hostname, "10.0.1.5");

    EXPECT_TRUE(MonitoringConfig::ParseDevices("").Value().empty());
    EXPECT_EQ(MonitoringConfig::ParseDevices("no-address").Code(), ErrorCode::CONFIGURATION_ERROR);
    EXPECT_EQ(MonitoringConfig::ParseDevices("@10.0.0.1").Code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(MonitoringConfigTest, ReadsKeysFromConfigFile) {
    loadEnv(
        "MONITORING_INTERVAL_SECONDS=2\n"
        "MAX_CONCURRENT_MONITORS=4\n"
        "TASK_TIMEOUT_SECONDS=7\n"
        "CACHE_TTL_SECONDS=0\n"
        "DATABASE_PATH=/tmp/devicewatch_cfg.db\n"
        "ANOMALY_Z_THRESHOLD=3.5\n"
        "ANOMALY_OVERRIDES_THRESHOLDS=false\n"
        "ALERT_THRESHOLDS=cpu:70:90\n"
        "DEVICES=db-01@10.0.0.21\n");

    auto loaded = MonitoringConfig::FromConfigManager();
    ASSERT_TRUE(loaded.IsSuccess()) << loaded.Error().GetSummary();
    const auto& config = loaded.Value();

    EXPECT_EQ(config.interval, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.max_concurrent_monitors, 4u);
    EXPECT_EQ(config.task_timeout, std::chrono::milliseconds(7000));
    EXPECT_EQ(config.cache_ttl.count(), 0);
    EXPECT_EQ(config.database_path, "/tmp/devicewatch_cfg.db");
    EXPECT_DOUBLE_EQ(config.anomaly_z_threshold, 3.5);
    EXPECT_FALSE(config.anomaly_overrides_thresholds);
    ASSERT_EQ(config.thresholds.size(), 1u);
    EXPECT_DOUBLE_EQ(config.thresholds[0].warning_level, 70.0);
    ASSERT_EQ(config.seed_devices.size(), 1u);
    EXPECT_EQ(config.seed_devices[0].id, "db-01");

    // 지정하지 않은 키는 기본값
    EXPECT_EQ(config.max_history_size, Constants::DEFAULT_MAX_HISTORY_SIZE);
    EXPECT_EQ(config.anomaly_min_samples, Constants::DEFAULT_ANOMALY_MIN_SAMPLES);
}

TEST_F(MonitoringConfigTest, DefaultThresholdsApplyWhenKeyIsMissing) {
    loadEnv("MONITORING_INTERVAL_SECONDS=5\n");

    auto loaded = MonitoringConfig::FromConfigManager();
    ASSERT_TRUE(loaded.IsSuccess());
    ASSERT_EQ(loaded.Value().thresholds.size(), 3u);
    EXPECT_EQ(loaded.Value().thresholds[0].metric, "cpu");
    EXPECT_DOUBLE_EQ(loaded.Value().thresholds[0].critical_level, 95.0);
}

TEST_F(MonitoringConfigTest, InvalidValuesAreConfigurationErrors) {
    loadEnv("ALERT_THRESHOLDS=cpu:80\n");
    EXPECT_EQ(MonitoringConfig::FromConfigManager().Code(), ErrorCode::CONFIGURATION_ERROR);

    loadEnv("MONITORING_INTERVAL_SECONDS=0\n");
    EXPECT_EQ(MonitoringConfig::FromConfigManager().Code(), ErrorCode::CONFIGURATION_ERROR);
}

TEST_F(MonitoringConfigTest, ValidateChecksRanges) {
    MonitoringConfig config;
    EXPECT_TRUE(config.Validate().IsSuccess());

    config.database_connections = 0;
    EXPECT_EQ(config.Validate().Code(), ErrorCode::CONFIGURATION_ERROR);

    config = MonitoringConfig{};
    config.anomaly_z_threshold = 0.0;
    EXPECT_FALSE(config.Validate().IsSuccess());
}
