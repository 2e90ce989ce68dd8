/**
 * @file test_anomaly_detector.cpp
 * @brief AnomalyDetector 기준선 / z-score 판정 테스트
 */

#include <gtest/gtest.h>

#include <limits>

#include "Alarm/AnomalyDetector.h"
#include "Logging/LogManager.h"

using namespace DeviceWatch::Alarm;

class AnomalyDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::WARN);
    }

    // 10, 20 교대로 n개 -> mean 15, stddev 5
    void feedAlternating(AnomalyDetector& detector, int n) {
        for (int i = 0; i < n; ++i) {
            detector.updateBaseline("web-01", "cpu", i % 2 == 0 ? 10.0 : 20.0);
        }
    }
};

TEST_F(AnomalyDetectorTest, NotAnomalousBelowMinSamples) {
    AnomalyDetector detector;
    feedAlternating(detector, 19);

    auto result = detector.detect("web-01", "cpu", 500.0);
    EXPECT_FALSE(result.is_anomalous);
    EXPECT_DOUBLE_EQ(result.z_score, 0.0);
}

TEST_F(AnomalyDetectorTest, DetectsOutlierOnceBaselineIsEstablished) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);

    auto outlier = detector.detect("web-01", "cpu", 40.0);
    EXPECT_TRUE(outlier.is_anomalous);
    EXPECT_NEAR(outlier.z_score, 5.0, 1e-9);

    auto normal = detector.detect("web-01", "cpu", 17.0);
    EXPECT_FALSE(normal.is_anomalous);
    EXPECT_NEAR(normal.z_score, 0.4, 1e-9);
}

TEST_F(AnomalyDetectorTest, ConstantSeriesIsNeverAnomalous) {
    AnomalyDetector detector;
    for (int i = 0; i < 30; ++i) detector.updateBaseline("db-01", "disk", 50.0);

    auto result = detector.detect("db-01", "disk", 99.0);
    EXPECT_FALSE(result.is_anomalous);
    EXPECT_DOUBLE_EQ(result.z_score, 0.0);
}

TEST_F(AnomalyDetectorTest, DetectDoesNotChangeWindow) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);
    detector.detect("web-01", "cpu", 40.0);
    EXPECT_EQ(detector.sampleCount("web-01", "cpu"), 20u);
}

TEST_F(AnomalyDetectorTest, UpdateAndDetectIncludesObservationInWindow) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);

    auto result = detector.updateAndDetect("web-01", "cpu", 100.0);
    EXPECT_EQ(detector.sampleCount("web-01", "cpu"), 21u);
    EXPECT_TRUE(result.is_anomalous);
    // 윈도우에 100이 포함되어 detect()보다 z-score가 작다
    EXPECT_LT(result.z_score, 17.0);
    EXPECT_GT(result.z_score, 4.0);
}

TEST_F(AnomalyDetectorTest, WindowIsBounded) {
    AnomalyDetectorConfig config;
    config.window_size = 5;
    config.min_samples = 3;
    AnomalyDetector detector(config);

    for (int i = 0; i < 12; ++i) detector.updateBaseline("edge-01", "memory", i);
    EXPECT_EQ(detector.sampleCount("edge-01", "memory"), 5u);
}

TEST_F(AnomalyDetectorTest, WindowsAreKeyedPerEntityAndMetric) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);

    EXPECT_EQ(detector.sampleCount("web-01", "memory"), 0u);
    EXPECT_EQ(detector.sampleCount("web-02", "cpu"), 0u);
    EXPECT_FALSE(detector.detect("web-02", "cpu", 40.0).is_anomalous);
}

TEST_F(AnomalyDetectorTest, BaselineStatsRequireTenSamples) {
    AnomalyDetector detector;
    feedAlternating(detector, 9);
    EXPECT_FALSE(detector.getBaselineStats("web-01", "cpu").has_value());

    detector.updateBaseline("web-01", "cpu", 20.0);
    auto stats = detector.getBaselineStats("web-01", "cpu");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->samples, 10u);
    EXPECT_NEAR(stats->mean, 15.0, 1e-9);
    EXPECT_NEAR(stats->stddev, 5.0, 1e-9);
    EXPECT_NEAR(stats->variance, 25.0, 1e-9);
}

TEST_F(AnomalyDetectorTest, ResetAndClear) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);
    detector.updateBaseline("db-01", "disk", 1.0);

    detector.reset("web-01", "cpu");
    EXPECT_EQ(detector.sampleCount("web-01", "cpu"), 0u);
    EXPECT_EQ(detector.sampleCount("db-01", "disk"), 1u);

    detector.clear();
    EXPECT_EQ(detector.sampleCount("db-01", "disk"), 0u);
}

TEST_F(AnomalyDetectorTest, NonFiniteValuesDoNotEnterWindow) {
    AnomalyDetector detector;
    feedAlternating(detector, 20);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    detector.updateBaseline("web-01", "cpu", nan);
    auto scored = detector.updateAndDetect("web-01", "cpu", inf);
    EXPECT_FALSE(scored.is_anomalous);
    EXPECT_DOUBLE_EQ(scored.z_score, 0.0);
    EXPECT_EQ(detector.sampleCount("web-01", "cpu"), 20u);

    // 창이 오염되지 않았으므로 정상 판정이 그대로 유지된다
    auto outlier = detector.detect("web-01", "cpu", 40.0);
    EXPECT_TRUE(outlier.is_anomalous);
    EXPECT_NEAR(outlier.z_score, 5.0, 1e-9);
    EXPECT_FALSE(detector.detect("web-01", "cpu", nan).is_anomalous);
}
