/**
 * @file test_alert_manager.cpp
 * @brief AlertManager 알람 생명주기 테스트
 */

#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Alarm/AlertManager.h"
#include "Event/MonitoringEventBus.h"
#include "Logging/LogManager.h"

using namespace DeviceWatch;
using namespace DeviceWatch::Alarm;
using DeviceWatch::Enums::ErrorCode;
using DeviceWatch::Event::MonitoringEventType;

class AlertManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::LOG_ERROR);

        bus_ = std::make_shared<Event::MonitoringEventBus>();
        manager_ = makeManager(AlertManagerConfig{});
    }

    std::unique_ptr<AlertManager> makeManager(AlertManagerConfig config) {
        auto manager = std::make_unique<AlertManager>(std::make_shared<AnomalyDetector>(), config, bus_);
        manager->setThreshold("cpu", 80.0, 95.0);
        manager->setThreshold("memory", 85.0, 95.0);
        return manager;
    }

    // 10/20 교대로 20개 -> 기준선 확립, 임계값 알람 없음
    void establishBaseline(AlertManager& manager, const std::string& device) {
        for (int i = 0; i < 20; ++i) {
            EXPECT_FALSE(manager.evaluate(device, "cpu", i % 2 == 0 ? 10.0 : 20.0).has_value());
        }
    }

    std::shared_ptr<Event::MonitoringEventBus> bus_;
    std::unique_ptr<AlertManager> manager_;
};

TEST_F(AlertManagerTest, ThresholdSequenceCreatesUpdatesAndResolves) {
    auto queue = bus_->subscribeQueue(0);

    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", 50.0).has_value());
    EXPECT_TRUE(manager_->getActiveAlerts().empty());

    auto created = manager_->evaluate("web-01", "cpu", 85.0);
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->type, AlertTransitionType::CREATED);
    EXPECT_EQ(created->alert.id, "web-01_cpu");
    EXPECT_EQ(created->alert.level, AlertLevel::WARNING);
    EXPECT_DOUBLE_EQ(created->alert.threshold, 80.0);
    EXPECT_EQ(created->alert.message, "cpu usage high: 85.0%");

    auto escalated = manager_->evaluate("web-01", "cpu", 97.0);
    ASSERT_TRUE(escalated.has_value());
    EXPECT_EQ(escalated->type, AlertTransitionType::UPDATED);
    EXPECT_EQ(escalated->alert.level, AlertLevel::CRITICAL);
    ASSERT_TRUE(escalated->previous_level.has_value());
    EXPECT_EQ(*escalated->previous_level, AlertLevel::WARNING);
    EXPECT_EQ(escalated->alert.message, "cpu usage critically high: 97.0%");
    EXPECT_DOUBLE_EQ(escalated->alert.threshold, 95.0);

    auto resolved = manager_->evaluate("web-01", "cpu", 60.0);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->type, AlertTransitionType::RESOLVED);
    EXPECT_TRUE(resolved->alert.resolved);
    EXPECT_EQ(resolved->alert.message, "cpu returned to normal levels");

    EXPECT_TRUE(manager_->getActiveAlerts().empty());
    auto history = manager_->getAlertHistory();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, "web-01_cpu");
    EXPECT_EQ(history[0].level, AlertLevel::CRITICAL);

    auto events = queue->try_pop_all();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, MonitoringEventType::ALERT_CREATED);
    EXPECT_EQ(events[1].type, MonitoringEventType::ALERT_UPDATED);
    EXPECT_EQ(events[2].type, MonitoringEventType::ALERT_RESOLVED);
    EXPECT_EQ(events[2].device_id, "web-01");
}

TEST_F(AlertManagerTest, SameLevelProducesNoTransition) {
    ASSERT_TRUE(manager_->evaluate("web-01", "cpu", 85.0).has_value());
    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", 88.0).has_value());

    auto alert = manager_->getAlert("web-01_cpu");
    ASSERT_TRUE(alert.has_value());
    EXPECT_DOUBLE_EQ(alert->value, 85.0);
}

TEST_F(AlertManagerTest, ResolvedAlertStaysQuietWhileNormal) {
    manager_->evaluate("web-01", "cpu", 85.0);
    manager_->evaluate("web-01", "cpu", 50.0);
    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", 40.0).has_value());
    EXPECT_EQ(manager_->getAlertHistory().size(), 1u);
}

TEST_F(AlertManagerTest, ReRaiseKeepsIdAndClearsAcknowledgement) {
    manager_->evaluate("web-01", "cpu", 85.0);
    ASSERT_TRUE(manager_->acknowledgeAlert("web-01_cpu").IsSuccess());
    manager_->evaluate("web-01", "cpu", 50.0);

    auto raised = manager_->evaluate("web-01", "cpu", 90.0);
    ASSERT_TRUE(raised.has_value());
    EXPECT_EQ(raised->type, AlertTransitionType::UPDATED);
    EXPECT_EQ(raised->alert.id, "web-01_cpu");
    EXPECT_FALSE(raised->alert.resolved);
    EXPECT_FALSE(raised->alert.acknowledged);
    EXPECT_EQ(manager_->alertCount(), 1u);
}

TEST_F(AlertManagerTest, LevelChangeKeepsAcknowledgement) {
    manager_->evaluate("web-01", "cpu", 85.0);
    manager_->acknowledgeAlert("web-01_cpu");

    auto escalated = manager_->evaluate("web-01", "cpu", 99.0);
    ASSERT_TRUE(escalated.has_value());
    EXPECT_TRUE(escalated->alert.acknowledged);
}

TEST_F(AlertManagerTest, AcknowledgeUnknownAlertFailsWithoutEvent) {
    const uint64_t before = bus_->publishedCount();

    auto result = manager_->acknowledgeAlert("ghost_cpu");
    EXPECT_TRUE(result.IsFailure());
    EXPECT_EQ(result.Code(), ErrorCode::ALERT_NOT_FOUND);
    EXPECT_EQ(result.Error().message, "Alert not found: ghost_cpu");
    EXPECT_EQ(bus_->publishedCount(), before);
}

TEST_F(AlertManagerTest, AcknowledgePublishesEvent) {
    manager_->evaluate("db-01", "memory", 96.0);
    auto queue = bus_->subscribeQueue(0);

    auto result = manager_->acknowledgeAlert("db-01_memory");
    ASSERT_TRUE(result.IsSuccess());
    EXPECT_TRUE(result.Value().acknowledged);

    auto event = queue->try_pop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, MonitoringEventType::ALERT_ACKNOWLEDGED);
    ASSERT_TRUE(event->alert.has_value());
    EXPECT_EQ(event->alert->id, "db-01_memory");
}

TEST_F(AlertManagerTest, HistoryDropsOldestBeyondCapacity) {
    for (int i = 0; i < 1001; ++i) {
        const std::string device = "dev-" + std::to_string(i);
        manager_->evaluate(device, "cpu", 85.0);
        manager_->evaluate(device, "cpu", 50.0);
    }

    auto history = manager_->getAlertHistory();
    ASSERT_EQ(history.size(), 1000u);
    EXPECT_EQ(history.front().device_id, "dev-1");
    EXPECT_EQ(history.back().device_id, "dev-1000");

    auto last_two = manager_->getAlertHistory(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[1].device_id, "dev-1000");
}

TEST_F(AlertManagerTest, AnomalyOverridesThresholdByDefault) {
    establishBaseline(*manager_, "web-01");

    auto transition = manager_->evaluate("web-01", "cpu", 97.0);
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->alert.level, AlertLevel::ANOMALY);
    EXPECT_DOUBLE_EQ(transition->alert.threshold, 0.0);
    EXPECT_EQ(transition->alert.message.rfind("Anomalous cpu value detected (z-score: ", 0), 0u);
}

TEST_F(AlertManagerTest, ThresholdWinsWhenAnomalyOverrideDisabled) {
    AlertManagerConfig config;
    config.anomaly_overrides_thresholds = false;
    auto manager = makeManager(config);
    establishBaseline(*manager, "web-01");

    auto transition = manager->evaluate("web-01", "cpu", 97.0);
    ASSERT_TRUE(transition.has_value());
    EXPECT_EQ(transition->alert.level, AlertLevel::CRITICAL);
}

TEST_F(AlertManagerTest, MetricsWithoutEnabledThresholdAreIgnored) {
    EXPECT_FALSE(manager_->evaluate("web-01", "disk", 99.0).has_value());

    ASSERT_TRUE(manager_->setThresholdEnabled("cpu", false));
    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", 99.0).has_value());
    EXPECT_FALSE(manager_->setThresholdEnabled("disk", true));
    EXPECT_EQ(manager_->alertCount(), 0u);
}

TEST_F(AlertManagerTest, NonFiniteValuesAreIgnored) {
    establishBaseline(*manager_, "web-01");
    auto stats = manager_->getStatistics();

    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(manager_->evaluate("web-01", "cpu", std::numeric_limits<double>::infinity()).has_value());
    EXPECT_TRUE(manager_->getActiveAlerts().empty());
    EXPECT_EQ(manager_->getStatistics()["evaluations"], stats["evaluations"]);

    // 기준선은 그대로이므로 이상치 판정이 계속 동작한다
    auto anomaly = manager_->evaluate("web-01", "cpu", 60.0);
    ASSERT_TRUE(anomaly.has_value());
    EXPECT_EQ(anomaly->alert.level, AlertLevel::ANOMALY);
}

TEST_F(AlertManagerTest, ActiveAlertsAreOrderedByTimestampThenId) {
    manager_->evaluate("b-host", "cpu", 85.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    manager_->evaluate("a-host", "cpu", 85.0);

    auto active = manager_->getActiveAlerts();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].id, "b-host_cpu");
    EXPECT_EQ(active[1].id, "a-host_cpu");
}

TEST_F(AlertManagerTest, RestoreDoesNotOverwriteLiveAlerts) {
    manager_->evaluate("web-01", "cpu", 97.0);

    Structs::Alert stored;
    stored.id = "web-01_cpu";
    stored.device_id = "web-01";
    stored.metric = "cpu";
    stored.level = AlertLevel::WARNING;
    stored.timestamp = BasicTypes::GetCurrentTimestamp();

    Structs::Alert other = stored;
    other.id = "db-01_memory";
    other.device_id = "db-01";
    other.metric = "memory";

    EXPECT_EQ(manager_->restoreAlerts({stored, other}), 1u);
    EXPECT_EQ(manager_->getAlert("web-01_cpu")->level, AlertLevel::CRITICAL);
    EXPECT_EQ(manager_->getActiveAlerts().size(), 2u);
}

TEST_F(AlertManagerTest, PruneResolvedKeepsHistory) {
    manager_->evaluate("web-01", "cpu", 85.0);
    manager_->evaluate("web-01", "cpu", 50.0);
    manager_->evaluate("db-01", "memory", 90.0);

    EXPECT_EQ(manager_->pruneResolved(), 1u);
    EXPECT_EQ(manager_->alertCount(), 1u);
    EXPECT_EQ(manager_->getAlertHistory().size(), 1u);
}

TEST_F(AlertManagerTest, ConcurrentEvaluationKeepsOneAlertPerKey) {
    const int num_threads = 8;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 200; ++i) {
                manager_->evaluate("web-01", "cpu", i % 2 == 0 ? 85.0 : 97.0);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(manager_->alertCount(), 1u);
    auto stats = manager_->getStatistics();
    EXPECT_EQ(stats["created"].get<uint64_t>(), 1u);
    EXPECT_EQ(stats["evaluations"].get<uint64_t>(), 1600u);
}
