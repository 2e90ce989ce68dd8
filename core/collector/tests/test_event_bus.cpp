/**
 * @file test_event_bus.cpp
 * @brief MonitoringEventBus 구독 / 발행 테스트
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "Event/MonitoringEventBus.h"
#include "Logging/LogManager.h"

using namespace DeviceWatch;
using namespace DeviceWatch::Event;

class MonitoringEventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setLogLevel(LogLevel::LOG_ERROR);
        LogManager::getInstance().setFileOutput(false);
    }

    static MonitoringEvent makeEvent(MonitoringEventType type, const std::string& message) {
        MonitoringEvent event;
        event.type = type;
        event.device_id = "web-01";
        event.message = message;
        return event;
    }

    MonitoringEventBus bus_;
};

TEST_F(MonitoringEventBusTest, HandlersReceiveEventsInOrder) {
    std::vector<std::string> received;
    bus_.subscribe([&received](const MonitoringEvent& event) { received.push_back(event.message); });

    bus_.publish(makeEvent(MonitoringEventType::DEVICE_UPDATED, "first"));
    bus_.publish(makeEvent(MonitoringEventType::DEVICE_UPDATED, "second"));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "first");
    EXPECT_EQ(received[1], "second");
    EXPECT_EQ(bus_.publishedCount(), 2u);
}

TEST_F(MonitoringEventBusTest, ThrowingHandlerDoesNotStopOthers) {
    std::atomic<int> delivered{0};
    bus_.subscribe([](const MonitoringEvent&) { throw std::runtime_error("display closed"); });
    bus_.subscribe([&delivered](const MonitoringEvent&) { delivered++; });

    bus_.publish(makeEvent(MonitoringEventType::ALERT_CREATED, "cpu usage high: 85.0%"));
    bus_.publish(makeEvent(MonitoringEventType::LOG, "log line"));

    EXPECT_EQ(delivered.load(), 2);
    EXPECT_EQ(bus_.handlerErrorCount(), 2u);
}

TEST_F(MonitoringEventBusTest, QueueSubscriberPullsEvents) {
    SubscriptionId id = 0;
    auto queue = bus_.subscribeQueue(0, &id);
    EXPECT_NE(id, 0u);
    EXPECT_EQ(bus_.subscriberCount(), 1u);

    bus_.publishLog("INFO", "Monitoring started");
    auto event = queue->pop_for(std::chrono::milliseconds(100));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, MonitoringEventType::LOG);
    EXPECT_EQ(event->level, "INFO");
    EXPECT_EQ(event->message, "Monitoring started");
}

TEST_F(MonitoringEventBusTest, BoundedQueueDropsOldest) {
    auto queue = bus_.subscribeQueue(2);
    bus_.publishLog("INFO", "1");
    bus_.publishLog("INFO", "2");
    bus_.publishLog("INFO", "3");

    auto events = queue->try_pop_all();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].message, "2");
    EXPECT_EQ(events[1].message, "3");
    EXPECT_EQ(queue->dropped(), 1u);
}

TEST_F(MonitoringEventBusTest, UnsubscribeClosesQueueAndStopsDelivery) {
    SubscriptionId queue_id = 0;
    auto queue = bus_.subscribeQueue(0, &queue_id);
    int calls = 0;
    SubscriptionId handler_id = bus_.subscribe([&calls](const MonitoringEvent&) { calls++; });

    EXPECT_TRUE(bus_.unsubscribe(queue_id));
    EXPECT_TRUE(bus_.unsubscribe(handler_id));
    EXPECT_FALSE(bus_.unsubscribe(handler_id));
    EXPECT_TRUE(queue->closed());

    bus_.publishLog("INFO", "after");
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(bus_.subscriberCount(), 0u);
}

TEST_F(MonitoringEventBusTest, RecentEventsRingIsBounded) {
    MonitoringEventBus bus(3);
    for (int i = 0; i < 5; ++i) bus.publishLog("INFO", std::to_string(i));

    auto all = bus.recentEvents();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front().message, "2");
    EXPECT_EQ(all.back().message, "4");

    auto last = bus.recentEvents(1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_EQ(last[0].message, "4");
}

TEST_F(MonitoringEventBusTest, AlertEventCarriesSnapshot) {
    Structs::Alert alert;
    alert.id = "web-01_cpu";
    alert.device_id = "web-01";
    alert.metric = "cpu";
    alert.level = Enums::AlertLevel::CRITICAL;
    alert.value = 97.0;
    alert.message = "cpu usage critically high: 97.0%";
    alert.timestamp = BasicTypes::GetCurrentTimestamp();

    auto queue = bus_.subscribeQueue(0);
    bus_.publishAlert(MonitoringEventType::ALERT_UPDATED, alert);

    auto event = queue->try_pop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->level, "critical");
    EXPECT_EQ(event->device_id, "web-01");

    auto j = event->toJson();
    EXPECT_EQ(j["type"], "alert_updated");
    EXPECT_EQ(j["alert"]["id"], "web-01_cpu");
}

TEST_F(MonitoringEventBusTest, LogStreamForwardsLogLines) {
    LogManager::getInstance().setLogLevel(LogLevel::INFO);
    auto queue = bus_.subscribeQueue(0);

    bus_.attachLogStream();
    LogManager::getInstance().log("scheduler", LogLevel::INFO, "cycle finished");
    bus_.detachLogStream();
    LogManager::getInstance().log("scheduler", LogLevel::INFO, "not forwarded");

    auto events = queue->try_pop_all();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, MonitoringEventType::LOG);
    EXPECT_EQ(events[0].level, "INFO");
    EXPECT_EQ(events[0].message, "[scheduler] cycle finished");
}

TEST_F(MonitoringEventBusTest, DestroyedBusNoLongerReceivesLogLines) {
    LogManager::getInstance().setLogLevel(LogLevel::INFO);
    auto received = std::make_shared<std::atomic<int>>(0);

    auto bus = std::make_unique<MonitoringEventBus>();
    bus->subscribe([received](const MonitoringEvent&) { received->fetch_add(1); });
    bus->attachLogStream();
    LogManager::getInstance().log("engine", LogLevel::INFO, "before destroy");
    EXPECT_EQ(received->load(), 1);

    // detachLogStream 호출 없이 소멸
    bus.reset();
    LogManager::getInstance().log("engine", LogLevel::INFO, "after destroy");
    EXPECT_EQ(received->load(), 1);
}

TEST_F(MonitoringEventBusTest, BusDestroyedWhileOtherThreadLogs) {
    LogManager::getInstance().setLogLevel(LogLevel::INFO);
    LogManager::getInstance().setConsoleOutput(false);
    std::atomic<bool> running{true};
    std::thread logger([&running] {
        while (running.load()) {
            LogManager::getInstance().log("scheduler", LogLevel::INFO, "tick");
        }
    });

    for (int i = 0; i < 50; ++i) {
        auto bus = std::make_unique<MonitoringEventBus>(8);
        bus->subscribe([](const MonitoringEvent&) { std::this_thread::yield(); });
        bus->attachLogStream();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        bus.reset();
    }

    running.store(false);
    logger.join();
    LogManager::getInstance().setConsoleOutput(true);
    SUCCEED();
}
