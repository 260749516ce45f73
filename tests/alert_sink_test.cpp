#include <gtest/gtest.h>
#include "components/sink/alert_sink.h"
#include "components/sink/sink_dispatcher.h"
#include "test_helpers.h"
#include <thread>

using namespace zwatch;
using zwatch::test_support::FakeAlertTransport;

namespace {

ZoneEvent enterEvent(const std::string& zoneId, int trackId, uint64_t frame = 1) {
    ZoneEvent event;
    event.zoneId = zoneId;
    event.trackId = trackId;
    event.kind = ZoneEventKind::ENTER;
    event.frameSequence = frame;
    event.timestampMs = static_cast<int64_t>(frame) * 40;
    return event;
}

AlertConfig alertConfig(int cooldownMs = 60000) {
    AlertConfig config;
    config.enabled = true;
    config.url = "http://alerts.local/play";
    config.cooldownMs = cooldownMs;
    return config;
}

std::shared_ptr<AlertSink> makeSink(const AlertConfig& config, std::shared_ptr<FakeAlertTransport::Shared> shared) {
    return std::make_shared<AlertSink>("alert", "cam", config, std::make_unique<FakeAlertTransport>(shared));
}

size_t requestCount(const std::shared_ptr<FakeAlertTransport::Shared>& shared) {
    std::lock_guard<std::mutex> lock(shared->mutex);
    return shared->requests.size();
}

} // namespace

TEST(AlertSinkTest, AlertsOnZoneEntry) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(), shared);
    ASSERT_TRUE(sink->initialize());
    ASSERT_TRUE(sink->start());

    sink->onEvents({enterEvent("door", 7, 12)});
    sink->stop();

    ASSERT_EQ(1u, shared->requests.size());
    const AlertRequest& request = shared->requests[0];
    EXPECT_EQ("door", request.zoneId);
    EXPECT_EQ(7, request.trackId);
    EXPECT_EQ("cam", request.cameraId);
    EXPECT_EQ("enter", request.payload["event"].get<std::string>());
    EXPECT_EQ(1u, sink->getStatus()["alerts_sent"].get<uint64_t>());
}

TEST(AlertSinkTest, SecondEntryDuringCooldownIsSuppressed) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(), shared);
    ASSERT_TRUE(sink->start());

    sink->onEvents({enterEvent("door", 1, 3)});
    sink->onEvents({enterEvent("door", 2, 9)});
    sink->stop();

    ASSERT_EQ(1u, shared->requests.size());
    EXPECT_EQ(1, shared->requests[0].trackId);
    EXPECT_GT(sink->cooldownRemaining("door").count(), 0);
    EXPECT_EQ(1u, sink->getStatus()["alerts_suppressed"].get<uint64_t>());
}

TEST(AlertSinkTest, ZonesCoolDownIndependently) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(), shared);
    ASSERT_TRUE(sink->start());

    sink->onEvents({enterEvent("door", 1), enterEvent("window", 1)});
    sink->stop();

    EXPECT_EQ(2u, shared->requests.size());
    EXPECT_EQ(0, sink->cooldownRemaining("stairs").count());
}

TEST(AlertSinkTest, ExitEventsDoNotAlert) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(), shared);
    ASSERT_TRUE(sink->start());

    ZoneEvent exit = enterEvent("door", 1);
    exit.kind = ZoneEventKind::EXIT;
    exit.dwellMs = 1200;
    sink->onEvents({exit});
    sink->stop();

    EXPECT_TRUE(shared->requests.empty());
    EXPECT_EQ(0, sink->cooldownRemaining("door").count());
}

TEST(AlertSinkTest, FailedDeliveryClearsCooldown) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    shared->results = {false};
    auto sink = makeSink(alertConfig(), shared);

    ASSERT_TRUE(sink->start());
    sink->onEvents({enterEvent("door", 1)});
    sink->stop();

    EXPECT_EQ(1u, requestCount(shared));
    EXPECT_EQ(0, sink->cooldownRemaining("door").count());
    EXPECT_EQ(1u, sink->getStatus()["alerts_failed"].get<uint64_t>());

    // The zone is unlocked, so the next entry alerts again
    ASSERT_TRUE(sink->start());
    sink->onEvents({enterEvent("door", 2)});
    sink->stop();

    EXPECT_EQ(2u, requestCount(shared));
    EXPECT_GT(sink->cooldownRemaining("door").count(), 0);
    EXPECT_EQ(1u, sink->getStatus()["alerts_sent"].get<uint64_t>());
}

TEST(AlertSinkTest, CooldownExpires) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(30), shared);
    ASSERT_TRUE(sink->start());

    sink->onEvents({enterEvent("door", 1)});
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    sink->onEvents({enterEvent("door", 2)});
    sink->stop();

    EXPECT_EQ(2u, requestCount(shared));
}

TEST(AlertSinkTest, EntryAfterStopIsNotQueued) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    auto sink = makeSink(alertConfig(), shared);
    ASSERT_TRUE(sink->start());
    sink->stop();

    sink->onEvents({enterEvent("door", 1)});

    EXPECT_EQ(0u, requestCount(shared));
    EXPECT_EQ(0, sink->cooldownRemaining("door").count());
}

TEST(AlertSinkTest, DeliveredThroughDispatcher) {
    auto shared = std::make_shared<FakeAlertTransport::Shared>();
    SinksConfig sinks;
    sinks.eventLog = "";
    sinks.async = true;

    SinkDispatcher dispatcher("cam", sinks);
    dispatcher.addSink(makeSink(alertConfig(), shared));
    ASSERT_TRUE(dispatcher.start());
    dispatcher.dispatch({enterEvent("door", 4, 5)}, std::nullopt);
    dispatcher.dispatch({enterEvent("door", 5, 6)}, std::nullopt);
    dispatcher.stop();

    ASSERT_EQ(1u, requestCount(shared));
    EXPECT_EQ(4, shared->requests[0].trackId);
}
