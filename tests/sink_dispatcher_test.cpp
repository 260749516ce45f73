#include <gtest/gtest.h>
#include "components/sink/sink_dispatcher.h"
#include "components/sink/event_log_sink.h"
#include "test_helpers.h"
#include <cstdio>
#include <fstream>

using namespace zwatch;
using zwatch::test_support::RecordingSink;

namespace {

ZoneEvent makeEvent(int trackId, ZoneEventKind kind, uint64_t frame) {
    ZoneEvent event;
    event.zoneId = "door";
    event.trackId = trackId;
    event.kind = kind;
    event.frameSequence = frame;
    event.timestampMs = static_cast<int64_t>(frame) * 40;
    return event;
}

FrameSnapshot makeSnapshot(uint64_t sequence) {
    FrameSnapshot snapshot;
    snapshot.cameraId = "cam";
    snapshot.frame.sequence = sequence;
    return snapshot;
}

SinksConfig makeConfig(bool async, int capacity = 8) {
    SinksConfig config;
    config.eventLog = "";
    config.async = async;
    config.queueCapacity = capacity;
    config.backpressure = BackpressurePolicy::DROP_OLDEST;
    return config;
}

} // namespace

TEST(SinkDispatcherTest, SyncDeliveryIsInline) {
    SinkDispatcher dispatcher("cam", makeConfig(false));
    auto sink = std::make_shared<RecordingSink>("rec");
    dispatcher.addSink(sink);
    ASSERT_TRUE(dispatcher.start());

    dispatcher.dispatch({makeEvent(1, ZoneEventKind::ENTER, 3)}, makeSnapshot(3));
    ASSERT_EQ(1u, sink->events().size());
    EXPECT_EQ(std::vector<uint64_t>{3}, sink->frameSequences());
    dispatcher.stop();
}

TEST(SinkDispatcherTest, AsyncDeliversAllEventsInOrder) {
    SinkDispatcher dispatcher("cam", makeConfig(true, 2));
    auto sink = std::make_shared<RecordingSink>("rec");
    dispatcher.addSink(sink);
    ASSERT_TRUE(dispatcher.start());

    for (uint64_t frame = 1; frame <= 50; ++frame) {
        std::vector<ZoneEvent> events;
        if (frame % 5 == 0) {
            events.push_back(makeEvent(static_cast<int>(frame), ZoneEventKind::ENTER, frame));
        }
        dispatcher.dispatch(std::move(events), makeSnapshot(frame));
    }
    dispatcher.stop();

    const auto events = sink->events();
    ASSERT_EQ(10u, events.size());
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(static_cast<uint64_t>((i + 1) * 5), events[i].frameSequence);
    }

    // Frames may be dropped but never reordered
    const auto frames = sink->frameSequences();
    for (size_t i = 1; i < frames.size(); ++i) {
        EXPECT_LT(frames[i - 1], frames[i]);
    }
}

TEST(SinkDispatcherTest, WantsFramesOnlyWhenASinkDoes) {
    SinkDispatcher dispatcher("cam", makeConfig(false));
    dispatcher.addSink(std::make_shared<RecordingSink>("events", false));
    EXPECT_FALSE(dispatcher.wantsFrames());
    dispatcher.addSink(std::make_shared<RecordingSink>("frames", true));
    EXPECT_TRUE(dispatcher.wantsFrames());
}

TEST(SinkDispatcherTest, FailingSinkDoesNotStopOthers) {
    SinkDispatcher dispatcher("cam", makeConfig(false));
    dispatcher.addSink(std::make_shared<RecordingSink>("broken", false, true));
    auto sink = std::make_shared<RecordingSink>("rec", false);
    dispatcher.addSink(sink);
    ASSERT_TRUE(dispatcher.start());

    dispatcher.dispatch({makeEvent(1, ZoneEventKind::ENTER, 1)}, std::nullopt);
    EXPECT_EQ(1u, sink->events().size());
    EXPECT_EQ(1u, dispatcher.getStatus()["sink_errors"].get<uint64_t>());
    dispatcher.stop();
}

TEST(EventLogSinkTest, WritesJsonLines) {
    const std::string path = ::testing::TempDir() + "zonewatch_events_test.jsonl";
    std::remove(path.c_str());
    {
        EventLogSink sink("log", "cam1", path);
        ASSERT_TRUE(sink.initialize());
        ASSERT_TRUE(sink.start());

        ZoneEvent exit = makeEvent(4, ZoneEventKind::EXIT, 22);
        exit.forced = true;
        exit.dwellMs = 1900;
        sink.onEvents({makeEvent(4, ZoneEventKind::ENTER, 3), exit});
        sink.stop();
    }

    std::ifstream in(path);
    std::string line;
    std::vector<nlohmann::json> lines;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("enter", lines[0]["event"].get<std::string>());
    EXPECT_EQ("cam1", lines[0]["camera_id"].get<std::string>());
    EXPECT_EQ("door", lines[0]["zone_id"].get<std::string>());
    EXPECT_EQ(4, lines[0]["track_id"].get<int>());
    EXPECT_EQ("exit", lines[1]["event"].get<std::string>());
    EXPECT_TRUE(lines[1]["forced"].get<bool>());
    EXPECT_EQ(1900, lines[1]["dwell_ms"].get<int64_t>());
    std::remove(path.c_str());
}
