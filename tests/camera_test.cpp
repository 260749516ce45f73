#include <gtest/gtest.h>
#include "camera.h"
#include "camera_manager.h"
#include "test_helpers.h"
#include <thread>

using namespace zwatch;
using zwatch::test_support::FakeCaptureBackend;
using zwatch::test_support::FakeDetectionBackend;
using zwatch::test_support::RecordingSink;
using zwatch::test_support::personAt;
using zwatch::test_support::registryOf;
using zwatch::test_support::square;

namespace {

struct CameraRig {
    std::shared_ptr<FakeCaptureBackend::Shared> capture = std::make_shared<FakeCaptureBackend::Shared>();
    std::shared_ptr<FakeDetectionBackend::Shared> detection = std::make_shared<FakeDetectionBackend::Shared>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>("rec");
    CameraConfig config;

    CameraRig(const std::string& id = "cam1") {
        config.id = id;
        config.name = "Test " + id;
        config.source.url = "rtsp://camera.local/" + id;
        config.source.readFailuresBeforeReconnect = 1;
        config.source.reconnect.initialDelayMs = 1;
        config.source.reconnect.maxDelayMs = 1;
        config.source.reconnect.maxRetries = 0;
        config.tracker.gracePeriod = 1;
        config.zones.debounceFrames = 3;
        config.sinks.async = false;
        config.sinks.eventLog = "";
    }

    std::shared_ptr<Camera> build() {
        auto dispatcher = std::make_unique<SinkDispatcher>(config.id, config.sinks);
        dispatcher->addSink(sink);
        return std::make_shared<Camera>(
            config,
            std::make_shared<GStreamerSource>(config.id + "_source", config.id, config.source,
                                              std::make_unique<FakeCaptureBackend>(capture, cv::Size(200, 200))),
            std::make_shared<PersonDetectorProcessor>(config.id + "_detector", config.id, config.detector,
                                                      std::make_unique<FakeDetectionBackend>(detection)),
            std::make_shared<ObjectTrackerProcessor>(config.id + "_tracker", config.id, config.tracker),
            std::make_shared<ZoneEvaluator>(config.id + "_zones", config.id, config.zones.debounceFrames),
            registryOf({PolygonZone("door", square(0, 0, 100, 100))}),
            std::move(dispatcher));
    }
};

Frame makeFrame(uint64_t sequence) {
    Frame frame;
    frame.sequence = sequence;
    frame.timestampMs = static_cast<int64_t>(sequence) * 40;
    frame.image = cv::Mat(200, 200, CV_8UC3, cv::Scalar::all(0));
    return frame;
}

} // namespace

TEST(CameraTest, ProcessFrameRunsTheWholePipeline) {
    CameraRig rig;
    for (int i = 0; i < 3; ++i) {
        rig.detection->results.push_back({personAt(40, 40, 10, 20)});
    }
    auto camera = rig.build();

    EXPECT_TRUE(camera->processFrame(makeFrame(1)).empty());
    EXPECT_TRUE(camera->processFrame(makeFrame(2)).empty());
    auto events = camera->processFrame(makeFrame(3));

    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(ZoneEventKind::ENTER, events[0].kind);
    EXPECT_EQ(1, events[0].trackId);
    EXPECT_EQ(3u, events[0].frameSequence);

    ASSERT_EQ(1u, rig.sink->events().size());
    EXPECT_EQ((std::vector<uint64_t>{1, 2, 3}), rig.sink->frameSequences());
    EXPECT_EQ(3u, camera->getFramesProcessed());
}

TEST(CameraTest, DetectionErrorsCountAsEmptyFrames) {
    CameraRig rig;
    rig.detection->results.push_back({personAt(40, 40, 10, 20)});
    rig.detection->failures = {false, true, true};
    auto camera = rig.build();

    camera->processFrame(makeFrame(1));
    camera->processFrame(makeFrame(2));
    camera->processFrame(makeFrame(3));

    EXPECT_EQ(2u, camera->getDetectionErrors());
    auto status = camera->getStatus(false);
    EXPECT_EQ(0u, status["live_tracks"].get<size_t>());
    EXPECT_EQ(3u, status["frames_processed"].get<uint64_t>());
}

TEST(CameraTest, FrameSkipProcessesEveryNthFrame) {
    CameraRig rig;
    rig.config.pipeline.frameSkip = 3;
    rig.capture->readResults = {true, true, true, true, true, true, true, true, true, true};
    auto camera = rig.build();

    ASSERT_TRUE(camera->start());
    camera->wait();

    // Frames 1, 4, 7 and 10 are processed; the stream then fails for good
    EXPECT_EQ(4u, camera->getFramesProcessed());
    EXPECT_EQ((std::vector<uint64_t>{1, 4, 7, 10}), rig.sink->frameSequences());
    auto status = camera->getStatus(false);
    EXPECT_EQ(10u, status["frames_delivered"].get<uint64_t>());
    EXPECT_EQ(6u, status["frames_skipped"].get<uint64_t>());
}

TEST(CameraTest, FatalStreamErrorFailsCamera) {
    CameraRig rig;
    rig.capture->readResults = {true, true};
    auto camera = rig.build();

    ASSERT_TRUE(camera->start());
    camera->wait();

    EXPECT_EQ(CameraState::FAILED, camera->getState());
    auto status = camera->getStatus();
    EXPECT_NE(std::string::npos, status["last_error"].get<std::string>().find("fatal"));
    EXPECT_EQ("closed", status["source"]["state"].get<std::string>());
}

TEST(CameraTest, StopFinishesCleanly) {
    CameraRig rig;
    rig.capture->readsSucceedForever = true;
    auto camera = rig.build();

    ASSERT_TRUE(camera->start());
    EXPECT_TRUE(camera->isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    camera->stop();

    EXPECT_EQ(CameraState::STOPPED, camera->getState());
    EXPECT_FALSE(camera->isRunning());
    EXPECT_GT(camera->getFramesProcessed(), 0u);
}

TEST(CameraTest, RestartsAfterStop) {
    CameraRig rig;
    rig.config.sinks.async = true;
    rig.capture->readsSucceedForever = true;
    auto camera = rig.build();

    ASSERT_TRUE(camera->start());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    camera->stop();
    ASSERT_EQ(CameraState::STOPPED, camera->getState());
    const uint64_t firstRun = camera->getFramesProcessed();
    const size_t firstRunFrames = rig.sink->frameSequences().size();
    ASSERT_GT(firstRun, 0u);

    ASSERT_TRUE(camera->start());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(camera->isRunning());
    camera->stop();

    EXPECT_EQ(CameraState::STOPPED, camera->getState());
    EXPECT_GT(camera->getFramesProcessed(), firstRun);
    EXPECT_GT(rig.sink->frameSequences().size(), firstRunFrames);
}

TEST(CameraTest, InvalidSourceFailsStart) {
    CameraRig rig;
    rig.config.source.url = "ftp://camera.local/stream";
    auto camera = rig.build();

    EXPECT_FALSE(camera->start());
    EXPECT_EQ(CameraState::FAILED, camera->getState());
}

TEST(CameraManagerTest, OneFailingCameraDoesNotStopOthers) {
    CameraRig good("good");
    good.capture->readsSucceedForever = true;
    CameraRig bad("bad");
    bad.config.source.url = "ftp://camera.local/stream";

    CameraManager manager;
    ASSERT_TRUE(manager.addCamera(good.build()));
    ASSERT_TRUE(manager.addCamera(bad.build()));
    EXPECT_FALSE(manager.addCamera(bad.build()));

    EXPECT_EQ(1u, manager.startAll());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(manager.getCamera("good")->isRunning());
    EXPECT_EQ(CameraState::FAILED, manager.getCamera("bad")->getState());
    EXPECT_FALSE(manager.allFailed());

    auto status = manager.status();
    ASSERT_EQ(2u, status.size());
    EXPECT_EQ("good", status[0]["id"].get<std::string>());

    manager.stopAll();
    EXPECT_EQ(CameraState::STOPPED, manager.getCamera("good")->getState());
}
