#include <gtest/gtest.h>
#include "components/processor/person_detector_processor.h"
#include "test_helpers.h"

using namespace zwatch;
using zwatch::test_support::FakeDetectionBackend;

namespace {

Frame makeFrame(int width, int height, int type = CV_8UC3) {
    Frame frame;
    frame.sequence = 1;
    frame.image = cv::Mat(height, width, type, cv::Scalar::all(0));
    return frame;
}

Detection raw(float x, float y, float w, float h, float confidence, int classId) {
    Detection detection;
    detection.bbox = cv::Rect2f(x, y, w, h);
    detection.confidence = confidence;
    detection.classId = classId;
    return detection;
}

class PersonDetectorTest : public ::testing::Test {
protected:
    PersonDetectorTest() : shared_(std::make_shared<FakeDetectionBackend::Shared>()) {
        config_.confidenceThreshold = 0.5f;
        config_.personClassId = 0;
        config_.detectionSize = 640;
    }

    std::unique_ptr<PersonDetectorProcessor> makeDetector() {
        return std::make_unique<PersonDetectorProcessor>("detector", "cam", config_,
                                                         std::make_unique<FakeDetectionBackend>(shared_));
    }

    std::shared_ptr<FakeDetectionBackend::Shared> shared_;
    DetectorConfig config_;
};

} // namespace

TEST_F(PersonDetectorTest, KeepsConfidentPersonsOnly) {
    shared_->results.push_back({
        raw(10, 10, 20, 40, 0.9f, 0),
        raw(50, 10, 20, 40, 0.3f, 0),
        raw(90, 10, 20, 40, 0.95f, 2),
        raw(120, 10, 20, 40, 0.5f, 0)
    });
    auto detector = makeDetector();
    ASSERT_TRUE(detector->initialize());

    auto result = detector->detect(makeFrame(320, 240));
    ASSERT_TRUE(result.isSuccess());
    const auto& persons = result.getValue();
    ASSERT_EQ(2u, persons.size());
    EXPECT_FLOAT_EQ(10.0f, persons[0].bbox.x);
    EXPECT_FLOAT_EQ(120.0f, persons[1].bbox.x);
}

TEST_F(PersonDetectorTest, BoxesAreClippedToFrame) {
    shared_->results.push_back({raw(300, 200, 50, 80, 0.9f, 0), raw(400, 300, 10, 10, 0.9f, 0)});
    auto detector = makeDetector();
    auto result = detector->detect(makeFrame(320, 240));
    ASSERT_TRUE(result.isSuccess());
    ASSERT_EQ(1u, result.getValue().size());
    const cv::Rect2f box = result.getValue()[0].bbox;
    EXPECT_FLOAT_EQ(20.0f, box.width);
    EXPECT_FLOAT_EQ(40.0f, box.height);
}

TEST_F(PersonDetectorTest, LargeFramesAreDownscaledAndMappedBack) {
    shared_->results.push_back({raw(32, 18, 64, 36, 0.9f, 0)});
    auto detector = makeDetector();
    auto result = detector->detect(makeFrame(1280, 720));
    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(cv::Size(640, 360), shared_->lastInputSize);

    ASSERT_EQ(1u, result.getValue().size());
    const cv::Rect2f box = result.getValue()[0].bbox;
    EXPECT_FLOAT_EQ(64.0f, box.x);
    EXPECT_FLOAT_EQ(36.0f, box.y);
    EXPECT_FLOAT_EQ(128.0f, box.width);
    EXPECT_FLOAT_EQ(72.0f, box.height);
}

TEST_F(PersonDetectorTest, EmptyFrameIsDetectionError) {
    auto detector = makeDetector();
    Frame frame;
    auto result = detector->detect(frame);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(0u, result.getError().find("DetectionError"));
    EXPECT_EQ(0, shared_->calls);
}

TEST_F(PersonDetectorTest, WrongPixelFormatIsDetectionError) {
    auto detector = makeDetector();
    auto result = detector->detect(makeFrame(32, 32, CV_8UC1));
    EXPECT_TRUE(result.isError());
}

TEST_F(PersonDetectorTest, BackendExceptionIsDetectionError) {
    shared_->failures.push_back(true);
    auto detector = makeDetector();
    auto result = detector->detect(makeFrame(32, 32));
    ASSERT_TRUE(result.isError());
    EXPECT_NE(std::string::npos, result.getError().find("inference failed"));

    // Next frame works again
    EXPECT_TRUE(detector->detect(makeFrame(32, 32)).isSuccess());
    EXPECT_EQ(1u, detector->getStatus()["errors"].get<uint64_t>());
}

TEST_F(PersonDetectorTest, FailedLoadFailsInitialize) {
    shared_->loadResult = false;
    auto detector = makeDetector();
    EXPECT_FALSE(detector->initialize());
    EXPECT_FALSE(detector->getLastError().empty());
}
