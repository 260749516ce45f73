#include <gtest/gtest.h>
#include "geometry/anchor.h"
#include "logger.h"
#include "pipeline_types.h"
#include "utils/result.h"
#include "utils/url_utils.h"

using namespace zwatch;

TEST(UrlUtilsTest, Scheme) {
    EXPECT_EQ("rtsp", utils::uriScheme("RTSP://host/stream"));
    EXPECT_EQ("http", utils::uriScheme("http://host"));
    EXPECT_EQ("", utils::uriScheme("videos/clip.mp4"));
    EXPECT_EQ("", utils::uriScheme("://host"));
}

TEST(UrlUtilsTest, MaskCredentials) {
    EXPECT_EQ("rtsp://***@host:554/live", utils::maskCredentials("rtsp://admin:pw@host:554/live"));
    EXPECT_EQ("rtsp://host/live", utils::maskCredentials("rtsp://host/live"));
    // An @ in the path is not user-info
    EXPECT_EQ("http://host/a@b", utils::maskCredentials("http://host/a@b"));
    EXPECT_EQ("clip.mp4", utils::maskCredentials("clip.mp4"));
}

TEST(UrlUtilsTest, WithCredentials) {
    EXPECT_EQ("rtsp://admin:pw@host/live", utils::withCredentials("rtsp://host/live", "admin", "pw"));
    EXPECT_EQ("rtsp://admin@host/live", utils::withCredentials("rtsp://host/live", "admin", ""));
    EXPECT_EQ("rtsp://host/live", utils::withCredentials("rtsp://host/live", "", "pw"));
    EXPECT_EQ("rtsp://a:b@host/live", utils::withCredentials("rtsp://a:b@host/live", "admin", "pw"));
}

TEST(AnchorTest, PositionNames) {
    EXPECT_EQ(Position::BOTTOM_CENTER, StringToPosition("bottom_center"));
    EXPECT_EQ(Position::TOP_LEFT, StringToPosition("TOP_LEFT"));
    EXPECT_EQ("CENTER_RIGHT", PositionToString(Position::CENTER_RIGHT));
    EXPECT_THROW(StringToPosition("middle"), std::invalid_argument);
}

TEST(AnchorTest, AnchorPoints) {
    const cv::Rect2f box(10, 20, 40, 100);
    EXPECT_EQ(cv::Point2f(30, 120), anchorPoint(box, Position::BOTTOM_CENTER));
    const cv::Point2f offset = anchorPoint(box, Position::BOTTOM_CENTER, 0.05f);
    EXPECT_FLOAT_EQ(30.0f, offset.x);
    EXPECT_NEAR(115.0f, offset.y, 1e-4);
    EXPECT_EQ(cv::Point2f(30, 70), anchorPoint(box, Position::CENTER));
    EXPECT_EQ(cv::Point2f(10, 20), anchorPoint(box, Position::TOP_LEFT));
    EXPECT_EQ(cv::Point2f(50, 120), anchorPoint(box, Position::BOTTOM_RIGHT));
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(LogLevel::DEBUG, stringToLogLevel("debug"));
    EXPECT_EQ(LogLevel::WARN, stringToLogLevel("WARNING"));
    EXPECT_EQ(LogLevel::OFF, stringToLogLevel("off"));
    EXPECT_EQ(LogLevel::INFO, stringToLogLevel("nonsense"));
    EXPECT_TRUE(isValidLogLevel("trace"));
    EXPECT_FALSE(isValidLogLevel("verbose"));
}

TEST(ResultTest, ValueAndError) {
    auto ok = Result<int>::success(4);
    EXPECT_TRUE(ok.isSuccess());
    EXPECT_EQ(4, ok.getValue());

    auto failed = Result<int>::error("DetectionError: nope");
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ("DetectionError: nope", failed.getError());

    EXPECT_TRUE(Result<void>::success().isSuccess());
    EXPECT_TRUE(Result<void>::error("x").isError());
}

TEST(ZoneEventJsonTest, ExitCarriesDwell) {
    ZoneEvent event;
    event.zoneId = "door";
    event.trackId = 3;
    event.kind = ZoneEventKind::EXIT;
    event.timestampMs = 2200;
    event.frameSequence = 22;
    event.dwellMs = 1900;
    event.location = cv::Point2f(50, 50);

    const nlohmann::json j = zoneEventToJson(event, "cam1");
    EXPECT_EQ("exit", j["event"].get<std::string>());
    EXPECT_EQ(1900, j["dwell_ms"].get<int64_t>());
    EXPECT_FALSE(j["forced"].get<bool>());
    EXPECT_EQ(22u, j["frame"].get<uint64_t>());

    event.kind = ZoneEventKind::ENTER;
    EXPECT_FALSE(zoneEventToJson(event).contains("dwell_ms"));
}
