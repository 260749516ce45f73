#include <gtest/gtest.h>
#include "errors.h"
#include "pipeline_config.h"
#include <cstdio>
#include <fstream>
#include <functional>

using namespace zwatch;

namespace {

nlohmann::json minimalDocument() {
    return {{"cameras", nlohmann::json::array({{{"id", "cam1"}, {"source", {{"url", "rtsp://host/stream"}}}}})}};
}

} // namespace

TEST(PipelineConfigTest, DefaultsApplyToMissingKeys) {
    AppConfig config = AppConfig::fromJson(minimalDocument());
    ASSERT_EQ(1u, config.cameras.size());
    const CameraConfig& camera = config.cameras[0];
    EXPECT_EQ("cam1", camera.id);
    EXPECT_EQ("rtsp://host/stream", camera.source.url);
    EXPECT_EQ(3, camera.zones.debounceFrames);
    EXPECT_EQ(30, camera.tracker.gracePeriod);
    EXPECT_EQ(Position::BOTTOM_CENTER, camera.tracker.anchor);
    EXPECT_FLOAT_EQ(0.5f, camera.detector.confidenceThreshold);
    EXPECT_EQ(500, camera.source.reconnect.initialDelayMs);
    EXPECT_EQ(BackpressurePolicy::DROP_OLDEST, camera.sinks.backpressure);
    EXPECT_EQ("info", config.logging.level);
    EXPECT_NO_THROW(config.validate());
}

TEST(PipelineConfigTest, ParsesExplicitValues) {
    nlohmann::json doc = minimalDocument();
    auto& camera = doc["cameras"][0];
    camera["tracker"] = {{"grace_period", 5}, {"anchor", "center"}};
    camera["zones"] = {{"file", "zones/lobby.json"}, {"debounce_frames", 4}};
    camera["sinks"] = {{"async", false}, {"backpressure", "block"}, {"queue_capacity", 16}};
    camera["pipeline"] = {{"frame_skip", 2}};
    camera["unknown_section"] = {{"ignored", true}};
    doc["logging"] = {{"level", "debug"}, {"console", false}};

    AppConfig config = AppConfig::fromJson(doc);
    const CameraConfig& parsed = config.cameras[0];
    EXPECT_EQ(5, parsed.tracker.gracePeriod);
    EXPECT_EQ(Position::CENTER, parsed.tracker.anchor);
    EXPECT_EQ("zones/lobby.json", parsed.zones.file);
    EXPECT_EQ(4, parsed.zones.debounceFrames);
    EXPECT_FALSE(parsed.sinks.async);
    EXPECT_EQ(BackpressurePolicy::BLOCK, parsed.sinks.backpressure);
    EXPECT_EQ(16, parsed.sinks.queueCapacity);
    EXPECT_EQ(2, parsed.pipeline.frameSkip);
    EXPECT_EQ("debug", config.logging.level);
    EXPECT_FALSE(config.logging.console);
}

TEST(PipelineConfigTest, WrongTypesAreConfigErrors) {
    nlohmann::json doc = minimalDocument();
    doc["cameras"][0]["zones"] = {{"debounce_frames", "three"}};
    EXPECT_THROW(AppConfig::fromJson(doc), ConfigError);

    doc = minimalDocument();
    doc["cameras"][0]["sinks"] = {{"backpressure", "drop_everything"}};
    EXPECT_THROW(AppConfig::fromJson(doc), ConfigError);

    doc = minimalDocument();
    doc["cameras"][0]["tracker"] = {{"anchor", "NOWHERE"}};
    EXPECT_THROW(AppConfig::fromJson(doc), ConfigError);

    EXPECT_THROW(AppConfig::fromJson(nlohmann::json::array()), ConfigError);
}

TEST(PipelineConfigTest, ValidationRules) {
    auto invalid = [](const std::function<void(CameraConfig&)>& mutate) {
        AppConfig config = AppConfig::fromJson(minimalDocument());
        mutate(config.cameras[0]);
        EXPECT_THROW(config.validate(), ConfigError);
    };

    invalid([](CameraConfig& c) { c.detector.confidenceThreshold = 1.5f; });
    invalid([](CameraConfig& c) { c.zones.debounceFrames = 0; });
    invalid([](CameraConfig& c) { c.tracker.gracePeriod = -1; });
    invalid([](CameraConfig& c) { c.pipeline.frameSkip = 0; });
    invalid([](CameraConfig& c) { c.source.reconnect.multiplier = 0.5; });
    invalid([](CameraConfig& c) { c.source.reconnect.initialDelayMs = 5000; c.source.reconnect.maxDelayMs = 100; });
    invalid([](CameraConfig& c) { c.sinks.queueCapacity = 0; });
    invalid([](CameraConfig& c) { c.source.url.clear(); });
}

TEST(PipelineConfigTest, CameraListRules) {
    AppConfig empty;
    EXPECT_THROW(empty.validate(), ConfigError);

    AppConfig duplicate = AppConfig::fromJson(minimalDocument());
    duplicate.cameras.push_back(duplicate.cameras[0]);
    EXPECT_THROW(duplicate.validate(), ConfigError);

    AppConfig badLevel = AppConfig::fromJson(minimalDocument());
    badLevel.logging.level = "verbose";
    EXPECT_THROW(badLevel.validate(), ConfigError);
}

TEST(PipelineConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "zonewatch_config_test.json";
    {
        std::ofstream out(path);
        out << minimalDocument().dump(2);
    }
    AppConfig config = AppConfig::loadFromFile(path);
    EXPECT_EQ("cam1", config.cameras[0].id);
    std::remove(path.c_str());

    EXPECT_THROW(AppConfig::loadFromFile(path), ConfigError);
}

TEST(PipelineConfigTest, SerializedCameraOmitsCredentials) {
    AppConfig config = AppConfig::fromJson(minimalDocument());
    config.cameras[0].source.password = "hunter2";
    const nlohmann::json j = cameraConfigToJson(config.cameras[0]);
    EXPECT_EQ("cam1", j["id"].get<std::string>());
    EXPECT_EQ(std::string::npos, j.dump().find("hunter2"));
    EXPECT_EQ("BOTTOM_CENTER", j["tracker"]["anchor"].get<std::string>());
}

TEST(PipelineConfigTest, AlertSettings) {
    AppConfig defaults = AppConfig::fromJson(minimalDocument());
    EXPECT_FALSE(defaults.cameras[0].sinks.alert.enabled);
    EXPECT_EQ(20000, defaults.cameras[0].sinks.alert.cooldownMs);

    nlohmann::json doc = minimalDocument();
    doc["cameras"][0]["sinks"] = {{"alert", {{"enabled", true},
                                             {"url", "https://receiver.local:8443/play/1.wav/1"},
                                             {"login_url", "https://receiver.local/login"},
                                             {"username", "admin"},
                                             {"password", "hunter2"},
                                             {"cooldown_ms", 5000},
                                             {"method", "GET"},
                                             {"verify_tls", false}}}};
    AppConfig config = AppConfig::fromJson(doc);
    const AlertConfig& alert = config.cameras[0].sinks.alert;
    EXPECT_TRUE(alert.enabled);
    EXPECT_EQ("GET", alert.method);
    EXPECT_EQ(5000, alert.cooldownMs);
    EXPECT_FALSE(alert.verifyTls);
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(std::string::npos, cameraConfigToJson(config.cameras[0]).dump().find("hunter2"));

    config.cameras[0].sinks.alert.url.clear();
    EXPECT_THROW(config.validate(), ConfigError);
    config.cameras[0].sinks.alert.url = "http://receiver.local/alert";
    config.cameras[0].sinks.alert.method = "PUT";
    EXPECT_THROW(config.validate(), ConfigError);
    config.cameras[0].sinks.alert.method = "POST";
    config.cameras[0].sinks.alert.retryCount = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    doc["cameras"][0]["sinks"]["alert"]["cooldown_ms"] = "soon";
    EXPECT_THROW(AppConfig::fromJson(doc), ConfigError);
}

TEST(BackpressurePolicyTest, NamesRoundTrip) {
    for (auto policy : {BackpressurePolicy::DROP_OLDEST, BackpressurePolicy::DROP_NEWEST, BackpressurePolicy::BLOCK}) {
        EXPECT_EQ(policy, stringToBackpressurePolicy(backpressurePolicyToString(policy)));
    }
    EXPECT_THROW(stringToBackpressurePolicy("drop"), ConfigError);
}
