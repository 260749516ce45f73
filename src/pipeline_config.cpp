#include "pipeline_config.h"
#include "errors.h"
#include "utils/url_utils.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <unordered_set>

namespace zwatch {

namespace {

template<typename T>
void readValue(const nlohmann::json& section, const char* key, T& target, const std::string& context) {
    if (!section.contains(key) || section[key].is_null()) {
        return;
    }
    try {
        target = section[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(context + "." + key + ": " + e.what());
    }
}

const nlohmann::json& section(const nlohmann::json& parent, const char* key, const std::string& context) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!parent.contains(key)) {
        return empty;
    }
    if (!parent[key].is_object()) {
        throw ConfigError(context + "." + key + " must be an object");
    }
    return parent[key];
}

} // namespace

std::chrono::milliseconds ReconnectPolicy::delayForAttempt(int attempt) const {
    const int exponent = std::max(0, attempt - 1);
    const double delay = static_cast<double>(initialDelayMs) * std::pow(multiplier, exponent);
    if (!std::isfinite(delay) || delay >= static_cast<double>(maxDelayMs)) {
        return std::chrono::milliseconds(maxDelayMs);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

BackpressurePolicy stringToBackpressurePolicy(const std::string& name) {
    if (name == "drop_oldest") return BackpressurePolicy::DROP_OLDEST;
    if (name == "drop_newest") return BackpressurePolicy::DROP_NEWEST;
    if (name == "block") return BackpressurePolicy::BLOCK;
    throw ConfigError("Unknown backpressure policy: " + name);
}

std::string backpressurePolicyToString(BackpressurePolicy policy) {
    switch (policy) {
        case BackpressurePolicy::DROP_OLDEST: return "drop_oldest";
        case BackpressurePolicy::DROP_NEWEST: return "drop_newest";
        case BackpressurePolicy::BLOCK: return "block";
        default: return "drop_oldest";
    }
}

CameraConfig parseCameraConfig(const nlohmann::json& camera) {
    if (!camera.is_object()) {
        throw ConfigError("Camera entry must be an object");
    }

    CameraConfig config;
    readValue(camera, "id", config.id, "camera");
    const std::string ctx = "camera[" + config.id + "]";
    readValue(camera, "name", config.name, ctx);
    if (config.name.empty()) {
        config.name = config.id;
    }

    const auto& source = section(camera, "source", ctx);
    readValue(source, "url", config.source.url, ctx + ".source");
    readValue(source, "username", config.source.username, ctx + ".source");
    readValue(source, "password", config.source.password, ctx + ".source");
    readValue(source, "format", config.source.format, ctx + ".source");
    readValue(source, "rtsp_transport", config.source.rtspTransport, ctx + ".source");
    readValue(source, "latency", config.source.latency, ctx + ".source");
    readValue(source, "use_hw_accel", config.source.useHwAccel, ctx + ".source");
    readValue(source, "width", config.source.width, ctx + ".source");
    readValue(source, "height", config.source.height, ctx + ".source");
    readValue(source, "loop", config.source.loop, ctx + ".source");
    readValue(source, "read_failures_before_reconnect", config.source.readFailuresBeforeReconnect, ctx + ".source");

    const auto& reconnect = section(source, "reconnect", ctx + ".source");
    readValue(reconnect, "initial_delay_ms", config.source.reconnect.initialDelayMs, ctx + ".source.reconnect");
    readValue(reconnect, "max_delay_ms", config.source.reconnect.maxDelayMs, ctx + ".source.reconnect");
    readValue(reconnect, "multiplier", config.source.reconnect.multiplier, ctx + ".source.reconnect");
    readValue(reconnect, "max_retries", config.source.reconnect.maxRetries, ctx + ".source.reconnect");

    const auto& detector = section(camera, "detector", ctx);
    readValue(detector, "model_path", config.detector.modelPath, ctx + ".detector");
    readValue(detector, "input_size", config.detector.inputSize, ctx + ".detector");
    readValue(detector, "confidence_threshold", config.detector.confidenceThreshold, ctx + ".detector");
    readValue(detector, "nms_threshold", config.detector.nmsThreshold, ctx + ".detector");
    readValue(detector, "person_class_id", config.detector.personClassId, ctx + ".detector");
    readValue(detector, "resize_for_detection", config.detector.resizeForDetection, ctx + ".detector");
    readValue(detector, "detection_size", config.detector.detectionSize, ctx + ".detector");

    const auto& tracker = section(camera, "tracker", ctx);
    readValue(tracker, "iou_threshold", config.tracker.iouThreshold, ctx + ".tracker");
    readValue(tracker, "grace_period", config.tracker.gracePeriod, ctx + ".tracker");
    readValue(tracker, "history_length", config.tracker.historyLength, ctx + ".tracker");
    readValue(tracker, "duplicate_iou_threshold", config.tracker.duplicateIouThreshold, ctx + ".tracker");
    readValue(tracker, "anchor_offset", config.tracker.anchorOffset, ctx + ".tracker");
    if (tracker.contains("anchor")) {
        std::string anchor;
        readValue(tracker, "anchor", anchor, ctx + ".tracker");
        try {
            config.tracker.anchor = StringToPosition(anchor);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(ctx + ".tracker.anchor: " + e.what());
        }
    }

    const auto& zones = section(camera, "zones", ctx);
    readValue(zones, "file", config.zones.file, ctx + ".zones");
    readValue(zones, "debounce_frames", config.zones.debounceFrames, ctx + ".zones");

    const auto& pipeline = section(camera, "pipeline", ctx);
    readValue(pipeline, "frame_skip", config.pipeline.frameSkip, ctx + ".pipeline");
    readValue(pipeline, "fps_log_interval", config.pipeline.fpsLogInterval, ctx + ".pipeline");

    const auto& sinks = section(camera, "sinks", ctx);
    readValue(sinks, "event_log", config.sinks.eventLog, ctx + ".sinks");
    readValue(sinks, "video_file", config.sinks.videoFile, ctx + ".sinks");
    readValue(sinks, "display", config.sinks.display, ctx + ".sinks");
    readValue(sinks, "async", config.sinks.async, ctx + ".sinks");
    readValue(sinks, "queue_capacity", config.sinks.queueCapacity, ctx + ".sinks");
    if (sinks.contains("backpressure")) {
        std::string policy;
        readValue(sinks, "backpressure", policy, ctx + ".sinks");
        config.sinks.backpressure = stringToBackpressurePolicy(policy);
    }

    const auto& alert = section(sinks, "alert", ctx + ".sinks");
    const std::string alertCtx = ctx + ".sinks.alert";
    readValue(alert, "enabled", config.sinks.alert.enabled, alertCtx);
    readValue(alert, "url", config.sinks.alert.url, alertCtx);
    readValue(alert, "method", config.sinks.alert.method, alertCtx);
    readValue(alert, "login_url", config.sinks.alert.loginUrl, alertCtx);
    readValue(alert, "username", config.sinks.alert.username, alertCtx);
    readValue(alert, "password", config.sinks.alert.password, alertCtx);
    readValue(alert, "api_key", config.sinks.alert.apiKey, alertCtx);
    readValue(alert, "timeout_ms", config.sinks.alert.timeoutMs, alertCtx);
    readValue(alert, "retry_count", config.sinks.alert.retryCount, alertCtx);
    readValue(alert, "retry_delay_ms", config.sinks.alert.retryDelayMs, alertCtx);
    readValue(alert, "cooldown_ms", config.sinks.alert.cooldownMs, alertCtx);
    readValue(alert, "verify_tls", config.sinks.alert.verifyTls, alertCtx);
    readValue(alert, "queue_capacity", config.sinks.alert.queueCapacity, alertCtx);

    return config;
}

nlohmann::json cameraConfigToJson(const CameraConfig& config) {
    nlohmann::json j;
    j["id"] = config.id;
    j["name"] = config.name;
    j["source"] = {
        {"format", config.source.format},
        {"rtsp_transport", config.source.rtspTransport},
        {"latency", config.source.latency},
        {"width", config.source.width},
        {"height", config.source.height},
        {"loop", config.source.loop},
        {"read_failures_before_reconnect", config.source.readFailuresBeforeReconnect},
        {"reconnect", {
            {"initial_delay_ms", config.source.reconnect.initialDelayMs},
            {"max_delay_ms", config.source.reconnect.maxDelayMs},
            {"multiplier", config.source.reconnect.multiplier},
            {"max_retries", config.source.reconnect.maxRetries}
        }}
    };
    j["detector"] = {
        {"model_path", config.detector.modelPath},
        {"input_size", config.detector.inputSize},
        {"confidence_threshold", config.detector.confidenceThreshold},
        {"nms_threshold", config.detector.nmsThreshold},
        {"person_class_id", config.detector.personClassId},
        {"resize_for_detection", config.detector.resizeForDetection},
        {"detection_size", config.detector.detectionSize}
    };
    j["tracker"] = {
        {"iou_threshold", config.tracker.iouThreshold},
        {"grace_period", config.tracker.gracePeriod},
        {"history_length", config.tracker.historyLength},
        {"duplicate_iou_threshold", config.tracker.duplicateIouThreshold},
        {"anchor", PositionToString(config.tracker.anchor)},
        {"anchor_offset", config.tracker.anchorOffset}
    };
    j["zones"] = {{"file", config.zones.file}, {"debounce_frames", config.zones.debounceFrames}};
    j["pipeline"] = {{"frame_skip", config.pipeline.frameSkip}, {"fps_log_interval", config.pipeline.fpsLogInterval}};
    j["sinks"] = {
        {"event_log", config.sinks.eventLog},
        {"video_file", config.sinks.videoFile},
        {"display", config.sinks.display},
        {"async", config.sinks.async},
        {"queue_capacity", config.sinks.queueCapacity},
        {"backpressure", backpressurePolicyToString(config.sinks.backpressure)},
        {"alert", {
            {"enabled", config.sinks.alert.enabled},
            {"url", utils::maskCredentials(config.sinks.alert.url)},
            {"method", config.sinks.alert.method},
            {"login_url", utils::maskCredentials(config.sinks.alert.loginUrl)},
            {"timeout_ms", config.sinks.alert.timeoutMs},
            {"retry_count", config.sinks.alert.retryCount},
            {"retry_delay_ms", config.sinks.alert.retryDelayMs},
            {"cooldown_ms", config.sinks.alert.cooldownMs},
            {"verify_tls", config.sinks.alert.verifyTls},
            {"queue_capacity", config.sinks.alert.queueCapacity}
        }}
    };
    return j;
}

AppConfig AppConfig::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    AppConfig config;
    const auto& logging = section(document, "logging", "config");
    readValue(logging, "level", config.logging.level, "logging");
    readValue(logging, "file", config.logging.file, "logging");
    readValue(logging, "console", config.logging.console, "logging");

    if (document.contains("cameras")) {
        if (!document["cameras"].is_array()) {
            throw ConfigError("cameras must be an array");
        }
        for (const auto& camera : document["cameras"]) {
            config.cameras.push_back(parseCameraConfig(camera));
        }
    }

    return config;
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse configuration file " + path + ": " + e.what());
    }

    return fromJson(document);
}

void AppConfig::validate() const {
    if (!isValidLogLevel(logging.level)) {
        throw ConfigError("logging.level: unknown level '" + logging.level + "'");
    }
    if (cameras.empty()) {
        throw ConfigError("At least one camera must be configured");
    }

    std::unordered_set<std::string> ids;
    for (const auto& camera : cameras) {
        if (camera.id.empty()) {
            throw ConfigError("Camera id must not be empty");
        }
        if (!ids.insert(camera.id).second) {
            throw ConfigError("Duplicate camera id: " + camera.id);
        }

        const std::string ctx = "camera[" + camera.id + "]";
        const auto& reconnect = camera.source.reconnect;
        if (camera.source.url.empty()) {
            throw ConfigError(ctx + ".source.url must not be empty");
        }
        if (camera.source.readFailuresBeforeReconnect < 1) {
            throw ConfigError(ctx + ".source.read_failures_before_reconnect must be >= 1");
        }
        if (reconnect.initialDelayMs < 0 || reconnect.maxDelayMs < 0) {
            throw ConfigError(ctx + ".source.reconnect delays must be >= 0");
        }
        if (reconnect.initialDelayMs > reconnect.maxDelayMs) {
            throw ConfigError(ctx + ".source.reconnect.initial_delay_ms must be <= max_delay_ms");
        }
        if (reconnect.multiplier < 1.0) {
            throw ConfigError(ctx + ".source.reconnect.multiplier must be >= 1");
        }
        if (camera.source.width < 0 || camera.source.height < 0) {
            throw ConfigError(ctx + ".source width and height must be >= 0");
        }
        if (camera.detector.confidenceThreshold < 0.0f || camera.detector.confidenceThreshold > 1.0f) {
            throw ConfigError(ctx + ".detector.confidence_threshold must be in [0, 1]");
        }
        if (camera.detector.nmsThreshold < 0.0f || camera.detector.nmsThreshold > 1.0f) {
            throw ConfigError(ctx + ".detector.nms_threshold must be in [0, 1]");
        }
        if (camera.detector.inputSize <= 0 || camera.detector.detectionSize <= 0) {
            throw ConfigError(ctx + ".detector input_size and detection_size must be > 0");
        }
        if (camera.tracker.iouThreshold <= 0.0f || camera.tracker.iouThreshold > 1.0f) {
            throw ConfigError(ctx + ".tracker.iou_threshold must be in (0, 1]");
        }
        if (camera.tracker.gracePeriod < 0) {
            throw ConfigError(ctx + ".tracker.grace_period must be >= 0");
        }
        if (camera.tracker.historyLength < 1) {
            throw ConfigError(ctx + ".tracker.history_length must be >= 1");
        }
        if (camera.tracker.anchorOffset < 0.0f || camera.tracker.anchorOffset >= 1.0f) {
            throw ConfigError(ctx + ".tracker.anchor_offset must be in [0, 1)");
        }
        if (camera.zones.debounceFrames < 1) {
            throw ConfigError(ctx + ".zones.debounce_frames must be >= 1");
        }
        if (camera.pipeline.frameSkip < 1) {
            throw ConfigError(ctx + ".pipeline.frame_skip must be >= 1");
        }
        if (camera.pipeline.fpsLogInterval < 1) {
            throw ConfigError(ctx + ".pipeline.fps_log_interval must be >= 1");
        }
        if (camera.sinks.queueCapacity < 1) {
            throw ConfigError(ctx + ".sinks.queue_capacity must be >= 1");
        }

        const AlertConfig& alert = camera.sinks.alert;
        if (alert.enabled) {
            if (alert.url.empty()) {
                throw ConfigError(ctx + ".sinks.alert.url is required when alerts are enabled");
            }
            if (alert.method != "POST" && alert.method != "GET") {
                throw ConfigError(ctx + ".sinks.alert.method must be POST or GET");
            }
            if (alert.timeoutMs < 1) {
                throw ConfigError(ctx + ".sinks.alert.timeout_ms must be >= 1");
            }
            if (alert.retryCount < 1) {
                throw ConfigError(ctx + ".sinks.alert.retry_count must be >= 1");
            }
            if (alert.retryDelayMs < 0 || alert.cooldownMs < 0) {
                throw ConfigError(ctx + ".sinks.alert delays must be >= 0");
            }
            if (alert.queueCapacity < 1) {
                throw ConfigError(ctx + ".sinks.alert.queue_capacity must be >= 1");
            }
        }
    }
}

} // namespace zwatch
