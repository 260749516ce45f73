#pragma once

#include "geometry/anchor.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace zwatch {

/**
 * @brief Bounded exponential backoff for stream reconnection
 */
struct ReconnectPolicy {
    int initialDelayMs = 500;
    int maxDelayMs = 30000;
    double multiplier = 2.0;
    int maxRetries = -1;          ///< Negative means retry forever

    /**
     * @brief Delay before reconnection attempt number `attempt` (1-based)
     *
     * min(initialDelayMs * multiplier^(attempt-1), maxDelayMs)
     */
    std::chrono::milliseconds delayForAttempt(int attempt) const;
};

struct SourceConfig {
    std::string url;
    std::string username;
    std::string password;
    std::string format = "h264";          ///< h264, h265 or anything else for decodebin
    std::string rtspTransport = "tcp";
    int latency = 0;                      ///< RTSP jitter buffer, milliseconds
    bool useHwAccel = false;
    int width = 0;                        ///< Output width, 0 keeps the native size
    int height = 0;
    bool loop = true;                     ///< Restart file sources at end of file
    int readFailuresBeforeReconnect = 3;
    ReconnectPolicy reconnect;
};

struct DetectorConfig {
    std::string modelPath = "models/yolov8n.onnx";
    int inputSize = 640;
    float confidenceThreshold = 0.5f;
    float nmsThreshold = 0.45f;
    int personClassId = 0;
    bool resizeForDetection = true;
    int detectionSize = 640;
};

struct TrackerConfig {
    float iouThreshold = 0.3f;
    int gracePeriod = 30;
    int historyLength = 30;
    float duplicateIouThreshold = 0.8f;
    Position anchor = Position::BOTTOM_CENTER;
    float anchorOffset = 0.05f;
};

struct ZonesConfig {
    std::string file = "config/zones.json";
    int debounceFrames = 3;
};

struct PipelineSettings {
    int frameSkip = 1;            ///< Process every N-th delivered frame
    int fpsLogInterval = 100;     ///< Processed frames between FPS reports
};

enum class BackpressurePolicy {
    DROP_OLDEST,
    DROP_NEWEST,
    BLOCK
};

BackpressurePolicy stringToBackpressurePolicy(const std::string& name);
std::string backpressurePolicyToString(BackpressurePolicy policy);

/**
 * @brief HTTP alert sent when a person enters a zone
 *
 * After an alert a zone stays quiet for cooldownMs; a failed delivery lifts
 * the cooldown again.
 */
struct AlertConfig {
    bool enabled = false;
    std::string url;                  ///< Alert endpoint
    std::string method = "POST";      ///< POST sends the event as JSON, GET sends nothing
    std::string loginUrl;             ///< Optional token endpoint, POSTed username and password
    std::string username;
    std::string password;
    std::string apiKey;               ///< Static bearer token, used when loginUrl is empty
    int timeoutMs = 10000;
    int retryCount = 3;               ///< Attempts per request on transport errors
    int retryDelayMs = 1000;
    int cooldownMs = 20000;
    bool verifyTls = true;
    int queueCapacity = 16;
};

struct SinksConfig {
    std::string eventLog = "logs/events.jsonl";
    std::string videoFile;
    bool display = false;
    bool async = true;
    int queueCapacity = 64;
    BackpressurePolicy backpressure = BackpressurePolicy::DROP_OLDEST;
    AlertConfig alert;
};

struct CameraConfig {
    std::string id;
    std::string name;
    SourceConfig source;
    DetectorConfig detector;
    TrackerConfig tracker;
    ZonesConfig zones;
    PipelineSettings pipeline;
    SinksConfig sinks;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console = true;
};

/**
 * @brief Whole runtime configuration
 *
 * Unknown keys are ignored. Every parse and validation failure raises ConfigError.
 */
struct AppConfig {
    LoggingConfig logging;
    std::vector<CameraConfig> cameras;

    static AppConfig fromJson(const nlohmann::json& document);
    static AppConfig loadFromFile(const std::string& path);

    /**
     * @brief Check value ranges and cross-field rules
     *
     * @throws ConfigError describing the first violation
     */
    void validate() const;
};

CameraConfig parseCameraConfig(const nlohmann::json& camera);
nlohmann::json cameraConfigToJson(const CameraConfig& config);

} // namespace zwatch
