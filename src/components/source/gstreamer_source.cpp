#include "components/source/gstreamer_source.h"
#include "errors.h"
#include "logger.h"
#include "utils/url_utils.h"
#include <opencv2/imgproc.hpp>
#include <filesystem>
#include <sstream>

namespace zwatch {

namespace {

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING: return "connecting";
        case ConnectionState::STREAMING: return "streaming";
        case ConnectionState::RECONNECTING: return "reconnecting";
        case ConnectionState::FAILED: return "failed";
        case ConnectionState::CLOSED: return "closed";
        default: return "unknown";
    }
}

GStreamerSource::GStreamerSource(const std::string& id, const std::string& cameraId,
                                 const SourceConfig& config,
                                 std::unique_ptr<CaptureBackend> backend)
    : SourceComponent(id, cameraId),
      config_(config),
      uri_(utils::withCredentials(config.url, config.username, config.password)),
      displayUri_(utils::maskCredentials(uri_)),
      protocol_(parseSourceProtocol(config.url)),
      backend_(backend ? std::move(backend) : std::make_unique<OpenCvCaptureBackend>()),
      stopRequested_(false),
      sequence_(0),
      pendingDropped_(0),
      consecutiveFailures_(0),
      attempt_(0),
      framesSinceConnect_(0),
      opened_(false),
      state_(ConnectionState::DISCONNECTED),
      framesDelivered_(0),
      framesDropped_(0),
      reconnectCount_(0),
      avgFps_(0.0),
      fpsWindowStart_(std::chrono::steady_clock::now()),
      fpsWindowFrames_(0) {
}

GStreamerSource::~GStreamerSource() {
    requestStop();
    close();
}

SourceProtocol GStreamerSource::parseSourceProtocol(const std::string& uri) {
    const std::string scheme = utils::uriScheme(uri);
    if (scheme == "rtsp" || scheme == "rtsps") {
        return SourceProtocol::RTSP;
    }
    if (scheme == "http" || scheme == "https") {
        return SourceProtocol::HTTP;
    }
    if (uri.find("/dev/video") == 0) {
        return SourceProtocol::V4L2;
    }
    return SourceProtocol::FILE;
}

void GStreamerSource::open() {
    const std::string logTag = logSource("GStreamerSource");

    if (config_.url.empty()) {
        setState(ConnectionState::FAILED);
        setLastError("Empty source URI");
        throw StreamError(StreamError::Kind::FATAL, "Empty source URI");
    }

    const std::string scheme = utils::uriScheme(config_.url);
    if (!scheme.empty() && scheme != "rtsp" && scheme != "rtsps" &&
        scheme != "http" && scheme != "https" && scheme != "file") {
        setState(ConnectionState::FAILED);
        setLastError("Unsupported URI scheme: " + scheme);
        throw StreamError(StreamError::Kind::FATAL, "Unsupported URI scheme '" + scheme + "' in " + displayUri_);
    }

    if (protocol_ == SourceProtocol::FILE) {
        std::string path = config_.url;
        if (scheme == "file") {
            path = path.substr(std::string("file://").size());
        }
        if (!std::filesystem::exists(path)) {
            setState(ConnectionState::FAILED);
            setLastError("Video file not found: " + path);
            throw StreamError(StreamError::Kind::FATAL, "Video file not found: " + path);
        }
    }

    pipeline_ = buildPipeline();
    LOG_DEBUG(logTag, "Pipeline: " + utils::maskCredentials(pipeline_));

    opened_ = true;
    running_ = true;
    if (!connect()) {
        setState(ConnectionState::RECONNECTING);
    }
}

bool GStreamerSource::connect() {
    const std::string logTag = logSource("GStreamerSource");
    setState(attempt_ == 0 ? ConnectionState::CONNECTING : ConnectionState::RECONNECTING);
    LOG_INFO(logTag, "Connecting to " + displayUri_);

    if (backend_->open(pipeline_, uri_)) {
        LOG_INFO(logTag, "Connected to " + displayUri_ + " via " + backend_->backendName());
        framesSinceConnect_ = 0;
        setState(ConnectionState::STREAMING);
        return true;
    }

    backend_->release();
    setLastError("Failed to open " + displayUri_);
    LOG_WARN(logTag, "Failed to open " + displayUri_);
    return false;
}

bool GStreamerSource::reconnectWithBackoff() {
    const std::string logTag = logSource("GStreamerSource");
    const ReconnectPolicy& policy = config_.reconnect;

    while (!stopRequested_) {
        ++attempt_;
        if (policy.maxRetries >= 0 && attempt_ > policy.maxRetries) {
            setState(ConnectionState::FAILED);
            const std::string message = "Reconnection to " + displayUri_ + " failed after " +
                                        std::to_string(policy.maxRetries) + " attempt(s)";
            setLastError(message);
            LOG_ERROR(logTag, message);
            throw StreamError(StreamError::Kind::FATAL, message);
        }

        setState(ConnectionState::RECONNECTING);
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            ++reconnectCount_;
        }

        const auto delay = policy.delayForAttempt(attempt_);
        LOG_WARN(logTag, "Reconnect attempt " + std::to_string(attempt_) + " in " +
                 std::to_string(delay.count()) + " ms");
        if (waitForStop(delay)) {
            return false;
        }

        if (connect()) {
            return true;
        }
    }
    return false;
}

bool GStreamerSource::waitForStop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(stopMutex_);
    return stopCV_.wait_for(lock, delay, [this] { return stopRequested_.load(); });
}

std::optional<Frame> GStreamerSource::nextFrame() {
    const std::string logTag = logSource("GStreamerSource");

    if (!opened_) {
        open();
    }

    while (!stopRequested_) {
        if (!backend_->isOpened()) {
            if (!reconnectWithBackoff()) {
                break;
            }
        }

        cv::Mat image;
        if (backend_->read(image) && !image.empty()) {
            consecutiveFailures_ = 0;
            attempt_ = 0;
            return makeFrame(std::move(image));
        }

        if (stopRequested_) {
            break;
        }

        if (protocol_ == SourceProtocol::FILE) {
            if (!config_.loop) {
                LOG_INFO(logTag, "End of file reached: " + displayUri_);
                close();
                return std::nullopt;
            }
            if (framesSinceConnect_ == 0) {
                // Restarting a file that decodes nothing would spin forever
                const std::string message = "No decodable frame in " + displayUri_;
                backend_->release();
                setState(ConnectionState::FAILED);
                setLastError(message);
                LOG_ERROR(logTag, message);
                throw StreamError(StreamError::Kind::FATAL, message);
            }
            LOG_INFO(logTag, "End of file reached, restarting from beginning");
            backend_->release();
            if (!connect()) {
                setState(ConnectionState::RECONNECTING);
            }
            continue;
        }

        // Failed read on a live stream: the sequence gap stays visible downstream
        ++sequence_;
        ++pendingDropped_;
        ++consecutiveFailures_;
        {
            std::lock_guard<std::mutex> lock(statusMutex_);
            ++framesDropped_;
        }

        if (consecutiveFailures_ == 1) {
            LOG_WARN(logTag, "Failed to read frame from " + displayUri_);
        }

        if (consecutiveFailures_ >= config_.readFailuresBeforeReconnect) {
            LOG_WARN(logTag, "Connection lost after " + std::to_string(consecutiveFailures_) +
                     " failed reads, reconnecting");
            setLastError("Connection lost");
            consecutiveFailures_ = 0;
            backend_->release();
            setState(ConnectionState::RECONNECTING);
        }
    }

    return std::nullopt;
}

Frame GStreamerSource::makeFrame(cv::Mat image) {
    if (config_.width > 0 && config_.height > 0 &&
        (image.cols != config_.width || image.rows != config_.height)) {
        cv::Mat scaled;
        cv::resize(image, scaled, cv::Size(config_.width, config_.height), 0, 0, cv::INTER_LINEAR);
        image = scaled;
    }

    Frame frame;
    frame.sequence = ++sequence_;
    frame.timestampMs = nowMs();
    frame.droppedBefore = pendingDropped_;
    frame.image = std::move(image);
    pendingDropped_ = 0;
    ++framesSinceConnect_;

    std::lock_guard<std::mutex> lock(statusMutex_);
    if (state_ != ConnectionState::STREAMING) {
        state_ = ConnectionState::STREAMING;
    }
    ++framesDelivered_;
    ++fpsWindowFrames_;
    const auto now = std::chrono::steady_clock::now();
    const double elapsed = std::chrono::duration<double>(now - fpsWindowStart_).count();
    if (elapsed >= 1.0) {
        avgFps_ = fpsWindowFrames_ / elapsed;
        fpsWindowStart_ = now;
        fpsWindowFrames_ = 0;
    }

    return frame;
}

void GStreamerSource::requestStop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCV_.notify_all();
}

void GStreamerSource::resetStop() {
    std::lock_guard<std::mutex> lock(stopMutex_);
    stopRequested_ = false;
}

void GStreamerSource::close() {
    backend_->release();
    if (opened_) {
        opened_ = false;
        setState(ConnectionState::CLOSED);
        LOG_INFO(logSource("GStreamerSource"), "Closed " + displayUri_);
    }
    running_ = false;
}

bool GStreamerSource::initialize() {
    try {
        open();
        return true;
    } catch (const StreamError& e) {
        LOG_ERROR(logSource("GStreamerSource"), e.what());
        return false;
    }
}

bool GStreamerSource::start() {
    running_ = true;
    return true;
}

bool GStreamerSource::stop() {
    requestStop();
    return true;
}

void GStreamerSource::setState(ConnectionState state) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        previous = state_;
        state_ = state;
    }
    if (previous != state) {
        LOG_INFO(logSource("GStreamerSource"), "State " + connectionStateToString(previous) +
                 " -> " + connectionStateToString(state));
    }
}

void GStreamerSource::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    lastError_ = error;
}

ConnectionState GStreamerSource::getState() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return state_;
}

std::string GStreamerSource::getDisplayUri() const {
    return displayUri_;
}

nlohmann::json GStreamerSource::getStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    auto status = Component::getStatus();

    switch (protocol_) {
        case SourceProtocol::RTSP: status["protocol"] = "rtsp"; break;
        case SourceProtocol::HTTP: status["protocol"] = "http"; break;
        case SourceProtocol::V4L2: status["protocol"] = "v4l2"; break;
        case SourceProtocol::FILE: status["protocol"] = "file"; break;
    }

    status["url"] = displayUri_;
    status["state"] = connectionStateToString(state_);
    status["backend"] = backend_->backendName();
    status["frames_delivered"] = framesDelivered_;
    status["frames_dropped"] = framesDropped_;
    status["reconnect_count"] = reconnectCount_;
    status["average_fps"] = avgFps_;

    if (protocol_ == SourceProtocol::RTSP) {
        status["rtsp_transport"] = config_.rtspTransport;
        status["latency"] = config_.latency;
    }

    return status;
}

std::string GStreamerSource::buildPipeline() const {
    std::ostringstream pipeline;

    auto decoder = [this](const std::string& codec) {
        if (config_.useHwAccel) {
            return std::string("vaapidecode ! vaapipostproc ! video/x-raw, format=BGRx ! ");
        }
        return "avdec_" + codec + " ! ";
    };

    switch (protocol_) {
        case SourceProtocol::RTSP:
            pipeline << "rtspsrc location=" << uri_
                     << " latency=" << config_.latency
                     << " protocols=" << config_.rtspTransport
                     << " drop-on-latency=true"
                     << " ! ";
            if (config_.format == "h264") {
                pipeline << "rtph264depay ! h264parse ! " << decoder("h264");
            } else if (config_.format == "h265") {
                pipeline << "rtph265depay ! h265parse ! " << decoder("h265");
            } else {
                pipeline << "decodebin ! ";
            }
            break;
        case SourceProtocol::HTTP:
            pipeline << "souphttpsrc location=" << uri_ << " timeout=10 keep-alive=true ! ";
            if (uri_.find(".m3u8") != std::string::npos) {
                pipeline << "hlsdemux ! ";
            }
            pipeline << "decodebin ! ";
            break;
        case SourceProtocol::V4L2:
            pipeline << "v4l2src device=" << uri_ << " ! ";
            break;
        case SourceProtocol::FILE: {
            std::string path = uri_;
            if (utils::uriScheme(path) == "file") {
                path = path.substr(std::string("file://").size());
            }
            pipeline << "filesrc location=" << path << " ! decodebin ! ";
            break;
        }
    }

    pipeline << "videoconvert ! videoscale ! ";
    if (config_.width > 0 && config_.height > 0) {
        pipeline << "video/x-raw, width=" << config_.width << ", height=" << config_.height << ", format=BGR ! ";
    } else {
        pipeline << "video/x-raw, format=BGR ! ";
    }

    if (protocol_ == SourceProtocol::FILE) {
        pipeline << "appsink drop=false max-buffers=1 sync=false";
    } else {
        pipeline << "appsink drop=true max-buffers=1 sync=false";
    }

    return pipeline.str();
}

} // namespace zwatch
