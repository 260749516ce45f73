#include "camera.h"
#include "components/sink/display_sink.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace zwatch {

namespace {

std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

double percentile(std::vector<double> values, double fraction) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const double position = fraction * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(position);
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double weight = position - static_cast<double>(lower);
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

} // namespace

std::string cameraStateToString(CameraState state) {
    switch (state) {
        case CameraState::IDLE: return "idle";
        case CameraState::RUNNING: return "running";
        case CameraState::STOPPED: return "stopped";
        case CameraState::FAILED: return "failed";
        default: return "unknown";
    }
}

Camera::Camera(const CameraConfig& config,
               std::shared_ptr<GStreamerSource> source,
               std::shared_ptr<PersonDetectorProcessor> detector,
               std::shared_ptr<ObjectTrackerProcessor> tracker,
               std::shared_ptr<ZoneEvaluator> evaluator,
               std::shared_ptr<const ZoneRegistry> zones,
               std::unique_ptr<SinkDispatcher> dispatcher)
    : logTag_("Camera[" + config.id + "]"),
      config_(config),
      source_(std::move(source)),
      detector_(std::move(detector)),
      tracker_(std::move(tracker)),
      evaluator_(std::move(evaluator)),
      baseZones_(std::move(zones)),
      dispatcher_(std::move(dispatcher)),
      state_(CameraState::IDLE),
      stopProcessing_(false),
      framesDelivered_(0),
      framesProcessed_(0),
      framesSkipped_(0),
      detectionErrors_(0),
      eventsEmitted_(0),
      liveTracks_(0),
      haveLastProcessed_(false) {
    if (!dispatcher_) {
        dispatcher_ = std::make_unique<SinkDispatcher>(config_.id, config_.sinks);
    }

    // A display window can end the run interactively
    for (const auto& sink : dispatcher_->getSinks()) {
        auto display = std::dynamic_pointer_cast<DisplaySink>(sink);
        if (display) {
            display->setQuitCallback([this]() { requestStop(); });
        }
    }
}

Camera::~Camera() {
    stop();
}

std::string Camera::getId() const {
    return config_.id;
}

std::string Camera::getName() const {
    return config_.name;
}

void Camera::setState(CameraState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

CameraState Camera::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Camera::isRunning() const {
    return getState() == CameraState::RUNNING;
}

std::shared_ptr<const ZoneRegistry> Camera::getZones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return zones_ ? zones_ : baseZones_;
}

bool Camera::start() {
    if (isRunning()) {
        return true;
    }

    auto fail = [this](const std::string& message) {
        LOG_ERROR(logTag_, message);
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = message;
        state_ = CameraState::FAILED;
        return false;
    };

    // Join a previous run before its components are reused
    wait();

    if (!detector_->initialize()) {
        return fail("Failed to initialize detector: " + detector_->getLastError());
    }
    tracker_->initialize();
    evaluator_->start();

    source_->resetStop();
    try {
        source_->open();
    } catch (const StreamError& e) {
        detector_->stop();
        return fail(std::string("Failed to open source (") + StreamError::kindToString(e.kind()) + "): " + e.what());
    }

    if (!dispatcher_->start()) {
        source_->close();
        detector_->stop();
        return fail("Failed to start sinks");
    }

    stopProcessing_ = false;
    setState(CameraState::RUNNING);
    processingThread_ = std::thread(&Camera::run, this);

    LOG_INFO(logTag_, "Started camera '" + config_.name + "' on " + source_->getDisplayUri() +
             " with " + std::to_string(baseZones_->size()) + " zone(s)");
    return true;
}

void Camera::requestStop() {
    stopProcessing_ = true;
    source_->requestStop();
}

bool Camera::stop() {
    requestStop();
    wait();
    return true;
}

void Camera::wait() {
    if (processingThread_.joinable() && processingThread_.get_id() != std::this_thread::get_id()) {
        processingThread_.join();
        LOG_INFO(logTag_, "Processing thread stopped");
    }
}

void Camera::run() {
    LOG_INFO(logTag_, "Processing thread started");
    const uint64_t frameSkip = static_cast<uint64_t>(std::max(1, config_.pipeline.frameSkip));

    try {
        while (!stopProcessing_) {
            auto frame = source_->nextFrame();
            if (!frame) {
                break;
            }

            const uint64_t delivered = ++framesDelivered_;
            if ((delivered - 1) % frameSkip != 0) {
                framesSkipped_++;
                continue;
            }

            processFrame(*frame);
        }
        setState(CameraState::STOPPED);
    } catch (const StreamError& e) {
        const std::string message = "Stream error (" + StreamError::kindToString(e.kind()) + ") at " +
                                    utcTimestamp() + ": " + e.what();
        LOG_ERROR(logTag_, message);
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = message;
        state_ = CameraState::FAILED;
    } catch (const cv::Exception& e) {
        const std::string message = std::string("OpenCV error in frame loop: ") + e.what();
        LOG_ERROR(logTag_, message);
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = message;
        state_ = CameraState::FAILED;
    }

    shutdownComponents();
    LOG_INFO(logTag_, "Processing thread exiting after " + std::to_string(framesProcessed_.load()) +
             " processed frame(s), state " + cameraStateToString(getState()));
}

void Camera::shutdownComponents() {
    source_->close();
    dispatcher_->stop();
    evaluator_->stop();
    tracker_->stop();
    detector_->stop();
}

std::vector<ZoneEvent> Camera::processFrame(const Frame& frame) {
    std::shared_ptr<const ZoneRegistry> zones;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!zones_) {
            zones_ = frame.image.empty() ? baseZones_ : baseZones_->scaledTo(frame.image.size());
        }
        zones = zones_;
    }

    if (frame.droppedBefore > 0) {
        LOG_DEBUG(logTag_, std::to_string(frame.droppedBefore) + " frame(s) lost before frame " +
                  std::to_string(frame.sequence));
    }

    std::vector<Detection> detections;
    auto result = detector_->detect(frame);
    if (result.isSuccess()) {
        detections = result.moveValue();
    } else {
        const uint64_t errors = ++detectionErrors_;
        if (errors == 1 || errors % 100 == 0) {
            LOG_WARN(logTag_, result.getError() + " (" + std::to_string(errors) + " detection error(s) so far)");
        }
    }

    TrackerUpdate update = tracker_->update(detections, frame.timestampMs);
    std::vector<ZoneEvent> events = evaluator_->evaluate(*zones, update.tracks, frame.timestampMs, frame.sequence);

    std::optional<FrameSnapshot> snapshot;
    if (dispatcher_->wantsFrames()) {
        snapshot = FrameSnapshot{config_.id, frame, update.tracks, evaluator_->snapshot(), events, zones};
    }
    dispatcher_->dispatch(events, std::move(snapshot));

    liveTracks_ = update.tracks.size();
    eventsEmitted_ += events.size();
    framesProcessed_++;
    recordFrameRate();

    return events;
}

void Camera::recordFrameRate() {
    const auto now = std::chrono::steady_clock::now();
    if (haveLastProcessed_) {
        const double seconds = std::chrono::duration<double>(now - lastProcessedAt_).count();
        if (seconds > 0.0) {
            fpsSamples_.push_back(1.0 / seconds);
        }
    }
    lastProcessedAt_ = now;
    haveLastProcessed_ = true;

    if (fpsSamples_.size() >= static_cast<size_t>(config_.pipeline.fpsLogInterval)) {
        logFrameRateStats();
        fpsSamples_.clear();
    }
}

void Camera::logFrameRateStats() {
    if (fpsSamples_.empty()) {
        return;
    }

    const double avg = std::accumulate(fpsSamples_.begin(), fpsSamples_.end(), 0.0) /
                       static_cast<double>(fpsSamples_.size());
    const auto minmax = std::minmax_element(fpsSamples_.begin(), fpsSamples_.end());

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1)
       << "FPS over " << fpsSamples_.size() << " frames: avg " << avg
       << ", min " << *minmax.first << ", max " << *minmax.second
       << ", p25 " << percentile(fpsSamples_, 0.25) << ", p75 " << percentile(fpsSamples_, 0.75);
    LOG_INFO(logTag_, ss.str());

    if (avg < 10.0) {
        LOG_WARN(logTag_, "Processing rate is below 10 FPS, zone timing may be coarse");
    } else if (avg < 15.0) {
        LOG_WARN(logTag_, "Processing rate is below 15 FPS");
    }
}

nlohmann::json Camera::getStatus(bool includeComponents) const {
    nlohmann::json status;
    status["id"] = config_.id;
    status["name"] = config_.name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status["state"] = cameraStateToString(state_);
        if (!lastError_.empty()) {
            status["last_error"] = lastError_;
        }
    }
    status["frames_delivered"] = framesDelivered_.load();
    status["frames_processed"] = framesProcessed_.load();
    status["frames_skipped"] = framesSkipped_.load();
    status["detection_errors"] = detectionErrors_.load();
    status["events_emitted"] = eventsEmitted_.load();
    status["live_tracks"] = liveTracks_.load();

    if (includeComponents) {
        status["source"] = source_->getStatus();
        status["detector"] = detector_->getStatus();
        status["tracker"] = tracker_->getStatus();
        status["zones"] = evaluator_->getStatus();
        status["sinks"] = dispatcher_->getStatus();
    }
    return status;
}

} // namespace zwatch
