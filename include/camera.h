#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "pipeline_config.h"
#include "pipeline_types.h"
#include "zone_registry.h"
#include "components/source/gstreamer_source.h"
#include "components/processor/person_detector_processor.h"
#include "components/processor/object_tracker_processor.h"
#include "components/processor/zone_evaluator.h"
#include "components/sink/sink_dispatcher.h"

namespace zwatch {

enum class CameraState {
    IDLE,
    RUNNING,
    STOPPED,
    FAILED
};

std::string cameraStateToString(CameraState state);

/**
 * @brief One camera pipeline: source, detector, tracker, zone evaluator and sinks
 *
 * The loop runs on its own thread: nextFrame, detect, track, evaluate,
 * dispatch. A stop request is honoured between frames; the frame in flight is
 * always completed. A fatal stream error ends the loop with state FAILED.
 */
class Camera {
public:
    Camera(const CameraConfig& config,
           std::shared_ptr<GStreamerSource> source,
           std::shared_ptr<PersonDetectorProcessor> detector,
           std::shared_ptr<ObjectTrackerProcessor> tracker,
           std::shared_ptr<ZoneEvaluator> evaluator,
           std::shared_ptr<const ZoneRegistry> zones,
           std::unique_ptr<SinkDispatcher> dispatcher);

    ~Camera();

    Camera(const Camera&) = delete;
    Camera& operator=(const Camera&) = delete;

    std::string getId() const;

    std::string getName() const;

    /**
     * @brief Initialize every component and start the processing thread
     *
     * @return true if started, false if a component failed (state FAILED)
     */
    bool start();

    /**
     * @brief Ask the loop to finish the current frame and exit; does not block
     */
    void requestStop();

    /**
     * @brief Request a stop and wait for the processing thread
     */
    bool stop();

    /**
     * @brief Block until the processing thread has exited
     */
    void wait();

    bool isRunning() const;

    CameraState getState() const;

    nlohmann::json getStatus(bool includeComponents = true) const;

    /**
     * @brief Run one pipeline iteration on a frame
     *
     * detect, track, evaluate and dispatch. Detection failures are logged and
     * treated as an empty detection list.
     *
     * @return std::vector<ZoneEvent> Events committed for this frame
     */
    std::vector<ZoneEvent> processFrame(const Frame& frame);

    /**
     * @brief The frame loop; runs until a stop request, end of input or a fatal error
     */
    void run();

    /**
     * @brief Zones in frame coordinates, scaled on the first frame
     */
    std::shared_ptr<const ZoneRegistry> getZones() const;

    uint64_t getFramesProcessed() const { return framesProcessed_; }
    uint64_t getDetectionErrors() const { return detectionErrors_; }

private:
    void setState(CameraState state);
    void recordFrameRate();
    void logFrameRateStats();
    void shutdownComponents();

    std::string logTag_;
    CameraConfig config_;

    std::shared_ptr<GStreamerSource> source_;
    std::shared_ptr<PersonDetectorProcessor> detector_;
    std::shared_ptr<ObjectTrackerProcessor> tracker_;
    std::shared_ptr<ZoneEvaluator> evaluator_;
    std::shared_ptr<const ZoneRegistry> baseZones_;       ///< Zones as configured
    std::shared_ptr<const ZoneRegistry> zones_;           ///< Zones scaled to the stream
    std::unique_ptr<SinkDispatcher> dispatcher_;

    mutable std::mutex mutex_;                             ///< Guards state_, zones_, lastError_
    CameraState state_;
    std::string lastError_;

    std::thread processingThread_;                         ///< Background frame loop
    std::atomic<bool> stopProcessing_;

    std::atomic<uint64_t> framesDelivered_;
    std::atomic<uint64_t> framesProcessed_;
    std::atomic<uint64_t> framesSkipped_;
    std::atomic<uint64_t> detectionErrors_;
    std::atomic<uint64_t> eventsEmitted_;
    std::atomic<size_t> liveTracks_;

    // Loop-thread only
    std::chrono::steady_clock::time_point lastProcessedAt_;
    bool haveLastProcessed_;
    std::vector<double> fpsSamples_;
};

} // namespace zwatch
