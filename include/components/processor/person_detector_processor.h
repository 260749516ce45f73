#pragma once

#include "component.h"
#include "components/processor/detection_backend.h"
#include "pipeline_config.h"
#include "pipeline_types.h"
#include "utils/result.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Person detector adapter
 *
 * Wraps a DetectionBackend and applies the detection boundary rules: person
 * class only, confidence threshold, boxes clipped to the frame. Failures are
 * returned as errors and never thrown into the camera loop.
 */
class PersonDetectorProcessor : public ProcessorComponent {
public:
    /**
     * @brief Construct a new Person Detector Processor
     *
     * @param id Component ID
     * @param cameraId Owning camera
     * @param config Detector configuration
     * @param backend Model backend, DnnDetectionBackend when null
     */
    PersonDetectorProcessor(const std::string& id, const std::string& cameraId,
                            const DetectorConfig& config,
                            std::unique_ptr<DetectionBackend> backend = nullptr);

    ~PersonDetectorProcessor() override;

    /**
     * @brief Load the model
     *
     * @return true if the backend is ready
     */
    bool initialize() override;

    /**
     * @brief Detect persons in a frame
     *
     * @param frame Frame to analyse
     * @return Result<std::vector<Detection>> Person detections in frame coordinates,
     *         or a DetectionError message
     */
    Result<std::vector<Detection>> detect(const Frame& frame);

    nlohmann::json getStatus() const override;

    const DetectorConfig& getConfig() const { return config_; }

private:
    Result<std::vector<Detection>> failure(const std::string& message);

    DetectorConfig config_;
    std::unique_ptr<DetectionBackend> backend_;

    mutable std::mutex statsMutex_;
    uint64_t framesProcessed_;
    uint64_t errorCount_;
    uint64_t detectionCount_;
    double lastInferenceMs_;
    double avgInferenceMs_;
};

} // namespace zwatch
