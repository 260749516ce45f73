#include "components/processor/person_detector_processor.h"
#include "components/processor/dnn_detection_backend.h"
#include "logger.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <chrono>

namespace zwatch {

PersonDetectorProcessor::PersonDetectorProcessor(const std::string& id, const std::string& cameraId,
                                                 const DetectorConfig& config,
                                                 std::unique_ptr<DetectionBackend> backend)
    : ProcessorComponent(id, cameraId),
      config_(config),
      backend_(std::move(backend)),
      framesProcessed_(0),
      errorCount_(0),
      detectionCount_(0),
      lastInferenceMs_(0.0),
      avgInferenceMs_(0.0) {
    if (!backend_) {
        backend_ = std::make_unique<DnnDetectionBackend>(
            config_.modelPath, config_.inputSize, config_.confidenceThreshold, config_.nmsThreshold);
    }
}

PersonDetectorProcessor::~PersonDetectorProcessor() {
    stop();
}

bool PersonDetectorProcessor::initialize() {
    const std::string logTag = logSource("PersonDetector");
    try {
        if (!backend_->load()) {
            lastError_ = "Failed to load detection backend " + backend_->name();
            LOG_ERROR(logTag, lastError_);
            return false;
        }
    } catch (const std::exception& e) {
        lastError_ = std::string("Detection backend load raised: ") + e.what();
        LOG_ERROR(logTag, lastError_);
        return false;
    }

    LOG_INFO(logTag, "Detector ready (" + backend_->name() + ", confidence >= " +
             std::to_string(config_.confidenceThreshold) + ", person class " +
             std::to_string(config_.personClassId) + ")");
    running_ = true;
    return true;
}

Result<std::vector<Detection>> PersonDetectorProcessor::failure(const std::string& message) {
    std::lock_guard<std::mutex> lock(statsMutex_);
    ++errorCount_;
    return Result<std::vector<Detection>>::error("DetectionError: " + message);
}

Result<std::vector<Detection>> PersonDetectorProcessor::detect(const Frame& frame) {
    const cv::Mat& image = frame.image;
    if (image.empty()) {
        return failure("empty frame " + std::to_string(frame.sequence));
    }
    if (image.type() != CV_8UC3) {
        return failure("frame " + std::to_string(frame.sequence) + " is not 8-bit BGR");
    }

    // Large frames are downscaled before inference and boxes mapped back
    cv::Mat input = image;
    float scale = 1.0f;
    const int longSide = std::max(image.cols, image.rows);
    if (config_.resizeForDetection && longSide > config_.detectionSize) {
        scale = static_cast<float>(config_.detectionSize) / static_cast<float>(longSide);
        cv::resize(image, input, cv::Size(), scale, scale, cv::INTER_AREA);
    }

    std::vector<Detection> raw;
    const auto start = std::chrono::steady_clock::now();
    try {
        raw = backend_->infer(input);
    } catch (const cv::Exception& e) {
        return failure(std::string("backend raised cv::Exception: ") + e.what());
    } catch (const std::exception& e) {
        return failure(std::string("backend raised: ") + e.what());
    }
    const double elapsedMs = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    const cv::Rect2f frameRect(0.0f, 0.0f, static_cast<float>(image.cols), static_cast<float>(image.rows));
    std::vector<Detection> persons;
    persons.reserve(raw.size());
    for (const auto& detection : raw) {
        if (detection.classId != config_.personClassId) {
            continue;
        }
        if (detection.confidence < config_.confidenceThreshold) {
            continue;
        }

        cv::Rect2f box = detection.bbox;
        if (scale != 1.0f) {
            box = cv::Rect2f(box.x / scale, box.y / scale, box.width / scale, box.height / scale);
        }
        box &= frameRect;
        if (box.width <= 0.0f || box.height <= 0.0f) {
            continue;
        }

        Detection person;
        person.bbox = box;
        person.confidence = std::clamp(detection.confidence, 0.0f, 1.0f);
        person.classId = detection.classId;
        persons.push_back(person);
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        ++framesProcessed_;
        detectionCount_ += persons.size();
        lastInferenceMs_ = elapsedMs;
        avgInferenceMs_ = framesProcessed_ == 1 ? elapsedMs : avgInferenceMs_ * 0.9 + elapsedMs * 0.1;
    }

    return Result<std::vector<Detection>>::success(std::move(persons));
}

nlohmann::json PersonDetectorProcessor::getStatus() const {
    auto status = Component::getStatus();
    status["backend"] = backend_->name();
    status["confidence_threshold"] = config_.confidenceThreshold;
    status["person_class_id"] = config_.personClassId;

    std::lock_guard<std::mutex> lock(statsMutex_);
    status["frames_processed"] = framesProcessed_;
    status["errors"] = errorCount_;
    status["detections"] = detectionCount_;
    status["last_inference_ms"] = lastInferenceMs_;
    status["average_inference_ms"] = avgInferenceMs_;
    return status;
}

} // namespace zwatch
