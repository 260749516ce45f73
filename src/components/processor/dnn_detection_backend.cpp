#include "components/processor/dnn_detection_backend.h"
#include "logger.h"
#include <filesystem>
#include <stdexcept>

namespace zwatch {

DnnDetectionBackend::DnnDetectionBackend(const std::string& modelPath, int inputSize,
                                         float scoreThreshold, float nmsThreshold)
    : modelPath_(modelPath),
      inputSize_(inputSize),
      scoreThreshold_(scoreThreshold),
      nmsThreshold_(nmsThreshold),
      loaded_(false) {
}

bool DnnDetectionBackend::load() {
    if (!std::filesystem::exists(modelPath_)) {
        LOG_ERROR("DnnDetectionBackend", "Model file not found: " + modelPath_);
        return false;
    }

    try {
        net_ = cv::dnn::readNet(modelPath_);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        LOG_ERROR("DnnDetectionBackend", "Failed to load model " + modelPath_ + ": " + e.what());
        return false;
    }

    loaded_ = !net_.empty();
    if (loaded_) {
        LOG_INFO("DnnDetectionBackend", "Loaded model " + modelPath_ + " (input " +
                 std::to_string(inputSize_) + "x" + std::to_string(inputSize_) + ")");
    }
    return loaded_;
}

std::vector<Detection> DnnDetectionBackend::infer(const cv::Mat& image) {
    if (!loaded_) {
        throw std::runtime_error("Model is not loaded");
    }

    cv::Mat blob = cv::dnn::blobFromImage(image, 1.0 / 255.0, cv::Size(inputSize_, inputSize_),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    int rows = 0;
    int dims = 0;
    bool channelFirst = false;
    if (pred.dims == 3) {
        rows = pred.size[1];
        dims = pred.size[2];
        if (pred.size[2] > pred.size[1]) {
            rows = pred.size[2];
            dims = pred.size[1];
            channelFirst = true;
        }
    } else if (pred.dims == 2) {
        rows = pred.size[0];
        dims = pred.size[1];
    } else {
        throw std::runtime_error("Unexpected model output with " + std::to_string(pred.dims) + " dimensions");
    }
    if (dims < 5) {
        throw std::runtime_error("Unexpected model output width " + std::to_string(dims));
    }

    // Transposed outputs (YOLOv8 and later) carry no objectness column
    const bool hasObjectness = !channelFirst;
    const int classStart = hasObjectness ? 5 : 4;
    const int classes = dims - classStart;

    const float* data = reinterpret_cast<const float*>(pred.data);
    const float scaleX = static_cast<float>(image.cols) / static_cast<float>(inputSize_);
    const float scaleY = static_cast<float>(image.rows) / static_cast<float>(inputSize_);

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    std::vector<int> classIds;

    for (int i = 0; i < rows; ++i) {
        const float* ptr = channelFirst ? (data + i) : (data + i * dims);
        auto item = [&](int idx) -> float {
            return channelFirst ? ptr[idx * rows] : ptr[idx];
        };

        const float objectness = hasObjectness ? item(4) : 1.0f;
        int bestClass = -1;
        float bestScore = 0.0f;
        for (int c = 0; c < classes; ++c) {
            const float score = objectness * item(classStart + c);
            if (score > bestScore) {
                bestScore = score;
                bestClass = c;
            }
        }
        if (bestClass < 0 || bestScore < scoreThreshold_) {
            continue;
        }

        const float cx = item(0);
        const float cy = item(1);
        const float w = item(2);
        const float h = item(3);
        boxes.emplace_back(static_cast<int>((cx - 0.5f * w) * scaleX),
                           static_cast<int>((cy - 0.5f * h) * scaleY),
                           static_cast<int>(w * scaleX),
                           static_cast<int>(h * scaleY));
        scores.push_back(bestScore);
        classIds.push_back(bestClass);
    }

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, scoreThreshold_, nmsThreshold_, keep);

    std::vector<Detection> detections;
    detections.reserve(keep.size());
    for (int idx : keep) {
        Detection detection;
        detection.bbox = cv::Rect2f(boxes[idx]);
        detection.confidence = scores[idx];
        detection.classId = classIds[idx];
        detections.push_back(detection);
    }
    return detections;
}

} // namespace zwatch
