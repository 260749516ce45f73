#pragma once

#include "components/processor/detection_backend.h"
#include <opencv2/dnn.hpp>
#include <string>

namespace zwatch {

/**
 * @brief YOLO-family ONNX model run through OpenCV DNN
 *
 * Handles both output layouts: [1, N, 5 + classes] with an objectness column
 * and the transposed [1, 4 + classes, N] layout without one. Boxes are
 * rescaled to the input image and reduced with NMS.
 */
class DnnDetectionBackend : public DetectionBackend {
public:
    DnnDetectionBackend(const std::string& modelPath, int inputSize,
                        float scoreThreshold, float nmsThreshold);

    bool load() override;

    std::vector<Detection> infer(const cv::Mat& image) override;

    std::string name() const override { return "opencv-dnn"; }

private:
    std::string modelPath_;
    int inputSize_;
    float scoreThreshold_;
    float nmsThreshold_;
    cv::dnn::Net net_;
    bool loaded_;
};

} // namespace zwatch
