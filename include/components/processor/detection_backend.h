#pragma once

#include "pipeline_types.h"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace zwatch {

/**
 * @brief Object detection model seam
 *
 * Implementations return boxes for every class they know in the coordinates
 * of the image they were given. Filtering to persons happens in
 * PersonDetectorProcessor. infer() may throw cv::Exception or std::exception.
 */
class DetectionBackend {
public:
    virtual ~DetectionBackend() = default;

    /**
     * @brief Load the model
     *
     * @return true if the model is ready for inference
     */
    virtual bool load() = 0;

    virtual std::vector<Detection> infer(const cv::Mat& image) = 0;

    virtual std::string name() const = 0;
};

} // namespace zwatch
