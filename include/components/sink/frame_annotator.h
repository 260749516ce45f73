#pragma once

#include "pipeline_types.h"
#include <opencv2/core.hpp>

namespace zwatch {

/**
 * @brief Drawing options for annotated debug frames
 */
struct AnnotationStyle {
    int thickness = 2;
    float zoneOpacity = 0.2f;
    float textScale = 0.6f;
    int textThickness = 2;
    int textPadding = 5;
    bool drawHistory = true;
    cv::Scalar trackColor = cv::Scalar(255, 128, 0);
    cv::Scalar insideColor = cv::Scalar(0, 0, 255);
};

/**
 * @brief Render zones, track boxes, ids and reference points on a copy of the frame
 *
 * Zones are filled with their colour at the configured opacity and labelled
 * with their name and current occupancy. Tracks inside at least one zone use
 * insideColor.
 */
cv::Mat annotateFrame(const FrameSnapshot& snapshot, const AnnotationStyle& style = AnnotationStyle());

} // namespace zwatch
