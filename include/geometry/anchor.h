#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace zwatch {

/**
 * @brief Anchor position on a bounding box used as a track's reference point
 */
enum class Position {
    TOP_LEFT,
    TOP_CENTER,
    TOP_RIGHT,
    CENTER_LEFT,
    CENTER,
    CENTER_RIGHT,
    BOTTOM_LEFT,
    BOTTOM_CENTER,
    BOTTOM_RIGHT
};

/**
 * @brief Parse an anchor name such as "BOTTOM_CENTER"
 *
 * @param positionStr Anchor name, case-insensitive
 * @return Position Parsed anchor
 * @throws std::invalid_argument if the name is unknown
 */
Position StringToPosition(const std::string& positionStr);

/**
 * @brief Get the canonical name of an anchor
 */
std::string PositionToString(Position position);

/**
 * @brief Compute the anchor point of a box
 *
 * Bottom anchors are raised by bottomOffset * height so that the point sits on
 * the feet rather than on the box edge.
 *
 * @param box Bounding box in pixel coordinates
 * @param position Anchor to compute
 * @param bottomOffset Fraction of the box height, applied to bottom anchors only
 * @return cv::Point2f Anchor point
 */
cv::Point2f anchorPoint(const cv::Rect2f& box, Position position, float bottomOffset = 0.0f);

} // namespace zwatch
