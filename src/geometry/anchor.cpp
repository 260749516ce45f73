#include "geometry/anchor.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zwatch {

Position StringToPosition(const std::string& positionStr) {
    std::string name = positionStr;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (name == "TOP_LEFT") return Position::TOP_LEFT;
    if (name == "TOP_CENTER") return Position::TOP_CENTER;
    if (name == "TOP_RIGHT") return Position::TOP_RIGHT;
    if (name == "CENTER_LEFT") return Position::CENTER_LEFT;
    if (name == "CENTER") return Position::CENTER;
    if (name == "CENTER_RIGHT") return Position::CENTER_RIGHT;
    if (name == "BOTTOM_LEFT") return Position::BOTTOM_LEFT;
    if (name == "BOTTOM_CENTER") return Position::BOTTOM_CENTER;
    if (name == "BOTTOM_RIGHT") return Position::BOTTOM_RIGHT;

    throw std::invalid_argument("Unknown anchor position: " + positionStr);
}

std::string PositionToString(Position position) {
    switch (position) {
        case Position::TOP_LEFT: return "TOP_LEFT";
        case Position::TOP_CENTER: return "TOP_CENTER";
        case Position::TOP_RIGHT: return "TOP_RIGHT";
        case Position::CENTER_LEFT: return "CENTER_LEFT";
        case Position::CENTER: return "CENTER";
        case Position::CENTER_RIGHT: return "CENTER_RIGHT";
        case Position::BOTTOM_LEFT: return "BOTTOM_LEFT";
        case Position::BOTTOM_CENTER: return "BOTTOM_CENTER";
        case Position::BOTTOM_RIGHT: return "BOTTOM_RIGHT";
        default: return "CENTER";
    }
}

cv::Point2f anchorPoint(const cv::Rect2f& box, Position position, float bottomOffset) {
    const float left = box.x;
    const float right = box.x + box.width;
    const float centerX = box.x + box.width / 2.0f;
    const float top = box.y;
    const float centerY = box.y + box.height / 2.0f;
    const float bottom = box.y + box.height - bottomOffset * box.height;

    switch (position) {
        case Position::TOP_LEFT: return {left, top};
        case Position::TOP_CENTER: return {centerX, top};
        case Position::TOP_RIGHT: return {right, top};
        case Position::CENTER_LEFT: return {left, centerY};
        case Position::CENTER: return {centerX, centerY};
        case Position::CENTER_RIGHT: return {right, centerY};
        case Position::BOTTOM_LEFT: return {left, bottom};
        case Position::BOTTOM_CENTER: return {centerX, bottom};
        case Position::BOTTOM_RIGHT: return {right, bottom};
        default: return {centerX, centerY};
    }
}

} // namespace zwatch
