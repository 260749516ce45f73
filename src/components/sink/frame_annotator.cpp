#include "components/sink/frame_annotator.h"
#include "zone_registry.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <map>
#include <set>

namespace zwatch {

namespace {

cv::Point polygonCenter(const std::vector<cv::Point>& polygon) {
    cv::Moments m = cv::moments(polygon);
    if (m.m00 != 0) {
        return cv::Point(static_cast<int>(m.m10 / m.m00), static_cast<int>(m.m01 / m.m00));
    }
    int sumX = 0, sumY = 0;
    for (const auto& p : polygon) {
        sumX += p.x;
        sumY += p.y;
    }
    return polygon.empty() ? cv::Point() : cv::Point(sumX / static_cast<int>(polygon.size()),
                                                     sumY / static_cast<int>(polygon.size()));
}

void drawLabel(cv::Mat& image, const std::string& text, const cv::Point& center,
               const cv::Scalar& background, const AnnotationStyle& style) {
    int baseLine = 0;
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    cv::Size textSize = cv::getTextSize(text, font, style.textScale, style.textThickness, &baseLine);
    cv::Rect rect(center.x - textSize.width / 2 - style.textPadding,
                  center.y - textSize.height / 2 - style.textPadding,
                  textSize.width + 2 * style.textPadding,
                  textSize.height + 2 * style.textPadding);
    cv::rectangle(image, rect, background, -1);
    cv::putText(image, text, cv::Point(center.x - textSize.width / 2, center.y + textSize.height / 2),
                font, style.textScale, cv::Scalar(255, 255, 255), style.textThickness);
}

} // namespace

cv::Mat annotateFrame(const FrameSnapshot& snapshot, const AnnotationStyle& style) {
    cv::Mat annotated = snapshot.frame.image.clone();
    if (annotated.empty()) {
        return annotated;
    }

    std::map<std::string, int> occupancy;
    std::set<int> insideTracks;
    for (const auto& pair : snapshot.states) {
        if (pair.state.phase == OccupancyPhase::INSIDE || pair.state.phase == OccupancyPhase::EXITING) {
            occupancy[pair.zoneId]++;
            insideTracks.insert(pair.trackId);
        }
    }

    if (snapshot.zones) {
        for (const auto& zone : snapshot.zones->listZones()) {
            std::vector<cv::Point> polygon;
            for (const auto& pt : zone.getPolygon()) {
                polygon.emplace_back(static_cast<int>(pt.x), static_cast<int>(pt.y));
            }
            std::vector<std::vector<cv::Point>> contours = {polygon};

            if (style.zoneOpacity > 0.0f) {
                cv::Mat overlay = annotated.clone();
                cv::fillPoly(overlay, contours, zone.getColor());
                cv::addWeighted(overlay, style.zoneOpacity, annotated, 1.0 - style.zoneOpacity, 0, annotated);
            }
            cv::polylines(annotated, contours, true, zone.getColor(), style.thickness);

            const std::string label = zone.getName() + ": " + std::to_string(occupancy[zone.getId()]);
            drawLabel(annotated, label, polygonCenter(polygon), zone.getColor(), style);
        }
    }

    for (const auto& track : snapshot.tracks) {
        const bool inside = insideTracks.count(track.trackId) != 0;
        const cv::Scalar color = inside ? style.insideColor : style.trackColor;
        const cv::Rect box(static_cast<int>(track.bbox.x), static_cast<int>(track.bbox.y),
                           static_cast<int>(track.bbox.width), static_cast<int>(track.bbox.height));
        cv::rectangle(annotated, box, color, style.thickness);

        if (style.drawHistory && track.history.size() > 1) {
            for (size_t i = 1; i < track.history.size(); ++i) {
                cv::line(annotated, track.history[i - 1], track.history[i], color, 1);
            }
        }
        cv::circle(annotated, track.referencePoint, 4, color, -1);

        const std::string text = "#" + std::to_string(track.trackId);
        cv::putText(annotated, text, cv::Point(box.x, std::max(box.y - 5, 10)),
                    cv::FONT_HERSHEY_SIMPLEX, style.textScale, color, style.textThickness);
    }

    return annotated;
}

} // namespace zwatch
