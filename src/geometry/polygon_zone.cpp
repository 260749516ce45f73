#include "geometry/polygon_zone.h"
#include "errors.h"
#include <cmath>
#include <algorithm>

namespace zwatch {

namespace {

double cross(const cv::Point2d& o, const cv::Point2d& a, const cv::Point2d& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

int orientation(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
    const double value = cross(a, b, c);
    if (std::abs(value) <= PolygonZone::kEdgeEpsilon) {
        return 0;
    }
    return value > 0 ? 1 : -1;
}

bool onSegment(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& p) {
    return p.x <= std::max(a.x, b.x) + PolygonZone::kEdgeEpsilon &&
           p.x >= std::min(a.x, b.x) - PolygonZone::kEdgeEpsilon &&
           p.y <= std::max(a.y, b.y) + PolygonZone::kEdgeEpsilon &&
           p.y >= std::min(a.y, b.y) - PolygonZone::kEdgeEpsilon;
}

bool segmentsIntersect(const cv::Point2d& p1, const cv::Point2d& p2,
                       const cv::Point2d& q1, const cv::Point2d& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) return true;
    if (o1 == 0 && onSegment(p1, p2, q1)) return true;
    if (o2 == 0 && onSegment(p1, p2, q2)) return true;
    if (o3 == 0 && onSegment(q1, q2, p1)) return true;
    if (o4 == 0 && onSegment(q1, q2, p2)) return true;
    return false;
}

double distanceToSegment(const cv::Point2d& p, const cv::Point2d& a, const cv::Point2d& b) {
    const cv::Point2d ab = b - a;
    const double lengthSq = ab.dot(ab);
    if (lengthSq <= 0.0) {
        return std::hypot(p.x - a.x, p.y - a.y);
    }
    const double t = std::clamp((p - a).dot(ab) / lengthSq, 0.0, 1.0);
    const cv::Point2d projection = a + t * ab;
    return std::hypot(p.x - projection.x, p.y - projection.y);
}

} // namespace

PolygonZone::PolygonZone(const std::string& id,
                         const std::vector<cv::Point2f>& polygon,
                         const std::string& name,
                         const cv::Scalar& color)
    : id_(id), name_(name.empty() ? id : name), polygon_(polygon), color_(color) {
    validate();
}

void PolygonZone::validate() const {
    if (id_.empty()) {
        throw ConfigError("Zone id must not be empty");
    }
    if (polygon_.size() < 3) {
        throw ConfigError("Zone '" + id_ + "' has " + std::to_string(polygon_.size()) +
                          " vertices, at least 3 are required");
    }
    for (const auto& point : polygon_) {
        if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
            throw ConfigError("Zone '" + id_ + "' has a non-finite vertex");
        }
    }
    if (area() <= kEdgeEpsilon) {
        throw ConfigError("Zone '" + id_ + "' has zero area");
    }

    // Any two edges that do not share a vertex must not touch
    const size_t n = polygon_.size();
    for (size_t i = 0; i < n; ++i) {
        const cv::Point2d a1 = polygon_[i];
        const cv::Point2d a2 = polygon_[(i + 1) % n];
        for (size_t j = i + 1; j < n; ++j) {
            const bool adjacent = (j == i + 1) || (i == 0 && j == n - 1);
            if (adjacent) {
                continue;
            }
            const cv::Point2d b1 = polygon_[j];
            const cv::Point2d b2 = polygon_[(j + 1) % n];
            if (segmentsIntersect(a1, a2, b1, b2)) {
                throw ConfigError("Zone '" + id_ + "' is self-intersecting (edges " +
                                  std::to_string(i) + " and " + std::to_string(j) + ")");
            }
        }
    }
}

bool PolygonZone::containsPoint(const cv::Point2f& point) const {
    const cv::Point2d p = point;
    if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
        return false;
    }

    const size_t n = polygon_.size();
    for (size_t i = 0; i < n; ++i) {
        if (distanceToSegment(p, polygon_[i], polygon_[(i + 1) % n]) <= kEdgeEpsilon) {
            return true;
        }
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const cv::Point2d vi = polygon_[i];
        const cv::Point2d vj = polygon_[j];
        if ((vi.y > p.y) != (vj.y > p.y)) {
            const double crossingX = vj.x + (p.y - vj.y) * (vi.x - vj.x) / (vi.y - vj.y);
            if (p.x < crossingX) {
                inside = !inside;
            }
        }
    }
    return inside;
}

double PolygonZone::area() const {
    double sum = 0.0;
    const size_t n = polygon_.size();
    for (size_t i = 0; i < n; ++i) {
        const cv::Point2d a = polygon_[i];
        const cv::Point2d b = polygon_[(i + 1) % n];
        sum += a.x * b.y - b.x * a.y;
    }
    return std::abs(sum) / 2.0;
}

PolygonZone PolygonZone::scaled(double scaleX, double scaleY) const {
    std::vector<cv::Point2f> points;
    points.reserve(polygon_.size());
    for (const auto& point : polygon_) {
        points.emplace_back(static_cast<float>(point.x * scaleX), static_cast<float>(point.y * scaleY));
    }
    return PolygonZone(id_, points, name_, color_);
}

nlohmann::json PolygonZone::toJson() const {
    nlohmann::json j;
    j["id"] = id_;
    j["name"] = name_;
    nlohmann::json points = nlohmann::json::array();
    for (const auto& point : polygon_) {
        points.push_back({point.x, point.y});
    }
    j["points"] = points;
    j["color"] = {static_cast<int>(color_[0]), static_cast<int>(color_[1]), static_cast<int>(color_[2])};
    return j;
}

} // namespace zwatch
