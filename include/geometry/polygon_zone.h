#pragma once

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace zwatch {

/**
 * @brief An immutable named polygonal region of the frame
 *
 * The polygon is validated at construction: at least 3 finite vertices, simple
 * (no two non-adjacent edges touch) and with non-zero area. Any violation
 * raises ConfigError.
 */
class PolygonZone {
public:
    /**
     * @brief Construct and validate a polygon zone
     *
     * @param id Unique zone id
     * @param polygon Polygon vertices in pixel coordinates
     * @param name Display name, defaults to the id
     * @param color Display color (BGR)
     * @throws ConfigError if the polygon is invalid
     */
    PolygonZone(const std::string& id,
                const std::vector<cv::Point2f>& polygon,
                const std::string& name = "",
                const cv::Scalar& color = cv::Scalar(0, 255, 0));

    const std::string& getId() const { return id_; }
    const std::string& getName() const { return name_; }
    const std::vector<cv::Point2f>& getPolygon() const { return polygon_; }
    const cv::Scalar& getColor() const { return color_; }

    /**
     * @brief Test whether a point lies inside the zone
     *
     * Crossing-number ray cast. Points on an edge or a vertex (within a fixed
     * epsilon) count as inside.
     *
     * @param point Point in pixel coordinates
     * @return true if inside or on the boundary
     */
    bool containsPoint(const cv::Point2f& point) const;

    /**
     * @brief Absolute polygon area (shoelace formula)
     */
    double area() const;

    /**
     * @brief Get a copy of the zone with every vertex scaled
     *
     * @param scaleX Horizontal factor
     * @param scaleY Vertical factor
     */
    PolygonZone scaled(double scaleX, double scaleY) const;

    /**
     * @brief Get the zone as JSON (id, name, points, color)
     */
    nlohmann::json toJson() const;

    static constexpr double kEdgeEpsilon = 1e-6;

private:
    void validate() const;

    std::string id_;                    ///< Zone ID
    std::string name_;                  ///< Display name
    std::vector<cv::Point2f> polygon_;  ///< Polygon vertices
    cv::Scalar color_;                  ///< Display color
};

} // namespace zwatch
