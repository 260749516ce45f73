#pragma once

#include "geometry/polygon_zone.h"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace zwatch {

/**
 * @brief Immutable, ordered set of configured zones
 *
 * Loaded once at startup and shared read-only between the camera loop and sinks.
 * There is no mutation API; scaledTo() returns a new registry.
 */
class ZoneRegistry {
public:
    /**
     * @brief Build a registry from already validated zones
     *
     * @param zones Zones in evaluation order
     * @param sourceResolution Resolution the vertices were drawn at, empty if unknown
     * @throws ConfigError on duplicate zone ids
     */
    explicit ZoneRegistry(std::vector<PolygonZone> zones, cv::Size sourceResolution = cv::Size());

    /**
     * @brief Parse a zone document
     *
     * Accepts {"metadata": {"resolution": [w, h]}, "zones": [...]} or a bare array of zones.
     * Each zone has "id" (or "name"), "points" as [[x, y], ...] and an optional "color" (BGR).
     *
     * @throws ConfigError on any malformed entry
     */
    static std::shared_ptr<const ZoneRegistry> fromJson(const nlohmann::json& document);

    /**
     * @brief Read and parse a zone file
     *
     * @throws ConfigError if the file cannot be read or parsed
     */
    static std::shared_ptr<const ZoneRegistry> loadFromFile(const std::string& path);

    const std::vector<PolygonZone>& listZones() const { return zones_; }

    /**
     * @brief Find a zone by id
     *
     * @return const PolygonZone* The zone, nullptr if unknown
     */
    const PolygonZone* findZone(const std::string& id) const;

    /**
     * @brief Containment test against a zone by id
     *
     * @throws std::out_of_range if the zone id is unknown
     */
    bool containsPoint(const std::string& zoneId, const cv::Point2f& point) const;

    cv::Size sourceResolution() const { return sourceResolution_; }
    size_t size() const { return zones_.size(); }
    bool empty() const { return zones_.empty(); }

    /**
     * @brief Get a registry whose vertices are scaled to the live frame size
     *
     * Returns a registry equal to this one when no source resolution is known
     * or it already matches.
     */
    std::shared_ptr<const ZoneRegistry> scaledTo(const cv::Size& frameSize) const;

    nlohmann::json toJson() const;

private:
    std::vector<PolygonZone> zones_;
    cv::Size sourceResolution_;
};

} // namespace zwatch
