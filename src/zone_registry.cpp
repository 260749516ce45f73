#include "zone_registry.h"
#include "errors.h"
#include "logger.h"
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace zwatch {

namespace {

cv::Point2f parsePoint(const nlohmann::json& value, const std::string& zoneId) {
    if (value.is_array() && value.size() == 2 && value[0].is_number() && value[1].is_number()) {
        return cv::Point2f(value[0].get<float>(), value[1].get<float>());
    }
    if (value.is_object() && value.contains("x") && value.contains("y") &&
        value["x"].is_number() && value["y"].is_number()) {
        return cv::Point2f(value["x"].get<float>(), value["y"].get<float>());
    }
    throw ConfigError("Zone '" + zoneId + "' has a malformed point: " + value.dump());
}

cv::Scalar parseColor(const nlohmann::json& zone, const std::string& zoneId) {
    if (!zone.contains("color")) {
        return cv::Scalar(0, 255, 0);
    }
    const auto& color = zone["color"];
    if (!color.is_array() || color.size() != 3) {
        throw ConfigError("Zone '" + zoneId + "' color must be [b, g, r]");
    }
    for (const auto& channel : color) {
        if (!channel.is_number()) {
            throw ConfigError("Zone '" + zoneId + "' color must be numeric");
        }
    }
    return cv::Scalar(color[0].get<double>(), color[1].get<double>(), color[2].get<double>());
}

PolygonZone parseZone(const nlohmann::json& zone, size_t index) {
    if (!zone.is_object()) {
        throw ConfigError("Zone entry " + std::to_string(index) + " is not an object");
    }

    std::string name = zone.value("name", std::string());
    std::string id;
    if (zone.contains("id")) {
        if (!zone["id"].is_string()) {
            throw ConfigError("Zone entry " + std::to_string(index) + " has a non-string id");
        }
        id = zone["id"].get<std::string>();
    } else {
        id = name;
    }
    if (id.empty()) {
        throw ConfigError("Zone entry " + std::to_string(index) + " has no id or name");
    }

    if (!zone.contains("points") || !zone["points"].is_array()) {
        throw ConfigError("Zone '" + id + "' has no points array");
    }
    std::vector<cv::Point2f> points;
    for (const auto& point : zone["points"]) {
        points.push_back(parsePoint(point, id));
    }

    return PolygonZone(id, points, name, parseColor(zone, id));
}

} // namespace

ZoneRegistry::ZoneRegistry(std::vector<PolygonZone> zones, cv::Size sourceResolution)
    : zones_(std::move(zones)), sourceResolution_(sourceResolution) {
    std::unordered_set<std::string> ids;
    for (const auto& zone : zones_) {
        if (!ids.insert(zone.getId()).second) {
            throw ConfigError("Duplicate zone id: " + zone.getId());
        }
    }
}

std::shared_ptr<const ZoneRegistry> ZoneRegistry::fromJson(const nlohmann::json& document) {
    const nlohmann::json* zones = nullptr;
    cv::Size resolution;

    if (document.is_array()) {
        zones = &document;
    } else if (document.is_object()) {
        if (!document.contains("zones") || !document["zones"].is_array()) {
            throw ConfigError("Zone document has no 'zones' array");
        }
        zones = &document["zones"];

        if (document.contains("metadata") && document["metadata"].contains("resolution")) {
            const auto& res = document["metadata"]["resolution"];
            if (!res.is_array() || res.size() != 2 || !res[0].is_number_integer() || !res[1].is_number_integer() ||
                res[0].get<int>() <= 0 || res[1].get<int>() <= 0) {
                throw ConfigError("metadata.resolution must be [width, height] with positive integers");
            }
            resolution = cv::Size(res[0].get<int>(), res[1].get<int>());
        }
    } else {
        throw ConfigError("Zone document must be an object or an array");
    }

    std::vector<PolygonZone> parsed;
    parsed.reserve(zones->size());
    for (size_t i = 0; i < zones->size(); ++i) {
        parsed.push_back(parseZone((*zones)[i], i));
    }

    return std::make_shared<const ZoneRegistry>(std::move(parsed), resolution);
}

std::shared_ptr<const ZoneRegistry> ZoneRegistry::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open zone file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse zone file " + path + ": " + e.what());
    }

    auto registry = fromJson(document);
    LOG_INFO("ZoneRegistry", "Loaded " + std::to_string(registry->size()) + " zone(s) from " + path);
    if (registry->empty()) {
        LOG_WARN("ZoneRegistry", "Zone file " + path + " defines no zones, no events will be produced");
    }
    return registry;
}

const PolygonZone* ZoneRegistry::findZone(const std::string& id) const {
    for (const auto& zone : zones_) {
        if (zone.getId() == id) {
            return &zone;
        }
    }
    return nullptr;
}

bool ZoneRegistry::containsPoint(const std::string& zoneId, const cv::Point2f& point) const {
    const PolygonZone* zone = findZone(zoneId);
    if (!zone) {
        throw std::out_of_range("Unknown zone id: " + zoneId);
    }
    return zone->containsPoint(point);
}

std::shared_ptr<const ZoneRegistry> ZoneRegistry::scaledTo(const cv::Size& frameSize) const {
    if (sourceResolution_.empty() || frameSize.empty() || sourceResolution_ == frameSize) {
        return std::make_shared<const ZoneRegistry>(zones_, sourceResolution_);
    }

    const double scaleX = static_cast<double>(frameSize.width) / sourceResolution_.width;
    const double scaleY = static_cast<double>(frameSize.height) / sourceResolution_.height;

    std::vector<PolygonZone> scaledZones;
    scaledZones.reserve(zones_.size());
    for (const auto& zone : zones_) {
        scaledZones.push_back(zone.scaled(scaleX, scaleY));
    }

    LOG_INFO("ZoneRegistry", "Scaled zones from " + std::to_string(sourceResolution_.width) + "x" +
             std::to_string(sourceResolution_.height) + " to " + std::to_string(frameSize.width) + "x" +
             std::to_string(frameSize.height));
    return std::make_shared<const ZoneRegistry>(std::move(scaledZones), frameSize);
}

nlohmann::json ZoneRegistry::toJson() const {
    nlohmann::json j;
    if (!sourceResolution_.empty()) {
        j["metadata"]["resolution"] = {sourceResolution_.width, sourceResolution_.height};
    }
    j["zones"] = nlohmann::json::array();
    for (const auto& zone : zones_) {
        j["zones"].push_back(zone.toJson());
    }
    return j;
}

} // namespace zwatch
