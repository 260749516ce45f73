#include "pipeline_types.h"

namespace zwatch {

std::string zoneEventKindToString(ZoneEventKind kind) {
    return kind == ZoneEventKind::ENTER ? "enter" : "exit";
}

std::string occupancyPhaseToString(OccupancyPhase phase) {
    switch (phase) {
        case OccupancyPhase::OUTSIDE: return "outside";
        case OccupancyPhase::ENTERING: return "entering";
        case OccupancyPhase::INSIDE: return "inside";
        case OccupancyPhase::EXITING: return "exiting";
        default: return "unknown";
    }
}

nlohmann::json zoneEventToJson(const ZoneEvent& event, const std::string& cameraId) {
    nlohmann::json j;
    if (!cameraId.empty()) {
        j["camera_id"] = cameraId;
    }
    j["zone_id"] = event.zoneId;
    j["track_id"] = event.trackId;
    j["event"] = zoneEventKindToString(event.kind);
    j["timestamp_ms"] = event.timestampMs;
    j["frame"] = event.frameSequence;
    j["location"] = {event.location.x, event.location.y};
    if (event.kind == ZoneEventKind::EXIT) {
        j["forced"] = event.forced;
        j["dwell_ms"] = event.dwellMs;
    }
    return j;
}

nlohmann::json trackToJson(const Track& track) {
    nlohmann::json j;
    j["track_id"] = track.trackId;
    j["bbox"] = {track.bbox.x, track.bbox.y, track.bbox.width, track.bbox.height};
    j["reference_point"] = {track.referencePoint.x, track.referencePoint.y};
    j["frames_since_matched"] = track.framesSinceMatched;
    j["hits"] = track.hits;
    j["confidence"] = track.confidence;
    return j;
}

} // namespace zwatch
