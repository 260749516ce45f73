#pragma once

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace zwatch {

class ZoneRegistry;

/**
 * @brief A decoded video frame
 *
 * Owned by the camera loop for one iteration.
 */
struct Frame {
    uint64_t sequence = 0;        ///< Monotonic frame counter, advances on failed reads too
    int64_t timestampMs = 0;      ///< Capture time, milliseconds since epoch
    uint64_t droppedBefore = 0;   ///< Sequence numbers skipped since the previous delivered frame
    cv::Mat image;                ///< BGR raster
};

/**
 * @brief A person detection for one frame
 */
struct Detection {
    cv::Rect2f bbox;              ///< Box in frame pixel coordinates
    float confidence = 0.0f;      ///< Score in [0,1]
    int classId = 0;              ///< Model class id
};

/**
 * @brief A persistent person identity maintained by the tracker
 */
struct Track {
    int trackId = 0;                          ///< Monotonic id, never reused
    cv::Rect2f bbox;                          ///< Last matched box
    cv::Point2f referencePoint;               ///< Anchor point used for zone containment
    std::deque<cv::Point2f> history;          ///< Recent reference points, oldest first
    cv::Point2f velocity;                     ///< Per-frame displacement of the box origin
    int framesSinceMatched = 0;               ///< Consecutive frames without a detection
    int hits = 0;                             ///< Number of matched frames
    float confidence = 0.0f;                  ///< Confidence of the last matched detection
    int64_t createdAtMs = 0;
    int64_t lastMatchedAtMs = 0;
};

enum class ZoneEventKind {
    ENTER,
    EXIT
};

/**
 * @brief A committed zone occupancy transition
 */
struct ZoneEvent {
    std::string zoneId;
    int trackId = 0;
    ZoneEventKind kind = ZoneEventKind::ENTER;
    int64_t timestampMs = 0;      ///< Frame timestamp of the committing frame
    uint64_t frameSequence = 0;
    bool forced = false;          ///< Exit emitted because the track was deleted
    int64_t dwellMs = 0;          ///< Exit only: time since the committed enter
    cv::Point2f location;         ///< Reference point at commit time
};

enum class OccupancyPhase {
    OUTSIDE,
    ENTERING,
    INSIDE,
    EXITING
};

/**
 * @brief Debounce state of one (zone, track) pair
 */
struct ZoneOccupancyState {
    OccupancyPhase phase = OccupancyPhase::OUTSIDE;
    int counter = 0;              ///< Consecutive frames in ENTERING or EXITING
    int64_t enteredAtMs = 0;      ///< Timestamp of the committed enter
    int64_t lastUpdateMs = 0;
    cv::Point2f lastPoint;
};

/**
 * @brief Read-only copy of a pair state handed to frame sinks
 */
struct PairState {
    std::string zoneId;
    int trackId = 0;
    ZoneOccupancyState state;
};

/**
 * @brief Const view of one processed frame handed to frame sinks
 *
 * Holds copies of the tracker and evaluator state; sinks cannot mutate the pipeline.
 */
struct FrameSnapshot {
    std::string cameraId;
    Frame frame;
    std::vector<Track> tracks;
    std::vector<PairState> states;
    std::vector<ZoneEvent> events;
    std::shared_ptr<const ZoneRegistry> zones;
};

std::string zoneEventKindToString(ZoneEventKind kind);
std::string occupancyPhaseToString(OccupancyPhase phase);

/**
 * @brief Serialize an event as one JSON object (event log line format)
 */
nlohmann::json zoneEventToJson(const ZoneEvent& event, const std::string& cameraId = "");

nlohmann::json trackToJson(const Track& track);

} // namespace zwatch
