#pragma once

#include "component.h"
#include "pipeline_config.h"
#include "pipeline_types.h"
#include <opencv2/core.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief One (track, detection) pairing chosen for a frame
 */
struct TrackAssignment {
    int trackId;
    size_t detectionIndex;
    float iou;
};

/**
 * @brief Outcome of one tracker update
 */
struct TrackerUpdate {
    std::vector<Track> tracks;                    ///< Live tracks after the update, ascending id
    std::vector<TrackAssignment> assignments;     ///< Matched pairs for this frame
    std::vector<int> createdTrackIds;
    std::vector<int> deletedTrackIds;             ///< Tracks that exceeded the grace period this frame
    size_t suppressedDuplicates = 0;              ///< Unmatched detections dropped as duplicate boxes
};

/**
 * @brief IoU tracker keeping persistent person identities
 *
 * Live tracks are held in an id-keyed arena. Each update matches detections
 * against constant-velocity predictions of the live tracks, greedily by
 * descending IoU, and produces an explicit assignment list. Ids come from a
 * monotonic counter and are never reused.
 */
class ObjectTrackerProcessor : public ProcessorComponent {
public:
    ObjectTrackerProcessor(const std::string& id, const std::string& cameraId,
                           const TrackerConfig& config);

    ~ObjectTrackerProcessor() override;

    bool initialize() override;

    /**
     * @brief Advance the tracker by one frame
     *
     * @param detections Person detections of the frame, empty on a missed frame
     * @param timestampMs Frame timestamp
     * @return TrackerUpdate Live tracks plus what changed
     */
    TrackerUpdate update(const std::vector<Detection>& detections, int64_t timestampMs);

    /**
     * @brief Compute the greedy assignment without mutating any track
     *
     * Pairs with IoU >= iou_threshold are ranked by IoU descending; ties go to
     * the lower track id, then the lower detection index.
     */
    std::vector<TrackAssignment> assign(const std::vector<Detection>& detections) const;

    /**
     * @brief Live tracks in ascending id order
     */
    std::vector<Track> liveTracks() const;

    /**
     * @brief Box a track is expected at in the next frame
     *
     * Last box shifted by velocity * (framesSinceMatched + 1).
     */
    static cv::Rect2f predictBox(const Track& track);

    static float iou(const cv::Rect2f& a, const cv::Rect2f& b);

    nlohmann::json getStatus() const override;

    /**
     * @brief Drop all tracks; the id counter keeps counting
     */
    void reset();

private:
    void insertTrack(Track track);

    cv::Point2f referencePoint(const cv::Rect2f& box) const;

    TrackerConfig config_;
    std::map<int, Track> tracks_;      ///< Live tracks keyed by id
    int nextTrackId_;

    mutable std::mutex statsMutex_;
    uint64_t processedFrames_;
    uint64_t totalCreated_;
    uint64_t totalDeleted_;
    size_t activeTracks_;
};

} // namespace zwatch
