#include "components/processor/object_tracker_processor.h"
#include "logger.h"
#include <algorithm>
#include <stdexcept>

namespace zwatch {

ObjectTrackerProcessor::ObjectTrackerProcessor(const std::string& id, const std::string& cameraId,
                                               const TrackerConfig& config)
    : ProcessorComponent(id, cameraId),
      config_(config),
      nextTrackId_(1),
      processedFrames_(0),
      totalCreated_(0),
      totalDeleted_(0),
      activeTracks_(0) {
}

ObjectTrackerProcessor::~ObjectTrackerProcessor() {
    stop();
}

bool ObjectTrackerProcessor::initialize() {
    LOG_INFO(logSource("ObjectTracker"), "Tracker ready (iou >= " + std::to_string(config_.iouThreshold) +
             ", grace period " + std::to_string(config_.gracePeriod) + " frames, anchor " +
             PositionToString(config_.anchor) + ")");
    running_ = true;
    return true;
}

float ObjectTrackerProcessor::iou(const cv::Rect2f& a, const cv::Rect2f& b) {
    const float intersection = (a & b).area();
    if (intersection <= 0.0f) {
        return 0.0f;
    }
    const float unionArea = a.area() + b.area() - intersection;
    return unionArea > 0.0f ? intersection / unionArea : 0.0f;
}

cv::Rect2f ObjectTrackerProcessor::predictBox(const Track& track) {
    const float steps = static_cast<float>(track.framesSinceMatched + 1);
    return cv::Rect2f(track.bbox.x + track.velocity.x * steps,
                      track.bbox.y + track.velocity.y * steps,
                      track.bbox.width, track.bbox.height);
}

cv::Point2f ObjectTrackerProcessor::referencePoint(const cv::Rect2f& box) const {
    return anchorPoint(box, config_.anchor, config_.anchorOffset);
}

std::vector<TrackAssignment> ObjectTrackerProcessor::assign(const std::vector<Detection>& detections) const {
    std::vector<TrackAssignment> candidates;
    for (const auto& entry : tracks_) {
        const cv::Rect2f predicted = predictBox(entry.second);
        for (size_t j = 0; j < detections.size(); ++j) {
            const float overlap = iou(predicted, detections[j].bbox);
            if (overlap >= config_.iouThreshold) {
                candidates.push_back({entry.first, j, overlap});
            }
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const TrackAssignment& a, const TrackAssignment& b) {
                  if (a.iou != b.iou) return a.iou > b.iou;
                  if (a.trackId != b.trackId) return a.trackId < b.trackId;
                  return a.detectionIndex < b.detectionIndex;
              });

    std::vector<TrackAssignment> assignments;
    std::vector<bool> detectionUsed(detections.size(), false);
    std::vector<int> trackUsed;
    for (const auto& candidate : candidates) {
        if (detectionUsed[candidate.detectionIndex] ||
            std::find(trackUsed.begin(), trackUsed.end(), candidate.trackId) != trackUsed.end()) {
            continue;
        }
        detectionUsed[candidate.detectionIndex] = true;
        trackUsed.push_back(candidate.trackId);
        assignments.push_back(candidate);
    }
    return assignments;
}

void ObjectTrackerProcessor::insertTrack(Track track) {
    const int trackId = track.trackId;
    if (tracks_.count(trackId) != 0) {
        const std::string message = "Track id " + std::to_string(trackId) + " is already live";
        LOG_FATAL(logSource("ObjectTracker"), message);
        throw std::logic_error(message);
    }
    tracks_.emplace(trackId, std::move(track));
}

TrackerUpdate ObjectTrackerProcessor::update(const std::vector<Detection>& detections, int64_t timestampMs) {
    const std::string logTag = logSource("ObjectTracker");
    TrackerUpdate result;
    result.assignments = assign(detections);

    std::vector<bool> detectionMatched(detections.size(), false);
    std::vector<int> matchedTrackIds;

    for (const auto& assignment : result.assignments) {
        Track& track = tracks_.at(assignment.trackId);
        const Detection& detection = detections[assignment.detectionIndex];

        const float steps = static_cast<float>(track.framesSinceMatched + 1);
        track.velocity = cv::Point2f((detection.bbox.x - track.bbox.x) / steps,
                                     (detection.bbox.y - track.bbox.y) / steps);
        track.bbox = detection.bbox;
        track.referencePoint = referencePoint(detection.bbox);
        track.history.push_back(track.referencePoint);
        while (track.history.size() > static_cast<size_t>(config_.historyLength)) {
            track.history.pop_front();
        }
        track.framesSinceMatched = 0;
        track.hits++;
        track.confidence = detection.confidence;
        track.lastMatchedAtMs = timestampMs;

        detectionMatched[assignment.detectionIndex] = true;
        matchedTrackIds.push_back(assignment.trackId);
    }

    // Age unmatched tracks; delete those past the grace period
    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (std::find(matchedTrackIds.begin(), matchedTrackIds.end(), it->first) != matchedTrackIds.end()) {
            ++it;
            continue;
        }
        it->second.framesSinceMatched++;
        if (it->second.framesSinceMatched > config_.gracePeriod) {
            LOG_DEBUG(logTag, "Track " + std::to_string(it->first) + " deleted after " +
                      std::to_string(it->second.framesSinceMatched) + " missed frames");
            result.deletedTrackIds.push_back(it->first);
            it = tracks_.erase(it);
        } else {
            ++it;
        }
    }

    // Spawn tracks for unmatched detections that are not duplicates of a matched box
    for (size_t j = 0; j < detections.size(); ++j) {
        if (detectionMatched[j]) {
            continue;
        }

        bool duplicate = false;
        for (size_t k = 0; k < detections.size(); ++k) {
            if (detectionMatched[k] && iou(detections[j].bbox, detections[k].bbox) > config_.duplicateIouThreshold) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            result.suppressedDuplicates++;
            continue;
        }

        Track track;
        track.trackId = nextTrackId_++;
        track.bbox = detections[j].bbox;
        track.referencePoint = referencePoint(detections[j].bbox);
        track.history.push_back(track.referencePoint);
        track.velocity = cv::Point2f(0.0f, 0.0f);
        track.framesSinceMatched = 0;
        track.hits = 1;
        track.confidence = detections[j].confidence;
        track.createdAtMs = timestampMs;
        track.lastMatchedAtMs = timestampMs;

        result.createdTrackIds.push_back(track.trackId);
        LOG_DEBUG(logTag, "Track " + std::to_string(track.trackId) + " created");
        insertTrack(std::move(track));
    }

    result.tracks = liveTracks();

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        processedFrames_++;
        totalCreated_ += result.createdTrackIds.size();
        totalDeleted_ += result.deletedTrackIds.size();
        activeTracks_ = tracks_.size();
    }

    return result;
}

std::vector<Track> ObjectTrackerProcessor::liveTracks() const {
    std::vector<Track> tracks;
    tracks.reserve(tracks_.size());
    for (const auto& entry : tracks_) {
        tracks.push_back(entry.second);
    }
    return tracks;
}

void ObjectTrackerProcessor::reset() {
    tracks_.clear();
    std::lock_guard<std::mutex> lock(statsMutex_);
    activeTracks_ = 0;
}

nlohmann::json ObjectTrackerProcessor::getStatus() const {
    auto status = Component::getStatus();
    status["iou_threshold"] = config_.iouThreshold;
    status["grace_period"] = config_.gracePeriod;
    status["anchor"] = PositionToString(config_.anchor);

    std::lock_guard<std::mutex> lock(statsMutex_);
    status["processed_frames"] = processedFrames_;
    status["active_tracks"] = activeTracks_;
    status["total_tracks_created"] = totalCreated_;
    status["total_tracks_deleted"] = totalDeleted_;
    return status;
}

} // namespace zwatch
