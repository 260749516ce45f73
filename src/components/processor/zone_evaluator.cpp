#include "components/processor/zone_evaluator.h"
#include "logger.h"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <unordered_set>

namespace zwatch {

ZoneEvaluator::ZoneEvaluator(const std::string& id, const std::string& cameraId, int debounceFrames)
    : ProcessorComponent(id, cameraId),
      debounceFrames_(debounceFrames) {
    if (debounceFrames_ < 1) {
        throw std::invalid_argument("debounce_frames must be >= 1");
    }
}

ZoneEvaluator::~ZoneEvaluator() {
    stop();
}

bool ZoneEvaluator::step(ZoneOccupancyState& state, bool contained) {
    switch (state.phase) {
        case OccupancyPhase::OUTSIDE:
            if (contained) {
                state.phase = OccupancyPhase::ENTERING;
                state.counter = 1;
            }
            break;
        case OccupancyPhase::ENTERING:
            if (contained) {
                state.counter++;
            } else {
                state.phase = OccupancyPhase::OUTSIDE;
                state.counter = 0;
            }
            break;
        case OccupancyPhase::INSIDE:
            if (!contained) {
                state.phase = OccupancyPhase::EXITING;
                state.counter = 1;
            }
            break;
        case OccupancyPhase::EXITING:
            if (contained) {
                state.phase = OccupancyPhase::INSIDE;
                state.counter = 0;
            } else {
                state.counter++;
            }
            break;
    }

    if (state.counter >= debounceFrames_) {
        state.phase = state.phase == OccupancyPhase::ENTERING ? OccupancyPhase::INSIDE : OccupancyPhase::OUTSIDE;
        state.counter = 0;
        return true;
    }
    return false;
}

ZoneEvent ZoneEvaluator::makeEvent(const std::string& zoneId, int trackId, ZoneEventKind kind,
                                   const ZoneOccupancyState& state, int64_t timestampMs,
                                   uint64_t frameSequence, bool forced) const {
    ZoneEvent event;
    event.zoneId = zoneId;
    event.trackId = trackId;
    event.kind = kind;
    event.timestampMs = timestampMs;
    event.frameSequence = frameSequence;
    event.forced = forced;
    event.location = state.lastPoint;
    if (kind == ZoneEventKind::EXIT) {
        event.dwellMs = std::max<int64_t>(0, timestampMs - state.enteredAtMs);
    }
    return event;
}

std::vector<ZoneEvent> ZoneEvaluator::evaluate(const ZoneRegistry& zones,
                                               const std::vector<Track>& tracks,
                                               int64_t timestampMs,
                                               uint64_t frameSequence) {
    const std::string logTag = logSource("ZoneEvaluator");
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ZoneEvent> events;

    std::vector<const Track*> ordered;
    ordered.reserve(tracks.size());
    std::unordered_set<int> liveIds;
    for (const auto& track : tracks) {
        ordered.push_back(&track);
        liveIds.insert(track.trackId);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Track* a, const Track* b) { return a->trackId < b->trackId; });

    for (const auto& zone : zones.listZones()) {
        ZoneStats& stats = stats_[zone.getId()];

        for (const Track* track : ordered) {
            const PairKey key(zone.getId(), track->trackId);
            const bool contained = zone.containsPoint(track->referencePoint);

            auto it = pairs_.find(key);
            if (it == pairs_.end()) {
                if (!contained) {
                    continue;
                }
                it = pairs_.emplace(key, ZoneOccupancyState()).first;
            }

            ZoneOccupancyState& state = it->second;
            state.lastUpdateMs = timestampMs;
            state.lastPoint = track->referencePoint;

            if (step(state, contained)) {
                if (state.phase == OccupancyPhase::INSIDE) {
                    state.enteredAtMs = timestampMs;
                    stats.enterCount++;
                    stats.currentOccupancy++;
                    events.push_back(makeEvent(zone.getId(), track->trackId, ZoneEventKind::ENTER,
                                               state, timestampMs, frameSequence, false));
                } else {
                    stats.exitCount++;
                    stats.currentOccupancy--;
                    events.push_back(makeEvent(zone.getId(), track->trackId, ZoneEventKind::EXIT,
                                               state, timestampMs, frameSequence, false));
                }
                LOG_DEBUG(logTag, "Track " + std::to_string(track->trackId) + " " +
                          zoneEventKindToString(events.back().kind) + " zone " + zone.getId());
            }

            if (state.phase == OccupancyPhase::OUTSIDE) {
                pairs_.erase(it);
            }
        }
    }

    // Pairs whose track is gone: close them in registry order, then by track id
    for (const auto& zone : zones.listZones()) {
        ZoneStats& stats = stats_[zone.getId()];
        auto it = pairs_.lower_bound(PairKey(zone.getId(), INT_MIN));
        while (it != pairs_.end() && it->first.first == zone.getId()) {
            const int trackId = it->first.second;
            if (liveIds.count(trackId) != 0) {
                ++it;
                continue;
            }

            const ZoneOccupancyState& state = it->second;
            if (state.phase == OccupancyPhase::INSIDE || state.phase == OccupancyPhase::EXITING) {
                stats.exitCount++;
                stats.currentOccupancy--;
                events.push_back(makeEvent(zone.getId(), trackId, ZoneEventKind::EXIT,
                                           state, timestampMs, frameSequence, true));
                LOG_DEBUG(logTag, "Track " + std::to_string(trackId) + " lost inside zone " +
                          zone.getId() + ", forced exit");
            }
            it = pairs_.erase(it);
        }
    }

    return events;
}

std::vector<PairState> ZoneEvaluator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PairState> states;
    states.reserve(pairs_.size());
    for (const auto& entry : pairs_) {
        states.push_back(PairState{entry.first.first, entry.first.second, entry.second});
    }
    return states;
}

std::vector<OccupancyEntry> ZoneEvaluator::occupancy(const std::string& zoneId, int64_t timestampMs) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OccupancyEntry> entries;
    auto it = pairs_.lower_bound(PairKey(zoneId, INT_MIN));
    for (; it != pairs_.end() && it->first.first == zoneId; ++it) {
        const auto phase = it->second.phase;
        if (phase == OccupancyPhase::INSIDE || phase == OccupancyPhase::EXITING) {
            entries.push_back(OccupancyEntry{it->first.second,
                                             std::max<int64_t>(0, timestampMs - it->second.enteredAtMs)});
        }
    }
    return entries;
}

ZoneStats ZoneEvaluator::zoneStats(const std::string& zoneId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stats_.find(zoneId);
    return it != stats_.end() ? it->second : ZoneStats();
}

size_t ZoneEvaluator::pairCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairs_.size();
}

nlohmann::json ZoneEvaluator::getStatus() const {
    auto status = Component::getStatus();
    status["debounce_frames"] = debounceFrames_;

    std::lock_guard<std::mutex> lock(mutex_);
    status["tracked_pairs"] = pairs_.size();
    nlohmann::json zones = nlohmann::json::object();
    for (const auto& entry : stats_) {
        zones[entry.first] = {
            {"enter_count", entry.second.enterCount},
            {"exit_count", entry.second.exitCount},
            {"current_occupancy", entry.second.currentOccupancy}
        };
    }
    status["zones"] = zones;
    return status;
}

} // namespace zwatch
