#pragma once

#include "component.h"
#include "pipeline_types.h"
#include "zone_registry.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Per-zone counters
 */
struct ZoneStats {
    uint64_t enterCount = 0;
    uint64_t exitCount = 0;
    int currentOccupancy = 0;   ///< Pairs currently INSIDE or EXITING
};

/**
 * @brief A track currently inside a zone and how long it has been there
 */
struct OccupancyEntry {
    int trackId;
    int64_t dwellMs;
};

/**
 * @brief Debounced zone occupancy state machine
 *
 * Keeps one ZoneOccupancyState per (zone, track) pair and is the only producer
 * of ZoneEvents. A transition is committed after debounceFrames consecutive
 * frames agree. Pairs whose track disappeared from the live list are closed in
 * the same call: a forced exit when an enter was published, silently otherwise.
 */
class ZoneEvaluator : public ProcessorComponent {
public:
    /**
     * @param debounceFrames Consecutive frames needed to commit a transition (K >= 1)
     * @throws std::invalid_argument if debounceFrames < 1
     */
    ZoneEvaluator(const std::string& id, const std::string& cameraId, int debounceFrames);

    ~ZoneEvaluator() override;

    /**
     * @brief Evaluate one frame
     *
     * Events are ordered by zone (registry order), then track id, followed by
     * forced exits in the same order.
     *
     * @param zones Zone registry
     * @param tracks Live tracks after the tracker update
     * @param timestampMs Frame timestamp
     * @param frameSequence Frame sequence number, copied into events
     * @return std::vector<ZoneEvent> Committed events
     */
    std::vector<ZoneEvent> evaluate(const ZoneRegistry& zones,
                                    const std::vector<Track>& tracks,
                                    int64_t timestampMs,
                                    uint64_t frameSequence = 0);

    /**
     * @brief Copy of every tracked pair state
     */
    std::vector<PairState> snapshot() const;

    /**
     * @brief Tracks inside a zone with their dwell time at timestampMs
     */
    std::vector<OccupancyEntry> occupancy(const std::string& zoneId, int64_t timestampMs) const;

    ZoneStats zoneStats(const std::string& zoneId) const;

    size_t pairCount() const;

    int getDebounceFrames() const { return debounceFrames_; }

    nlohmann::json getStatus() const override;

private:
    using PairKey = std::pair<std::string, int>;

    /**
     * @return true if the step committed a transition
     */
    bool step(ZoneOccupancyState& state, bool contained);

    ZoneEvent makeEvent(const std::string& zoneId, int trackId, ZoneEventKind kind,
                        const ZoneOccupancyState& state, int64_t timestampMs,
                        uint64_t frameSequence, bool forced) const;

    int debounceFrames_;
    std::map<PairKey, ZoneOccupancyState> pairs_;
    std::map<std::string, ZoneStats> stats_;
    mutable std::mutex mutex_;
};

} // namespace zwatch
