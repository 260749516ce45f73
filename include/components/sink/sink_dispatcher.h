#pragma once

#include "component.h"
#include "pipeline_config.h"
#include "pipeline_types.h"
#include "utils/bounded_queue.h"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Work item handed from the camera loop to the sinks
 */
struct DispatchItem {
    std::vector<ZoneEvent> events;
    std::optional<FrameSnapshot> frame;

    /**
     * @brief Frame-only items may be discarded under backpressure; events never are
     */
    bool droppable() const { return events.empty(); }
};

/**
 * @brief Fans events and frame snapshots out to the camera's sinks
 *
 * Synchronous mode calls every sink inline from the camera loop. Asynchronous
 * mode hands items to a worker thread through a BoundedQueue; frame-only items
 * may be dropped under pressure while event batches are delivered in order.
 */
class SinkDispatcher {
public:
    SinkDispatcher(const std::string& cameraId, const SinksConfig& config);

    ~SinkDispatcher();

    SinkDispatcher(const SinkDispatcher&) = delete;
    SinkDispatcher& operator=(const SinkDispatcher&) = delete;

    void addSink(std::shared_ptr<SinkComponent> sink);

    /**
     * @brief Initialize and start every sink, then the worker in async mode
     *
     * @return true if all sinks started
     */
    bool start();

    /**
     * @brief Deliver the events, then stop the worker and the sinks
     *
     * Queued items are drained before the worker exits.
     */
    void stop();

    /**
     * @brief Whether any sink consumes frame snapshots
     */
    bool wantsFrames() const;

    /**
     * @brief Hand one frame's output to the sinks
     *
     * @param events Events committed for the frame, may be empty
     * @param frame Snapshot for frame sinks, omitted when no sink wants frames
     */
    void dispatch(std::vector<ZoneEvent> events, std::optional<FrameSnapshot> frame);

    nlohmann::json getStatus() const;

    const std::vector<std::shared_ptr<SinkComponent>>& getSinks() const { return sinks_; }

private:
    void workerThread();

    void deliver(const DispatchItem& item);

    std::string cameraId_;
    SinksConfig config_;
    std::vector<std::shared_ptr<SinkComponent>> sinks_;
    BoundedQueue<DispatchItem> queue_;
    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> delivered_;
    std::atomic<uint64_t> sinkErrors_;
};

} // namespace zwatch
