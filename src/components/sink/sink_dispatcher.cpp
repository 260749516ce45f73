#include "components/sink/sink_dispatcher.h"
#include "logger.h"

namespace zwatch {

SinkDispatcher::SinkDispatcher(const std::string& cameraId, const SinksConfig& config)
    : cameraId_(cameraId),
      config_(config),
      queue_(static_cast<size_t>(config.queueCapacity), config.backpressure,
             [](const DispatchItem& item) { return item.droppable(); }),
      running_(false),
      delivered_(0),
      sinkErrors_(0) {
}

SinkDispatcher::~SinkDispatcher() {
    stop();
}

void SinkDispatcher::addSink(std::shared_ptr<SinkComponent> sink) {
    sinks_.push_back(std::move(sink));
}

bool SinkDispatcher::start() {
    const std::string logTag = "SinkDispatcher[" + cameraId_ + "]";
    for (const auto& sink : sinks_) {
        if (!sink->initialize() || !sink->start()) {
            LOG_ERROR(logTag, "Failed to start sink " + sink->getId() + ": " + sink->getLastError());
            return false;
        }
    }

    running_ = true;
    queue_.reopen();
    if (config_.async) {
        worker_ = std::thread(&SinkDispatcher::workerThread, this);
    }
    LOG_INFO(logTag, "Started " + std::to_string(sinks_.size()) + " sink(s), " +
             (config_.async ? "async, queue " + std::to_string(config_.queueCapacity) + ", " +
                              backpressurePolicyToString(config_.backpressure)
                            : std::string("sync")));
    return true;
}

void SinkDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }

    for (const auto& sink : sinks_) {
        sink->stop();
    }
    LOG_INFO("SinkDispatcher[" + cameraId_ + "]", "Stopped after delivering " +
             std::to_string(delivered_.load()) + " item(s), " + std::to_string(queue_.droppedCount()) +
             " frame(s) dropped");
}

bool SinkDispatcher::wantsFrames() const {
    for (const auto& sink : sinks_) {
        if (sink->wantsFrames()) {
            return true;
        }
    }
    return false;
}

void SinkDispatcher::dispatch(std::vector<ZoneEvent> events, std::optional<FrameSnapshot> frame) {
    if (events.empty() && !frame) {
        return;
    }

    DispatchItem item{std::move(events), std::move(frame)};
    if (!config_.async) {
        deliver(item);
        return;
    }

    const auto result = queue_.push(std::move(item));
    if (result == BoundedQueue<DispatchItem>::PushResult::CLOSED) {
        LOG_WARN("SinkDispatcher[" + cameraId_ + "]", "Dispatch after stop ignored");
    }
}

void SinkDispatcher::workerThread() {
    LOG_DEBUG("SinkDispatcher[" + cameraId_ + "]", "Worker thread started");
    while (auto item = queue_.pop()) {
        deliver(*item);
    }
    LOG_DEBUG("SinkDispatcher[" + cameraId_ + "]", "Worker thread exiting");
}

void SinkDispatcher::deliver(const DispatchItem& item) {
    for (const auto& sink : sinks_) {
        try {
            if (!item.events.empty()) {
                sink->onEvents(item.events);
            }
            if (item.frame && sink->wantsFrames()) {
                sink->onFrame(*item.frame);
            }
        } catch (const std::exception& e) {
            sinkErrors_++;
            LOG_ERROR("SinkDispatcher[" + cameraId_ + "]", "Sink " + sink->getId() + " failed: " + e.what());
        }
    }
    delivered_++;
}

nlohmann::json SinkDispatcher::getStatus() const {
    nlohmann::json status;
    status["mode"] = config_.async ? "async" : "sync";
    status["backpressure"] = backpressurePolicyToString(config_.backpressure);
    status["queue_capacity"] = queue_.capacity();
    status["queued"] = queue_.size();
    status["dropped_frames"] = queue_.droppedCount();
    status["delivered"] = delivered_.load();
    status["sink_errors"] = sinkErrors_.load();
    nlohmann::json sinks = nlohmann::json::array();
    for (const auto& sink : sinks_) {
        sinks.push_back(sink->getStatus());
    }
    status["sinks"] = sinks;
    return status;
}

} // namespace zwatch
