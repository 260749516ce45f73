#include "components/sink/alert_sink.h"
#include "logger.h"
#include "utils/url_utils.h"
#include <algorithm>

namespace zwatch {

AlertSink::AlertSink(const std::string& id, const std::string& cameraId, const AlertConfig& config,
                     std::unique_ptr<AlertTransport> transport)
    : SinkComponent(id, cameraId),
      config_(config),
      transport_(std::move(transport)),
      queue_(std::make_unique<BoundedQueue<AlertRequest>>(static_cast<size_t>(std::max(1, config.queueCapacity)),
                                                          BackpressurePolicy::DROP_NEWEST)),
      alertsSent_(0),
      alertsFailed_(0),
      alertsSuppressed_(0) {
    if (!transport_) {
        transport_ = std::make_unique<HttpAlertTransport>(config_);
    }
}

AlertSink::~AlertSink() {
    stop();
}

bool AlertSink::initialize() {
    LOG_INFO(logSource("AlertSink"), "Alerts for zone entries go to " + utils::maskCredentials(config_.url) +
             " via " + transport_->name() + ", cooldown " + std::to_string(config_.cooldownMs) + " ms");
    return true;
}

bool AlertSink::start() {
    if (running_) {
        return true;
    }
    queue_->reopen();
    running_ = true;
    worker_ = std::thread(&AlertSink::workerThread, this);
    return true;
}

bool AlertSink::stop() {
    running_ = false;
    queue_->close();
    if (worker_.joinable()) {
        worker_.join();
    }
    return true;
}

void AlertSink::onEvents(const std::vector<ZoneEvent>& events) {
    const std::string logTag = logSource("AlertSink");

    for (const auto& event : events) {
        if (event.kind != ZoneEventKind::ENTER) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(cooldownMutex_);
            const auto now = Clock::now();
            auto it = lockedUntil_.find(event.zoneId);
            if (it != lockedUntil_.end() && now < it->second) {
                alertsSuppressed_++;
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(it->second - now);
                LOG_DEBUG(logTag, "Zone '" + event.zoneId + "' cooling down, " +
                          std::to_string(remaining.count()) + " ms left");
                continue;
            }
            lockedUntil_[event.zoneId] = now + std::chrono::milliseconds(config_.cooldownMs);
        }

        AlertRequest request;
        request.cameraId = cameraId_;
        request.zoneId = event.zoneId;
        request.trackId = event.trackId;
        request.timestampMs = event.timestampMs;
        request.payload = zoneEventToJson(event, cameraId_);

        LOG_INFO(logTag, "Track " + std::to_string(event.trackId) + " entered zone '" + event.zoneId +
                 "', queueing alert");
        const auto result = queue_->push(std::move(request));
        if (result == BoundedQueue<AlertRequest>::PushResult::DROPPED_NEW ||
            result == BoundedQueue<AlertRequest>::PushResult::CLOSED) {
            alertsFailed_++;
            LOG_WARN(logTag, "Alert for zone '" + event.zoneId + "' not queued (" +
                     (result == BoundedQueue<AlertRequest>::PushResult::CLOSED ? "stopped" : "queue full") + ")");
            unlockZone(event.zoneId);
        }
    }
}

void AlertSink::workerThread() {
    const std::string logTag = logSource("AlertSink");
    LOG_DEBUG(logTag, "Alert worker started");

    while (auto request = queue_->pop()) {
        bool delivered = false;
        try {
            delivered = transport_->send(*request);
        } catch (const std::exception& e) {
            LOG_ERROR(logTag, std::string("Alert transport raised: ") + e.what());
        }

        if (delivered) {
            alertsSent_++;
            LOG_INFO(logTag, "Alert for zone '" + request->zoneId + "' delivered");
        } else {
            alertsFailed_++;
            LOG_ERROR(logTag, "Alert for zone '" + request->zoneId + "' failed: " + transport_->getLastError());
            unlockZone(request->zoneId);
        }
    }

    LOG_DEBUG(logTag, "Alert worker exiting");
}

void AlertSink::unlockZone(const std::string& zoneId) {
    std::lock_guard<std::mutex> lock(cooldownMutex_);
    lockedUntil_.erase(zoneId);
}

std::chrono::milliseconds AlertSink::cooldownRemaining(const std::string& zoneId) const {
    std::lock_guard<std::mutex> lock(cooldownMutex_);
    auto it = lockedUntil_.find(zoneId);
    if (it == lockedUntil_.end()) {
        return std::chrono::milliseconds(0);
    }
    const auto now = Clock::now();
    if (now >= it->second) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(it->second - now);
}

nlohmann::json AlertSink::getStatus() const {
    auto status = Component::getStatus();
    status["type"] = "alert";
    status["url"] = utils::maskCredentials(config_.url);
    status["transport"] = transport_->name();
    status["cooldown_ms"] = config_.cooldownMs;
    status["alerts_sent"] = alertsSent_.load();
    status["alerts_failed"] = alertsFailed_.load();
    status["alerts_suppressed"] = alertsSuppressed_.load();
    status["queued"] = queue_->size();

    nlohmann::json cooling = nlohmann::json::object();
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(cooldownMutex_);
    for (const auto& entry : lockedUntil_) {
        if (now < entry.second) {
            cooling[entry.first] = std::chrono::duration_cast<std::chrono::milliseconds>(entry.second - now).count();
        }
    }
    status["cooldown_remaining_ms"] = cooling;
    return status;
}

} // namespace zwatch
