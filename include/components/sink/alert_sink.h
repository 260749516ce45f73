#pragma once

#include "component.h"
#include "components/sink/alert_transport.h"
#include "pipeline_config.h"
#include "utils/bounded_queue.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Sends an alert when a person enters a zone
 *
 * Only Enter events raise alerts. Each alerted zone is locked for the
 * configured cooldown and further Enter events for it are suppressed until
 * the lock expires. Delivery runs on a worker thread so a slow receiver never
 * stalls the other sinks. A failed delivery unlocks the zone again.
 */
class AlertSink : public SinkComponent {
public:
    AlertSink(const std::string& id, const std::string& cameraId, const AlertConfig& config,
              std::unique_ptr<AlertTransport> transport);

    ~AlertSink() override;

    bool initialize() override;
    bool start() override;

    /**
     * @brief Deliver the queued alerts, then stop the worker
     */
    bool stop() override;

    void onEvents(const std::vector<ZoneEvent>& events) override;
    void onFrame(const FrameSnapshot&) override {}
    bool wantsFrames() const override { return false; }

    /**
     * @brief Time left before the zone may alert again, zero when unlocked
     */
    std::chrono::milliseconds cooldownRemaining(const std::string& zoneId) const;

    nlohmann::json getStatus() const override;

private:
    using Clock = std::chrono::steady_clock;

    void workerThread();
    void unlockZone(const std::string& zoneId);

    AlertConfig config_;
    std::unique_ptr<AlertTransport> transport_;
    std::unique_ptr<BoundedQueue<AlertRequest>> queue_;
    std::thread worker_;

    mutable std::mutex cooldownMutex_;
    std::map<std::string, Clock::time_point> lockedUntil_;

    std::atomic<uint64_t> alertsSent_;
    std::atomic<uint64_t> alertsFailed_;
    std::atomic<uint64_t> alertsSuppressed_;
};

} // namespace zwatch
