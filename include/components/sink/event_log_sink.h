#pragma once

#include "component.h"
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Appends zone events to a JSON Lines file and logs each one
 *
 * An empty path disables the file; events are still logged.
 */
class EventLogSink : public SinkComponent {
public:
    EventLogSink(const std::string& id, const std::string& cameraId, const std::string& filePath);

    ~EventLogSink() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;

    void onEvents(const std::vector<ZoneEvent>& events) override;
    void onFrame(const FrameSnapshot&) override {}
    bool wantsFrames() const override { return false; }

    nlohmann::json getStatus() const override;

    std::string getFilePath() const { return filePath_; }

private:
    std::string filePath_;
    std::ofstream file_;
    mutable std::mutex fileMutex_;
    uint64_t eventsWritten_;
};

} // namespace zwatch
