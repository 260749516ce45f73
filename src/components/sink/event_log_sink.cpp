#include "components/sink/event_log_sink.h"
#include "logger.h"
#include <filesystem>

namespace zwatch {

EventLogSink::EventLogSink(const std::string& id, const std::string& cameraId, const std::string& filePath)
    : SinkComponent(id, cameraId),
      filePath_(filePath),
      eventsWritten_(0) {
}

EventLogSink::~EventLogSink() {
    stop();
}

bool EventLogSink::initialize() {
    if (filePath_.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(fileMutex_);
    std::filesystem::path path(filePath_);
    if (!path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            lastError_ = "Cannot create directory for " + filePath_ + ": " + ec.message();
            LOG_ERROR(logSource("EventLogSink"), lastError_);
            return false;
        }
    }

    file_.open(filePath_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        lastError_ = "Cannot open event log " + filePath_;
        LOG_ERROR(logSource("EventLogSink"), lastError_);
        return false;
    }

    LOG_INFO(logSource("EventLogSink"), "Writing events to " + filePath_);
    return true;
}

bool EventLogSink::start() {
    running_ = true;
    return true;
}

bool EventLogSink::stop() {
    running_ = false;
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
    return true;
}

void EventLogSink::onEvents(const std::vector<ZoneEvent>& events) {
    const std::string logTag = logSource("Events");
    std::lock_guard<std::mutex> lock(fileMutex_);

    for (const auto& event : events) {
        std::string message = "Track " + std::to_string(event.trackId) + " " +
                              (event.kind == ZoneEventKind::ENTER ? "entered" : "left") +
                              " zone '" + event.zoneId + "'";
        if (event.kind == ZoneEventKind::EXIT) {
            message += " after " + std::to_string(event.dwellMs) + " ms";
            if (event.forced) {
                message += " (track lost)";
            }
        }
        LOG_INFO(logTag, message);

        if (file_.is_open()) {
            file_ << zoneEventToJson(event, cameraId_).dump() << '\n';
            ++eventsWritten_;
        }
    }

    if (file_.is_open()) {
        file_.flush();
    }
}

nlohmann::json EventLogSink::getStatus() const {
    auto status = Component::getStatus();
    status["type"] = "event_log";
    status["file"] = filePath_;
    std::lock_guard<std::mutex> lock(fileMutex_);
    status["events_written"] = eventsWritten_;
    return status;
}

} // namespace zwatch
