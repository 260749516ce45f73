#include "component_factory.h"
#include "components/sink/alert_sink.h"
#include "components/sink/display_sink.h"
#include "components/sink/event_log_sink.h"
#include "components/sink/file_sink.h"
#include "logger.h"

namespace zwatch {

ComponentFactory& ComponentFactory::getInstance() {
    static ComponentFactory instance;
    return instance;
}

void ComponentFactory::setOptions(const FactoryOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
}

FactoryOptions ComponentFactory::getOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

std::shared_ptr<GStreamerSource> ComponentFactory::createSource(const CameraConfig& config) {
    return std::make_shared<GStreamerSource>(config.id + "_source", config.id, config.source);
}

std::shared_ptr<PersonDetectorProcessor> ComponentFactory::createDetector(const CameraConfig& config) {
    return std::make_shared<PersonDetectorProcessor>(config.id + "_detector", config.id, config.detector);
}

std::shared_ptr<ObjectTrackerProcessor> ComponentFactory::createTracker(const CameraConfig& config) {
    return std::make_shared<ObjectTrackerProcessor>(config.id + "_tracker", config.id, config.tracker);
}

std::shared_ptr<ZoneEvaluator> ComponentFactory::createZoneEvaluator(const CameraConfig& config) {
    return std::make_shared<ZoneEvaluator>(config.id + "_zones", config.id, config.zones.debounceFrames);
}

std::unique_ptr<SinkDispatcher> ComponentFactory::createSinkDispatcher(const CameraConfig& config) {
    const FactoryOptions options = getOptions();
    auto dispatcher = std::make_unique<SinkDispatcher>(config.id, config.sinks);

    if (!config.sinks.eventLog.empty()) {
        dispatcher->addSink(std::make_shared<EventLogSink>(config.id + "_event_log", config.id,
                                                           config.sinks.eventLog));
    }
    if (!config.sinks.videoFile.empty()) {
        dispatcher->addSink(std::make_shared<FileSink>(config.id + "_video", config.id,
                                                       config.sinks.videoFile));
    }
    if (config.sinks.alert.enabled) {
        dispatcher->addSink(std::make_shared<AlertSink>(config.id + "_alert", config.id, config.sinks.alert,
                                                        std::make_unique<HttpAlertTransport>(config.sinks.alert)));
    }
    if (config.sinks.display) {
        if (options.headless) {
            LOG_INFO("ComponentFactory", "Display sink disabled for camera " + config.id + " (headless)");
        } else {
            dispatcher->addSink(std::make_shared<DisplaySink>(config.id + "_display", config.id,
                                                              "ZoneWatch - " + config.name));
        }
    }
    return dispatcher;
}

std::shared_ptr<const ZoneRegistry> ComponentFactory::loadZones(const CameraConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = zoneCache_.find(config.zones.file);
    if (it != zoneCache_.end()) {
        return it->second;
    }
    auto zones = ZoneRegistry::loadFromFile(config.zones.file);
    zoneCache_[config.zones.file] = zones;
    return zones;
}

std::shared_ptr<Camera> ComponentFactory::createCamera(const CameraConfig& config) {
    auto zones = loadZones(config);
    auto camera = std::make_shared<Camera>(config,
                                           createSource(config),
                                           createDetector(config),
                                           createTracker(config),
                                           createZoneEvaluator(config),
                                           zones,
                                           createSinkDispatcher(config));
    LOG_DEBUG("ComponentFactory", "Created camera " + config.id + " with " +
              std::to_string(zones->size()) + " zone(s) from " + config.zones.file);
    return camera;
}

void ComponentFactory::clearZoneCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    zoneCache_.clear();
}

} // namespace zwatch
