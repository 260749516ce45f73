#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "camera.h"
#include "pipeline_config.h"
#include "zone_registry.h"
#include "components/source/gstreamer_source.h"
#include "components/processor/person_detector_processor.h"
#include "components/processor/object_tracker_processor.h"
#include "components/processor/zone_evaluator.h"
#include "components/sink/sink_dispatcher.h"

namespace zwatch {

/**
 * @brief Options applied on top of every camera configuration
 */
struct FactoryOptions {
    bool headless = false;      ///< Never create display sinks
};

/**
 * @brief Factory for the components of a camera pipeline
 *
 * Component ids are derived from the camera id ("cam1_source", "cam1_detector", ...).
 * Zone files are loaded once and shared read-only between cameras that use
 * the same file.
 */
class ComponentFactory {
public:
    /**
     * @brief Get the singleton instance of ComponentFactory
     *
     * @return ComponentFactory& The singleton instance
     */
    static ComponentFactory& getInstance();

    void setOptions(const FactoryOptions& options);
    FactoryOptions getOptions() const;

    std::shared_ptr<GStreamerSource> createSource(const CameraConfig& config);

    std::shared_ptr<PersonDetectorProcessor> createDetector(const CameraConfig& config);

    std::shared_ptr<ObjectTrackerProcessor> createTracker(const CameraConfig& config);

    std::shared_ptr<ZoneEvaluator> createZoneEvaluator(const CameraConfig& config);

    /**
     * @brief Create the sink dispatcher with the sinks enabled in the configuration
     *
     * An event log sink is added when sinks.event_log is set, a file sink when
     * sinks.video_file is set, and a display sink when sinks.display is true and
     * the factory is not headless.
     */
    std::unique_ptr<SinkDispatcher> createSinkDispatcher(const CameraConfig& config);

    /**
     * @brief Load (or reuse) the zone registry named by the camera configuration
     *
     * @throws ConfigError if the zone file is missing or invalid
     */
    std::shared_ptr<const ZoneRegistry> loadZones(const CameraConfig& config);

    /**
     * @brief Build a complete camera pipeline
     *
     * @throws ConfigError if the zone file is invalid
     */
    std::shared_ptr<Camera> createCamera(const CameraConfig& config);

    /**
     * @brief Forget cached zone registries
     */
    void clearZoneCache();

private:
    ComponentFactory() = default;
    ComponentFactory(const ComponentFactory&) = delete;
    ComponentFactory& operator=(const ComponentFactory&) = delete;

    mutable std::mutex mutex_;
    FactoryOptions options_;
    std::map<std::string, std::shared_ptr<const ZoneRegistry>> zoneCache_;
};

} // namespace zwatch
