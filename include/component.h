#pragma once

#include "pipeline_types.h"
#include <atomic>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace zwatch {

/**
 * @brief Base component type
 */
enum class ComponentType {
    SOURCE,
    PROCESSOR,
    SINK
};

/**
 * @brief Base class for all pipeline components
 */
class Component {
public:
    /**
     * @brief Construct a new Component object
     *
     * @param id Unique identifier for the component
     * @param type Component type (source, processor, sink)
     * @param cameraId Id of the owning camera, used in log sources
     */
    Component(const std::string& id, ComponentType type, const std::string& cameraId);

    virtual ~Component();

    std::string getId() const;

    ComponentType getType() const;

    std::string getCameraId() const;

    /**
     * @brief Initialize the component
     *
     * @return true if initialization succeeded, false otherwise
     */
    virtual bool initialize() = 0;

    /**
     * @brief Start the component
     *
     * @return true if start succeeded, false otherwise
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the component
     *
     * @return true if stop succeeded, false otherwise
     */
    virtual bool stop() = 0;

    bool isRunning() const;

    /**
     * @brief Get component status
     *
     * @return nlohmann::json Component status
     */
    virtual nlohmann::json getStatus() const;

    /**
     * @brief Get the last error recorded by the component
     */
    std::string getLastError() const;

protected:
    /**
     * @brief Logger source tag, e.g. "GStreamerSource[cam1]"
     */
    std::string logSource(const std::string& name) const;

    std::string id_;               ///< Component ID
    ComponentType type_;           ///< Component type
    std::string cameraId_;         ///< Owning camera
    std::atomic<bool> running_;    ///< Whether component is running
    std::string lastError_;        ///< Last error message
};

/**
 * @brief Source component (camera input)
 */
class SourceComponent : public Component {
public:
    SourceComponent(const std::string& id, const std::string& cameraId);
    ~SourceComponent() override;

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }
};

/**
 * @brief Processor component (analytics)
 */
class ProcessorComponent : public Component {
public:
    ProcessorComponent(const std::string& id, const std::string& cameraId);
    ~ProcessorComponent() override;

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }
};

/**
 * @brief Sink component (output)
 *
 * Sinks receive committed events and const frame snapshots. They are called
 * from a single thread, either the camera loop or the dispatcher worker.
 */
class SinkComponent : public Component {
public:
    SinkComponent(const std::string& id, const std::string& cameraId);
    ~SinkComponent() override;

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }

    /**
     * @brief Receive the events committed for one frame, in emission order
     */
    virtual void onEvents(const std::vector<ZoneEvent>& events) = 0;

    /**
     * @brief Receive a processed frame with its tracks and occupancy states
     */
    virtual void onFrame(const FrameSnapshot& snapshot) = 0;

    /**
     * @brief Whether this sink needs frame snapshots at all
     */
    virtual bool wantsFrames() const { return true; }
};

} // namespace zwatch
