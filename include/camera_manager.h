#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "camera.h"
#include "pipeline_config.h"

namespace zwatch {

/**
 * @brief Owns every camera pipeline of the process
 *
 * Cameras are independent: a camera that fails to start or hits a fatal
 * stream error is logged and left in state FAILED while the others continue.
 */
class CameraManager {
public:
    CameraManager() = default;
    ~CameraManager();

    CameraManager(const CameraManager&) = delete;
    CameraManager& operator=(const CameraManager&) = delete;

    /**
     * @brief Build one camera per configuration through ComponentFactory
     *
     * @throws ConfigError on a duplicate camera id or an invalid zone file
     */
    void createCameras(const std::vector<CameraConfig>& configs);

    /**
     * @brief Register an already built camera
     *
     * @return false if a camera with the same id exists
     */
    bool addCamera(std::shared_ptr<Camera> camera);

    std::shared_ptr<Camera> getCamera(const std::string& id) const;

    std::vector<std::shared_ptr<Camera>> getAllCameras() const;

    /**
     * @brief Start every camera
     *
     * @return size_t Number of cameras that started
     */
    size_t startAll();

    /**
     * @brief Ask every camera to stop; does not block
     */
    void requestStopAll();

    /**
     * @brief Stop every camera and wait for its thread
     */
    void stopAll();

    /**
     * @brief Block until every camera thread has exited
     */
    void waitAll();

    /**
     * @brief True if at least one camera exists and all of them are FAILED
     */
    bool allFailed() const;

    nlohmann::json status() const;

private:
    std::map<std::string, std::shared_ptr<Camera>> cameras_;
    std::vector<std::string> order_;                ///< Insertion order of camera ids
    mutable std::mutex camerasMutex_;
};

} // namespace zwatch
