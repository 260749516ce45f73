#include "camera_manager.h"
#include "component_factory.h"
#include "errors.h"
#include "logger.h"

namespace zwatch {

CameraManager::~CameraManager() {
    stopAll();
}

void CameraManager::createCameras(const std::vector<CameraConfig>& configs) {
    for (const auto& config : configs) {
        auto camera = ComponentFactory::getInstance().createCamera(config);
        if (!addCamera(camera)) {
            throw ConfigError("Duplicate camera id: " + config.id);
        }
    }
}

bool CameraManager::addCamera(std::shared_ptr<Camera> camera) {
    std::lock_guard<std::mutex> lock(camerasMutex_);
    const std::string id = camera->getId();
    if (cameras_.find(id) != cameras_.end()) {
        LOG_ERROR("CameraManager", "Camera ID already exists: " + id);
        return false;
    }
    cameras_[id] = std::move(camera);
    order_.push_back(id);
    return true;
}

std::shared_ptr<Camera> CameraManager::getCamera(const std::string& id) const {
    std::lock_guard<std::mutex> lock(camerasMutex_);
    auto it = cameras_.find(id);
    if (it == cameras_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<Camera>> CameraManager::getAllCameras() const {
    std::lock_guard<std::mutex> lock(camerasMutex_);
    std::vector<std::shared_ptr<Camera>> cameras;
    for (const auto& id : order_) {
        cameras.push_back(cameras_.at(id));
    }
    return cameras;
}

size_t CameraManager::startAll() {
    size_t started = 0;
    for (const auto& camera : getAllCameras()) {
        if (camera->start()) {
            started++;
        } else {
            LOG_ERROR("CameraManager", "Camera " + camera->getId() + " failed to start, continuing with the others");
        }
    }
    LOG_INFO("CameraManager", "Started " + std::to_string(started) + " of " +
             std::to_string(getAllCameras().size()) + " camera(s)");
    return started;
}

void CameraManager::requestStopAll() {
    for (const auto& camera : getAllCameras()) {
        camera->requestStop();
    }
}

void CameraManager::stopAll() {
    requestStopAll();
    waitAll();
}

void CameraManager::waitAll() {
    for (const auto& camera : getAllCameras()) {
        camera->wait();
    }
}

bool CameraManager::allFailed() const {
    const auto cameras = getAllCameras();
    if (cameras.empty()) {
        return false;
    }
    for (const auto& camera : cameras) {
        if (camera->getState() != CameraState::FAILED) {
            return false;
        }
    }
    return true;
}

nlohmann::json CameraManager::status() const {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& camera : getAllCameras()) {
        result.push_back(camera->getStatus());
    }
    return result;
}

} // namespace zwatch
