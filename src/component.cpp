#include "component.h"

namespace zwatch {

Component::Component(const std::string& id, ComponentType type, const std::string& cameraId)
    : id_(id), type_(type), cameraId_(cameraId), running_(false) {
}

Component::~Component() {
    // Derived classes stop themselves; stop() is pure virtual here
}

std::string Component::getId() const {
    return id_;
}

ComponentType Component::getType() const {
    return type_;
}

std::string Component::getCameraId() const {
    return cameraId_;
}

bool Component::isRunning() const {
    return running_;
}

std::string Component::getLastError() const {
    return lastError_;
}

std::string Component::logSource(const std::string& name) const {
    return name + "[" + cameraId_ + "]";
}

nlohmann::json Component::getStatus() const {
    nlohmann::json status;
    status["id"] = id_;

    switch (type_) {
        case ComponentType::SOURCE:
            status["type"] = "source";
            break;
        case ComponentType::PROCESSOR:
            status["type"] = "processor";
            break;
        case ComponentType::SINK:
            status["type"] = "sink";
            break;
        default:
            status["type"] = "unknown";
    }

    status["running"] = running_.load();
    if (!lastError_.empty()) {
        status["last_error"] = lastError_;
    }
    return status;
}

SourceComponent::SourceComponent(const std::string& id, const std::string& cameraId)
    : Component(id, ComponentType::SOURCE, cameraId) {
}

SourceComponent::~SourceComponent() {
    running_ = false;
}

ProcessorComponent::ProcessorComponent(const std::string& id, const std::string& cameraId)
    : Component(id, ComponentType::PROCESSOR, cameraId) {
}

ProcessorComponent::~ProcessorComponent() {
    running_ = false;
}

SinkComponent::SinkComponent(const std::string& id, const std::string& cameraId)
    : Component(id, ComponentType::SINK, cameraId) {
}

SinkComponent::~SinkComponent() {
    running_ = false;
}

} // namespace zwatch
