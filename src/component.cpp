#include "component.h"

namespace facegate {

Component::Component(const std::string& id, ComponentType type)
    : id_(id), type_(type), running_(false), config_(nlohmann::json::object()) {
}

// Derived classes stop themselves; stop() cannot be dispatched from here
Component::~Component() = default;

std::string Component::getId() const {
    return id_;
}

ComponentType Component::getType() const {
    return type_;
}

bool Component::isRunning() const {
    return running_.load();
}

const char* Component::typeName(ComponentType type) {
    switch (type) {
        case ComponentType::SOURCE:    return "source";
        case ComponentType::PROCESSOR: return "processor";
        case ComponentType::SINK:      return "sink";
    }
    return "unknown";
}

nlohmann::json Component::getStatus() const {
    return {
        {"id", id_},
        {"type", typeName(type_)},
        {"running", running_.load()},
        {"settings", config_}
    };
}

} // namespace facegate
