#pragma once

#include <atomic>
#include <string>
#include <nlohmann/json.hpp>

namespace facegate {

/**
 * @brief Position of a component in the door pipeline
 */
enum class ComponentType {
    SOURCE,     ///< Produces frames (camera or stream)
    PROCESSOR,  ///< Turns frames into face results
    SINK        ///< Performs a side effect (relay, alert, audit row)
};

/**
 * @brief Common lifecycle and status reporting for pipeline parts
 *
 * Subclasses record their effective settings in @c config_ when they are
 * constructed; the settings are reported under "settings" by getStatus().
 * Secrets must never be placed there.
 */
class Component {
public:
    Component(const std::string& id, ComponentType type);
    virtual ~Component();

    Component(const Component&) = delete;
    Component& operator=(const Component&) = delete;

    std::string getId() const;
    ComponentType getType() const;

    /**
     * @brief Acquire resources (sockets, devices, database handles)
     *
     * Safe to call more than once.
     *
     * @return true when the component is ready to start
     */
    virtual bool initialize() = 0;

    virtual bool start() = 0;
    virtual bool stop() = 0;

    bool isRunning() const;

    /**
     * @brief Snapshot for the periodic status line and diagnostics
     *
     * Subclasses extend the base fields ("id", "type", "running", "settings")
     * with their own counters.
     */
    virtual nlohmann::json getStatus() const;

    static const char* typeName(ComponentType type);

protected:
    std::string id_;
    ComponentType type_;
    std::atomic<bool> running_;
    nlohmann::json config_;        ///< Effective settings, reported in status
};

/**
 * @brief Frame producer
 */
class SourceComponent : public Component {
public:
    explicit SourceComponent(const std::string& id) : Component(id, ComponentType::SOURCE) {}

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }
};

class ProcessorComponent : public Component {
public:
    explicit ProcessorComponent(const std::string& id) : Component(id, ComponentType::PROCESSOR) {}

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }
};

/**
 * @brief Side-effect channel driven by the actuation controller
 */
class SinkComponent : public Component {
public:
    explicit SinkComponent(const std::string& id) : Component(id, ComponentType::SINK) {}

    bool initialize() override { return true; }
    bool start() override { running_ = true; return true; }
    bool stop() override { running_ = false; return true; }
};

} // namespace facegate
