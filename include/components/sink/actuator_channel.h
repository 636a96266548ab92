#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <netinet/in.h>
#include "component.h"
#include "result.h"

namespace facegate {

/**
 * @brief Output that receives a binary ON/OFF command
 */
class ActuatorChannel : public SinkComponent {
public:
    explicit ActuatorChannel(const std::string& id) : SinkComponent(id) {}

    /**
     * @brief Send the actuator command
     *
     * Delivery is at-most-once; callers do not retry.
     *
     * @param on true for ON, false for OFF
     * @return Result<void> Local send outcome
     */
    virtual Result<void> send(bool on) = 0;
};

/**
 * @brief ActuatorChannel sending a single UDP datagram per command
 */
class UdpActuatorChannel : public ActuatorChannel {
public:
    /**
     * @brief Construct a new UDP actuator channel
     *
     * @param id Component ID
     * @param host Receiver host name or IPv4 address
     * @param port Receiver UDP port
     * @param onCommand Payload sent for ON
     * @param offCommand Payload sent for OFF
     */
    UdpActuatorChannel(const std::string& id,
                       const std::string& host,
                       int port,
                       const std::string& onCommand = "ON",
                       const std::string& offCommand = "OFF");

    ~UdpActuatorChannel() override;

    bool initialize() override;
    bool start() override;
    bool stop() override;
    nlohmann::json getStatus() const override;

    Result<void> send(bool on) override;

private:
    void closeSocket();

    std::string host_;
    int port_;
    std::string onCommand_;
    std::string offCommand_;

    std::mutex socketMutex_;
    int sockfd_;
    sockaddr_in targetAddr_;

    std::atomic<uint64_t> sentCount_{0};
    std::atomic<uint64_t> failedCount_{0};
};

} // namespace facegate
