#include "components/sink/actuator_channel.h"
#include "logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace facegate {

UdpActuatorChannel::UdpActuatorChannel(const std::string& id,
                                       const std::string& host,
                                       int port,
                                       const std::string& onCommand,
                                       const std::string& offCommand)
    : ActuatorChannel(id),
      host_(host),
      port_(port),
      onCommand_(onCommand),
      offCommand_(offCommand),
      sockfd_(-1) {
    std::memset(&targetAddr_, 0, sizeof(targetAddr_));
    config_["host"] = host_;
    config_["port"] = port_;
    config_["on_command"] = onCommand_;
    config_["off_command"] = offCommand_;
}

UdpActuatorChannel::~UdpActuatorChannel() {
    stop();
}

bool UdpActuatorChannel::initialize() {
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (sockfd_ != -1) {
        return true;
    }

    // Resolve the receiver address, host names are accepted as well as literals
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* resolved = nullptr;

    int rc = getaddrinfo(host_.c_str(), nullptr, &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        LOG_ERROR("UdpActuatorChannel", "Cannot resolve actuator host " + host_ + ": " + gai_strerror(rc));
        return false;
    }

    targetAddr_ = *reinterpret_cast<sockaddr_in*>(resolved->ai_addr);
    targetAddr_.sin_port = htons(static_cast<uint16_t>(port_));
    freeaddrinfo(resolved);

    sockfd_ = socket(AF_INET, SOCK_DGRAM, 0);
    if (sockfd_ < 0) {
        LOG_ERROR("UdpActuatorChannel", "Failed to create UDP socket: " + std::string(strerror(errno)));
        sockfd_ = -1;
        return false;
    }

    char addrText[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &targetAddr_.sin_addr, addrText, sizeof(addrText));
    LOG_INFO("UdpActuatorChannel", "Actuator target " + std::string(addrText) + ":" + std::to_string(port_));
    return true;
}

bool UdpActuatorChannel::start() {
    if (running_) {
        return true;
    }
    if (!initialize()) {
        return false;
    }
    running_ = true;
    return true;
}

bool UdpActuatorChannel::stop() {
    running_ = false;
    closeSocket();
    return true;
}

void UdpActuatorChannel::closeSocket() {
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (sockfd_ != -1) {
        close(sockfd_);
        sockfd_ = -1;
    }
}

nlohmann::json UdpActuatorChannel::getStatus() const {
    nlohmann::json status = Component::getStatus();
    status["target"] = host_ + ":" + std::to_string(port_);
    status["sent"] = sentCount_.load();
    status["failed"] = failedCount_.load();
    return status;
}

Result<void> UdpActuatorChannel::send(bool on) {
    const std::string& payload = on ? onCommand_ : offCommand_;

    std::lock_guard<std::mutex> lock(socketMutex_);
    if (sockfd_ == -1) {
        failedCount_++;
        return Result<void>::error(ErrorKind::IoError, "UDP socket not initialized");
    }

    ssize_t sentBytes = sendto(sockfd_, payload.data(), payload.size(), 0,
                               reinterpret_cast<const sockaddr*>(&targetAddr_), sizeof(targetAddr_));
    if (sentBytes < 0) {
        failedCount_++;
        return Result<void>::error(ErrorKind::IoError,
            "Failed to send UDP packet to " + host_ + ":" + std::to_string(port_) + ": " + strerror(errno));
    }

    sentCount_++;
    LOG_DEBUG("UdpActuatorChannel", "Sent " + payload + " to " + host_ + ":" + std::to_string(port_));
    return Result<void>::success();
}

} // namespace facegate
