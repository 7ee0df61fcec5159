#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace geotrack {

struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 8883;
    std::string clientId;
    std::string username;
    std::string password;              // SAS token when a device key is configured
    bool useTls = true;
    std::string caPath;                // empty uses the system trust store
    bool verifyServer = true;
    std::chrono::milliseconds timeout{30000};
};

enum class PublishStatus {
    Delivered,
    NotConnected,
    Rejected,
    TimedOut
};

/**
 * @brief Minimal MQTT client used by the MQTT sync transport
 *
 * connect() and publish() block until the broker acknowledges or the given
 * timeout expires, so callers on the network executor never wait unbounded.
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    virtual bool connect(const MqttConnectOptions& options) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual PublishStatus publish(const std::string& topic, const std::string& payload,
                                  int qos, std::chrono::milliseconds timeout) = 0;

    // Called from the MQTT library thread.
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
};

inline std::string publishStatusToString(PublishStatus status) {
    switch (status) {
        case PublishStatus::Delivered: return "delivered";
        case PublishStatus::NotConnected: return "not_connected";
        case PublishStatus::Rejected: return "rejected";
        case PublishStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

} // namespace geotrack
