#pragma once

#include "../ports/ITransport.hpp"
#include "../IMqttClient.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace geotrack::adapters {

struct MqttTransportConfig {
    MqttConnectOptions connection;
    std::string topic = "geotrack/records";
    int qos = 1;
    // When set, the password is a SAS token minted from the device key before each connect.
    std::string sasDeviceKeyBase64;
    uint64_t sasExpirySeconds = 3600;
};

/**
 * @brief Sync transport that publishes each request body to one MQTT topic
 *
 * Connects lazily on the first send and after a lost connection. A broker
 * acknowledgement maps to status 200, a missing connection to a network
 * failure and an unacknowledged publish to a timeout. MQTT has no headers,
 * so request headers (including the body signature) are not transmitted.
 */
class MqttTransportAdapter : public ports::ITransport {
public:
    MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient, MqttTransportConfig config);
    ~MqttTransportAdapter() override;

    ports::SyncResponse send(const ports::SyncRequest& request) override;

    bool isConnected() const;

private:
    bool ensureConnected(std::chrono::milliseconds timeout);

    std::shared_ptr<IMqttClient> mqttClient_;
    MqttTransportConfig config_;
    std::mutex mutex_;
};

} // namespace geotrack::adapters
