#include "MqttTransportAdapter.hpp"
#include "../Log.hpp"
#include "../../crypto/SasToken.hpp"
#include <algorithm>

namespace geotrack::adapters {

MqttTransportAdapter::MqttTransportAdapter(std::shared_ptr<IMqttClient> mqttClient, MqttTransportConfig config)
    : mqttClient_(mqttClient), config_(std::move(config)) {
    mqttClient_->setConnectionCallback([](bool connected, const std::string& reason) {
        Log::get("MQTT")->info("link {}: {}", connected ? "up" : "down", reason);
    });
}

MqttTransportAdapter::~MqttTransportAdapter() {
    mqttClient_->setConnectionCallback(nullptr);
    mqttClient_->disconnect();
}

bool MqttTransportAdapter::isConnected() const {
    return mqttClient_->isConnected();
}

bool MqttTransportAdapter::ensureConnected(std::chrono::milliseconds timeout) {
    if (mqttClient_->isConnected()) {
        return true;
    }

    MqttConnectOptions options = config_.connection;
    options.timeout = std::min(options.timeout, timeout);
    if (!config_.sasDeviceKeyBase64.empty()) {
        SasToken::Config sas;
        sas.host = options.host;
        sas.deviceId = options.clientId;
        sas.deviceKeyBase64 = config_.sasDeviceKeyBase64;
        sas.expirySeconds = config_.sasExpirySeconds;
        options.password = SasToken::generate(sas);
    }
    return mqttClient_->connect(options);
}

ports::SyncResponse MqttTransportAdapter::send(const ports::SyncRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    ports::SyncResponse response;
    auto started = std::chrono::steady_clock::now();
    if (!ensureConnected(request.timeout)) {
        response.failure = ports::TransportFailure::Network;
        response.body = "broker unreachable";
        return response;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    auto remaining = std::max(request.timeout - elapsed, std::chrono::milliseconds(1));

    auto status = mqttClient_->publish(config_.topic, request.body, config_.qos, remaining);
    switch (status) {
        case PublishStatus::Delivered:
            response.status = 200;
            break;
        case PublishStatus::NotConnected:
        case PublishStatus::Rejected:
            response.failure = ports::TransportFailure::Network;
            break;
        case PublishStatus::TimedOut:
            response.failure = ports::TransportFailure::Timeout;
            break;
    }
    response.body = publishStatusToString(status);
    Log::get("MQTT")->debug("publish {} bytes to {}: {}", request.body.size(), config_.topic, response.body);
    return response;
}

} // namespace geotrack::adapters
