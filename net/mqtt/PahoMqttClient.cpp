#include "PahoMqttClient.hpp"
#include "../../core/Log.hpp"
#include <algorithm>

namespace geotrack {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    destroyClient();
}

void PahoMqttClient::destroyClient() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    destroyClient();

    std::string serverURI = (options.useTls ? "ssl://" : "tcp://") + options.host + ":" + std::to_string(options.port);
    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options.clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::get("MQTT")->error("unable to create client for {}, code {}", serverURI, rc);
        client_ = nullptr;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);

    MQTTAsync_connectOptions connOpts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions sslOpts = MQTTAsync_SSLOptions_initializer;

    connOpts.keepAliveInterval = kKeepAliveIntervalSeconds;
    connOpts.cleansession = 1;
    connOpts.connectTimeout = static_cast<int>(std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count()));
    connOpts.onSuccess = onConnected;
    connOpts.onFailure = onConnectFailure;
    connOpts.context = this;
    if (!options.username.empty()) connOpts.username = options.username.c_str();
    if (!options.password.empty()) connOpts.password = options.password.c_str();

    if (options.useTls) {
        if (!options.caPath.empty()) sslOpts.trustStore = options.caPath.c_str();
        sslOpts.enableServerCertAuth = options.verifyServer ? 1 : 0;
        sslOpts.verify = options.verifyServer ? 1 : 0;
        sslOpts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        connOpts.ssl = &sslOpts;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectState::Connecting;
        lastFailure_.clear();
    }

    Log::get("MQTT")->info("connecting to {} as {}", serverURI, options.clientId);
    rc = MQTTAsync_connect(client_, &connOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::get("MQTT")->error("connect request rejected, code {}", rc);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = ConnectState::Failed;
        return false;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_for(lock, options.timeout, [this]() { return state_ != ConnectState::Connecting; });
    if (!settled) {
        state_ = ConnectState::Failed;
        Log::get("MQTT")->warn("connect timed out after {} ms", options.timeout.count());
        return false;
    }
    if (state_ != ConnectState::Connected) {
        Log::get("MQTT")->warn("connect failed: {}", lastFailure_);
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && isConnected()) {
        MQTTAsync_disconnectOptions discOpts = MQTTAsync_disconnectOptions_initializer;
        discOpts.timeout = 1000;
        MQTTAsync_disconnect(client_, &discOpts);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectState::Idle;
}

bool PahoMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectState::Connected;
}

PublishStatus PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                                      int qos, std::chrono::milliseconds timeout) {
    if (!client_ || !isConnected()) {
        return PublishStatus::NotConnected;
    }

    MQTTAsync_message message = MQTTAsync_message_initializer;
    message.payload = const_cast<char*>(payload.data());
    message.payloadlen = static_cast<int>(payload.size());
    message.qos = qos;
    message.retained = 0;

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onDelivered;
    opts.onFailure = onDeliveryFailure;
    opts.context = this;

    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &message, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        Log::get("MQTT")->warn("publish to {} rejected, code {}", topic, rc);
        return rc == MQTTASYNC_DISCONNECTED ? PublishStatus::NotConnected : PublishStatus::Rejected;
    }

    // QoS 0 has no acknowledgement; handing it to the library is all we get.
    if (qos == 0) {
        return PublishStatus::Delivered;
    }

    MQTTAsync_token token = opts.token;
    std::unique_lock<std::mutex> lock(mutex_);
    bool done = cv_.wait_for(lock, timeout, [this, token]() {
        return completed_.count(token) > 0 || state_ != ConnectState::Connected;
    });

    auto it = completed_.find(token);
    if (it != completed_.end()) {
        bool delivered = it->second;
        completed_.erase(it);
        return delivered ? PublishStatus::Delivered : PublishStatus::Rejected;
    }

    abandoned_.insert(token);
    if (!done) {
        return PublishStatus::TimedOut;
    }
    return PublishStatus::NotConnected;
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::completeDelivery(MQTTAsync_token token, bool delivered) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_.erase(token) > 0) {
            return;
        }
        completed_[token] = delivered;
    }
    cv_.notify_all();
}

void PahoMqttClient::notifyConnection(bool connected, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, reason);
    }
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    auto* client = static_cast<PahoMqttClient*>(context);
    {
        std::lock_guard<std::mutex> lock(client->mutex_);
        client->state_ = ConnectState::Connected;
    }
    client->cv_.notify_all();
    Log::get("MQTT")->info("connected");
    client->notifyConnection(true, "connected");
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    std::string reason = "connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    {
        std::lock_guard<std::mutex> lock(client->mutex_);
        client->state_ = ConnectState::Failed;
        client->lastFailure_ = reason;
    }
    client->cv_.notify_all();
    client->notifyConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    std::string reason = cause ? std::string(cause) : "connection lost";
    {
        std::lock_guard<std::mutex> lock(client->mutex_);
        client->state_ = ConnectState::Idle;
    }
    client->cv_.notify_all();
    Log::get("MQTT")->warn("{}", reason);
    client->notifyConnection(false, reason);
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    (void)context;
    (void)topicLen;
    // Uploads never subscribe; anything arriving here is dropped.
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onDelivered(void* context, MQTTAsync_successData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (response) {
        client->completeDelivery(response->token, true);
    }
}

void PahoMqttClient::onDeliveryFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    if (response) {
        Log::get("MQTT")->warn("delivery failed, code {}", response->code);
        client->completeDelivery(response->token, false);
    }
}

} // namespace geotrack
