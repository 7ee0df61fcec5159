#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>

namespace geotrack {

/**
 * @brief IMqttClient on top of the Eclipse Paho asynchronous C client
 *
 * Paho delivers completions on its own thread; this class turns them into
 * bounded waits. A delivery that completes after its publish() timed out is
 * discarded.
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    PublishStatus publish(const std::string& topic, const std::string& payload,
                          int qos, std::chrono::milliseconds timeout) override;

    void setConnectionCallback(ConnectionCallback callback) override;

private:
    static constexpr int kKeepAliveIntervalSeconds = 240;

    enum class ConnectState {
        Idle,
        Connecting,
        Connected,
        Failed
    };

    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onDelivered(void* context, MQTTAsync_successData* response);
    static void onDeliveryFailure(void* context, MQTTAsync_failureData* response);

    void completeDelivery(MQTTAsync_token token, bool delivered);
    void notifyConnection(bool connected, const std::string& reason);
    void destroyClient();

    MQTTAsync client_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConnectState state_ = ConnectState::Idle;
    std::string lastFailure_;
    std::map<MQTTAsync_token, bool> completed_;
    std::set<MQTTAsync_token> abandoned_;

    ConnectionCallback connectionCallback_;
};

} // namespace geotrack
