#include "MockTransport.hpp"
#include <stdexcept>

namespace geotrack::sim {

MockTransport::MockTransport() {
    defaultResponse_.status = 200;
    defaultResponse_.body = "{}";
}

ports::SyncResponse MockTransport::send(const ports::SyncRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);

    if (throwMessage_) {
        std::string message = *throwMessage_;
        throwMessage_.reset();
        throw std::runtime_error(message);
    }

    if (script_.empty()) {
        return defaultResponse_;
    }
    auto response = script_.front();
    script_.pop_front();
    return response;
}

void MockTransport::enqueue(const ports::SyncResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(response);
}

void MockTransport::enqueueStatus(int status, int times) {
    ports::SyncResponse response;
    response.status = status;
    for (int i = 0; i < times; ++i) {
        enqueue(response);
    }
}

void MockTransport::enqueueFailure(ports::TransportFailure failure, int times) {
    ports::SyncResponse response;
    response.failure = failure;
    for (int i = 0; i < times; ++i) {
        enqueue(response);
    }
}

void MockTransport::setDefaultResponse(const ports::SyncResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultResponse_ = response;
}

void MockTransport::throwOnNextSend(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwMessage_ = message;
}

std::vector<ports::SyncRequest> MockTransport::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t MockTransport::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

std::optional<ports::SyncRequest> MockTransport::lastRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) return std::nullopt;
    return requests_.back();
}

void MockTransport::clearRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
}

} // namespace geotrack::sim
