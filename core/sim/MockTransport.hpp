#pragma once

#include "../ports/ITransport.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace geotrack::sim {

/**
 * @brief Scripted transport for tests
 *
 * Responses queued with enqueue() are returned in order; once the script is
 * exhausted every request gets the default response (HTTP 200 unless
 * changed). Every request is recorded.
 */
class MockTransport : public ports::ITransport {
public:
    MockTransport();
    ~MockTransport() override = default;

    ports::SyncResponse send(const ports::SyncRequest& request) override;

    void enqueue(const ports::SyncResponse& response);
    void enqueueStatus(int status, int times = 1);
    void enqueueFailure(ports::TransportFailure failure, int times = 1);
    void setDefaultResponse(const ports::SyncResponse& response);
    // The next send() throws std::runtime_error with this message.
    void throwOnNextSend(const std::string& message);

    std::vector<ports::SyncRequest> requests() const;
    std::size_t requestCount() const;
    std::optional<ports::SyncRequest> lastRequest() const;
    void clearRequests();

private:
    mutable std::mutex mutex_;
    std::deque<ports::SyncResponse> script_;
    ports::SyncResponse defaultResponse_;
    std::optional<std::string> throwMessage_;
    std::vector<ports::SyncRequest> requests_;
};

} // namespace geotrack::sim
