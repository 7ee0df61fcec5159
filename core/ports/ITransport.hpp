#pragma once

#include <chrono>
#include <map>
#include <string>

namespace geotrack::ports {

enum class TransportFailure {
    None,
    Network,
    Timeout,
    Rejected
};

struct SyncRequest {
    std::string url;
    std::string method = "POST";
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{60000};
};

struct SyncResponse {
    int status = 0;
    TransportFailure failure = TransportFailure::None;
    std::string body;
};

// send() must return within request.timeout.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual SyncResponse send(const SyncRequest& request) = 0;
};

} // namespace geotrack::ports
