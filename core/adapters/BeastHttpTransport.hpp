#pragma once

#include "../ports/ITransport.hpp"
#include <optional>
#include <string>

namespace geotrack::adapters {

/**
 * @brief HTTP/1.1 sync transport over Boost.Beast
 *
 * One connection per request, plain http:// only. The whole exchange
 * (resolve, connect, write, read) is bounded by request.timeout.
 */
class BeastHttpTransport : public ports::ITransport {
public:
    struct Endpoint {
        std::string host;
        std::string port;
        std::string target;
    };

    explicit BeastHttpTransport(std::string userAgent = "geotrack/1.0");

    ports::SyncResponse send(const ports::SyncRequest& request) override;

    static std::optional<Endpoint> parseUrl(const std::string& url);

private:
    std::string userAgent_;
};

} // namespace geotrack::adapters
