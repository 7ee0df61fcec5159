#include "BeastHttpTransport.hpp"
#include "../Log.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace geotrack::adapters {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

BeastHttpTransport::BeastHttpTransport(std::string userAgent) : userAgent_(std::move(userAgent)) {
}

std::optional<BeastHttpTransport::Endpoint> BeastHttpTransport::parseUrl(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (authority.empty()) {
        return std::nullopt;
    }

    Endpoint endpoint;
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        endpoint.port = authority.substr(colon + 1);
        if (endpoint.port.empty()) return std::nullopt;
    } else {
        endpoint.host = authority;
        endpoint.port = "80";
    }
    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    return endpoint;
}

ports::SyncResponse BeastHttpTransport::send(const ports::SyncRequest& request) {
    ports::SyncResponse response;

    auto endpoint = parseUrl(request.url);
    if (!endpoint) {
        response.failure = ports::TransportFailure::Rejected;
        response.body = "unsupported url " + request.url;
        return response;
    }

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    http::request<http::string_body> req{request.method == "PUT" ? http::verb::put : http::verb::post,
                                         endpoint->target, 11};
    req.set(http::field::host, endpoint->host);
    req.set(http::field::user_agent, userAgent_);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code failure;
    bool finished = false;

    stream.expires_after(request.timeout);
    resolver.async_resolve(endpoint->host, endpoint->port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { failure = ec; return; }
            stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) { failure = ec; return; }
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) { failure = ec; return; }
                    http::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
                        if (ec) { failure = ec; return; }
                        finished = true;
                    });
                });
            });
        });

    ioc.run_for(request.timeout);

    if (!finished) {
        bool timedOut = !failure || failure == beast::error::timeout;
        response.failure = timedOut ? ports::TransportFailure::Timeout : ports::TransportFailure::Network;
        response.body = timedOut ? "request timed out" : failure.message();
        Log::get("HTTP")->warn("{} {} failed: {}", request.method, request.url, response.body);
        return response;
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    response.status = static_cast<int>(res.result_int());
    response.body = res.body();
    Log::get("HTTP")->debug("{} {} -> {}", request.method, request.url, response.status);
    return response;
}

} // namespace geotrack::adapters
