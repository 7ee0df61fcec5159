#include <gtest/gtest.h>
#include "../core/adapters/BeastHttpTransport.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/adapters/ThreadExecutor.hpp"
#include "../core/adapters/ThreadTimerService.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace geotrack;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

TEST(BeastHttpTransportTest, ParseUrl) {
    auto full = adapters::BeastHttpTransport::parseUrl("http://example.com:8080/api/locations?x=1");
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->host, "example.com");
    EXPECT_EQ(full->port, "8080");
    EXPECT_EQ(full->target, "/api/locations?x=1");

    auto bare = adapters::BeastHttpTransport::parseUrl("http://localhost");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->port, "80");
    EXPECT_EQ(bare->target, "/");

    EXPECT_FALSE(adapters::BeastHttpTransport::parseUrl("https://example.com/").has_value());
    EXPECT_FALSE(adapters::BeastHttpTransport::parseUrl("http:///path").has_value());
    EXPECT_FALSE(adapters::BeastHttpTransport::parseUrl("http://host:/path").has_value());
    EXPECT_FALSE(adapters::BeastHttpTransport::parseUrl("ftp://host/").has_value());
}

TEST(BeastHttpTransportTest, UnsupportedSchemeIsRejected) {
    adapters::BeastHttpTransport transport;
    ports::SyncRequest request;
    request.url = "https://example.com/locations";
    auto response = transport.send(request);
    EXPECT_EQ(response.failure, ports::TransportFailure::Rejected);
    EXPECT_EQ(response.status, 0);
}

TEST(BeastHttpTransportTest, PostsToLocalServer) {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    auto port = acceptor.local_endpoint().port();

    std::promise<http::request<http::string_body>> received;
    auto receivedFuture = received.get_future();
    std::thread server([&]() {
        tcp::socket socket(ioc);
        acceptor.accept(socket);
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(socket, buffer, req);

        http::response<http::string_body> res{http::status::created, req.version()};
        res.set(http::field::content_type, "application/json");
        res.body() = "{\"ok\":true}";
        res.prepare_payload();
        http::write(socket, res);

        beast::error_code ignored;
        socket.shutdown(tcp::socket::shutdown_both, ignored);
        received.set_value(std::move(req));
    });

    adapters::BeastHttpTransport transport("geotrack-test");
    ports::SyncRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/locations";
    request.method = "PUT";
    request.headers["Content-Type"] = "application/json";
    request.headers["Authorization"] = "Bearer abc";
    request.body = "{\"location\":[]}";
    request.timeout = 5000ms;

    auto response = transport.send(request);
    server.join();

    EXPECT_EQ(response.failure, ports::TransportFailure::None);
    EXPECT_EQ(response.status, 201);
    EXPECT_EQ(response.body, "{\"ok\":true}");

    auto req = receivedFuture.get();
    EXPECT_EQ(req.method(), http::verb::put);
    EXPECT_EQ(req.target(), "/locations");
    EXPECT_EQ(req[http::field::authorization], "Bearer abc");
    EXPECT_EQ(req[http::field::user_agent], "geotrack-test");
    EXPECT_EQ(req.body(), "{\"location\":[]}");
}

TEST(BeastHttpTransportTest, RefusedConnectionIsNetworkFailure) {
    // Bind then close to get a port nothing listens on.
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    adapters::BeastHttpTransport transport;
    ports::SyncRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/";
    request.timeout = 2000ms;
    auto response = transport.send(request);
    EXPECT_NE(response.failure, ports::TransportFailure::None);
    EXPECT_EQ(response.status, 0);
}

TEST(ThreadExecutorTest, RunsTasksInOrder) {
    std::vector<int> order;
    std::mutex mutex;
    {
        adapters::ThreadExecutor executor("test");
        for (int i = 0; i < 50; ++i) {
            executor.post([&, i]() {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            });
        }
        executor.shutdown();
    }
    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(ThreadTimerServiceTest, FiresInDueOrderAndHonorsCancel) {
    adapters::ThreadTimerService timers;
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int> fired;

    auto record = [&](int n) {
        return [&, n]() {
            std::lock_guard<std::mutex> lock(mutex);
            fired.push_back(n);
            cv.notify_all();
        };
    };

    timers.schedule(60ms, record(2));
    auto cancelled = timers.schedule(30ms, record(99));
    timers.schedule(10ms, record(1));
    timers.cancel(cancelled);

    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 2s, [&]() { return fired.size() >= 2; }));
    EXPECT_EQ(fired, (std::vector<int>{1, 2}));
    lock.unlock();

    timers.shutdown();
    EXPECT_EQ(timers.pending(), 0u);
}

TEST(ThreadTimerServiceTest, CallbackMayReschedule) {
    adapters::ThreadTimerService timers;
    std::atomic<int> count{0};
    std::promise<void> done;

    std::function<void()> tick;
    tick = [&]() {
        if (++count == 3) {
            done.set_value();
        } else {
            timers.schedule(5ms, tick);
        }
    };
    timers.schedule(5ms, tick);

    EXPECT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
    timers.shutdown();
    EXPECT_EQ(count.load(), 3);
}

TEST(DefaultPoliciesTest, BackoffDoublesUpToCeiling) {
    SyncConfig sync;
    sync.backoffBase = 1000ms;
    sync.backoffCeiling = 5000ms;
    sync.maxAttempts = 5;
    adapters::DefaultPolicyEngine engine(sync);
    const auto& policy = engine.getRetryPolicy();

    EXPECT_EQ(policy.getBackoffDelay(1), 1000ms);
    EXPECT_EQ(policy.getBackoffDelay(2), 2000ms);
    EXPECT_EQ(policy.getBackoffDelay(3), 4000ms);
    EXPECT_EQ(policy.getBackoffDelay(4), 5000ms);
    EXPECT_EQ(policy.getBackoffDelay(200), 5000ms);

    EXPECT_TRUE(policy.shouldRetry(4));
    EXPECT_FALSE(policy.shouldRetry(5));
}
