// =============================================================================
// HttpServer Integration Tests
// Real sockets on an ephemeral loopback port, fake provider behind the dispatcher
// =============================================================================

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../src/bridge/dispatch/dispatcher.hpp"
#include "../src/bridge/registry/widget_loader.hpp"
#include "../src/http/provider/vianexus.hpp"
#include "../src/server/http_server.hpp"
#include "test_support.hpp"

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using boost::asio::ip::tcp;

namespace {
    std::string to_std(beast::string_view sv) { return {sv.data(), sv.size()}; }
}  // namespace

class HttpServerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        upstream_ = test_support::always(test_support::AAPL_RECORD);
        auto dispatcher = bridge::dispatch::DispatcherBuilder()
                              .with_registry(std::make_shared<const bridge::registry::WidgetRegistry>(
                                  bridge::registry::WidgetLoader::parse_json(test_support::TEST_REGISTRY_JSON)))
                              .with_settings(test_support::test_settings())
                              .with_data_provider(std::make_unique<http::provider::VianexusProvider>(test_support::PROVIDER_BASE_URL,
                                                                                                     test_support::PROVIDER_TOKEN))
                              .with_http_client_factory(test_support::factory_for(upstream_))
                              .validate()
                              .build();

        server_ = std::make_unique<bridge::server::HttpServer>(options(), std::move(dispatcher));
        runner_ = std::thread([this] { server_->run(); });
    }

    void TearDown() override {
        server_->stop();
        if (runner_.joinable()) {
            runner_.join();
        }
    }

    [[nodiscard]] virtual bridge::server::ServerOptions options() const {
        return bridge::server::ServerOptions{.host_ = "127.0.0.1", .port_ = 0, .worker_threads_ = 2};
    }

    void connect(tcp::socket& socket) const { socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), server_->port())); }

    static beast_http::response<beast_http::string_body> round_trip(tcp::socket& socket, beast_http::verb verb, const std::string& target,
                                                                     const std::string& key) {
        beast_http::request<beast_http::empty_body> req{verb, target, 11};
        req.set(beast_http::field::host, "localhost");
        if (!key.empty()) {
            req.set("X-API-Key", key);
        }
        beast_http::write(socket, req);

        beast::flat_buffer buffer;
        beast_http::response<beast_http::string_body> res;
        beast_http::read(socket, buffer, res);
        return res;
    }

    boost::asio::io_context client_ioc_;
    std::shared_ptr<test_support::FakeUpstream> upstream_;
    std::unique_ptr<bridge::server::HttpServer> server_;
    std::thread runner_;
};

// -----------------------------------------------------------------------------
// Discovery_OverLoopback
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, Discovery_OverLoopback) {
    tcp::socket socket(client_ioc_);
    connect(socket);

    const auto res = round_trip(socket, beast_http::verb::get, "/widgets.json", test_support::CONNECTOR_KEY);

    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(to_std(res[beast_http::field::content_type]), "application/json");
    const auto body = nlohmann::json::parse(res.body());
    EXPECT_TRUE(body.contains("quote"));
}

// -----------------------------------------------------------------------------
// KeepAlive_ServesSeveralRequestsPerConnection
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, KeepAlive_ServesSeveralRequestsPerConnection) {
    tcp::socket socket(client_ioc_);
    connect(socket);

    const auto denied = round_trip(socket, beast_http::verb::get, "/widgets.json", "wrong");
    EXPECT_EQ(denied.result_int(), 401u);

    const auto query = round_trip(socket, beast_http::verb::get, "/quote?symbol=aapl", test_support::CONNECTOR_KEY);
    EXPECT_EQ(query.result_int(), 200u);
    EXPECT_EQ(nlohmann::json::parse(query.body())[0].at("symbol"), "AAPL");
    EXPECT_EQ(upstream_->calls_.load(), 1u);
}

// -----------------------------------------------------------------------------
// ConcurrentConnections_AllServed
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, ConcurrentConnections_AllServed) {
    constexpr int CLIENTS = 4;
    std::vector<std::thread> clients;
    std::atomic<int> ok = 0;

    for (int i = 0; i < CLIENTS; ++i) {
        clients.emplace_back([this, &ok] {
            boost::asio::io_context ioc;
            tcp::socket socket(ioc);
            connect(socket);
            const auto res = round_trip(socket, beast_http::verb::get, "/stats", test_support::CONNECTOR_KEY);
            if (res.result_int() == 200) {
                ++ok;
            }
            boost::system::error_code ignored;
            socket.shutdown(tcp::socket::shutdown_both, ignored);
        });
    }
    for (auto& t : clients) {
        t.join();
    }

    EXPECT_EQ(ok.load(), CLIENTS);
    EXPECT_EQ(upstream_->calls_.load(), static_cast<size_t>(CLIENTS));
}

// -----------------------------------------------------------------------------
// Preflight_WithoutCredential
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, Preflight_WithoutCredential) {
    tcp::socket socket(client_ioc_);
    connect(socket);

    const auto res = round_trip(socket, beast_http::verb::options, "/quote", "");

    EXPECT_EQ(res.result_int(), 204u);
    EXPECT_EQ(to_std(res["Access-Control-Allow-Methods"]), "GET, OPTIONS");
}

// -----------------------------------------------------------------------------
// HalfClosedClient_StillAnswered
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, HalfClosedClient_StillAnswered) {
    tcp::socket socket(client_ioc_);
    connect(socket);

    beast_http::request<beast_http::empty_body> req{beast_http::verb::get, "/quote?symbol=AAPL", 11};
    req.set(beast_http::field::host, "localhost");
    req.set("X-API-Key", test_support::CONNECTOR_KEY);
    beast_http::write(socket, req);
    socket.shutdown(tcp::socket::shutdown_send);

    beast::flat_buffer buffer;
    beast_http::response<beast_http::string_body> res;
    beast_http::read(socket, buffer, res);

    EXPECT_EQ(res.result_int(), 200u);
    EXPECT_EQ(nlohmann::json::parse(res.body())[0].at("symbol"), "AAPL");
    EXPECT_EQ(upstream_->calls_.load(), 1u);
}

class HttpServerIdleTest : public HttpServerTest {
   protected:
    [[nodiscard]] bridge::server::ServerOptions options() const override {
        return bridge::server::ServerOptions{.host_ = "127.0.0.1", .port_ = 0, .worker_threads_ = 1, .idle_timeout_ = std::chrono::seconds{1}};
    }

    // Sends the start of a request and never finishes it.
    void send_partial_request(tcp::socket& socket) const {
        connect(socket);
        const std::string partial = "GET /widgets.json HTTP/1.1\r\nHost: localhost\r\n";
        boost::asio::write(socket, boost::asio::buffer(partial));
    }
};

// -----------------------------------------------------------------------------
// PartialRequest_ClosedAtIdleDeadline
// -----------------------------------------------------------------------------
TEST_F(HttpServerIdleTest, PartialRequest_ClosedAtIdleDeadline) {
    tcp::socket stalled(client_ioc_);
    send_partial_request(stalled);

    const auto start = std::chrono::steady_clock::now();
    std::array<char, 64> sink{};
    boost::system::error_code ec;
    const auto n = stalled.read_some(boost::asio::buffer(sink), ec);
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(n, 0u);
    EXPECT_EQ(ec, boost::asio::error::eof);
    EXPECT_LT(waited, std::chrono::seconds{5});

    // The single worker is free again.
    tcp::socket next(client_ioc_);
    connect(next);
    EXPECT_EQ(round_trip(next, beast_http::verb::get, "/widgets.json", test_support::CONNECTOR_KEY).result_int(), 200u);
}

// -----------------------------------------------------------------------------
// Stop_DoesNotWaitForStalledClient
// -----------------------------------------------------------------------------
TEST_F(HttpServerTest, Stop_DoesNotWaitForStalledClient) {
    tcp::socket stalled(client_ioc_);
    connect(stalled);
    const std::string partial = "GET /widgets.json HTTP/1.1\r\nHost: localhost\r\n";
    boost::asio::write(stalled, boost::asio::buffer(partial));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto start = std::chrono::steady_clock::now();
    server_->stop();
    runner_.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{5});
}

// -----------------------------------------------------------------------------
// PeerClosed_HalfCloseIsNotClosed
// -----------------------------------------------------------------------------
TEST(PeerClosedTest, PeerClosed_HalfCloseIsNotClosed) {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    tcp::socket client(ioc);
    client.connect(acceptor.local_endpoint());
    tcp::socket server_side = acceptor.accept();

    EXPECT_FALSE(bridge::server::peer_closed(server_side));

    client.shutdown(tcp::socket::shutdown_send);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(bridge::server::peer_closed(server_side));
}

// -----------------------------------------------------------------------------
// PeerClosed_DetectsReset
// -----------------------------------------------------------------------------
TEST(PeerClosedTest, PeerClosed_DetectsReset) {
    boost::asio::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    tcp::socket client(ioc);
    client.connect(acceptor.local_endpoint());
    tcp::socket server_side = acceptor.accept();

    client.set_option(boost::asio::socket_base::linger(true, 0));
    client.close();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(bridge::server::peer_closed(server_side));
}
