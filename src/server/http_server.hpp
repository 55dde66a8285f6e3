#ifndef NEXUS_BRIDGE_SERVER_HTTP_SERVER_HPP
#define NEXUS_BRIDGE_SERVER_HTTP_SERVER_HPP

#pragma once

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "../bridge/dispatch/dispatcher.hpp"
#include "../utils/constants.hpp"
#include "../utils/thread_pool.hpp"

namespace bridge::server {

    struct ServerOptions {
        std::string host_ = "0.0.0.0";
        unsigned short port_ = constants::DEFAULT_PORT;
        size_t worker_threads_ = 1;
        std::chrono::seconds idle_timeout_{constants::IDLE_CONNECTION_TIMEOUT_S};
    };

    // Accepts on an io_context and hands each connection to the worker pool, where it is served with
    // blocking reads and writes until the peer closes, goes idle, or the server stops.
    class HttpServer {
       public:
        // Binds immediately; throws boost::system::system_error when the address cannot be bound.
        HttpServer(ServerOptions options, std::shared_ptr<const dispatch::Dispatcher> dispatcher);

        ~HttpServer() = default;
        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;
        HttpServer(HttpServer&&) = delete;
        HttpServer& operator=(HttpServer&&) = delete;

        // Blocks until SIGINT, SIGTERM or stop(), then drains the worker pool.
        void run();

        // Safe to call from any thread.
        void stop();

        [[nodiscard]] unsigned short port() const;

       private:
        void do_accept();
        void serve(const std::shared_ptr<boost::asio::ip::tcp::socket>& socket) const;
        bool wait_readable(boost::asio::ip::tcp::socket& socket, std::chrono::steady_clock::time_point deadline) const;
        void read_request(boost::asio::ip::tcp::socket& socket, boost::beast::flat_buffer& buffer,
                          boost::beast::http::request_parser<boost::beast::http::string_body>& parser, std::chrono::steady_clock::time_point deadline,
                          boost::beast::error_code& ec) const;

        ServerOptions options_;
        std::shared_ptr<const dispatch::Dispatcher> dispatcher_;
        boost::asio::io_context ioc_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        concurrency::ThreadPool pool_;
        std::atomic<bool> stopping_ = false;
    };

    // True once the connection is reset or broken. A half-closed peer is not closed. Never blocks and never consumes data.
    bool peer_closed(boost::asio::ip::tcp::socket& socket);

}  // namespace bridge::server

#endif
