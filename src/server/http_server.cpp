#include "http_server.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <string>

#include "../utils/logging.hpp"

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using boost::asio::ip::tcp;
using namespace std::chrono;

namespace bridge::server {
    namespace {
        constexpr milliseconds POLL_SLICE{250};
        constexpr std::uint64_t MAX_REQUEST_BODY_BYTES = 64 * 1024;
        constexpr std::size_t READ_CHUNK_BYTES = 4096;

        std::string to_std(beast::string_view sv) { return {sv.data(), sv.size()}; }
    }  // namespace

    bool peer_closed(tcp::socket& socket) {
        // A FIN alone is a half-close: the caller may still be waiting for the reply.
        char peeked = 0;
        const auto n = ::recv(socket.native_handle(), &peeked, 1, MSG_PEEK | MSG_DONTWAIT);
        return n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR;
    }

    HttpServer::HttpServer(ServerOptions options, std::shared_ptr<const dispatch::Dispatcher> dispatcher)
        : options_(std::move(options)),
          dispatcher_(std::move(dispatcher)),
          acceptor_(ioc_),
          signals_(ioc_, SIGINT, SIGTERM),
          pool_(options_.worker_threads_) {
        if (dispatcher_ == nullptr) {
            throw std::invalid_argument("HttpServer requires a dispatcher");
        }

        const tcp::endpoint endpoint(boost::asio::ip::make_address(options_.host_), options_.port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    }

    unsigned short HttpServer::port() const { return acceptor_.local_endpoint().port(); }

    void HttpServer::run() {
        auto log = logging::get(logging::SERVER);

        signals_.async_wait([this, log](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                log->info("Received signal {}, shutting down", signal);
                stop();
            }
        });

        do_accept();
        log->info("{} {} listening on {}:{} with {} worker(s)", constants::SERVICE_NAME, constants::SERVICE_VERSION, options_.host_, port(),
                  pool_.size());

        ioc_.run();

        pool_.shutdown();
        pool_.wait_all();
        log->info("Server stopped");
    }

    void HttpServer::stop() {
        boost::asio::post(ioc_, [this]() {
            stopping_ = true;
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            signals_.cancel(ignored);
            ioc_.stop();
        });
    }

    void HttpServer::do_accept() {
        acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    logging::get(logging::SERVER)->warn("Accept failed: {}", ec.message());
                    do_accept();
                }
                return;
            }

            auto shared = std::make_shared<tcp::socket>(std::move(socket));
            if (!pool_.enqueue([this, shared]() { serve(shared); })) {
                boost::system::error_code ignored;
                shared->close(ignored);
            }

            do_accept();
        });
    }

    bool HttpServer::wait_readable(tcp::socket& socket, steady_clock::time_point deadline) const {
        pollfd pfd{};
        pfd.fd = socket.native_handle();
        pfd.events = POLLIN;

        while (!stopping_) {
            const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
            if (remaining.count() <= 0) {
                return false;
            }

            const int rc = ::poll(&pfd, 1, static_cast<int>(std::min(remaining, POLL_SLICE).count()));
            if (rc > 0) {
                return true;
            }
            if (rc < 0 && errno != EINTR) {
                return false;
            }
        }
        return false;
    }

    void HttpServer::read_request(tcp::socket& socket, beast::flat_buffer& buffer, beast_http::request_parser<beast_http::string_body>& parser,
                                  steady_clock::time_point deadline, beast::error_code& ec) const {
        // Buffered bytes are parsed first; the socket is only read after a poll, so a stalled partial
        // request still runs into the deadline.
        while (!parser.is_done()) {
            if (buffer.size() > 0) {
                const auto used = parser.put(buffer.data(), ec);
                buffer.consume(used);
                if (ec == beast_http::error::need_more) {
                    ec = {};
                } else if (ec) {
                    return;
                } else if (used > 0) {
                    continue;
                }
            }

            if (!wait_readable(socket, deadline)) {
                ec = beast::error::timeout;
                return;
            }

            const auto n = socket.read_some(buffer.prepare(READ_CHUNK_BYTES), ec);
            buffer.commit(n);
            if (ec == boost::asio::error::eof) {
                if (!parser.got_some() && buffer.size() == 0) {
                    ec = beast_http::error::end_of_stream;
                    return;
                }
                ec = {};
                parser.put_eof(ec);
                return;
            }
            if (ec) {
                return;
            }
        }
    }

    void HttpServer::serve(const std::shared_ptr<tcp::socket>& socket) const {
        auto log = logging::get(logging::SERVER);
        beast::flat_buffer buffer;
        beast::error_code ec;

        while (!stopping_) {
            beast_http::request_parser<beast_http::string_body> parser;
            parser.header_limit(static_cast<std::uint32_t>(constants::MAX_REQUEST_HEADER_BYTES));
            parser.body_limit(MAX_REQUEST_BODY_BYTES);

            const auto deadline = steady_clock::now() + options_.idle_timeout_;
            read_request(*socket, buffer, parser, deadline, ec);

            if (ec) {
                if (ec != beast_http::error::end_of_stream && ec != beast::error::timeout && ec != boost::asio::error::connection_reset) {
                    log->debug("Dropping connection: {}", ec.message());
                }
                break;
            }

            const auto& req = parser.get();

            dispatch::InboundRequest inbound;
            inbound.method_ = to_std(req.method_string());
            inbound.target_ = to_std(req.target());
            for (const auto& field : req) {
                inbound.headers_.emplace_back(to_std(field.name_string()), to_std(field.value()));
            }
            inbound.is_cancelled_ = [socket]() { return peer_closed(*socket); };

            auto outbound = dispatcher_->handle(inbound);
            if (outbound.dropped_) {
                break;
            }

            beast_http::response<beast_http::string_body> res{static_cast<beast_http::status>(outbound.status_), req.version()};
            res.set(beast_http::field::server, constants::SERVICE_NAME);
            for (const auto& [name, value] : outbound.headers_) {
                res.insert(name, value);
            }
            res.keep_alive(req.keep_alive() && !stopping_);
            res.body() = std::move(outbound.body_);
            res.prepare_payload();

            beast_http::write(*socket, res, ec);
            if (ec || !res.keep_alive()) {
                break;
            }
        }

        boost::system::error_code ignored;
        socket->shutdown(tcp::socket::shutdown_send, ignored);
        socket->close(ignored);
    }

}  // namespace bridge::server
