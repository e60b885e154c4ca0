#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "core/errors/terminal_errors.hpp"
#include "runtime/protocol_loop.hpp"
#include "session/session_manager.hpp"

namespace terminal::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

struct ListenOptions {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8081;  // 0 picks an ephemeral port
};

// GET /sse opens a session's event stream; POST /messages/ feeds it.
// Accepting runs on an io_context thread; every connection is then served
// synchronously on its own thread.
class HttpServer {
public:
    HttpServer(ListenOptions options, session::SessionManager& sessions,
               const runtime::ProtocolLoop& loop);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and starts accepting. Returns the bound port.
    core::errors::Result<std::uint16_t> start();

    // Stops accepting, closes every session and joins all connection threads.
    void stop();

    // Blocks until stop() has completed. Only call after a successful start().
    void wait();

    bool is_running() const { return running_.load(); }
    std::uint16_t port() const { return port_; }

private:
    // The connection thread closes the socket and stop() shuts it down; the
    // mutex keeps the two from racing on a recycled descriptor.
    struct Connection {
        explicit Connection(tcp::socket s) : socket(std::move(s)) {}

        tcp::socket socket;
        std::mutex mutex;
        bool closed = false;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<Connection> connection;
    };

    void do_accept();
    void spawn_connection(tcp::socket socket);
    void reap_finished_workers();
    static void close_connection(Connection& connection);
    static bool is_closed(Connection& connection);

    void serve_connection(tcp::socket& socket);
    void serve_event_stream(tcp::socket& socket, const http::request<http::string_body>& req);
    http::response<http::string_body> post_message(const http::request<http::string_body>& req);

    ListenOptions options_;
    session::SessionManager& sessions_;
    const runtime::ProtocolLoop& loop_;

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic_bool running_{false};
    std::uint16_t port_ = 0;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;

    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;
    bool stopped_ = false;
};

}  // namespace terminal::server
