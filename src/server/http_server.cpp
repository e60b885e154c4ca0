#include "server/http_server.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "server/message_route.hpp"
#include "server/sse_stream.hpp"

namespace terminal::server {

using core::errors::ErrorCategory;
using core::errors::TerminalError;

namespace {

constexpr std::chrono::milliseconds kHangupPollInterval{100};

using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

std::string to_std(const beast::string_view view) {
    return std::string(view.data(), view.size());
}

StringResponse make_response(const StringRequest& req, const http::status status,
                             std::string body) {
    StringResponse res{status, req.version()};
    res.set(http::field::server, "mcp-terminal");
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

std::string remote_of(const tcp::socket& socket) {
    beast::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void log_access(const std::string& remote, const StringRequest& req, const http::status status) {
    LOG_INFO(remote + " - \"" + to_std(req.method_string()) + " " + to_std(req.target()) +
             " HTTP/" + std::to_string(req.version() / 10) + "." +
             std::to_string(req.version() % 10) + "\" " +
             std::to_string(static_cast<unsigned>(status)));
}

}  // namespace

HttpServer::HttpServer(ListenOptions options, session::SessionManager& sessions,
                       const runtime::ProtocolLoop& loop)
    : options_(std::move(options)), sessions_(sessions), loop_(loop), acceptor_(ioc_) {}

HttpServer::~HttpServer() {
    stop();
}

core::errors::Result<std::uint16_t> HttpServer::start() {
    if (running_.load()) {
        return TerminalError{ErrorCategory::Internal, "Server is already running.",
                             "already_running"};
    }

    beast::error_code ec;
    const auto address = net::ip::make_address(options_.host, ec);
    if (ec) {
        return TerminalError{ErrorCategory::Input, "Invalid bind host: " + options_.host,
                             "invalid_host"};
    }
    const tcp::endpoint endpoint{address, options_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        beast::error_code close_ec;
        acceptor_.close(close_ec);
        return TerminalError{ErrorCategory::Transport,
                             "Unable to listen on " + options_.host + ":" +
                                 std::to_string(options_.port) + ": " + ec.message(),
                             "listen_failed"};
    }

    port_ = acceptor_.local_endpoint(ec).port();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stopped_ = false;
    }
    running_.store(true);
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });

    LOG_INFO("Listening on http://" + options_.host + ":" + std::to_string(port_));
    return port_;
}

void HttpServer::do_accept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_WARN("Accept failed: " + ec.message());
            }
            if (!running_.load() || !acceptor_.is_open()) {
                return;
            }
        } else {
            spawn_connection(std::move(socket));
        }
        if (running_.load()) {
            do_accept();
        }
    });
}

void HttpServer::spawn_connection(tcp::socket socket) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reap_finished_workers();

    Worker worker;
    worker.connection = std::make_shared<Connection>(std::move(socket));
    auto connection = worker.connection;
    worker.thread = std::thread([this, connection] {
        serve_connection(connection->socket);
        close_connection(*connection);
    });
    workers_.push_back(std::move(worker));
}

void HttpServer::reap_finished_workers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (is_closed(*it->connection)) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void HttpServer::close_connection(Connection& connection) {
    std::lock_guard<std::mutex> lock(connection.mutex);
    beast::error_code ec;
    connection.socket.shutdown(tcp::socket::shutdown_send, ec);
    connection.socket.close(ec);
    connection.closed = true;
}

bool HttpServer::is_closed(Connection& connection) {
    std::lock_guard<std::mutex> lock(connection.mutex);
    return connection.closed;
}

void HttpServer::serve_connection(tcp::socket& socket) {
    const std::string remote = remote_of(socket);
    beast::flat_buffer buffer;
    try {
        while (running_.load()) {
            StringRequest req;
            beast::error_code ec;
            http::read(socket, buffer, req, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                LOG_DEBUG(remote + " - read ended: " + ec.message());
                break;
            }

            const auto target = parse_target(to_std(req.target()));
            const Route route = match_route(target);

            if (route == Route::EventStream && req.method() == http::verb::get) {
                log_access(remote, req, http::status::ok);
                serve_event_stream(socket, req);
                break;
            }

            StringResponse res;
            if (route == Route::Messages && req.method() == http::verb::post) {
                res = post_message(req);
            } else if (route == Route::Unknown) {
                res = make_response(req, http::status::not_found, "Not Found");
            } else {
                res = make_response(req, http::status::method_not_allowed, "Method Not Allowed");
                res.set(http::field::allow, route == Route::EventStream ? "GET" : "POST");
            }
            log_access(remote, req, res.result());

            http::write(socket, res, ec);
            if (ec || !res.keep_alive()) {
                break;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(remote + " - connection failed: " + e.what());
    }
}

void HttpServer::serve_event_stream(tcp::socket& socket, const StringRequest& req) {
    auto created = sessions_.create_session();
    if (core::errors::is_error(created)) {
        const auto& err = core::errors::get_error(created);
        LOG_ERROR("Unable to open session [" + err.code + "]: " + err.message);
        auto res = make_response(req, http::status::internal_server_error, err.message);
        beast::error_code ec;
        http::write(socket, res, ec);
        return;
    }
    const auto session = core::errors::get_value(created);

    SseStream stream(socket);
    if (stream.open(req.version()) &&
        stream.send("endpoint", message_endpoint_for(session->id()))) {
        LOG_INFO("Session " + session->id() + ": event stream open");

        // Unregisters the session as soon as the client hangs up, busy or idle.
        std::atomic_bool streaming{true};
        std::thread watcher([this, &stream, &streaming, id = session->id()] {
            while (streaming.load()) {
                if (stream.wait_for_hangup(kHangupPollInterval)) {
                    LOG_INFO("Session " + id + ": client disconnected");
                    sessions_.close_session(id);
                    return;
                }
            }
        });
        loop_.run(*session, stream);
        streaming.store(false);
        watcher.join();
    }

    sessions_.close_session(session->id());
    stream.finish();
}

StringResponse HttpServer::post_message(const StringRequest& req) {
    const auto target = parse_target(to_std(req.target()));
    auto session_id = extract_session_id(target);
    if (core::errors::is_error(session_id)) {
        const auto& err = core::errors::get_error(session_id);
        LOG_WARN("Rejected message: " + err.message);
        return make_response(req, http::status::bad_request, err.message);
    }
    const std::string& id = core::errors::get_value(session_id);

    if (auto found = sessions_.find(id); core::errors::is_error(found)) {
        LOG_WARN("Could not find session for ID: " + id);
        return make_response(req, http::status::not_found, "Could not find session");
    }

    auto frame = nlohmann::json::parse(req.body(), nullptr, false);
    if (frame.is_discarded()) {
        LOG_WARN("Session " + id + ": could not parse message body");
        return make_response(req, http::status::bad_request, "Could not parse message");
    }

    LOG_DEBUG("Session " + id + ": received message " + frame.dump(-1, ' ', false,
                                                                 nlohmann::json::error_handler_t::replace));
    auto delivered = sessions_.deliver(id, std::move(frame));
    if (core::errors::is_error(delivered)) {
        const auto& err = core::errors::get_error(delivered);
        if (err.code == "session_closed") {
            return make_response(req, http::status::gone, "Session is closed");
        }
        return make_response(req, http::status::not_found, "Could not find session");
    }
    return make_response(req, http::status::accepted, "Accepted");
}

void HttpServer::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    net::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    sessions_.close_all();

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    // Unblocks connection threads parked in a keep-alive read.
    for (auto& worker : workers) {
        std::lock_guard<std::mutex> lock(worker.connection->mutex);
        if (!worker.connection->closed) {
            beast::error_code ec;
            worker.connection->socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    LOG_INFO("Server stopped");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stopped_ = true;
    }
    stopped_cv_.notify_all();
}

void HttpServer::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this] { return stopped_; });
}

}  // namespace terminal::server
