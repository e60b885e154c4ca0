#pragma once

#include <chrono>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include "session/event_sink.hpp"

namespace terminal::server {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Server-sent events over a chunked HTTP/1.1 response. The socket is
// borrowed from the connection thread, which is also the only writer.
class SseStream : public session::EventSink {
public:
    explicit SseStream(tcp::socket& socket);

    // Sends the 200 text/event-stream header.
    bool open(unsigned http_version);

    bool send(const std::string& event, const std::string& data) override;
    bool keepalive() override;
    bool connected() override;

    // Blocks up to `timeout` waiting for the peer to hang up. Safe to call from
    // a second thread while the owner writes; it never touches the socket's
    // Asio state.
    bool wait_for_hangup(std::chrono::milliseconds timeout);

    // Terminates the chunked body if the peer is still there.
    void finish();

    bool is_open() const { return open_; }

private:
    bool write_chunk(const std::string& payload);
    bool peer_alive();

    tcp::socket& socket_;
    bool open_ = false;
};

}  // namespace terminal::server
