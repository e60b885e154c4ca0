#include "server/sse_stream.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <boost/asio/write.hpp>
#include "core/logging/logger.hpp"
#include "protocol/frame_codec.hpp"

namespace terminal::server {

namespace beast = boost::beast;
namespace net = boost::asio;

namespace {

std::string ping_text() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream out;
    out << "ping - " << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << "+00:00";
    return out.str();
}

// A client never sends anything after the GET, so a readable socket with no
// data means the peer has closed it. Stray bytes are discarded.
bool peer_hung_up(const int fd) {
    char scratch[256];
    while (true) {
        const ssize_t n = ::recv(fd, scratch, sizeof(scratch), MSG_DONTWAIT);
        if (n > 0) {
            continue;
        }
        if (n == 0) {
            LOG_DEBUG("SSE: peer closed the stream");
            return true;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return false;
        }
        LOG_DEBUG(std::string("SSE: peer gone: ") + std::strerror(errno));
        return true;
    }
}

}  // namespace

SseStream::SseStream(tcp::socket& socket) : socket_(socket) {}

bool SseStream::open(const unsigned http_version) {
    beast::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);

    http::response<http::empty_body> res{http::status::ok, http_version};
    res.set(http::field::server, "mcp-terminal");
    res.set(http::field::content_type, "text/event-stream");
    res.set(http::field::cache_control, "no-store");
    res.set(http::field::connection, "keep-alive");
    res.set("X-Accel-Buffering", "no");
    res.chunked(true);

    http::response_serializer<http::empty_body> serializer{res};
    http::write_header(socket_, serializer, ec);
    if (ec) {
        LOG_WARN("SSE: failed to send stream header: " + ec.message());
        return false;
    }
    open_ = true;
    return true;
}

bool SseStream::write_chunk(const std::string& payload) {
    if (!open_) {
        return false;
    }
    beast::error_code ec;
    net::write(socket_, http::make_chunk(net::buffer(payload)), ec);
    if (ec) {
        LOG_DEBUG("SSE: write failed: " + ec.message());
        open_ = false;
        return false;
    }
    return true;
}

bool SseStream::send(const std::string& event, const std::string& data) {
    return write_chunk(protocol::encode_sse_event(event, data));
}

bool SseStream::keepalive() {
    if (!connected()) {
        return false;
    }
    return write_chunk(protocol::encode_sse_comment(ping_text()));
}

bool SseStream::connected() {
    if (!peer_alive()) {
        open_ = false;
        return false;
    }
    return true;
}

bool SseStream::peer_alive() {
    return open_ && !peer_hung_up(socket_.native_handle());
}

bool SseStream::wait_for_hangup(const std::chrono::milliseconds timeout) {
    pollfd fd{};
    fd.fd = socket_.native_handle();
    fd.events = POLLIN;
    const int ready = ::poll(&fd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0) {
        return false;
    }
    if ((fd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
        return true;
    }
    return peer_hung_up(fd.fd);
}

void SseStream::finish() {
    if (!open_) {
        return;
    }
    beast::error_code ec;
    net::write(socket_, http::make_chunk_last(), ec);
    open_ = false;
}

}  // namespace terminal::server
