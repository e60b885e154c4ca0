#include "runtime/protocol_loop.hpp"

#include <exception>
#include <optional>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/frame_codec.hpp"

namespace terminal::runtime {

using nlohmann::json;

std::string to_string(const LoopExit exit) {
    switch (exit) {
        case LoopExit::QueueClosed:
            return "queue_closed";
        case LoopExit::SinkFailed:
            return "sink_failed";
        default:
            return "unknown";
    }
}

ProtocolLoop::ProtocolLoop(const tools::ToolRegistry& registry, ServerIdentity identity,
                           const std::chrono::milliseconds idle_interval)
    : registry_(registry), identity_(std::move(identity)), idle_interval_(idle_interval) {}

LoopExit ProtocolLoop::run(session::Session& session, session::EventSink& sink) const {
    ProtocolDispatcher dispatcher(registry_, identity_);
    session.activate();

    LoopExit exit = LoopExit::QueueClosed;
    while (true) {
        json frame;
        const auto status = session.inbound().pop(frame, idle_interval_);
        if (status == session::PopStatus::Closed) {
            exit = LoopExit::QueueClosed;
            break;
        }
        if (status == session::PopStatus::Timeout) {
            if (!sink.keepalive()) {
                exit = LoopExit::SinkFailed;
                break;
            }
            continue;
        }

        if (!sink.connected()) {
            LOG_WARN("Session " + session.id() + ": client gone, frame not dispatched");
            exit = LoopExit::SinkFailed;
            break;
        }

        std::optional<json> reply;
        try {
            reply = dispatcher.handle(frame);
        } catch (const std::exception& e) {
            LOG_ERROR("Session " + session.id() + ": dispatch failed: " + e.what());
            const auto id = frame.is_object() ? frame.value("id", json(nullptr)) : json(nullptr);
            reply = protocol::make_rpc_error(id, protocol::kInternalError, e.what());
        }

        if (!reply.has_value()) {
            continue;
        }
        // Command output is not guaranteed to be UTF-8.
        const std::string data = reply->dump(-1, ' ', false, json::error_handler_t::replace);
        if (!sink.send("message", data)) {
            exit = LoopExit::SinkFailed;
            break;
        }
    }

    dispatcher.close();
    LOG_INFO("Session " + session.id() + ": protocol loop finished (" + to_string(exit) + ")");
    return exit;
}

}  // namespace terminal::runtime
