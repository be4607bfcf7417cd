#include "platform/linux/ix_websocket_channel.hpp"

#include <atomic>
#include <ixwebsocket/IXWebSocket.h>
#include <print>

IxWebSocketChannel::IxWebSocketChannel(int handshake_timeout_s)
    : handshake_timeout_s_(handshake_timeout_s) {}

IxWebSocketChannel::~IxWebSocketChannel() {
    close();
}

bool IxWebSocketChannel::open(const std::string& url, Handlers handlers) {
    close();

    auto socket = std::make_unique<ix::WebSocket>();
    socket->setUrl(url);
    socket->disableAutomaticReconnection();
    socket->setHandshakeTimeout(handshake_timeout_s_);

    // Open failures arrive as Error, remote closes as Close. Report only the first.
    auto closed = std::make_shared<std::atomic<bool>>(false);
    socket->setOnMessageCallback([handlers = std::move(handlers), closed](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Open:
                if (handlers.on_open) handlers.on_open();
                break;
            case ix::WebSocketMessageType::Message:
                if (!msg->binary && handlers.on_message) handlers.on_message(msg->str);
                break;
            case ix::WebSocketMessageType::Close:
                if (!closed->exchange(true) && handlers.on_closed) {
                    handlers.on_closed(msg->closeInfo.reason.empty() ? "connection closed"
                                                                     : msg->closeInfo.reason);
                }
                break;
            case ix::WebSocketMessageType::Error:
                if (!closed->exchange(true) && handlers.on_closed) {
                    handlers.on_closed(msg->errorInfo.reason.empty() ? "connection error"
                                                                     : msg->errorInfo.reason);
                }
                break;
            default:
                break;
        }
    });

    socket->start();

    std::lock_guard lock(mutex_);
    socket_ = std::move(socket);
    return true;
}

bool IxWebSocketChannel::send(const std::string& text) {
    std::lock_guard lock(mutex_);
    if (!socket_ || socket_->getReadyState() != ix::ReadyState::Open) return false;
    auto info = socket_->sendText(text);
    if (!info.success) {
        std::println(stderr, "ws: send failed ({} bytes)", text.size());
    }
    return info.success;
}

void IxWebSocketChannel::close() {
    std::unique_ptr<ix::WebSocket> socket;
    {
        std::lock_guard lock(mutex_);
        socket = std::move(socket_);
    }
    // stop() joins the socket thread, so it must not run under the lock.
    if (socket) socket->stop();
}
