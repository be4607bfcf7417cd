#pragma once

#include "platform/message_channel.hpp"

#include <memory>
#include <mutex>

namespace ix {
class WebSocket;
}

// MessageChannel over IXWebSocket with its own reconnection disabled; the
// connection manager owns retry policy. Each open() gets a fresh socket.
class IxWebSocketChannel : public MessageChannel {
public:
    explicit IxWebSocketChannel(int handshake_timeout_s = 5);
    ~IxWebSocketChannel() override;

    IxWebSocketChannel(const IxWebSocketChannel&) = delete;
    IxWebSocketChannel& operator=(const IxWebSocketChannel&) = delete;

    bool open(const std::string& url, Handlers handlers) override;
    bool send(const std::string& text) override;
    void close() override;

private:
    int handshake_timeout_s_;
    std::mutex mutex_;
    std::unique_ptr<ix::WebSocket> socket_;
};
