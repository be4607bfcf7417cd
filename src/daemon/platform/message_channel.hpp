#pragma once

#include <functional>
#include <string>

// A bidirectional text message channel (WebSocket).
class MessageChannel {
public:
    // Handlers may fire on any thread until close() returns.
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(std::string text)> on_message;
        // Remote close, transport error or failed open.
        std::function<void(std::string reason)> on_closed;
    };

    virtual ~MessageChannel() = default;
    // Starts connecting in the background. False if the attempt could not be started.
    virtual bool open(const std::string& url, Handlers handlers) = 0;
    virtual bool send(const std::string& text) = 0;
    virtual void close() = 0;
};
