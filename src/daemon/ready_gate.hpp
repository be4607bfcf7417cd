#pragma once

#include <mutex>

// Whether captured audio may be forwarded to the backend. Shared between the
// audio thread (reads) and the control context (writes).
class ReadyGate {
public:
    void open() {
        std::lock_guard lock(mutex_);
        open_ = true;
    }

    void close() {
        std::lock_guard lock(mutex_);
        open_ = false;
    }

    bool is_open() const {
        std::lock_guard lock(mutex_);
        return open_;
    }

private:
    mutable std::mutex mutex_;
    bool open_ = false;
};
