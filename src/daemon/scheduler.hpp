#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

// The control context. Every session, connection and supervisor callback runs
// on the thread that drives a Scheduler; other threads hand work over with post().
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    // Thread-safe.
    virtual void post(Task task) = 0;

    // Control context only. Returns a non-zero id.
    virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;
    // Cancelling an unknown or already fired timer is a no-op.
    virtual void cancel(TimerId id) = 0;

    virtual Clock::time_point now() const = 0;
};

// Runs blocking work off the control context. The job must post its result back.
using BlockingRunner = std::function<void(std::function<void()>)>;

// Cancels the wrapped timer when reset or destroyed.
class ScopedTimer {
public:
    explicit ScopedTimer(Scheduler& scheduler) : scheduler_(scheduler) {}
    ~ScopedTimer() { reset(); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void arm(std::chrono::milliseconds delay, Scheduler::Task task) {
        reset();
        id_ = scheduler_.schedule(delay, [this, task = std::move(task)]() {
            id_ = 0;
            task();
        });
    }

    void reset() {
        if (id_ != 0) {
            scheduler_.cancel(id_);
            id_ = 0;
        }
    }

    bool armed() const { return id_ != 0; }

private:
    Scheduler& scheduler_;
    Scheduler::TimerId id_ = 0;
};
