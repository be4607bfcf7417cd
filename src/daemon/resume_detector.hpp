#pragma once

#include "scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>

// Periodically samples how long the machine has been suspended and reports a
// resume when that total grew by more than the threshold between samples.
class ResumeDetector {
public:
    using SuspendClock = std::function<std::chrono::milliseconds()>;

    ResumeDetector(Scheduler& scheduler, SuspendClock clock, std::function<void()> on_resume,
                   std::chrono::milliseconds interval = std::chrono::seconds(5),
                   std::chrono::milliseconds threshold = std::chrono::seconds(5));
    ~ResumeDetector();

    ResumeDetector(const ResumeDetector&) = delete;
    ResumeDetector& operator=(const ResumeDetector&) = delete;

    void start();
    void stop();

    // One sample. True if a resume was reported.
    bool check();

private:
    void arm();

    SuspendClock clock_;
    std::function<void()> on_resume_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds threshold_;
    std::chrono::milliseconds last_{0};
    ScopedTimer timer_;
};
