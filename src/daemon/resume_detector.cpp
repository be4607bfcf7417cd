#include "resume_detector.hpp"

#include <print>

ResumeDetector::ResumeDetector(Scheduler& scheduler, SuspendClock clock,
                               std::function<void()> on_resume,
                               std::chrono::milliseconds interval,
                               std::chrono::milliseconds threshold)
    : clock_(std::move(clock)), on_resume_(std::move(on_resume)),
      interval_(interval), threshold_(threshold), timer_(scheduler) {}

ResumeDetector::~ResumeDetector() = default;

void ResumeDetector::start() {
    last_ = clock_();
    arm();
}

void ResumeDetector::stop() {
    timer_.reset();
}

bool ResumeDetector::check() {
    auto now = clock_();
    auto slept = now - last_;
    last_ = now;
    if (slept <= threshold_) return false;

    std::println(stderr, "resume: system was suspended for {}s",
                 std::chrono::duration_cast<std::chrono::seconds>(slept).count());
    if (on_resume_) on_resume_();
    return true;
}

void ResumeDetector::arm() {
    timer_.arm(interval_, [this]() {
        check();
        arm();
    });
}
