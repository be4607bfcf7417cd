#include <catch2/catch_test_macros.hpp>

#include "resume_detector.hpp"
#include "support/manual_scheduler.hpp"

using namespace std::chrono_literals;

TEST_CASE("Resume detector", "[resume]") {
    ManualScheduler sched;
    std::chrono::milliseconds suspended{0};
    int resumes = 0;

    ResumeDetector detector(sched, [&] { return suspended; }, [&] { ++resumes; }, 5000ms, 5000ms);

    SECTION("QuietWhileAwake") {
        detector.start();
        sched.advance(60000ms);
        REQUIRE(resumes == 0);
    }

    SECTION("ShortSuspendIsIgnored") {
        detector.start();
        suspended = 3000ms;
        REQUIRE_FALSE(detector.check());
        REQUIRE(resumes == 0);
    }

    SECTION("LongSuspendReportsResume") {
        detector.start();
        suspended = 3600000ms;
        sched.advance(5000ms);
        REQUIRE(resumes == 1);

        // Reported once per suspension.
        sched.advance(5000ms);
        REQUIRE(resumes == 1);
    }

    SECTION("BaselineTakenAtStart") {
        suspended = 600000ms;
        detector.start();
        sched.advance(5000ms);
        REQUIRE(resumes == 0);
    }

    SECTION("StopCancelsSampling") {
        detector.start();
        detector.stop();
        suspended = 600000ms;
        sched.advance(60000ms);
        REQUIRE(resumes == 0);
        REQUIRE(sched.pending_timers() == 0);
    }
}
