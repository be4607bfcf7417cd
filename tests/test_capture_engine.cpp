#include <catch2/catch_test_macros.hpp>

#include "audio/capture_engine.hpp"
#include "support/fakes.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

CaptureSettings fast_settings() {
    CaptureSettings s;
    s.chunk_ms = 100;
    s.flow_wait = 20ms;
    s.flow_poll = 1ms;
    s.retry_pause = 1ms;
    s.restart_settle = 1ms;
    return s;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST_CASE("Audio capture engine", "[audio][capture]") {
    FakeCapture capture;
    FakeEnumerator devices;
    devices.set_devices({{"usb-mic", "USB Microphone"}, {"builtin", "Built-in"}});

    std::mutex chunks_mutex;
    std::vector<AudioChunk> chunks;
    auto on_chunk = [&](AudioChunk c) {
        std::lock_guard lock(chunks_mutex);
        chunks.push_back(std::move(c));
    };

    AudioCaptureEngine engine(capture, devices, fast_settings());

    SECTION("StartsOnDefaultInput") {
        auto started = engine.start("", on_chunk);
        REQUIRE(started);
        REQUIRE(started->device_uid.empty());
        REQUIRE_FALSE(started->fell_back);
        REQUIRE(started->attempts == 1);
        REQUIRE(engine.is_running());
        REQUIRE(engine.is_audio_flowing());
    }

    SECTION("OpensRequestedDevice") {
        auto started = engine.start("usb-mic", on_chunk);
        REQUIRE(started);
        REQUIRE(started->device_uid == "usb-mic");
        REQUIRE(capture.uids() == std::vector<std::string>{"usb-mic"});
    }

    SECTION("UnknownDeviceFallsBackToDefault") {
        auto started = engine.start("gone", on_chunk);
        REQUIRE(started);
        REQUIRE(started->fell_back);
        REQUIRE(started->device_uid.empty());
        REQUIRE(capture.uids() == std::vector<std::string>{""});
    }

    SECTION("RetriesTransientFailure") {
        capture.fail_next(CaptureError::EngineCreationFailed);
        auto started = engine.start("", on_chunk);
        REQUIRE(started);
        REQUIRE(started->attempts == 2);
        REQUIRE(capture.starts() == 2);
    }

    SECTION("PermissionDeniedIsNotRetried") {
        capture.fail_next(CaptureError::PermissionDenied);
        auto started = engine.start("usb-mic", on_chunk);
        REQUIRE_FALSE(started);
        REQUIRE(started.error() == "microphone permission denied");
        REQUIRE(capture.starts() == 1);
        REQUIRE_FALSE(engine.is_running());
    }

    SECTION("SilentDeviceFallsBackToDefault") {
        capture.set_silent_starts(3);
        auto started = engine.start("usb-mic", on_chunk);
        REQUIRE(started);
        REQUIRE(started->fell_back);
        REQUIRE(started->device_uid.empty());
        REQUIRE(started->attempts == 4);
        REQUIRE(capture.uids() ==
                std::vector<std::string>{"usb-mic", "usb-mic", "usb-mic", ""});
    }

    SECTION("GivesUpAfterAllAttempts") {
        for (int i = 0; i < 3; ++i) capture.fail_next(CaptureError::EngineCreationFailed);
        auto started = engine.start("", on_chunk);
        REQUIRE_FALSE(started);
        REQUIRE(started.error() == "failed to create audio engine");
        REQUIRE(capture.starts() == 3);
    }

    SECTION("StopFlushesRemainder") {
        REQUIRE(engine.start("", on_chunk));
        capture.push(std::vector<float>(2000, 0.1f));
        engine.stop();

        std::lock_guard lock(chunks_mutex);
        // 160 priming samples + 2000 pushed = one full chunk and a 560 sample tail.
        REQUIRE(chunks.size() == 2);
        REQUIRE(chunks[0].samples.size() == 1600);
        REQUIRE(chunks[1].samples.size() == 560);
        REQUIRE_FALSE(engine.is_running());
        REQUIRE(capture.stops() >= 1);
    }

    SECTION("StopIfCurrentIgnoresOtherEpoch") {
        auto started = engine.start("", on_chunk);
        REQUIRE(started);

        engine.stop_if_current(started->epoch + 1);
        REQUIRE(engine.is_running());

        engine.stop_if_current(started->epoch);
        REQUIRE_FALSE(engine.is_running());
    }

    SECTION("RestartPolicy") {
        auto now = AudioCaptureEngine::Clock::now();
        REQUIRE_FALSE(engine.should_restart({48000, 2}, now));

        REQUIRE(engine.start("", on_chunk));
        REQUIRE(engine.should_restart({48000, 2}, now));
        // Small drift while audio flows is tolerated.
        REQUIRE_FALSE(engine.should_restart({16050, 1}, now));
    }

    SECTION("FormatChangeRestartsCapture") {
        REQUIRE(engine.start("", on_chunk));
        REQUIRE(capture.starts() == 1);

        capture.change_format({48000, 2});
        REQUIRE(engine.format_restarts() == 1);
        REQUIRE(wait_until([&] { return capture.starts() == 2; }));

        // Debounced.
        capture.change_format({44100, 2});
        REQUIRE(engine.format_restarts() == 1);
        REQUIRE(wait_until([&] { return engine.is_audio_flowing(); }));
        REQUIRE(engine.is_running());
    }

    SECTION("RestartsAreCapped") {
        auto settings = fast_settings();
        settings.restart_debounce = 0ms;
        AudioCaptureEngine capped(capture, devices, settings);
        REQUIRE(capped.start("", on_chunk));

        capture.change_format({48000, 2});
        REQUIRE(wait_until([&] { return capture.starts() == 2 && capped.is_audio_flowing(); }));
        capture.change_format({44100, 2});
        REQUIRE(capped.format_restarts() == 2);
        REQUIRE(wait_until([&] { return capture.starts() == 3 && capped.is_audio_flowing(); }));

        capture.change_format({22050, 1});
        REQUIRE(capped.format_restarts() == 2);
        std::this_thread::sleep_for(30ms);
        REQUIRE(capture.starts() == 3);
        REQUIRE(capped.is_running());
    }

    SECTION("StopDoesNotWaitForSlowOpen") {
        capture.hold_starts();
        std::optional<std::expected<CaptureStart, std::string>> result;
        std::thread opener([&] { result = engine.start("", on_chunk); });
        REQUIRE(wait_until([&] { return capture.start_in_progress(); }));

        auto stopping = std::async(std::launch::async, [&] { engine.stop(); });
        bool returned = stopping.wait_for(1s) == std::future_status::ready;

        capture.release_starts();
        opener.join();
        stopping.wait();

        CHECK(returned);
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->has_value());
        REQUIRE(result->error() == "capture start aborted");
        REQUIRE_FALSE(engine.is_running());
        REQUIRE_FALSE(capture.is_capturing());
    }

    SECTION("FailedRestartReportsFailure") {
        std::atomic<bool> failed{false};
        engine.set_failure_handler([&](const std::string& reason) {
            if (reason == "microphone permission denied") failed = true;
        });

        REQUIRE(engine.start("", on_chunk));
        capture.fail_next(CaptureError::PermissionDenied);
        capture.change_format({48000, 2});

        REQUIRE(wait_until([&] { return failed.load(); }));
        REQUIRE_FALSE(engine.is_running());
    }
}
