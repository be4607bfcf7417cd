#pragma once

#include "audio/chunker.hpp"
#include "platform/audio_capture.hpp"
#include "platform/device_enumerator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct CaptureSettings {
    uint32_t target_rate = 16000;
    uint32_t chunk_ms = 400;
    int start_attempts = 3;
    int restart_start_attempts = 2;
    std::chrono::milliseconds flow_wait{500};
    std::chrono::milliseconds flow_poll{50};
    std::chrono::milliseconds retry_pause{300};
    int max_format_restarts = 2;
    std::chrono::milliseconds restart_debounce{500};
    std::chrono::milliseconds restart_settle{300};
    double format_tolerance_hz = 100.0;
};

struct CaptureStart {
    std::string device_uid; // device actually opened, "" for the system default
    bool fell_back = false;
    int attempts = 0;
    uint64_t epoch = 0;
};

// Opens an input device, converts to mono float at the target rate and emits
// fixed-size chunks. start() blocks while it retries, so it runs on a worker.
class AudioCaptureEngine {
public:
    using Clock = std::chrono::steady_clock;
    // Audio thread. Must not block.
    using ChunkCallback = std::function<void(AudioChunk)>;
    using FailureCallback = std::function<void(const std::string&)>;

    AudioCaptureEngine(AudioCapture& capture, DeviceEnumerator& devices,
                       CaptureSettings settings = {}, bool verbose = false);
    ~AudioCaptureEngine();

    AudioCaptureEngine(const AudioCaptureEngine&) = delete;
    AudioCaptureEngine& operator=(const AudioCaptureEngine&) = delete;

    std::expected<CaptureStart, std::string> start(const std::string& device_uid,
                                                   ChunkCallback on_chunk);

    // Stops capture and emits the buffered remainder as a final chunk. Does not
    // block: a start still opening the device is aborted and closes itself.
    void stop();
    // Stops only if the running capture was opened by the start that returned epoch.
    void stop_if_current(uint64_t epoch);

    // Reported when a hot-swap restart cannot reopen the device.
    void set_failure_handler(FailureCallback cb) { on_failure_ = std::move(cb); }

    // Format or device change while capturing. Thread-safe.
    void on_configuration_change(const CaptureFormat& format);

    bool should_restart(const CaptureFormat& format, Clock::time_point now) const;

    bool is_running() const { return running_.load(std::memory_order_acquire); }
    bool is_audio_flowing() const { return flowing_.load(std::memory_order_acquire); }
    int format_restarts() const;
    const CaptureSettings& settings() const { return settings_; }

private:
    struct OpenFailure {
        std::string message;
        bool retryable = true;
    };

    std::expected<int, OpenFailure> open_with_retries(const std::string& uid, int attempts);
    bool wait_for_flow();
    void close_locked();
    void restart_loop(std::stop_token stop);
    void restart_now();
    AudioCapture::Callbacks callbacks();
    void log(const std::string& msg);

    AudioCapture& capture_;
    DeviceEnumerator& devices_;
    CaptureSettings settings_;
    bool verbose_;

    // Guards the stream bookkeeping below. Never held while a device opens,
    // so stop() from the control context returns promptly.
    std::mutex lifecycle_mutex_;
    std::condition_variable_any idle_cv_;
    bool opening_ = false;
    Chunker chunker_;
    ChunkCallback on_chunk_;
    FailureCallback on_failure_;
    std::string device_;
    uint64_t epoch_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> flowing_{false};
    std::atomic<bool> stop_requested_{false};

    // Hot-swap policy state.
    mutable std::mutex policy_mutex_;
    int restarts_ = 0;
    std::optional<Clock::time_point> last_restart_;

    std::mutex restart_mutex_;
    std::condition_variable_any restart_cv_;
    bool restart_pending_ = false;
    std::jthread restart_thread_;
};
