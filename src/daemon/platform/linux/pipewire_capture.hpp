#pragma once

#include "platform/audio_capture.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

// Captures F32 at the source's native rate and channel count. Conversion to the
// session format happens in the engine.
class PipeWireCapture : public AudioCapture {
public:
    PipeWireCapture();
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    std::expected<void, CaptureError> start(const std::string& device_uid,
                                            Callbacks callbacks) override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }
    std::optional<CaptureFormat> current_format() const override;

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);
    static void on_param_changed(void* userdata, uint32_t id, const struct spa_pod* param);

    void teardown();
    CaptureError classify(const std::string& error) const;

    Callbacks callbacks_;
    std::string device_uid_;
    std::atomic<bool> capturing_{false};

    // Negotiated format, 0 until the first param_changed.
    std::atomic<uint32_t> rate_{0};
    std::atomic<uint32_t> channels_{0};

    // Written on the loop thread under the loop lock.
    pw_stream_state state_ = PW_STREAM_STATE_UNCONNECTED;
    std::string state_error_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .param_changed = on_param_changed,
        .process = on_process,
    };
};
