#include "platform/linux/pipewire_capture.hpp"

#include <cerrno>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/param/format-utils.h>
#include <spa/utils/result.h>

namespace {

constexpr int kStateWaitSeconds = 2;

bool settled(pw_stream_state s) {
    return s == PW_STREAM_STATE_PAUSED || s == PW_STREAM_STATE_STREAMING ||
           s == PW_STREAM_STATE_ERROR;
}

} // namespace

PipeWireCapture::PipeWireCapture() {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

std::expected<void, CaptureError> PipeWireCapture::start(const std::string& device_uid,
                                                         Callbacks callbacks) {
    if (capturing_.load(std::memory_order_relaxed)) stop();

    callbacks_ = std::move(callbacks);
    device_uid_ = device_uid;
    rate_.store(0);
    channels_.store(0);
    state_ = PW_STREAM_STATE_UNCONNECTED;
    state_error_.clear();

    loop_ = pw_thread_loop_new("mute-capture", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return std::unexpected(CaptureError::EngineCreationFailed);
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "mute",
        PW_KEY_APP_NAME, "mute",
        nullptr
    );
    if (!device_uid.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device_uid.c_str());
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "mute-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        teardown();
        return std::unexpected(CaptureError::EngineCreationFailed);
    }

    // F32 only. Rate and channels stay open so the source's native format is used.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(.format = SPA_AUDIO_FORMAT_F32);
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);
    if (!params[0]) {
        teardown();
        return std::unexpected(CaptureError::FormatCreationFailed);
    }

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );

    if (ret < 0) {
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        teardown();
        return std::unexpected(ret == -EACCES || ret == -EPERM ? CaptureError::PermissionDenied
                                                               : CaptureError::EngineCreationFailed);
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        teardown();
        return std::unexpected(CaptureError::EngineCreationFailed);
    }

    capturing_.store(true, std::memory_order_release);

    pw_thread_loop_lock(loop_);
    for (int i = 0; i < kStateWaitSeconds && !settled(state_); ++i) {
        pw_thread_loop_timed_wait(loop_, 1);
    }
    bool failed = state_ == PW_STREAM_STATE_ERROR;
    std::string error = state_error_;
    pw_thread_loop_unlock(loop_);

    if (failed) {
        std::println(stderr, "audio: stream error: {}", error);
        stop();
        return std::unexpected(classify(error));
    }

    return {};
}

void PipeWireCapture::stop() {
    capturing_.store(false, std::memory_order_release);
    teardown();
}

void PipeWireCapture::teardown() {
    // Stopping joins the loop thread, so no callback runs after this.
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

std::optional<CaptureFormat> PipeWireCapture::current_format() const {
    uint32_t rate = rate_.load(std::memory_order_acquire);
    uint32_t channels = channels_.load(std::memory_order_acquire);
    if (rate == 0 || channels == 0) return std::nullopt;
    return CaptureFormat{.sample_rate = rate, .channels = channels};
}

CaptureError PipeWireCapture::classify(const std::string& error) const {
    if (error.find("ermission") != std::string::npos ||
        error.find("ccess") != std::string::npos) {
        return CaptureError::PermissionDenied;
    }
    if (!device_uid_.empty() &&
        (error.find("not found") != std::string::npos ||
         error.find("no target") != std::string::npos)) {
        return CaptureError::DeviceNotFound;
    }
    if (device_uid_.empty()) return CaptureError::NoInputDevice;
    return CaptureError::EngineCreationFailed;
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || !d->chunk) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto format = self->current_format();
    if (format && self->capturing_.load(std::memory_order_relaxed) && self->callbacks_.on_frames) {
        auto* data = reinterpret_cast<const float*>(static_cast<const uint8_t*>(d->data) +
                                                    d->chunk->offset);
        size_t count = d->chunk->size / sizeof(float);
        if (count > 0) {
            self->callbacks_.on_frames(std::span<const float>(data, count), *format);
        }
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_param_changed(void* userdata, uint32_t id, const struct spa_pod* param) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    if (!param || id != SPA_PARAM_Format) return;

    uint32_t media_type = 0;
    uint32_t media_subtype = 0;
    if (spa_format_parse(param, &media_type, &media_subtype) < 0) return;
    if (media_type != SPA_MEDIA_TYPE_audio || media_subtype != SPA_MEDIA_SUBTYPE_raw) return;

    spa_audio_info_raw info{};
    if (spa_format_audio_raw_parse(param, &info) < 0) return;
    if (info.rate == 0 || info.channels == 0) return;

    uint32_t old_rate = self->rate_.exchange(info.rate, std::memory_order_acq_rel);
    uint32_t old_channels = self->channels_.exchange(info.channels, std::memory_order_acq_rel);

    bool renegotiated = old_rate != 0 && (old_rate != info.rate || old_channels != info.channels);
    if (renegotiated && self->callbacks_.on_format_changed) {
        self->callbacks_.on_format_changed(CaptureFormat{
            .sample_rate = info.rate,
            .channels = info.channels,
        });
    }
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);
    self->state_ = state;
    if (error) {
        self->state_error_ = error;
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
    pw_thread_loop_signal(self->loop_, false);
}
