#pragma once

#include "audio/audio_format.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

enum class CaptureError {
    EngineCreationFailed,
    NoInputDevice,
    FormatCreationFailed,
    DeviceNotFound,
    PermissionDenied,
};

inline std::string_view to_string(CaptureError e) {
    switch (e) {
        case CaptureError::EngineCreationFailed: return "failed to create audio engine";
        case CaptureError::NoInputDevice: return "no input device available";
        case CaptureError::FormatCreationFailed: return "failed to create audio format";
        case CaptureError::DeviceNotFound: return "audio device not found";
        case CaptureError::PermissionDenied: return "microphone permission denied";
    }
    return "unknown capture error";
}

// One open input stream. Callbacks fire on the audio thread.
class AudioCapture {
public:
    struct Callbacks {
        std::function<void(std::span<const float> interleaved, const CaptureFormat& format)> on_frames;
        std::function<void(const CaptureFormat& format)> on_format_changed;
    };

    virtual ~AudioCapture() = default;
    // Empty device uid selects the system default input.
    virtual std::expected<void, CaptureError> start(const std::string& device_uid,
                                                    Callbacks callbacks) = 0;
    // Returns once no further callbacks can fire.
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual std::optional<CaptureFormat> current_format() const = 0;
};
