#include "audio/capture_engine.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>

AudioCaptureEngine::AudioCaptureEngine(AudioCapture& capture, DeviceEnumerator& devices,
                                       CaptureSettings settings, bool verbose)
    : capture_(capture), devices_(devices), settings_(settings), verbose_(verbose),
      chunker_(settings.target_rate, settings.chunk_ms) {
    chunker_.set_emit([this](AudioChunk chunk) {
        if (on_chunk_) on_chunk_(std::move(chunk));
    });
    restart_thread_ = std::jthread([this](std::stop_token stop) { restart_loop(stop); });
}

AudioCaptureEngine::~AudioCaptureEngine() {
    restart_thread_.request_stop();
    restart_cv_.notify_all();
    if (restart_thread_.joinable()) restart_thread_.join();

    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load()) {
        capture_.stop();
        running_.store(false);
    }
}

std::expected<CaptureStart, std::string> AudioCaptureEngine::start(const std::string& device_uid,
                                                                   ChunkCallback on_chunk) {
    {
        // Only the previous opener (a hot-swap restart) is waited for here.
        std::unique_lock lock(lifecycle_mutex_);
        idle_cv_.wait(lock, [this] { return !opening_; });
        stop_requested_.store(false);

        if (running_.load()) close_locked();

        {
            std::lock_guard policy(policy_mutex_);
            restarts_ = 0;
            last_restart_.reset();
        }

        on_chunk_ = std::move(on_chunk);
        chunker_.reset();
        opening_ = true;
    }

    std::string target = device_uid;
    bool fell_back = false;

    if (!target.empty()) {
        auto devices = devices_.input_devices();
        bool found = std::ranges::any_of(devices, [&](const AudioDevice& d) { return d.uid == target; });
        if (!found) {
            std::println(stderr, "audio: device '{}' not found, using default input", target);
            target.clear();
            fell_back = true;
        }
    }

    auto opened = open_with_retries(target, settings_.start_attempts);
    int attempts = opened ? *opened : settings_.start_attempts;

    if (!opened && opened.error().retryable && !target.empty() && !stop_requested_.load()) {
        std::println(stderr, "audio: no audio from '{}', falling back to default input", target);
        target.clear();
        fell_back = true;
        opened = open_with_retries(target, 1);
        if (opened) attempts += *opened;
    }

    std::lock_guard lock(lifecycle_mutex_);
    opening_ = false;
    idle_cv_.notify_all();

    if (opened && stop_requested_.load()) {
        capture_.stop();
        flowing_.store(false);
        opened = std::unexpected(OpenFailure{"capture start aborted", false});
    }
    if (!opened) {
        on_chunk_ = nullptr;
        return std::unexpected(opened.error().message);
    }

    device_ = target;
    running_.store(true, std::memory_order_release);
    ++epoch_;
    log(std::format("audio: capturing from {} after {} attempt(s)",
                    device_.empty() ? "default input" : device_, attempts));

    return CaptureStart{
        .device_uid = device_,
        .fell_back = fell_back,
        .attempts = attempts,
        .epoch = epoch_,
    };
}

// Never waits for an open in progress: the opener sees stop_requested_ and
// tears its stream down itself.
void AudioCaptureEngine::stop() {
    stop_requested_.store(true);
    std::lock_guard lock(lifecycle_mutex_);
    if (opening_) {
        running_.store(false, std::memory_order_release);
        return;
    }
    if (!running_.load()) return;
    close_locked();
}

void AudioCaptureEngine::stop_if_current(uint64_t epoch) {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.load() || epoch != epoch_) return;
    if (opening_) {
        stop_requested_.store(true);
        running_.store(false, std::memory_order_release);
        return;
    }
    close_locked();
}

void AudioCaptureEngine::close_locked() {
    capture_.stop();
    running_.store(false, std::memory_order_release);
    flowing_.store(false);
    chunker_.flush();
    log(std::format("audio: capture stopped, {} chunks emitted", chunker_.emitted()));
}

std::expected<int, AudioCaptureEngine::OpenFailure>
AudioCaptureEngine::open_with_retries(const std::string& uid, int attempts) {
    std::string last_error = "no audio received";

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (stop_requested_.load()) {
            return std::unexpected(OpenFailure{"capture start aborted", false});
        }

        flowing_.store(false);
        auto started = capture_.start(uid, callbacks());
        if (!started) {
            last_error = std::string(to_string(started.error()));
            if (started.error() == CaptureError::PermissionDenied) {
                return std::unexpected(OpenFailure{last_error, false});
            }
        } else if (wait_for_flow()) {
            if (stop_requested_.load()) {
                capture_.stop();
                return std::unexpected(OpenFailure{"capture start aborted", false});
            }
            return attempt;
        } else {
            last_error = "no audio received";
            capture_.stop();
        }

        std::println(stderr, "audio: start attempt {}/{} failed: {}", attempt, attempts, last_error);
        if (attempt < attempts) std::this_thread::sleep_for(settings_.retry_pause);
    }

    return std::unexpected(OpenFailure{last_error, true});
}

bool AudioCaptureEngine::wait_for_flow() {
    auto deadline = Clock::now() + settings_.flow_wait;
    while (!flowing_.load(std::memory_order_acquire)) {
        if (stop_requested_.load() || Clock::now() >= deadline) break;
        std::this_thread::sleep_for(settings_.flow_poll);
    }
    return flowing_.load(std::memory_order_acquire) || stop_requested_.load();
}

AudioCapture::Callbacks AudioCaptureEngine::callbacks() {
    return {
        .on_frames = [this](std::span<const float> frames, const CaptureFormat& format) {
            flowing_.store(true, std::memory_order_release);
            chunker_.push(frames, format);
        },
        .on_format_changed = [this](const CaptureFormat& format) {
            on_configuration_change(format);
        },
    };
}

bool AudioCaptureEngine::should_restart(const CaptureFormat& format, Clock::time_point now) const {
    if (!running_.load()) return false;

    std::lock_guard lock(policy_mutex_);
    if (restarts_ >= settings_.max_format_restarts) return false;
    if (last_restart_ && now - *last_restart_ < settings_.restart_debounce) return false;

    double drift = std::abs(static_cast<double>(format.sample_rate) - settings_.target_rate);
    if (flowing_.load() && drift < settings_.format_tolerance_hz) return false;

    return true;
}

void AudioCaptureEngine::on_configuration_change(const CaptureFormat& format) {
    auto now = Clock::now();
    if (!should_restart(format, now)) {
        log(std::format("audio: ignoring format change to {} Hz / {} ch",
                        format.sample_rate, format.channels));
        return;
    }

    {
        std::lock_guard lock(policy_mutex_);
        ++restarts_;
        last_restart_ = now;
    }

    std::println(stderr, "audio: format changed to {} Hz / {} ch, restarting capture",
                 format.sample_rate, format.channels);
    {
        std::lock_guard lock(restart_mutex_);
        restart_pending_ = true;
    }
    restart_cv_.notify_one();
}

int AudioCaptureEngine::format_restarts() const {
    std::lock_guard lock(policy_mutex_);
    return restarts_;
}

void AudioCaptureEngine::restart_loop(std::stop_token stop) {
    while (true) {
        {
            std::unique_lock lock(restart_mutex_);
            if (!restart_cv_.wait(lock, stop, [this] { return restart_pending_; })) return;
            restart_pending_ = false;

            // Let the audio server settle on the new route.
            restart_cv_.wait_for(lock, stop, settings_.restart_settle, [] { return false; });
            if (stop.stop_requested()) return;
        }
        restart_now();
    }
}

void AudioCaptureEngine::restart_now() {
    std::string device;
    {
        std::lock_guard lock(lifecycle_mutex_);
        if (!running_.load() || stop_requested_.load() || opening_) return;

        capture_.stop();
        flowing_.store(false);
        opening_ = true;
        device = device_;
    }

    auto opened = open_with_retries(device, settings_.restart_start_attempts);

    std::string failure;
    {
        std::lock_guard lock(lifecycle_mutex_);
        opening_ = false;
        idle_cv_.notify_all();

        if (stop_requested_.load() || !running_.load()) {
            // Stopped while reopening.
            if (opened) capture_.stop();
            running_.store(false, std::memory_order_release);
            flowing_.store(false);
            chunker_.flush();
            return;
        }
        if (!opened) {
            running_.store(false, std::memory_order_release);
            chunker_.flush();
            failure = opened.error().message;
        }
    }

    if (!failure.empty()) {
        std::println(stderr, "audio: restart failed: {}", failure);
        if (on_failure_) on_failure_(failure);
        return;
    }
    log("audio: capture restarted");
}

void AudioCaptureEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
