#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

struct CaptureFormat {
    uint32_t sample_rate = 0;
    uint32_t channels = 0;
};

struct AudioChunk {
    std::vector<float> samples;
    uint32_t sample_rate = 16000;
    uint64_t sequence = 0;
    int64_t timestamp_ms = 0;
};

namespace audio {

// Averages interleaved frames into one channel.
inline std::vector<float> downmix(std::span<const float> interleaved, uint32_t channels) {
    if (channels <= 1) return {interleaved.begin(), interleaved.end()};

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint32_t c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = sum / static_cast<float>(channels);
    }
    return mono;
}

// Streaming linear interpolation resampler. The read position and the last
// input sample carry over between blocks, so a stream split into blocks of
// any size yields the same output as one long block.
class Resampler {
public:
    Resampler(uint32_t from_rate, uint32_t to_rate) { configure(from_rate, to_rate); }

    // Changing rates drops any carried state.
    void configure(uint32_t from_rate, uint32_t to_rate) {
        from_rate_ = from_rate;
        to_rate_ = to_rate;
        step_ = to_rate == 0 ? 0.0 : static_cast<double>(from_rate) / static_cast<double>(to_rate);
        reset();
    }

    void reset() {
        pos_ = 0.0;
        have_last_ = false;
    }

    uint32_t from_rate() const { return from_rate_; }
    uint32_t to_rate() const { return to_rate_; }

    std::vector<float> process(std::span<const float> input) {
        if (from_rate_ == to_rate_ || from_rate_ == 0 || to_rate_ == 0) {
            return {input.begin(), input.end()};
        }
        if (input.empty()) return {};

        // Index 0 is the sample held from the previous block, if any.
        size_t offset = have_last_ ? 1 : 0;
        size_t count = input.size() + offset;
        auto at = [&](size_t i) { return i < offset ? last_ : input[i - offset]; };

        std::vector<float> output;
        output.reserve(static_cast<size_t>(static_cast<double>(input.size()) / step_) + 1);
        while (pos_ < static_cast<double>(count - 1)) {
            auto idx = static_cast<size_t>(pos_);
            auto frac = static_cast<float>(pos_ - static_cast<double>(idx));
            output.push_back(at(idx) * (1.0f - frac) + at(idx + 1) * frac);
            pos_ += step_;
        }

        pos_ -= static_cast<double>(count - 1);
        last_ = input.back();
        have_last_ = true;
        return output;
    }

    // Emits the held sample when the read position sits exactly on it.
    std::vector<float> drain() {
        std::vector<float> output;
        if (have_last_ && from_rate_ != to_rate_ && pos_ == 0.0) output.push_back(last_);
        reset();
        return output;
    }

private:
    uint32_t from_rate_ = 0;
    uint32_t to_rate_ = 0;
    double step_ = 0.0;
    double pos_ = 0.0;
    float last_ = 0.0f;
    bool have_last_ = false;
};

inline size_t samples_per_chunk(uint32_t sample_rate, uint32_t chunk_ms) {
    return static_cast<size_t>(sample_rate) * chunk_ms / 1000;
}

} // namespace audio
