#pragma once

#include "audio/audio_format.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

// Converts captured frames to mono at the target rate and cuts them into
// fixed-duration chunks. Not thread-safe: owned by whichever thread feeds it.
class Chunker {
public:
    using Emit = std::function<void(AudioChunk)>;

    Chunker(uint32_t target_rate, uint32_t chunk_ms);

    void set_emit(Emit emit) { emit_ = std::move(emit); }

    // Interleaved frames in the source format.
    void push(std::span<const float> interleaved, const CaptureFormat& format);

    // Emits whatever is buffered as one short chunk and drops the
    // resampler's carried position.
    void flush();

    void reset();

    size_t buffered() const { return buffer_.size(); }
    size_t chunk_samples() const { return chunk_samples_; }
    uint64_t emitted() const { return sequence_; }

private:
    void emit(std::vector<float> samples);

    uint32_t target_rate_;
    size_t chunk_samples_;
    audio::Resampler resampler_;
    std::vector<float> buffer_;
    uint64_t sequence_ = 0;
    Emit emit_;
};
