#include "audio/chunker.hpp"

Chunker::Chunker(uint32_t target_rate, uint32_t chunk_ms)
    : target_rate_(target_rate),
      chunk_samples_(audio::samples_per_chunk(target_rate, chunk_ms)),
      resampler_(target_rate, target_rate) {
    buffer_.reserve(chunk_samples_ * 2);
}

void Chunker::push(std::span<const float> interleaved, const CaptureFormat& format) {
    if (interleaved.empty() || format.sample_rate == 0) return;

    auto mono = audio::downmix(interleaved, format.channels);
    if (resampler_.from_rate() != format.sample_rate) {
        resampler_.configure(format.sample_rate, target_rate_);
    }
    auto converted = resampler_.process(mono);
    buffer_.insert(buffer_.end(), converted.begin(), converted.end());

    if (chunk_samples_ == 0) return;

    size_t offset = 0;
    while (buffer_.size() - offset >= chunk_samples_) {
        auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(offset);
        emit({first, first + static_cast<std::ptrdiff_t>(chunk_samples_)});
        offset += chunk_samples_;
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
}

void Chunker::flush() {
    auto tail = resampler_.drain();
    buffer_.insert(buffer_.end(), tail.begin(), tail.end());
    if (buffer_.empty()) return;
    std::vector<float> rest;
    rest.swap(buffer_);
    emit(std::move(rest));
}

void Chunker::reset() {
    resampler_.reset();
    buffer_.clear();
    sequence_ = 0;
}

void Chunker::emit(std::vector<float> samples) {
    AudioChunk chunk{
        .samples = std::move(samples),
        .sample_rate = target_rate_,
        .sequence = sequence_++,
        .timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count(),
    };
    if (emit_) emit_(std::move(chunk));
}
