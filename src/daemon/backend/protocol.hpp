#pragma once

#include "audio/audio_format.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// JSON text frames exchanged with the inference backend, tagged by "type".
namespace protocol {

enum class InboundType {
    Ready,
    Partial,
    Final,
    IntervalTranscription,
    Error,
    ModelProgress,
    ModelDownloaded,
    ModelLoaded,
    ModelError,
    ModelsList,
    Pong,
    KeepWarmUpdated,
    ModelUnloaded,
    RecordingReady,
};

struct Inbound {
    InboundType type;
    nlohmann::json body;
};

struct ModelInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string size;
    bool downloaded = false;
    bool loaded = false;
    bool available = true;
};

std::string_view to_string(InboundType type);

// Rejects malformed JSON, non-objects and unknown or missing types.
std::expected<Inbound, std::string> parse(std::string_view text);

std::vector<ModelInfo> parse_models(const nlohmann::json& body);

// Little-endian float32 PCM, base64 encoded.
std::string encode_samples(std::span<const float> samples);

nlohmann::json start(const std::string& model, bool diarization, bool continuous);
nlohmann::json stop();
nlohmann::json audio(const AudioChunk& chunk);
nlohmann::json transcribe_interval();
nlohmann::json ping();
nlohmann::json download_model();
nlohmann::json clear_cache();
nlohmann::json get_models();
nlohmann::json load_model(const std::string& model);
nlohmann::json set_keep_warm(const std::vector<std::string>& models, const std::string& duration);

} // namespace protocol
