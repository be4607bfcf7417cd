#include "backend/protocol.hpp"

#include <array>
#include <bit>
#include <cstring>
#include <glib.h>
#include <memory>
#include <utility>

using json = nlohmann::json;

namespace protocol {

namespace {

constexpr std::array<std::pair<std::string_view, InboundType>, 14> INBOUND_TYPES = {{
    {"ready", InboundType::Ready},
    {"partial", InboundType::Partial},
    {"final", InboundType::Final},
    {"interval_transcription", InboundType::IntervalTranscription},
    {"error", InboundType::Error},
    {"model_progress", InboundType::ModelProgress},
    {"model_downloaded", InboundType::ModelDownloaded},
    {"model_loaded", InboundType::ModelLoaded},
    {"model_error", InboundType::ModelError},
    {"models_list", InboundType::ModelsList},
    {"pong", InboundType::Pong},
    {"keep_warm_updated", InboundType::KeepWarmUpdated},
    {"model_unloaded", InboundType::ModelUnloaded},
    {"recording_ready", InboundType::RecordingReady},
}};

uint32_t to_little_endian(uint32_t v) {
    if constexpr (std::endian::native == std::endian::big) {
        return std::byteswap(v);
    }
    return v;
}

} // namespace

std::string_view to_string(InboundType type) {
    for (const auto& [name, t] : INBOUND_TYPES) {
        if (t == type) return name;
    }
    return "unknown";
}

std::expected<Inbound, std::string> parse(std::string_view text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) return std::unexpected("message is not an object");
    if (!j.contains("type") || !j["type"].is_string()) {
        return std::unexpected("message has no type");
    }

    auto type = j["type"].get<std::string>();
    for (const auto& [name, t] : INBOUND_TYPES) {
        if (name == type) return Inbound{t, std::move(j)};
    }
    return std::unexpected("unknown message type: " + type);
}

std::vector<ModelInfo> parse_models(const json& body) {
    std::vector<ModelInfo> models;
    if (!body.contains("models") || !body["models"].is_array()) return models;

    for (const auto& m : body["models"]) {
        if (!m.is_object()) continue;
        try {
            models.push_back({
                .id = m.value("id", ""),
                .name = m.value("name", ""),
                .description = m.value("description", ""),
                .size = m.value("size", ""),
                .downloaded = m.value("downloaded", false),
                .loaded = m.value("loaded", false),
                .available = m.value("available", true),
            });
        } catch (const json::exception&) {
            // Wrongly typed fields: skip the entry.
        }
    }
    return models;
}

std::string encode_samples(std::span<const float> samples) {
    std::vector<uint8_t> bytes(samples.size() * sizeof(float));
    for (size_t i = 0; i < samples.size(); ++i) {
        uint32_t bits = to_little_endian(std::bit_cast<uint32_t>(samples[i]));
        std::memcpy(bytes.data() + i * sizeof(float), &bits, sizeof(bits));
    }
    std::unique_ptr<gchar, decltype(&g_free)> b64(
        g_base64_encode(reinterpret_cast<const guchar*>(bytes.data()), bytes.size()), &g_free);
    return b64 ? std::string(b64.get()) : std::string{};
}

json start(const std::string& model, bool diarization, bool continuous) {
    return {
        {"type", "start"},
        {"settings", {
            {"model", model},
            {"enable_diarization", diarization},
            {"continuous_mode", continuous},
        }},
    };
}

json stop() { return {{"type", "stop"}}; }

json audio(const AudioChunk& chunk) {
    return {
        {"type", "audio"},
        {"data", encode_samples(chunk.samples)},
        {"timestamp", chunk.timestamp_ms},
    };
}

json transcribe_interval() { return {{"type", "transcribe_interval"}}; }
json ping() { return {{"type", "ping"}}; }
json download_model() { return {{"type", "download_model"}}; }
json clear_cache() { return {{"type", "clear_cache"}}; }
json get_models() { return {{"type", "get_models"}}; }

json load_model(const std::string& model) {
    return {{"type", "load_model"}, {"model", model}};
}

json set_keep_warm(const std::vector<std::string>& models, const std::string& duration) {
    return {{"type", "set_keep_warm"}, {"models", models}, {"duration", duration}};
}

} // namespace protocol
