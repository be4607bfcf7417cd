#pragma once

#include "audio/capture_engine.hpp"
#include "backend/connection_manager.hpp"
#include "platform/device_enumerator.hpp"
#include "ready_gate.hpp"
#include "scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class SessionState { Idle, Starting, Recording, Processing, Done, Error };
enum class SessionMode { QuickDictation, ContinuousCapture };

std::string_view to_string(SessionState state);
std::string_view to_string(SessionMode mode);
std::optional<SessionMode> parse_session_mode(std::string_view text);

struct Session {
    SessionState state = SessionState::Idle;
    std::string error;
    SessionMode mode = SessionMode::QuickDictation;
    std::string model;
    bool diarization = false;
    std::string device_uid;
    uint64_t generation = 0;

    std::string partial;
    std::vector<std::string> intervals;
    std::string final_text;
    std::string transcript; // intervals followed by the final text
    bool device_fell_back = false;
    Scheduler::Clock::time_point started_at{};
    Scheduler::Clock::time_point recording_at{};
    Scheduler::Clock::time_point stopped_at{};
    Scheduler::Clock::time_point finished_at{};
};

struct SessionSettings {
    std::chrono::milliseconds ready_timeout{30000};
    std::chrono::milliseconds processing_timeout{15000};
    std::chrono::milliseconds interval{30000};
};

class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void on_session_changed(const Session& /*session*/) {}
    virtual void on_transcript(const Session& /*session*/) {}
};

// Runs one recording session at a time: backend handshake and audio start in
// parallel, gated audio forwarding, bounded waits for the transcript.
class SessionController : public ConnectionListener {
public:
    SessionController(Scheduler& scheduler, ConnectionManager& connection,
                      AudioCaptureEngine& engine, BlockingRunner run_blocking,
                      SessionSettings settings = {}, bool verbose = false);
    ~SessionController() override;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    std::expected<void, std::string> start_session(SessionMode mode, const std::string& model,
                                                   const std::string& device_uid, bool diarization);
    void stop_session();
    void cancel_session();

    void select_device(const std::string& uid) { selected_device_ = uid; }
    const std::string& selected_device() const { return selected_device_; }
    void on_devices_changed(const std::vector<AudioDevice>& devices);

    const Session& session() const { return session_; }
    SessionState state() const { return session_.state; }
    bool is_active() const;
    const ReadyGate& gate() const { return gate_; }

    void add_observer(SessionObserver* observer) { observers_.push_back(observer); }

    void on_partial(const std::string& text) override;
    void on_final(const std::string& text, const std::string& model) override;
    void on_interval(const std::string& text) override;
    void on_backend_error(const std::string& message) override;

private:
    void on_backend_ready(uint64_t generation, std::expected<std::string, std::string> result);
    void on_capture_started(uint64_t generation, std::expected<CaptureStart, std::string> result);
    void on_capture_failed(const std::string& reason);
    void maybe_begin_recording();
    void fail_start(const std::string& reason);
    void fail_active(const std::string& reason);
    void on_processing_timeout(uint64_t generation);
    void schedule_interval();
    void forward_chunk(uint64_t generation, AudioChunk chunk);

    void set_state(SessionState state, std::string error = {});
    void notify_transcript();
    void log(const std::string& msg);

    Scheduler& scheduler_;
    ConnectionManager& connection_;
    AudioCaptureEngine& engine_;
    BlockingRunner run_blocking_;
    SessionSettings settings_;
    bool verbose_;

    Session session_;
    ReadyGate gate_;
    std::string selected_device_;
    uint64_t next_generation_ = 0;

    struct StartProgress {
        bool backend_ready = false;
        bool capture_ready = false;
        std::optional<ConnectionManager::RequestId> request;
        std::optional<uint64_t> capture_epoch;
    } start_;

    ScopedTimer start_timer_;
    ScopedTimer processing_timer_;
    ScopedTimer interval_timer_;

    std::vector<SessionObserver*> observers_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
