#include "session_controller.hpp"

#include "backend/protocol.hpp"

#include <format>
#include <print>

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Starting: return "starting";
        case SessionState::Recording: return "recording";
        case SessionState::Processing: return "processing";
        case SessionState::Done: return "done";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

std::string_view to_string(SessionMode mode) {
    switch (mode) {
        case SessionMode::QuickDictation: return "quick";
        case SessionMode::ContinuousCapture: return "continuous";
    }
    return "unknown";
}

std::optional<SessionMode> parse_session_mode(std::string_view text) {
    if (text == "quick" || text == "dictation") return SessionMode::QuickDictation;
    if (text == "continuous" || text == "notes") return SessionMode::ContinuousCapture;
    return std::nullopt;
}

SessionController::SessionController(Scheduler& scheduler, ConnectionManager& connection,
                                     AudioCaptureEngine& engine, BlockingRunner run_blocking,
                                     SessionSettings settings, bool verbose)
    : scheduler_(scheduler), connection_(connection), engine_(engine),
      run_blocking_(std::move(run_blocking)), settings_(settings), verbose_(verbose),
      start_timer_(scheduler), processing_timer_(scheduler), interval_timer_(scheduler) {
    connection_.add_listener(this);

    std::weak_ptr<bool> alive = alive_;
    engine_.set_failure_handler([this, alive](const std::string& reason) {
        scheduler_.post([this, alive, reason]() {
            if (auto a = alive.lock(); a && *a) on_capture_failed(reason);
        });
    });
}

SessionController::~SessionController() {
    engine_.set_failure_handler(nullptr);
    engine_.stop();
    gate_.close();
    connection_.remove_listener(this);
    *alive_ = false;
}

bool SessionController::is_active() const {
    return session_.state == SessionState::Starting ||
           session_.state == SessionState::Recording ||
           session_.state == SessionState::Processing;
}

// --- Start ---

std::expected<void, std::string> SessionController::start_session(SessionMode mode,
                                                                  const std::string& model,
                                                                  const std::string& device_uid,
                                                                  bool diarization) {
    if (is_active()) {
        return std::unexpected(std::format("busy: session is {}", to_string(session_.state)));
    }

    start_timer_.reset();
    processing_timer_.reset();
    interval_timer_.reset();
    gate_.close();

    session_ = Session{
        .mode = mode,
        .model = model,
        .diarization = diarization,
        .device_uid = device_uid.empty() ? selected_device_ : device_uid,
        .generation = ++next_generation_,
        .started_at = scheduler_.now(),
    };
    start_ = {};

    uint64_t gen = session_.generation;
    log(std::format("session {}: starting ({}, model '{}', device '{}')", gen, to_string(mode),
                    model, session_.device_uid.empty() ? "default" : session_.device_uid));
    set_state(SessionState::Starting);

    start_timer_.arm(settings_.ready_timeout, [this, gen]() {
        if (gen != session_.generation || session_.state != SessionState::Starting) return;
        std::println(stderr, "session: backend not ready after {} ms",
                     settings_.ready_timeout.count());
        fail_start(start_.backend_ready ? "audio capture did not start in time"
                                        : "backend not ready (timeout)");
    });

    std::weak_ptr<bool> alive = alive_;

    start_.request = connection_.request_recording(
        {.model = model, .diarization = diarization,
         .continuous = mode == SessionMode::ContinuousCapture},
        [this, gen](std::expected<std::string, std::string> result) {
            on_backend_ready(gen, std::move(result));
        });

    // The chunk callback runs on the audio thread: it only consults the gate.
    auto on_chunk = [this, gen, alive](AudioChunk chunk) {
        if (!gate_.is_open()) return;
        scheduler_.post([this, gen, alive, chunk = std::move(chunk)]() mutable {
            if (auto a = alive.lock(); a && *a) forward_chunk(gen, std::move(chunk));
        });
    };

    run_blocking_([this, gen, alive, device = session_.device_uid, on_chunk = std::move(on_chunk)]() mutable {
        auto result = engine_.start(device, std::move(on_chunk));
        scheduler_.post([this, gen, alive, result = std::move(result)]() mutable {
            if (auto a = alive.lock(); a && *a) on_capture_started(gen, std::move(result));
        });
    });

    return {};
}

void SessionController::on_backend_ready(uint64_t generation,
                                         std::expected<std::string, std::string> result) {
    if (generation != session_.generation || session_.state != SessionState::Starting) {
        log(std::format("session: dropping ready ack for session {}", generation));
        return;
    }
    start_.request.reset();

    if (!result) {
        fail_start(result.error());
        return;
    }

    if (!result->empty()) session_.model = *result;
    gate_.open();
    start_.backend_ready = true;
    log(std::format("session {}: backend ready ({})", generation, session_.model));
    maybe_begin_recording();
}

void SessionController::on_capture_started(uint64_t generation,
                                           std::expected<CaptureStart, std::string> result) {
    if (generation != session_.generation || session_.state != SessionState::Starting) {
        if (result) {
            log(std::format("session: stopping capture started for session {}", generation));
            engine_.stop_if_current(result->epoch);
        }
        return;
    }

    if (!result) {
        fail_start("audio: " + result.error());
        return;
    }

    start_.capture_ready = true;
    start_.capture_epoch = result->epoch;
    session_.device_uid = result->device_uid;
    session_.device_fell_back = result->fell_back;
    if (result->fell_back) {
        std::println(stderr, "session: requested device unavailable, recording from default input");
    }
    maybe_begin_recording();
}

void SessionController::on_capture_failed(const std::string& reason) {
    if (session_.state == SessionState::Starting) {
        fail_start("audio: " + reason);
    } else if (session_.state == SessionState::Recording) {
        fail_active("audio: " + reason);
    }
}

void SessionController::maybe_begin_recording() {
    if (!start_.backend_ready || !start_.capture_ready) return;

    start_timer_.reset();
    session_.recording_at = scheduler_.now();
    set_state(SessionState::Recording);

    if (session_.mode == SessionMode::ContinuousCapture) schedule_interval();
}

void SessionController::fail_start(const std::string& reason) {
    start_timer_.reset();
    if (start_.request) {
        connection_.cancel_recording_request(*start_.request);
        start_.request.reset();
    }
    gate_.close();
    connection_.send_stop();

    if (start_.capture_epoch) {
        engine_.stop_if_current(*start_.capture_epoch);
    } else {
        engine_.stop();
    }

    std::println(stderr, "session: start failed: {}", reason);
    set_state(SessionState::Error, reason);
}

// --- Audio ---

void SessionController::forward_chunk(uint64_t generation, AudioChunk chunk) {
    if (generation != session_.generation || !gate_.is_open()) return;
    if (session_.state != SessionState::Starting && session_.state != SessionState::Recording) return;
    connection_.send_audio(chunk);
}

void SessionController::schedule_interval() {
    interval_timer_.arm(settings_.interval, [this]() {
        if (session_.state != SessionState::Recording ||
            session_.mode != SessionMode::ContinuousCapture) {
            return;
        }
        connection_.send(protocol::transcribe_interval());
        schedule_interval();
    });
}

// --- Stop / cancel ---

void SessionController::stop_session() {
    if (session_.state != SessionState::Recording) {
        log(std::format("session: stop ignored while {}", to_string(session_.state)));
        return;
    }

    gate_.close();
    interval_timer_.reset();
    engine_.stop();
    connection_.send_stop();

    session_.stopped_at = scheduler_.now();
    set_state(SessionState::Processing);

    uint64_t gen = session_.generation;
    processing_timer_.arm(settings_.processing_timeout, [this, gen]() {
        on_processing_timeout(gen);
    });
}

void SessionController::cancel_session() {
    if (session_.state != SessionState::Recording) {
        log(std::format("session: cancel ignored while {}", to_string(session_.state)));
        return;
    }

    gate_.close();
    interval_timer_.reset();
    engine_.stop();
    connection_.send_stop();

    session_.partial.clear();
    session_.intervals.clear();
    session_.final_text.clear();
    session_.transcript.clear();
    set_state(SessionState::Idle);
}

void SessionController::on_processing_timeout(uint64_t generation) {
    if (generation != session_.generation || session_.state != SessionState::Processing) return;

    std::println(stderr, "session: no final transcript after {} ms",
                 settings_.processing_timeout.count());
    set_state(SessionState::Error, "processing timeout");
    connection_.reconnect();
}

void SessionController::fail_active(const std::string& reason) {
    start_timer_.reset();
    processing_timer_.reset();
    interval_timer_.reset();
    gate_.close();
    engine_.stop();

    std::println(stderr, "session: {}", reason);
    set_state(SessionState::Error, reason);
}

// --- Inbound ---

void SessionController::on_partial(const std::string& text) {
    if (session_.state != SessionState::Recording) return;
    session_.partial = text;
    notify_transcript();
}

void SessionController::on_interval(const std::string& text) {
    if (session_.state != SessionState::Recording && session_.state != SessionState::Processing) {
        return;
    }
    if (text.empty()) return;

    session_.intervals.push_back(text);
    session_.transcript.clear();
    for (const auto& t : session_.intervals) {
        if (!session_.transcript.empty()) session_.transcript += ' ';
        session_.transcript += t;
    }
    notify_transcript();
}

void SessionController::on_final(const std::string& text, const std::string& model) {
    if (session_.state != SessionState::Processing) {
        log(std::format("session: final transcript ignored while {}", to_string(session_.state)));
        return;
    }
    processing_timer_.reset();

    session_.final_text = text;
    if (!text.empty()) {
        if (!session_.transcript.empty()) session_.transcript += ' ';
        session_.transcript += text;
    }
    if (!model.empty()) session_.model = model;
    session_.finished_at = scheduler_.now();

    notify_transcript();
    set_state(SessionState::Done);
}

void SessionController::on_backend_error(const std::string& message) {
    switch (session_.state) {
        case SessionState::Starting:
            // Before the ack the pending request carries the error.
            if (start_.backend_ready) fail_start(message);
            break;
        case SessionState::Recording:
        case SessionState::Processing:
            fail_active(message);
            break;
        default:
            break;
    }
}

// --- Devices ---

void SessionController::on_devices_changed(const std::vector<AudioDevice>& devices) {
    if (selected_device_.empty()) return;

    for (const auto& d : devices) {
        if (d.uid == selected_device_) return;
    }
    std::println(stderr, "session: selected device '{}' disappeared, using default input",
                 selected_device_);
    selected_device_.clear();
}

// --- Notification ---

void SessionController::set_state(SessionState state, std::string error) {
    session_.state = state;
    session_.error = std::move(error);
    log(std::format("session {}: {}{}", session_.generation, to_string(state),
                    session_.error.empty() ? "" : " (" + session_.error + ")"));

    auto observers = observers_;
    for (auto* o : observers) o->on_session_changed(session_);
}

void SessionController::notify_transcript() {
    auto observers = observers_;
    for (auto* o : observers) o->on_transcript(session_);
}

void SessionController::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
