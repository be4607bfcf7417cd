#include "backend/connection_manager.hpp"

#include <algorithm>
#include <format>
#include <print>

using json = nlohmann::json;

std::string_view to_string(ConnectionPhase phase) {
    switch (phase) {
        case ConnectionPhase::Disconnected: return "disconnected";
        case ConnectionPhase::Connecting: return "connecting";
        case ConnectionPhase::Connected: return "connected";
        case ConnectionPhase::Error: return "error";
    }
    return "unknown";
}

std::string_view to_string(ModelState state) {
    switch (state) {
        case ModelState::Unknown: return "unknown";
        case ModelState::Ready: return "ready";
        case ModelState::NotDownloaded: return "not_downloaded";
        case ModelState::Downloading: return "downloading";
        case ModelState::Downloaded: return "downloaded";
        case ModelState::Error: return "error";
    }
    return "unknown";
}

template <typename F>
void ConnectionManager::for_each_listener(F&& f) {
    auto listeners = listeners_;
    for (auto* l : listeners) f(l);
}

ConnectionManager::ConnectionManager(MessageChannel& channel, Scheduler& scheduler,
                                     ConnectionSettings settings, bool verbose)
    : channel_(channel), scheduler_(scheduler), settings_(std::move(settings)),
      verbose_(verbose),
      heartbeat_timer_(scheduler), reconnect_timer_(scheduler),
      probe_timer_(scheduler), wake_timer_(scheduler) {}

ConnectionManager::~ConnectionManager() {
    *alive_ = false;
    if (channel_open_) channel_.close();
}

void ConnectionManager::add_listener(ConnectionListener* listener) {
    listeners_.push_back(listener);
}

void ConnectionManager::remove_listener(ConnectionListener* listener) {
    std::erase(listeners_, listener);
}

void ConnectionManager::set_recovery_hooks(std::function<bool()> process_running,
                                           std::function<void()> start_backend,
                                           std::function<void()> restart_backend) {
    process_running_ = std::move(process_running);
    start_backend_ = std::move(start_backend);
    restart_backend_ = std::move(restart_backend);
}

// --- Lifecycle ---

void ConnectionManager::connect() {
    if (state_.phase == ConnectionPhase::Connected) return;
    if (state_.phase == ConnectionPhase::Connecting && channel_open_) return;

    reconnect_timer_.reset();
    state_.reconnect_attempts = 0;
    open_channel();
}

void ConnectionManager::disconnect() {
    reconnect_timer_.reset();
    wake_timer_.reset();
    close_channel();

    if (state_.phase != ConnectionPhase::Disconnected) {
        set_phase(ConnectionPhase::Disconnected);
    }
    fail_any_pending("disconnected from backend");
    resolve_probes(false);

    queue_.clear();
    state_.queued = 0;
}

void ConnectionManager::reconnect() {
    log("connection: reconnecting");
    reconnect_timer_.reset();
    close_channel();
    state_.reconnect_attempts = 0;
    open_channel();

    fail_any_pending("reconnecting to backend");
    resolve_probes(false);
}

void ConnectionManager::open_channel() {
    ++epoch_;
    channel_open_ = true;
    set_phase(ConnectionPhase::Connecting, state_.error);

    uint64_t epoch = epoch_;
    std::weak_ptr<bool> alive = alive_;

    MessageChannel::Handlers handlers{
        .on_open = [this, epoch, alive]() {
            scheduler_.post([this, epoch, alive]() {
                if (auto a = alive.lock(); a && *a) handle_open(epoch);
            });
        },
        .on_message = [this, epoch, alive](std::string text) {
            scheduler_.post([this, epoch, alive, text = std::move(text)]() {
                if (auto a = alive.lock(); a && *a) handle_message(epoch, text);
            });
        },
        .on_closed = [this, epoch, alive](std::string reason) {
            scheduler_.post([this, epoch, alive, reason = std::move(reason)]() {
                auto a = alive.lock();
                if (!a || !*a || epoch != epoch_) return;
                handle_failure(reason);
            });
        },
    };

    log("connection: connecting to " + settings_.url);
    if (!channel_.open(settings_.url, std::move(handlers))) {
        scheduler_.post([this, epoch, alive]() {
            auto a = alive.lock();
            if (!a || !*a || epoch != epoch_) return;
            handle_failure("could not open channel");
        });
    }
}

void ConnectionManager::close_channel() {
    heartbeat_timer_.reset();
    ++epoch_;
    if (channel_open_) {
        channel_.close();
        channel_open_ = false;
    }
}

void ConnectionManager::handle_open(uint64_t epoch) {
    if (epoch != epoch_) return;

    log("connection: connected");
    state_.last_pong = scheduler_.now();
    set_phase(ConnectionPhase::Connected);
    schedule_heartbeat();
    flush_queue();
}

void ConnectionManager::handle_failure(const std::string& reason) {
    if (state_.phase == ConnectionPhase::Disconnected || state_.phase == ConnectionPhase::Error) {
        return;
    }

    close_channel();

    // The phase moves on before any waiter runs, so a waiter that sends
    // (a stop, say) queues instead of failing the dead channel again.
    if (state_.reconnect_attempts >= settings_.max_reconnect_attempts) {
        std::println(stderr, "connection: giving up after {} reconnect attempts ({})",
                      state_.reconnect_attempts, reason);
        set_phase(ConnectionPhase::Error, "Connection failed");
    } else {
        ++state_.reconnect_attempts;
        std::println(stderr, "connection: {} (reconnect {}/{} in {} ms)",
                     reason, state_.reconnect_attempts, settings_.max_reconnect_attempts,
                     settings_.reconnect_delay.count());
        set_phase(ConnectionPhase::Connecting, reason);
        reconnect_timer_.arm(settings_.reconnect_delay, [this]() { open_channel(); });
    }

    fail_any_pending("connection lost: " + reason);
    resolve_probes(false);
}

void ConnectionManager::schedule_heartbeat() {
    heartbeat_timer_.arm(settings_.heartbeat_interval, [this]() {
        if (state_.phase != ConnectionPhase::Connected) return;
        send(protocol::ping());
        schedule_heartbeat();
    });
}

// --- Outbound ---

void ConnectionManager::send(const json& message) {
    send_text(message.dump());
}

void ConnectionManager::send_audio(const AudioChunk& chunk) {
    send(protocol::audio(chunk));
}

void ConnectionManager::send_stop() {
    send(protocol::stop());
}

void ConnectionManager::send_text(std::string text) {
    if (state_.phase != ConnectionPhase::Connected || !channel_open_ || !flush_queue()) {
        queue_.push_back(std::move(text));
        state_.queued = queue_.size();
        return;
    }

    if (!channel_.send(text)) {
        queue_.push_back(std::move(text));
        state_.queued = queue_.size();
        handle_failure("send failed");
    }
}

bool ConnectionManager::flush_queue() {
    while (!queue_.empty()) {
        if (!channel_.send(queue_.front())) {
            state_.queued = queue_.size();
            handle_failure("send failed");
            return false;
        }
        queue_.pop_front();
    }
    state_.queued = 0;
    return true;
}

// --- Health ---

bool ConnectionManager::is_stale() const {
    if (!state_.last_pong) return true;
    return scheduler_.now() - *state_.last_pong > settings_.stale_threshold;
}

void ConnectionManager::verify(std::function<void(bool)> done) {
    if (state_.phase != ConnectionPhase::Connected) {
        done(false);
        return;
    }
    if (!is_stale()) {
        done(true);
        return;
    }
    log("connection: no pong for a while, probing");
    probe(settings_.probe_timeout, std::move(done));
}

void ConnectionManager::probe(std::chrono::milliseconds timeout, std::function<void(bool)> done) {
    probes_.push_back(std::move(done));
    if (probe_timer_.armed()) return;

    send(protocol::ping());
    probe_timer_.arm(timeout, [this]() {
        std::println(stderr, "connection: probe ping unanswered");
        resolve_probes(false);
    });
}

void ConnectionManager::resolve_probes(bool healthy) {
    probe_timer_.reset();
    auto probes = std::move(probes_);
    probes_.clear();
    for (auto& done : probes) done(healthy);
}

// --- Recording handshake ---

ConnectionManager::RequestId ConnectionManager::request_recording(const RecordingRequest& request,
                                                                  ReadyCallback callback) {
    fail_any_pending("superseded by a new recording request");

    RequestId id = ++next_request_id_;
    pending_ = PendingRequest{id, std::move(callback)};
    auto start = protocol::start(request.model, request.diarization, request.continuous);

    switch (state_.phase) {
        case ConnectionPhase::Disconnected:
        case ConnectionPhase::Error:
            scheduler_.post([this, id, alive = std::weak_ptr<bool>(alive_)]() {
                if (auto a = alive.lock(); a && *a) fail_pending(id, "backend not connected");
            });
            break;
        case ConnectionPhase::Connecting:
            // Goes out first thing once the channel opens.
            send(start);
            break;
        case ConnectionPhase::Connected:
            verify([this, id, start](bool healthy) {
                if (!pending_ || pending_->id != id) return;
                if (!healthy) {
                    fail_pending(id, "backend not responding");
                    handle_failure("stale connection");
                    return;
                }
                send(start);
            });
            break;
    }
    return id;
}

void ConnectionManager::cancel_recording_request(RequestId id) {
    if (pending_ && pending_->id == id) {
        log(std::format("connection: recording request {} cancelled", id));
        pending_.reset();
    }
}

void ConnectionManager::fail_pending(RequestId id, const std::string& reason) {
    if (!pending_ || pending_->id != id) return;
    auto callback = std::move(pending_->callback);
    pending_.reset();
    callback(std::unexpected(reason));
}

void ConnectionManager::fail_any_pending(const std::string& reason) {
    if (pending_) fail_pending(pending_->id, reason);
}

// --- Wake from sleep ---

void ConnectionManager::on_system_resume() {
    log("connection: system resumed, checking backend");
    wake_timer_.arm(settings_.wake_settle, [this]() { wake_check(); });
}

void ConnectionManager::wake_check() {
    bool running = process_running_ ? process_running_() : true;

    if (state_.phase != ConnectionPhase::Connected) {
        if (!running) {
            log("connection: backend not running after resume, starting it");
            if (start_backend_) start_backend_();
        } else {
            reconnect();
        }
        return;
    }

    probe(settings_.wake_probe_timeout, [this](bool healthy) {
        bool alive = process_running_ ? process_running_() : true;
        if (!healthy || !alive) {
            std::println(stderr, "connection: backend unhealthy after resume, restarting");
            if (restart_backend_) restart_backend_();
            return;
        }
        refresh_models();
    });
}

// --- Model management ---

void ConnectionManager::refresh_models() { send(protocol::get_models()); }

void ConnectionManager::load_model(const std::string& model) {
    send(protocol::load_model(model));
}

void ConnectionManager::download_model() {
    status_.model_state = ModelState::Downloading;
    status_.download_progress = 0.0;
    notify_status();
    send(protocol::download_model());
}

void ConnectionManager::clear_cache() { send(protocol::clear_cache()); }

void ConnectionManager::set_keep_warm(const std::vector<std::string>& models,
                                      const std::string& duration) {
    send(protocol::set_keep_warm(models, duration));
}

// --- Inbound ---

void ConnectionManager::handle_message(uint64_t epoch, const std::string& text) {
    if (epoch != epoch_) return;

    auto msg = protocol::parse(text);
    if (!msg) {
        std::println(stderr, "connection: dropping message: {}", msg.error());
        return;
    }

    try {
        dispatch(*msg);
    } catch (const json::exception& e) {
        std::println(stderr, "connection: dropping malformed {} message: {}",
                     protocol::to_string(msg->type), e.what());
    }
}

void ConnectionManager::dispatch(const protocol::Inbound& msg) {
    using protocol::InboundType;
    const auto& body = msg.body;

    switch (msg.type) {
        case InboundType::Pong:
            state_.last_pong = scheduler_.now();
            if (probe_timer_.armed()) resolve_probes(true);
            break;

        case InboundType::Ready:
            log("connection: backend ready");
            state_.reconnect_attempts = 0;
            status_.whisper_available = body.value("whisper_available", false);
            status_.active_model = body.value("active_model", "");
            status_.loaded_models = body.value("loaded_models", std::vector<std::string>{});
            status_.model_state = body.value("model_loaded", false) ? ModelState::Ready
                                                                     : ModelState::Unknown;
            for_each_listener([](ConnectionListener* l) { l->on_backend_greeting(); });
            notify_status();
            refresh_models();
            break;

        case InboundType::RecordingReady: {
            auto model = body.value("model", "");
            if (!pending_) {
                log("connection: recording_ready with no pending request, dropped");
                break;
            }
            auto callback = std::move(pending_->callback);
            pending_.reset();
            callback(model);
            break;
        }

        case InboundType::Partial: {
            auto text = body.value("text", "");
            for_each_listener([&](ConnectionListener* l) { l->on_partial(text); });
            break;
        }

        case InboundType::Final: {
            auto text = body.value("text", "");
            auto model = body.value("model", "");
            for_each_listener([&](ConnectionListener* l) { l->on_final(text, model); });
            break;
        }

        case InboundType::IntervalTranscription: {
            auto text = body.value("text", "");
            for_each_listener([&](ConnectionListener* l) { l->on_interval(text); });
            break;
        }

        case InboundType::Error: {
            auto message = body.value("message", "unknown backend error");
            std::println(stderr, "connection: backend error: {}", message);
            fail_any_pending(message);
            for_each_listener([&](ConnectionListener* l) { l->on_backend_error(message); });
            break;
        }

        case InboundType::ModelProgress:
            status_.model_state = ModelState::Downloading;
            status_.download_progress = std::clamp(body.value("percent", 0.0) / 100.0, 0.0, 1.0);
            notify_status();
            break;

        case InboundType::ModelDownloaded:
            status_.model_state = ModelState::Downloaded;
            status_.download_progress = 1.0;
            notify_status();
            break;

        case InboundType::ModelLoaded: {
            auto model = body.value("model", "");
            if (!model.empty() && std::ranges::find(status_.loaded_models, model) == status_.loaded_models.end()) {
                status_.loaded_models.push_back(model);
            }
            status_.model_state = ModelState::Ready;
            status_.model_error.clear();
            notify_status();
            refresh_models();
            break;
        }

        case InboundType::ModelError:
            status_.model_state = ModelState::Error;
            status_.model_error = body.value("message", "model error");
            std::println(stderr, "connection: model error: {}", status_.model_error);
            notify_status();
            break;

        case InboundType::ModelsList:
            status_.models = protocol::parse_models(body);
            if (body.contains("active_model") && body["active_model"].is_string()) {
                status_.active_model = body["active_model"].get<std::string>();
            }
            if (status_.model_state == ModelState::Unknown) {
                bool any_available = std::ranges::any_of(status_.models,
                    [](const protocol::ModelInfo& m) { return m.downloaded; });
                status_.model_state = any_available ? ModelState::Downloaded : ModelState::NotDownloaded;
            }
            notify_status();
            break;

        case InboundType::KeepWarmUpdated:
            status_.keep_warm_models = body.value("models", std::vector<std::string>{});
            status_.keep_warm_duration = body.value("duration", "");
            notify_status();
            break;

        case InboundType::ModelUnloaded: {
            auto model = body.value("model", "");
            std::erase(status_.loaded_models, model);
            notify_status();
            refresh_models();
            break;
        }
    }
}

// --- Notification ---

void ConnectionManager::set_phase(ConnectionPhase phase, std::string error) {
    state_.phase = phase;
    state_.error = std::move(error);
    notify_state();
}

void ConnectionManager::notify_state() {
    for_each_listener([this](ConnectionListener* l) { l->on_connection_changed(state_); });
}

void ConnectionManager::notify_status() {
    for_each_listener([this](ConnectionListener* l) { l->on_backend_status(status_); });
}

void ConnectionManager::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
