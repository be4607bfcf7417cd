#include <catch2/catch_test_macros.hpp>

#include "backend/connection_manager.hpp"
#include "support/fakes.hpp"
#include "support/manual_scheduler.hpp"

#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct Recorder : ConnectionListener {
    std::vector<ConnectionPhase> phases;
    int greetings = 0;
    std::vector<std::string> partials;
    std::vector<std::string> finals;
    std::vector<std::string> errors;
    std::optional<BackendStatus> status;

    void on_connection_changed(const ConnectionState& s) override { phases.push_back(s.phase); }
    void on_backend_greeting() override { ++greetings; }
    void on_backend_status(const BackendStatus& s) override { status = s; }
    void on_partial(const std::string& t) override { partials.push_back(t); }
    void on_final(const std::string& t, const std::string&) override { finals.push_back(t); }
    void on_backend_error(const std::string& m) override { errors.push_back(m); }
};

ConnectionSettings test_settings() {
    ConnectionSettings s;
    s.url = "ws://127.0.0.1:9999/ws";
    return s;
}

} // namespace

TEST_CASE("Connection manager", "[connection]") {
    ManualScheduler sched;
    FakeChannel channel;
    ConnectionManager conn(channel, sched, test_settings());
    Recorder rec;
    conn.add_listener(&rec);

    auto establish = [&]() {
        conn.connect();
        channel.accept();
        sched.run_posted();
    };

    SECTION("ConnectsThroughConnecting") {
        conn.connect();
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
        REQUIRE(channel.urls == std::vector<std::string>{"ws://127.0.0.1:9999/ws"});

        channel.accept();
        REQUIRE_FALSE(conn.is_connected());
        sched.run_posted();
        REQUIRE(conn.is_connected());
        REQUIRE(rec.phases.back() == ConnectionPhase::Connected);
        REQUIRE_FALSE(conn.is_stale());
    }

    SECTION("ConnectIsIdempotent") {
        conn.connect();
        conn.connect();
        REQUIRE(channel.opened.size() == 1);
    }

    SECTION("QueuedMessagesFlushInOrder") {
        conn.send(json{{"type", "first"}});
        conn.send(json{{"type", "second"}});
        REQUIRE(conn.state().queued == 2);
        REQUIRE(channel.sent.empty());

        establish();
        conn.send(json{{"type", "third"}});
        REQUIRE(channel.sent_types() == std::vector<std::string>{"first", "second", "third"});
        REQUIRE(conn.state().queued == 0);
    }

    SECTION("ReconnectsWithFixedDelay") {
        establish();
        channel.drop("connection reset");
        sched.run_posted();
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
        REQUIRE(conn.state().reconnect_attempts == 1);
        REQUIRE(conn.state().error == "connection reset");
        REQUIRE(channel.opened.size() == 1);

        sched.advance(1999ms);
        REQUIRE(channel.opened.size() == 1);
        sched.advance(1ms);
        REQUIRE(channel.opened.size() == 2);

        channel.accept();
        sched.run_posted();
        REQUIRE(conn.is_connected());
    }

    SECTION("GivesUpAfterMaxAttempts") {
        conn.connect();
        for (int i = 0; i < 5; ++i) {
            channel.drop("refused");
            sched.run_posted();
            REQUIRE(conn.state().reconnect_attempts == i + 1);
            sched.advance(2000ms);
        }
        REQUIRE(channel.opened.size() == 6);

        channel.drop("refused");
        sched.run_posted();
        REQUIRE(conn.state().phase == ConnectionPhase::Error);
        REQUIRE(conn.state().error == "Connection failed");

        sched.advance(10000ms);
        REQUIRE(channel.opened.size() == 6);
    }

    SECTION("QueueSurvivesReconnect") {
        establish();
        channel.drop();
        sched.run_posted();

        conn.send(json{{"type", "first"}});
        conn.send(json{{"type", "second"}});
        REQUIRE(conn.state().queued == 2);
        size_t before = channel.sent.size();

        sched.advance(2000ms);
        channel.accept();
        sched.run_posted();
        conn.send(json{{"type", "third"}});

        std::vector<std::string> after;
        for (size_t i = before; i < channel.sent.size(); ++i) {
            after.push_back(channel.sent[i].value("type", ""));
        }
        REQUIRE(after == std::vector<std::string>{"first", "second", "third"});
        REQUIRE(conn.state().queued == 0);
    }

    SECTION("DropWithPendingRequestCountsOnce") {
        establish();
        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet"}, [&](auto r) {
            result = r;
            if (!r) conn.send_stop();
        });

        channel.drop("connection reset");
        sched.run_posted();
        REQUIRE(result.has_value());
        REQUIRE(result->error() == "connection lost: connection reset");
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
        REQUIRE(conn.state().reconnect_attempts == 1);
        REQUIRE(conn.state().queued == 1);

        sched.advance(2000ms);
        channel.accept();
        sched.run_posted();
        REQUIRE(channel.sent_types() == std::vector<std::string>{"start", "stop"});
    }

    SECTION("GivesUpAfterMaxAttemptsWithPendingRequests") {
        auto request = [&]() {
            conn.request_recording({.model = "parakeet"}, [&](auto r) {
                if (!r) conn.send_stop();
            });
        };

        conn.connect();
        for (int i = 0; i < 5; ++i) {
            request();
            channel.drop("refused");
            sched.run_posted();
            REQUIRE(conn.state().reconnect_attempts == i + 1);
            sched.advance(2000ms);
        }
        REQUIRE(channel.opened.size() == 6);

        request();
        channel.drop("refused");
        sched.run_posted();
        REQUIRE(conn.state().phase == ConnectionPhase::Error);
    }

    SECTION("ReadyGreetingResetsAttempts") {
        conn.connect();
        channel.drop();
        sched.run_posted();
        sched.advance(2000ms);
        channel.accept();
        sched.run_posted();
        REQUIRE(conn.state().reconnect_attempts == 1);

        channel.deliver({{"type", "ready"}, {"model_loaded", true}, {"active_model", "parakeet"},
                         {"whisper_available", true}});
        sched.run_posted();
        REQUIRE(conn.state().reconnect_attempts == 0);
        REQUIRE(rec.greetings == 1);
        REQUIRE(conn.backend_status().model_state == ModelState::Ready);
        REQUIRE(conn.backend_status().active_model == "parakeet");
        REQUIRE(channel.count("get_models") == 1);
    }

    SECTION("EventsFromReplacedChannelAreDropped") {
        establish();
        conn.reconnect();
        REQUIRE(channel.opened.size() == 2);

        channel.deliver({{"type", "partial"}, {"text", "old"}}, 0);
        channel.drop("late close", 0);
        sched.run_posted();
        REQUIRE(rec.partials.empty());
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
        REQUIRE(conn.state().reconnect_attempts == 0);
    }

    SECTION("DisconnectDropsQueue") {
        conn.send(json{{"type", "stale"}});
        conn.disconnect();
        REQUIRE(conn.state().queued == 0);
        REQUIRE(conn.state().phase == ConnectionPhase::Disconnected);

        establish();
        REQUIRE(channel.sent.empty());
    }

    SECTION("HeartbeatSendsPing") {
        establish();
        sched.advance(30000ms);
        REQUIRE(channel.count("ping") == 1);
        sched.advance(30000ms);
        REQUIRE(channel.count("ping") == 2);
    }

    SECTION("StaleAfterThreshold") {
        establish();
        sched.advance(120001ms);
        REQUIRE(conn.is_stale());

        channel.deliver({{"type", "pong"}});
        sched.run_posted();
        REQUIRE_FALSE(conn.is_stale());
    }

    SECTION("RecordingRequestSucceeds") {
        establish();
        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet", .diarization = true},
                               [&](auto r) { result = r; });
        REQUIRE(conn.has_pending_request());

        auto starts = channel.sent_of_type("start");
        REQUIRE(starts.size() == 1);
        REQUIRE(starts[0]["settings"]["model"] == "parakeet");
        REQUIRE(starts[0]["settings"]["enable_diarization"] == true);

        channel.deliver({{"type", "recording_ready"}, {"model", "parakeet-v2"}});
        sched.run_posted();
        REQUIRE(result.has_value());
        REQUIRE(result->has_value());
        REQUIRE(**result == "parakeet-v2");
        REQUIRE_FALSE(conn.has_pending_request());
    }

    SECTION("RecordingRequestFailsWhenDisconnected") {
        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet"}, [&](auto r) { result = r; });
        REQUIRE_FALSE(result.has_value());
        sched.run_posted();
        REQUIRE(result.has_value());
        REQUIRE(result->error() == "backend not connected");
        REQUIRE(channel.sent.empty());
    }

    SECTION("RecordingRequestWhileConnectingIsQueued") {
        conn.connect();
        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet"}, [&](auto r) { result = r; });
        REQUIRE(channel.sent.empty());

        channel.accept();
        sched.run_posted();
        REQUIRE(channel.count("start") == 1);
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("StaleConnectionIsProbedFirst") {
        establish();
        sched.advance(120001ms);
        size_t pings = channel.count("ping");

        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet"}, [&](auto r) { result = r; });
        REQUIRE(channel.count("ping") == pings + 1);
        REQUIRE(channel.count("start") == 0);

        channel.deliver({{"type", "pong"}});
        sched.run_posted();
        REQUIRE(channel.count("start") == 1);
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("UnansweredProbeFailsRequest") {
        establish();
        sched.advance(120001ms);

        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "parakeet"}, [&](auto r) { result = r; });
        sched.advance(2000ms);
        REQUIRE(result.has_value());
        REQUIRE(result->error() == "backend not responding");
        REQUIRE(channel.count("start") == 0);
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
    }

    SECTION("BackendErrorFailsPendingRequest") {
        establish();
        std::optional<std::expected<std::string, std::string>> result;
        conn.request_recording({.model = "missing"}, [&](auto r) { result = r; });

        channel.deliver({{"type", "error"}, {"message", "model not found"}});
        sched.run_posted();
        REQUIRE(result.has_value());
        REQUIRE(result->error() == "model not found");
        REQUIRE(rec.errors == std::vector<std::string>{"model not found"});
    }

    SECTION("CancelledRequestIgnoresReady") {
        establish();
        int calls = 0;
        auto id = conn.request_recording({.model = "parakeet"}, [&](auto) { ++calls; });
        conn.cancel_recording_request(id);

        channel.deliver({{"type", "recording_ready"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(calls == 0);
        REQUIRE(channel.count("start") == 1);
    }

    SECTION("NewRequestSupersedesOld") {
        establish();
        std::optional<std::expected<std::string, std::string>> first;
        conn.request_recording({.model = "a"}, [&](auto r) { first = r; });
        conn.request_recording({.model = "b"}, [](auto) {});
        REQUIRE(first.has_value());
        REQUIRE_FALSE(first->has_value());
    }

    SECTION("TranscriptsReachListeners") {
        establish();
        channel.deliver({{"type", "partial"}, {"text", "hel"}});
        channel.deliver({{"type", "final"}, {"text", "hello"}, {"model", "parakeet"}});
        channel.deliver_raw("{broken");
        channel.deliver({{"type", "partial"}, {"text", 5}});
        sched.run_posted();
        REQUIRE(rec.partials == std::vector<std::string>{"hel"});
        REQUIRE(rec.finals == std::vector<std::string>{"hello"});
    }

    SECTION("ModelLifecycleUpdatesStatus") {
        establish();
        conn.download_model();
        REQUIRE(conn.backend_status().model_state == ModelState::Downloading);
        REQUIRE(channel.count("download_model") == 1);

        channel.deliver({{"type", "model_progress"}, {"percent", 42.0}});
        sched.run_posted();
        REQUIRE(conn.backend_status().download_progress == 0.42);

        channel.deliver({{"type", "model_downloaded"}});
        channel.deliver({{"type", "model_loaded"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(conn.backend_status().model_state == ModelState::Ready);
        REQUIRE(conn.backend_status().loaded_models == std::vector<std::string>{"parakeet"});

        channel.deliver({{"type", "model_unloaded"}, {"model", "parakeet"}});
        channel.deliver({{"type", "keep_warm_updated"}, {"models", json::array({"parakeet"})}, {"duration", "1h"}});
        sched.run_posted();
        REQUIRE(conn.backend_status().loaded_models.empty());
        REQUIRE(conn.backend_status().keep_warm_duration == "1h");
        REQUIRE(rec.status.has_value());

        channel.deliver({{"type", "model_error"}, {"message", "out of memory"}});
        sched.run_posted();
        REQUIRE(conn.backend_status().model_state == ModelState::Error);
        REQUIRE(conn.backend_status().model_error == "out of memory");
    }

    SECTION("ModelsListSetsAvailability") {
        establish();
        channel.deliver({{"type", "models_list"},
                         {"active_model", "parakeet"},
                         {"models", json::array({{{"id", "parakeet"}, {"downloaded", false}}})}});
        sched.run_posted();
        REQUIRE(conn.backend_status().models.size() == 1);
        REQUIRE(conn.backend_status().model_state == ModelState::NotDownloaded);
    }

    SECTION("ResumeStartsStoppedBackend") {
        bool running = false;
        int starts = 0;
        int restarts = 0;
        conn.set_recovery_hooks([&] { return running; }, [&] { ++starts; }, [&] { ++restarts; });

        conn.on_system_resume();
        sched.advance(1999ms);
        REQUIRE(starts == 0);
        sched.advance(1ms);
        REQUIRE(starts == 1);
        REQUIRE(restarts == 0);
    }

    SECTION("ResumeReconnectsWhenProcessAlive") {
        conn.set_recovery_hooks([] { return true; }, [] {}, [] {});
        conn.on_system_resume();
        sched.advance(2000ms);
        REQUIRE(channel.opened.size() == 1);
        REQUIRE(conn.state().phase == ConnectionPhase::Connecting);
    }

    SECTION("ResumeRestartsUnresponsiveBackend") {
        int restarts = 0;
        conn.set_recovery_hooks([] { return true; }, [] {}, [&] { ++restarts; });
        establish();

        conn.on_system_resume();
        sched.advance(2000ms);
        REQUIRE(channel.count("ping") == 1);
        sched.advance(3000ms);
        REQUIRE(restarts == 1);
    }

    SECTION("ResumeRefreshesModelsWhenHealthy") {
        int restarts = 0;
        conn.set_recovery_hooks([] { return true; }, [] {}, [&] { ++restarts; });
        establish();

        conn.on_system_resume();
        sched.advance(2000ms);
        channel.deliver({{"type", "pong"}});
        sched.run_posted();
        REQUIRE(restarts == 0);
        REQUIRE(channel.count("get_models") == 1);
    }

    conn.remove_listener(&rec);
}
