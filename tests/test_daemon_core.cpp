#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "support/fakes.hpp"
#include "support/manual_scheduler.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

Config test_config(const std::string& history_path) {
    Config cfg;
    cfg.backend.autostart = false;
    cfg.audio.flow_wait_ms = 20;
    cfg.audio.retry_pause_ms = 1;
    cfg.history.path = history_path;
    return cfg;
}

struct TmpHistory {
    std::string path = std::filesystem::temp_directory_path() /
                       ("mute_test_core_" + std::to_string(getpid()) + ".sqlite");
    ~TmpHistory() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("Daemon core", "[daemon]") {
    TmpHistory tmp;
    ManualScheduler sched;
    FakeCapture capture;
    FakeEnumerator devices;
    devices.set_devices({{"usb-mic", "USB Microphone"}, {"builtin", "Built-in Audio"}});
    FakeChannel channel;
    FakeLauncher launcher;
    FakeReaper reaper;
    FakeIpcServer ipc;

    DaemonCore core(test_config(tmp.path), false,
                    {sched, capture, devices, channel, launcher, reaper, ipc,
                     [](std::function<void()> job) { job(); },
                     []() { return std::chrono::milliseconds(0); }});

    REQUIRE(core.init());
    REQUIRE(channel.urls == std::vector<std::string>{"ws://127.0.0.1:9877/ws"});
    REQUIRE(launcher.spawns == 0);
    channel.accept();
    sched.run_posted();

    auto command = [&](const std::string& name, json args = json::object()) {
        args["cmd"] = name;
        auto resp = core.handle_command(name, args);
        sched.run_posted();
        return resp;
    };

    auto record = [&]() {
        auto resp = command("start", {{"mode", "quick"}});
        REQUIRE(resp["status"] == "ok");
        channel.deliver({{"type", "recording_ready"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(core.sessions().state() == SessionState::Recording);
    };

    SECTION("StatusReportsEveryComponent") {
        auto resp = command("status");
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["session"]["state"] == "idle");
        REQUIRE(resp["connection"]["state"] == "connected");
        REQUIRE(resp["backend"]["model_state"] == "unknown");
        REQUIRE(resp["supervisor"]["managed"] == false);
        REQUIRE(resp["device"] == "");
    }

    SECTION("UnknownCommand") {
        auto resp = command("launch_rockets");
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "unknown command");
    }

    SECTION("WrongArgumentTypes") {
        auto resp = command("start", {{"mode", 5}});
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"].get<std::string>().starts_with("bad arguments"));
        REQUIRE(core.sessions().state() == SessionState::Idle);
    }

    SECTION("UnknownMode") {
        auto resp = command("start", {{"mode", "karaoke"}});
        REQUIRE(resp["message"] == "unknown mode: karaoke");
    }

    SECTION("DeviceSelection") {
        auto list = command("devices");
        REQUIRE(list["devices"].size() == 2);

        REQUIRE(command("select_device", {{"uid", "usb-mic"}})["status"] == "ok");
        REQUIRE(core.sessions().selected_device() == "usb-mic");

        auto bad = command("select_device", {{"uid", "ghost"}});
        REQUIRE(bad["status"] == "error");
        REQUIRE(bad["message"] == "unknown device: ghost");
        REQUIRE(core.sessions().selected_device() == "usb-mic");

        REQUIRE(command("select_device")["device"] == "");
        REQUIRE(core.sessions().selected_device().empty());
    }

    SECTION("StartReportsStarting") {
        auto resp = command("start", {{"mode", "quick"}, {"model", "whisper"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["state"] == "starting");
        REQUIRE(resp["session"] == 1);
        REQUIRE(channel.sent_of_type("start")[0]["settings"]["model"] == "whisper");

        auto busy = command("start");
        REQUIRE(busy["status"] == "error");
        REQUIRE(busy["message"] == "busy: session is starting");
    }

    SECTION("StopRequiresRecording") {
        auto resp = command("stop");
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "not recording");
    }

    SECTION("WaitingClientGetsFinalText") {
        record();
        REQUIRE(command("stop")["status"] == "processing");
        core.add_waiting_client(7);

        channel.deliver({{"type", "final"}, {"text", "ship it"}, {"model", "parakeet"}});
        sched.run_posted();

        auto replies = ipc.sent_to(7);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["status"] == "ok");
        REQUIRE(replies[0]["text"] == "ship it");

        auto history = command("history", {{"limit", 5}});
        REQUIRE(history["entries"].size() == 1);
        REQUIRE(history["entries"][0]["text"] == "ship it");
        REQUIRE(history["entries"][0]["mode"] == "quick");
    }

    SECTION("ProcessingTimeoutAnswersWithError") {
        record();
        command("stop");
        core.add_waiting_client(7);

        sched.advance(15000ms);
        auto replies = ipc.sent_to(7);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["status"] == "error");
        REQUIRE(replies[0]["message"] == "processing timeout");
    }

    SECTION("CancelAnswersWaitingClients") {
        record();
        core.add_waiting_client(7);

        auto resp = command("cancel");
        REQUIRE(resp["state"] == "idle");
        auto replies = ipc.sent_to(7);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["message"] == "cancelled");
        REQUIRE(command("history")["entries"].empty());
    }

    SECTION("ToggleStartsThenStops") {
        REQUIRE(command("toggle")["state"] == "starting");
        channel.deliver({{"type", "recording_ready"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(command("toggle")["status"] == "processing");
        REQUIRE(core.sessions().state() == SessionState::Processing);
    }

    SECTION("SubscribersReceiveEvents") {
        REQUIRE(command("subscribe")["status"] == "subscribed");
        core.add_subscriber(9);

        command("start");
        bool saw_starting = false;
        for (const auto& e : ipc.sent_to(9)) {
            if (e["event"] == "session" && e["state"] == "starting") saw_starting = true;
        }
        REQUIRE(saw_starting);
    }

    SECTION("BrokenSubscriberIsDropped") {
        core.add_subscriber(9);
        core.add_subscriber(10);
        ipc.broken.insert(10);

        command("start");
        REQUIRE(ipc.closed == std::vector<int>{10});

        size_t before = ipc.sent_to(9).size();
        channel.deliver({{"type", "recording_ready"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(ipc.sent_to(9).size() > before);
        REQUIRE(ipc.closed.size() == 1);
    }

    SECTION("RemovedClientIsNotAnswered") {
        record();
        command("stop");
        core.add_waiting_client(7);
        core.remove_client(7);

        channel.deliver({{"type", "final"}, {"text", "gone"}, {"model", "parakeet"}});
        sched.run_posted();
        REQUIRE(ipc.sent_to(7).empty());
    }

    SECTION("ModelCommandsReachBackend") {
        REQUIRE(command("load_model", {{"model", "canary"}})["status"] == "ok");
        REQUIRE(channel.sent_of_type("load_model")[0]["model"] == "canary");

        REQUIRE(command("load_model")["message"] == "missing model");

        REQUIRE(command("keep_warm", {{"models", json::array({"parakeet"})}, {"duration", "2h"}})["status"] == "ok");
        auto warm = channel.sent_of_type("set_keep_warm");
        REQUIRE(warm.size() == 1);
        REQUIRE(warm[0]["duration"] == "2h");

        size_t before = channel.count("get_models");
        REQUIRE(command("models")["status"] == "ok");
        REQUIRE(channel.count("get_models") == before + 1);
    }

    SECTION("LogsEmptyWithoutManagedBackend") {
        auto resp = command("logs", {{"limit", 10}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["lines"].empty());
    }

    SECTION("ShutdownReleasesWaitingClients") {
        record();
        command("stop");
        core.add_waiting_client(7);

        core.shutdown();
        auto replies = ipc.sent_to(7);
        REQUIRE(replies.size() == 1);
        REQUIRE(replies[0]["message"] == "daemon shutting down");
        REQUIRE(devices.unwatches == 1);
    }
}
