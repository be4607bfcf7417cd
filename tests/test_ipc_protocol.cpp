#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/mute_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll briefly for data to arrive.
bool read_some(UnixSocketServer& server, int fd, std::vector<json>& cmds, size_t want) {
    for (int i = 0; i < 100 && cmds.size() < want; ++i) {
        if (!server.read_commands(fd, cmds)) return false;
        if (cmds.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds.size() >= want;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("RejectsOverlongPath") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x')));
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        std::vector<json> cmds;
        REQUIRE(read_some(server, client_fd, cmds, 1));
        REQUIRE(cmds[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "ok");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("SeveralCommandsInOneRead") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "ping"}, {"seq", i}}));
        }

        std::vector<json> cmds;
        REQUIRE(read_some(server, client_fd, cmds, 5));
        for (int i = 0; i < 5; ++i) REQUIRE(cmds[i]["seq"] == i);

        server.stop();
    }

    SECTION("ClientReadsBufferedEventLines") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"event", "session"}, {"n", 1}}));
        REQUIRE(server.send_response(client_fd, {{"event", "session"}, {"n", 2}}));

        json a, b;
        REQUIRE(client.recv(a, 1000));
        REQUIRE(client.recv(b, 1000));
        REQUIRE(a["n"] == 1);
        REQUIRE(b["n"] == 2);

        server.stop();
    }

    SECTION("MalformedLineIsSkipped") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        // Raw socket, bypassing the client's JSON encoding.
        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string junk = "{not json\n\n{\"cmd\":\"devices\"}\n";
        REQUIRE(::send(raw, junk.data(), junk.size(), 0) == static_cast<ssize_t>(junk.size()));

        std::vector<json> cmds;
        REQUIRE(read_some(server, client_fd, cmds, 1));
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "devices");

        ::close(raw);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        // Server should detect disconnect (read returns false)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));

        server.close_client(client_fd);
        // Closing twice is harmless.
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("UnknownClientReadsAsGone") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(12345, cmds));
        server.stop();
    }
}
