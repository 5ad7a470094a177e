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
    return "/tmp/td_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server sockets are non-blocking; poll until at least want commands arrived.
std::vector<json> read_until(UnixSocketServer& server, int fd, size_t want) {
    std::vector<json> got;
    for (int i = 0; i < 200 && got.size() < want; ++i) {
        auto cmds = server.read_commands(fd);
        if (!cmds) break;
        got.insert(got.end(), cmds->begin(), cmds->end());
        if (got.size() < want) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return got;
}

// Plain socket for writing bytes the JSON client would never produce.
int connect_raw(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool write_raw(int fd, const std::string& bytes) {
    return ::write(fd, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size());
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

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        auto received = read_until(server, client_fd, 1);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["state"] == "idle");

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

        for (int i = 0; i < 3; ++i) {
            REQUIRE(client.send({{"cmd", "toggle"}, {"seq", i}}));
        }

        auto received = read_until(server, client_fd, 3);
        REQUIRE(received.size() == 3);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(received[i]["seq"] == i);
        }

        server.stop();
    }

    SECTION("PushedEventsArriveInOrder") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Both lines may land in one recv on the client side.
        REQUIRE(server.send_response(client_fd, {{"event", "recording"}, {"recording", true}}));
        REQUIRE(server.send_response(client_fd, {{"event", "recording"}, {"recording", false}}));

        json first, second;
        REQUIRE(client.recv(first, 1000));
        REQUIRE(client.recv(second, 1000));
        REQUIRE(first["recording"] == true);
        REQUIRE(second["recording"] == false);

        server.stop();
    }

    SECTION("PartialLineWaits") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(write_raw(raw, R"({"cmd":"sta)"));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        // Half a line: an empty batch, not a disconnect.
        auto partial = server.read_commands(client_fd);
        REQUIRE(partial.has_value());
        REQUIRE(partial->empty());

        REQUIRE(write_raw(raw, "tus\"}\n"));

        auto received = read_until(server, client_fd, 1);
        REQUIRE(received.size() == 1);
        REQUIRE(received[0]["cmd"] == "status");

        ::close(raw);
        server.stop();
    }

    SECTION("MalformedLineBecomesEmptyCommand") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = connect_raw(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(write_raw(raw, "not json\n{\"cmd\":\"status\"}\n"));

        auto received = read_until(server, client_fd, 2);
        REQUIRE(received.size() == 2);
        REQUIRE(received[0].is_object());
        REQUIRE(received[0].empty());
        REQUIRE(received[1]["cmd"] == "status");

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

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE_FALSE(server.read_commands(client_fd).has_value());

        server.close_client(client_fd);
        server.stop();
    }
}
