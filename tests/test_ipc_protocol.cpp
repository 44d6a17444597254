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

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/sl_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Polls the non-blocking server until something other than Incomplete comes back.
ReadStatus read_until_ready(UnixSocketServer& server, int fd, json& out) {
    ReadStatus st = ReadStatus::Incomplete;
    for (int i = 0; i < 100 && st == ReadStatus::Incomplete; ++i) {
        st = server.read_command(fd, out);
        if (st == ReadStatus::Incomplete) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return st;
}

// Connects a bare socket so tests can write arbitrary bytes.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void raw_write(int fd, const std::string& data) {
    ssize_t n = ::write(fd, data.data(), data.size());
    REQUIRE(n == static_cast<ssize_t>(data.size()));
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        {
            UnixSocketServer server;
            REQUIRE(server.start(sock_path));
            REQUIRE(std::filesystem::exists(sock_path));
            server.stop();
            REQUIRE_FALSE(std::filesystem::exists(sock_path));
        }
    }

    SECTION("ClientConnects") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        json cmd = {{"cmd", "status"}};
        REQUIRE(client.send(cmd));

        json received;
        REQUIRE(read_until_ready(server, client_fd, received) == ReadStatus::Command);
        REQUIRE(received["cmd"] == "status");

        json resp = {{"status", "ok"}};
        REQUIRE(server.send_response(client_fd, resp));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("MultipleMessages") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            json cmd = {{"cmd", "status"}, {"seq", i}};
            REQUIRE(client.send(cmd));

            json received;
            REQUIRE(read_until_ready(server, client_fd, received) == ReadStatus::Command);
            REQUIRE(received["seq"] == i);

            json resp = {{"status", "ok"}, {"seq", i}};
            REQUIRE(server.send_response(client_fd, resp));

            json client_resp;
            REQUIRE(client.recv(client_resp, 1000));
            REQUIRE(client_resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PartialLineWaitsForRest") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_write(raw, R"({"cmd":"hist)");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Incomplete);

        raw_write(raw, "ory\"}\n");
        REQUIRE(read_until_ready(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "history");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("TwoLinesInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_write(raw, "{\"cmd\":\"status\"}\n{\"cmd\":\"models\"}\n");
        json cmd;
        REQUIRE(read_until_ready(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "status");
        REQUIRE(server.pending_command(client_fd));
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "models");
        REQUIRE_FALSE(server.pending_command(client_fd));

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedLineKeepsConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = raw_connect(sock_path);
        REQUIRE(raw >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        raw_write(raw, "this is not json\n");
        json cmd;
        REQUIRE(read_until_ready(server, client_fd, cmd) == ReadStatus::Malformed);

        raw_write(raw, "{\"cmd\":\"status\"}\n");
        REQUIRE(read_until_ready(server, client_fd, cmd) == ReadStatus::Command);
        REQUIRE(cmd["cmd"] == "status");

        ::close(raw);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientKeepsBufferedResponse") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"seq", 1}}));
        REQUIRE(server.send_response(client_fd, {{"seq", 2}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json first, second;
        REQUIRE(client.recv(first, 1000));
        REQUIRE(client.recv(second, 1000));
        REQUIRE(first["seq"] == 1);
        REQUIRE(second["seq"] == 2);

        json none;
        REQUIRE_FALSE(client.recv(none, 20));
        REQUIRE(client.last_error() == "timed out waiting for the daemon");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("ConnectWithoutDaemon") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
        REQUIRE(client.last_error().starts_with("connect:"));
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
        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadStatus::Disconnected);

        server.close_client(client_fd);
        server.stop();
    }
}
