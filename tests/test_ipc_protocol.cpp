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
    return "/tmp/vd_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server socket is non-blocking, so poll briefly for data to arrive
ReadStatus read_with_retry(UnixSocketServer& server, int fd, json& out) {
    ReadStatus st = ReadStatus::Pending;
    for (int i = 0; i < 200 && st == ReadStatus::Pending; ++i) {
        st = server.read_command(fd, out);
        if (st == ReadStatus::Pending) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return st;
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

        // Client sends command
        json cmd = {{"cmd", "status"}};
        REQUIRE(client.send(cmd));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Ready);
        REQUIRE(received["cmd"] == "status");

        // Server sends response
        json resp = {{"status", "ok"}, {"jobs", 0}};
        REQUIRE(server.send_response(client_fd, resp));

        // Client reads response
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
            json cmd = {{"cmd", "ping"}, {"seq", i}};
            REQUIRE(client.send(cmd));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadStatus::Ready);
            REQUIRE(received["seq"] == i);

            json resp = {{"ok", true}, {"seq", i}};
            REQUIRE(server.send_response(client_fd, resp));

            json client_resp;
            REQUIRE(client.recv(client_resp, 1000));
            REQUIRE(client_resp["seq"] == i);
        }

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PipelinedCommandsInOneWrite") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "stats"}}));
        REQUIRE(client.send({{"cmd", "history"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json first;
        json second;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadStatus::Ready);
        REQUIRE(read_with_retry(server, client_fd, second) == ReadStatus::Ready);
        REQUIRE(first["cmd"] == "stats");
        REQUIRE(second["cmd"] == "history");

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("MalformedLine") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string junk = "not json\n";
        // Write raw bytes on a second socket to bypass the json encoder
        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        int raw_fd = server.accept_client();
        REQUIRE(raw_fd >= 0);
        REQUIRE(::send(raw, junk.data(), junk.size(), 0) == static_cast<ssize_t>(junk.size()));

        json cmd;
        REQUIRE(read_with_retry(server, raw_fd, cmd) == ReadStatus::Malformed);

        ::close(raw);
        server.close_client(raw_fd);
        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Client closes connection
        client.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadStatus::Closed);

        server.close_client(client_fd);
        server.stop();
    }
}
