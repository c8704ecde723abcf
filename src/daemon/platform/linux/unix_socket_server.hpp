#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

// Newline-delimited JSON over a user-private AF_UNIX stream socket.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadStatus read_command(int client_fd, nlohmann::json& cmd) override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    // A client that never sends a newline is dropped past this size
    static constexpr size_t max_line_bytes = 1 << 20;

    int server_fd_ = -1;
    std::string socket_path_;

    struct Connection {
        int fd;
        std::string pending;
    };
    std::vector<Connection> connections_;

    Connection* find_connection(int fd);
};
