#pragma once

#include "config.hpp"
#include "dispatch_core.hpp"
#include "platform/linux/posix_process_runner.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <string>

class LinuxEventLoop {
public:
    // An empty endpoint uses platform::ipc_endpoint().
    LinuxEventLoop(Config config, bool verbose = false, std::string endpoint = {});
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    std::string endpoint_;

    // Platform implementations (constructed before core_)
    UnixSocketServer ipc_server_;
    PosixProcessRunner process_runner_;

    // Portable business logic
    DispatchCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
