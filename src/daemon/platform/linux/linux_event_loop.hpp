#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/sway_window_source.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <atomic>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void dispatch(int fd, std::vector<nlohmann::json> cmds);
    void release_held_commands();
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    SwayWindowSource window_source_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Commands a client sent after one that is waiting for a refresh.
    std::unordered_map<int, std::vector<nlohmann::json>> held_commands_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
