#pragma once

#include "config.hpp"
#include "platform/ipc_server.hpp"
#include "platform/window_source.hpp"
#include "window/window_engine.hpp"

#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, WindowSource& source, IpcServer& ipc,
               NotifyCallback notify, int self_pid = 0);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // A reply with status "refreshing" means the client must be parked with
    // add_waiting_client() until on_refresh_complete() answers it.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Called on the event loop thread after the worker signalled completion.
    void on_refresh_complete();

    void add_waiting_client(int fd, nlohmann::json cmd);
    void remove_waiting_client(int fd);

    bool refreshing() const { return refreshing_; }
    const WindowEngine& engine() const { return engine_; }

    void shutdown();

private:
    nlohmann::json handle_refresh(const nlohmann::json& cmd);
    nlohmann::json handle_search(const nlohmann::json& cmd);
    nlohmann::json handle_activate(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_close(const nlohmann::json& cmd);

    void start_refresh();
    nlohmann::json reply_for(const nlohmann::json& cmd, const WindowError* error);
    nlohmann::json error_reply(const WindowError& error);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    IpcServer& ipc_;
    NotifyCallback notify_;

    WindowEngine engine_;

    bool refreshing_ = false;
    bool permission_reported_ = false;

    struct Waiter {
        int fd;
        nlohmann::json cmd;
    };
    std::vector<Waiter> waiting_clients_;

    std::expected<WindowEngine::Snapshot, WindowError> worker_result_;
    std::jthread worker_;
};
