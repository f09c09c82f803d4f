#include "daemon_core.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <print>

namespace {

nlohmann::json window_json(const WindowRecord& r) {
    nlohmann::json j = {
        {"id", r.identity},
        {"title", r.title},
        {"owner", r.owner_name},
        {"pid", r.owner_pid},
        {"synthesized", r.synthesized},
    };
    j["icon"] = r.owner_icon ? nlohmann::json(*r.owner_icon) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json windows_json(const std::vector<WindowRecord>& records) {
    auto arr = nlohmann::json::array();
    for (const auto& r : records) arr.push_back(window_json(r));
    return arr;
}

nlohmann::json bad_request(const std::string& message) {
    return {{"status", "error"}, {"kind", "bad_request"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, WindowSource& source, IpcServer& ipc,
                       NotifyCallback notify, int self_pid)
    : config_(std::move(config)), verbose_(verbose),
      ipc_(ipc), notify_(std::move(notify)),
      engine_(source,
              [&] {
                  auto opts = config_.reconcile_options();
                  opts.self_pid = self_pid;
                  return opts;
              }(),
              [this](const std::string& msg) { log(msg); }),
      worker_result_(std::make_shared<const std::vector<WindowRecord>>()) {}

DaemonCore::~DaemonCore() = default;

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "refresh") return handle_refresh(cmd);
    if (cmd_str == "search") return handle_search(cmd);
    if (cmd_str == "activate") return handle_activate(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "close") return handle_close(cmd);
    return bad_request("unknown command");
}

nlohmann::json DaemonCore::handle_refresh(const nlohmann::json& /*cmd*/) {
    start_refresh();
    return {{"status", "refreshing"}};
}

nlohmann::json DaemonCore::handle_search(const nlohmann::json& cmd) {
    if (cmd.contains("query") && !cmd["query"].is_string()) {
        return bad_request("query must be a string");
    }

    // First search of a session, or one racing a refresh, waits for the list.
    if (refreshing_ || !engine_.has_snapshot()) {
        start_refresh();
        return {{"status", "refreshing"}};
    }
    return reply_for(cmd, nullptr);
}

nlohmann::json DaemonCore::handle_activate(const nlohmann::json& cmd) {
    std::optional<WindowRecord> record;

    if (cmd.contains("id") && cmd["id"].is_string()) {
        record = engine_.find(cmd["id"].get<std::string>());
    } else if (cmd.contains("index") && cmd["index"].is_number_integer() &&
               cmd["index"].get<int64_t>() >= 0) {
        record = engine_.result_at(cmd["index"].get<size_t>());
    } else {
        return bad_request("activate needs \"id\" or a non-negative \"index\"");
    }

    if (!record) {
        return {{"status", "error"}, {"kind", "not_found"}, {"message", "no such window in this session"}};
    }

    auto res = engine_.activate(*record);
    if (!res) return error_reply(res.error());

    log(std::format("Activated \"{}\" ({})", record->title, record->owner_name));
    return {{"status", "ok"}, {"window", window_json(*record)}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"windows", engine_.snapshot()->size()},
        {"refreshing", refreshing_},
        {"session", engine_.has_snapshot()},
    };
    if (auto t = engine_.last_refresh()) {
        resp["last_refresh"] = std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(*t));
    } else {
        resp["last_refresh"] = nullptr;
    }
    return resp;
}

nlohmann::json DaemonCore::handle_close(const nlohmann::json& /*cmd*/) {
    engine_.close();
    permission_reported_ = false;
    log("Session closed");
    return {{"status", "ok"}};
}

void DaemonCore::start_refresh() {
    if (refreshing_) return;
    refreshing_ = true;

    if (worker_.joinable()) worker_.join();

    worker_ = std::jthread([this](std::stop_token) {
        worker_result_ = engine_.refresh();
        notify_();
    });
}

void DaemonCore::on_refresh_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    refreshing_ = false;

    const WindowError* error = nullptr;
    if (worker_result_) {
        log(std::format("Refresh complete: {} windows", (*worker_result_)->size()));
    } else {
        error = &worker_result_.error();
        if (error->kind != WindowErrorKind::PermissionDenied || !permission_reported_) {
            std::println(stderr, "refresh failed: {}", error->message);
        }
    }

    for (auto& w : waiting_clients_) {
        ipc_.send_response(w.fd, reply_for(w.cmd, error));
    }
    waiting_clients_.clear();

    if (error && error->kind == WindowErrorKind::PermissionDenied) {
        permission_reported_ = true;
    }
}

nlohmann::json DaemonCore::reply_for(const nlohmann::json& cmd, const WindowError* error) {
    if (error) return error_reply(*error);

    if (cmd.value("cmd", "") == "search") {
        std::string query = cmd.contains("query") && cmd["query"].is_string()
                                ? cmd["query"].get<std::string>() : "";
        auto results = engine_.search(query);
        return {{"status", "ok"}, {"query", query}, {"windows", windows_json(results)}};
    }

    // A refresh also starts a fresh navigation list over the whole snapshot.
    auto all = engine_.search("");
    return {{"status", "ok"}, {"count", all.size()}, {"windows", windows_json(all)}};
}

nlohmann::json DaemonCore::error_reply(const WindowError& error) {
    nlohmann::json resp = {
        {"status", "error"},
        {"kind", std::string(to_string(error.kind))},
        {"message", error.message},
    };
    // Surfaced once per session; later failures carry the kind only.
    if (error.kind == WindowErrorKind::PermissionDenied && permission_reported_) {
        resp["repeated"] = true;
    }
    return resp;
}

void DaemonCore::add_waiting_client(int fd, nlohmann::json cmd) {
    waiting_clients_.push_back({fd, std::move(cmd)});
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase_if(waiting_clients_, [fd](const Waiter& w) { return w.fd == fd; });
}

void DaemonCore::shutdown() {
    if (refreshing_) {
        log("Waiting for pending refresh to complete...");
        on_refresh_complete();
    } else if (worker_.joinable()) {
        worker_.join();
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[window-search] {}", msg);
    }
}
