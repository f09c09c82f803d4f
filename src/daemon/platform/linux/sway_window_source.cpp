#include "platform/linux/sway_window_source.hpp"

#include "platform/linux/procfs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace {

// Sway reports absent strings as null (e.g. app_id of an XWayland view).
std::string string_field(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || !node[key].is_string()) return {};
    return node[key].get<std::string>();
}

void walk(const nlohmann::json& node, std::string workspace, std::vector<SwayView>& out) {
    auto type = string_field(node, "type");
    if (type == "workspace") workspace = string_field(node, "name");

    bool is_container = type == "con" || type == "floating_con";
    bool has_children = (node.contains("nodes") && !node["nodes"].empty()) ||
                        (node.contains("floating_nodes") && !node["floating_nodes"].empty());

    if (is_container && !has_children && node.contains("pid") && node["pid"].is_number_integer()) {
        SwayView view;
        view.con_id = node.value("id", int64_t{0});
        view.pid = node.value("pid", 0);
        view.name = string_field(node, "name");
        view.app_id = string_field(node, "app_id");
        if (node.contains("window_properties") && node["window_properties"].is_object()) {
            const auto& props = node["window_properties"];
            view.window_class = string_field(props, "class");
            view.window_type = string_field(props, "window_type");
        }
        view.workspace = workspace;
        view.visible = node.value("visible", false);
        if (node.contains("rect") && node["rect"].is_object()) {
            view.width = node["rect"].value("width", 0);
            view.height = node["rect"].value("height", 0);
        }
        out.push_back(std::move(view));
        return;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) {
            walk(child, workspace, out);
        }
    }
}

std::string lowercase(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

std::vector<SwayView> collect_views(const nlohmann::json& tree) {
    std::vector<SwayView> views;
    walk(tree, "", views);
    return views;
}

int layer_for_window_type(std::string_view window_type) {
    static constexpr std::array<std::string_view, 11> chrome = {
        "desktop", "dock", "toolbar", "menu", "utility", "splash",
        "dropdown_menu", "popup_menu", "tooltip", "notification", "combo",
    };
    if (window_type.empty() || window_type == "normal" || window_type == "dialog") return 0;

    auto it = std::ranges::find(chrome, window_type);
    if (it == chrome.end()) return 0;
    return static_cast<int>(it - chrome.begin()) + 1;
}

ServerWindow to_server_window(const SwayView& view) {
    return ServerWindow{
        .owner_pid = view.pid,
        .layer = layer_for_window_type(view.window_type),
        .title = view.name,
        .on_screen = view.visible,
        .alpha = std::nullopt,
        .width = view.width,
        .height = view.height,
        .window_number = view.con_id,
    };
}

ProcessWindow to_process_window(const SwayView& view) {
    return ProcessWindow{
        .title = view.name,
        .minimized = view.on_scratchpad() && !view.visible,
        .activation = ActivationHandle{.pid = view.pid, .window_id = view.con_id},
    };
}

std::vector<ServerWindow> server_windows_from(const std::vector<SwayView>& views) {
    std::vector<ServerWindow> windows;
    windows.reserve(views.size());
    for (const auto& v : views) {
        windows.push_back(to_server_window(v));
    }
    return windows;
}

std::vector<ProcessWindow> process_windows_from(const std::vector<SwayView>& views, int pid,
                                                int min_width, int min_height) {
    std::vector<ProcessWindow> windows;
    for (const auto& v : views) {
        if (v.pid != pid) continue;
        if (layer_for_window_type(v.window_type) != 0) continue;
        if (v.width < min_width && v.height < min_height) continue;
        windows.push_back(to_process_window(v));
    }
    return windows;
}

std::expected<void, WindowError> check_command_reply(const std::string& payload) {
    try {
        auto j = nlohmann::json::parse(payload);
        if (!j.is_array() || j.empty()) {
            return std::unexpected(WindowError{WindowErrorKind::ActivationFailed,
                                               "sway: empty command reply"});
        }
        for (const auto& r : j) {
            if (!r.value("success", false)) {
                return std::unexpected(WindowError{WindowErrorKind::ActivationFailed,
                                                   "sway: " + r.value("error", std::string("command failed"))});
            }
        }
        return {};
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(WindowError{WindowErrorKind::ActivationFailed,
                                           std::format("sway: bad command reply: {}", e.what())});
    }
}

SwayWindowSource::SwayWindowSource(int min_width, int min_height,
                                   std::chrono::milliseconds request_timeout)
    : min_width_(min_width), min_height_(min_height), request_timeout_(request_timeout) {}

std::expected<void, WindowError> SwayWindowSource::connect(const std::string& socket_path) {
    return ipc_.connect(socket_path);
}

std::expected<std::vector<SwayView>, WindowError>
SwayWindowSource::fetch_views(std::chrono::milliseconds timeout) {
    auto reply = ipc_.request(SwayIpc::MSG_GET_TREE, "", timeout);
    if (!reply) return std::unexpected(reply.error());

    try {
        return collect_views(nlohmann::json::parse(*reply));
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(WindowError{WindowErrorKind::SourceUnavailable,
                                           std::format("sway: bad tree: {}", e.what())});
    }
}

std::expected<std::vector<ServerWindow>, WindowError> SwayWindowSource::list_server_windows() {
    auto views = fetch_views(request_timeout_);

    std::lock_guard lock(views_mutex_);
    if (!views) {
        views_.reset();
        return std::unexpected(views.error());
    }
    views_ = std::move(*views);
    return server_windows_from(*views_);
}

std::expected<std::vector<ProcessWindow>, WindowError>
SwayWindowSource::list_process_windows(int pid, std::chrono::milliseconds timeout) {
    {
        std::lock_guard lock(views_mutex_);
        if (views_) return process_windows_from(*views_, pid, min_width_, min_height_);
    }

    // No listing taken yet: the timeout bounds a fetch of our own.
    auto views = fetch_views(timeout);
    if (!views) return std::unexpected(views.error());
    return process_windows_from(*views, pid, min_width_, min_height_);
}

std::optional<ProcessInfo> SwayWindowSource::resolve_process(int pid) {
    if (!procfs::process_exists(pid)) return std::nullopt;

    std::string app_id;
    std::string window_class;
    {
        std::lock_guard lock(views_mutex_);
        if (views_) {
            auto it = std::ranges::find_if(*views_, [pid](const SwayView& v) { return v.pid == pid; });
            if (it != views_->end()) {
                app_id = it->app_id;
                window_class = it->window_class;
            }
        }
    }

    auto comm = procfs::read_comm(pid);
    auto exe = procfs::read_exe_name(pid);

    ProcessInfo info;
    info.identifier = !exe.empty() ? exe : comm;
    if (!window_class.empty()) info.display_name = window_class;
    else if (!app_id.empty()) info.display_name = app_id;
    else info.display_name = comm;

    if (info.display_name.empty()) return std::nullopt;

    if (!app_id.empty()) info.icon = lowercase(app_id);
    else if (!window_class.empty()) info.icon = lowercase(window_class);

    return info;
}

std::expected<void, WindowError> SwayWindowSource::activate_process(const ActivationHandle& handle) {
    if (handle.pid <= 0) {
        return std::unexpected(WindowError{WindowErrorKind::ActivationFailed, "no owning process"});
    }
    return run_command(std::format("[pid={}] focus", handle.pid));
}

std::expected<void, WindowError> SwayWindowSource::focus_window(const ActivationHandle& handle) {
    if (!handle.window_id) return {};
    return run_command(std::format("[con_id={}] focus", *handle.window_id));
}

std::expected<void, WindowError> SwayWindowSource::run_command(const std::string& command) {
    auto reply = ipc_.request(SwayIpc::MSG_RUN_COMMAND, command, request_timeout_);
    if (!reply) {
        return std::unexpected(WindowError{WindowErrorKind::ActivationFailed, reply.error().message});
    }
    return check_command_reply(*reply);
}
