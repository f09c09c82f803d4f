#pragma once

#include "platform/linux/sway_ipc.hpp"
#include "platform/window_source.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <optional>
#include <vector>

// A leaf container of the Sway layout tree that hosts a client surface.
struct SwayView {
    int64_t con_id = 0;
    int pid = 0;
    std::string name;         // window title
    std::string app_id;       // Wayland app_id
    std::string window_class; // X11 class (XWayland only)
    std::string window_type;  // X11 _NET_WM_WINDOW_TYPE, e.g. "normal"
    std::string workspace;
    bool visible = false;
    int width = 0;
    int height = 0;

    bool on_scratchpad() const { return workspace == "__i3_scratch"; }
};

// All views in tree order (tiling before floating within each container).
std::vector<SwayView> collect_views(const nlohmann::json& tree);

// 0 for ordinary and dialog windows, non-zero for chrome such as docks,
// menus and tooltips.
int layer_for_window_type(std::string_view window_type);

ServerWindow to_server_window(const SwayView& view);
ProcessWindow to_process_window(const SwayView& view);

std::vector<ServerWindow> server_windows_from(const std::vector<SwayView>& views);

// The views of one process that a client window list would show: chrome and
// views below the minimum on both axes are left out.
std::vector<ProcessWindow> process_windows_from(const std::vector<SwayView>& views, int pid,
                                                int min_width, int min_height);

// Checks a RUN_COMMAND reply: [{"success": true}, ...].
std::expected<void, WindowError> check_command_reply(const std::string& payload);

class SwayWindowSource : public WindowSource {
public:
    explicit SwayWindowSource(int min_width = 0, int min_height = 0,
                              std::chrono::milliseconds request_timeout = std::chrono::seconds(2));

    SwayWindowSource(const SwayWindowSource&) = delete;
    SwayWindowSource& operator=(const SwayWindowSource&) = delete;

    std::expected<void, WindowError> connect(const std::string& socket_path = "");

    std::expected<std::vector<ServerWindow>, WindowError> list_server_windows() override;
    std::expected<std::vector<ProcessWindow>, WindowError>
        list_process_windows(int pid, std::chrono::milliseconds timeout) override;
    std::optional<ProcessInfo> resolve_process(int pid) override;
    std::expected<void, WindowError> activate_process(const ActivationHandle& handle) override;
    std::expected<void, WindowError> focus_window(const ActivationHandle& handle) override;

private:
    std::expected<std::vector<SwayView>, WindowError> fetch_views(std::chrono::milliseconds timeout);
    std::expected<void, WindowError> run_command(const std::string& command);

    SwayIpc ipc_;
    int min_width_;
    int min_height_;
    std::chrono::milliseconds request_timeout_;

    // Tree taken by the last listing. Per-process queries and process names
    // are answered from it so one refresh sees one consistent tree.
    std::mutex views_mutex_;
    std::optional<std::vector<SwayView>> views_;
};
